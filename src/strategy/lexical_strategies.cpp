#include "ulidtool/strategy/lexical_strategies.h"

namespace ulidtool::strategy {

RuntimeLexicalStrategy::RuntimeLexicalStrategy(counter::CounterState& counter)
    : counter_(counter) {
  counter::require_width(counter_, UlidTraits::kRandomnessBits, "runtime_lexical");
}

LocalLexicalStrategy::LocalLexicalStrategy(counter::PersistedCounter& counter)
    : counter_(counter) {
  counter::require_width(counter_.state(), UlidTraits::kRandomnessBits, "local_lexical");
}

}  // namespace ulidtool::strategy
