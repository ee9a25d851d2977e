#include "ulidtool/storage/counter_store.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ulidtool::storage {

std::optional<core::Uint128> FileCounterStore::load() {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return std::nullopt;
  }

  std::ifstream in(path_);
  if (!in) {
    throw std::runtime_error("FileCounterStore::load cannot open " + path_.string());
  }
  std::ostringstream content;
  content << in.rdbuf();

  std::string text = content.str();
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
    text.pop_back();
  }

  const auto value = core::parse_uint128(text, 10);
  if (!value.has_value()) {
    throw std::runtime_error("FileCounterStore::load malformed counter in " + path_.string() +
                             ": '" + text + "'");
  }
  return value;
}

void FileCounterStore::save(const core::Uint128 value) {
  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("FileCounterStore::save cannot open " + path_.string());
  }
  out << core::to_string(value, 10) << "\n";
  out.flush();
  if (!out) {
    throw std::runtime_error("FileCounterStore::save failed writing " + path_.string());
  }
}

}  // namespace ulidtool::storage
