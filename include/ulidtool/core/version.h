#pragma once

namespace ulidtool::core {

// Printed by `ulidtool_cli --version`; matches project(VERSION) in CMakeLists.txt.
constexpr const char* kBuildVersion = "0.3";

}  // namespace ulidtool::core
