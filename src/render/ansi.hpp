#pragma once

// SGR sequences used by the status line
namespace ansi {

constexpr const char* DIM = "\033[2m";
constexpr const char* RST = "\033[0m";
constexpr const char* RED = "\033[31m";
constexpr const char* GREEN = "\033[32m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* MAGENTA = "\033[35m";
constexpr const char* CYAN = "\033[36m";

}  // namespace ansi
