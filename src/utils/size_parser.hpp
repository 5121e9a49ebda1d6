#pragma once

#include <cstdint>
#include <string>

namespace rangefetch {
namespace utils {

// "4096", "512K", "10MB", "2.5MiB", "1g". Units are binary multiples
// regardless of the "B"/"iB" spelling. Throws std::invalid_argument.
uint64_t parseByteSize(const std::string& text);

// 10485760 -> "10.00 MiB"
std::string formatByteSize(uint64_t bytes);

}  // namespace utils
}  // namespace rangefetch
