#include "size_parser.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace rangefetch {
namespace utils {

namespace {

std::string toLower(std::string s) {
  for (auto& c : s) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return s;
}

std::string trim(const std::string& s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;
  return s.substr(begin, end - begin);
}

uint64_t unitMultiplier(const std::string& unit, const std::string& text) {
  if (unit.empty() || unit == "b") return 1;
  static const char kPrefixes[] = {'k', 'm', 'g', 't'};
  for (size_t i = 0; i < sizeof(kPrefixes); ++i) {
    const char p = kPrefixes[i];
    if (unit == std::string(1, p) || unit == std::string(1, p) + "b" ||
        unit == std::string(1, p) + "ib") {
      return uint64_t{1} << (10 * (i + 1));
    }
  }
  throw std::invalid_argument("unknown size unit in '" + text + "'");
}

}  // namespace

uint64_t parseByteSize(const std::string& text) {
  const std::string input = trim(text);
  size_t pos = 0;
  while (pos < input.size() &&
         (std::isdigit(static_cast<unsigned char>(input[pos])) ||
          input[pos] == '.')) {
    ++pos;
  }
  const std::string number = input.substr(0, pos);
  if (number.empty() || number == "." ||
      number.find('.') != number.rfind('.')) {
    throw std::invalid_argument("invalid size '" + text + "'");
  }
  const uint64_t multiplier =
      unitMultiplier(toLower(trim(input.substr(pos))), text);

  long double value = 0;
  std::istringstream iss(number);
  iss.imbue(std::locale::classic());
  if (!(iss >> value)) {
    throw std::invalid_argument("invalid size '" + text + "'");
  }
  const long double bytes = std::floor(value * multiplier);
  if (bytes >= std::ldexp(1.0L, 64)) {
    throw std::invalid_argument("size '" + text + "' is too large");
  }
  return static_cast<uint64_t>(bytes);
}

std::string formatByteSize(uint64_t bytes) {
  static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  size_t unit = 0;
  double value = static_cast<double>(bytes);
  while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  if (unit == 0) {
    oss << bytes << " B";
  } else {
    oss << std::fixed << std::setprecision(2) << value << " " << kUnits[unit];
  }
  return oss.str();
}

}  // namespace utils
}  // namespace rangefetch
