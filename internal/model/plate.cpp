#include "plate.hpp"

#include <cctype>

namespace lotgate::model {

std::string NormalizePlate(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      out.push_back(static_cast<char>(std::toupper(uc)));
    } else if (uc >= 0x80) {
      // keep non-ASCII bytes (regional plate alphabets) untouched
      out.push_back(c);
    }
  }
  return out;
}

} // namespace lotgate::model
