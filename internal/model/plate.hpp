#pragma once

#include <string>
#include <string_view>

namespace lotgate::model {

// Uppercases and strips whitespace and punctuation: " ab-12 3" -> "AB123".
std::string NormalizePlate(std::string_view raw);

} // namespace lotgate::model
