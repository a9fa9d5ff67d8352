#pragma once

#include <string>
#include <string_view>

namespace lotgate::util {

// Random RFC 4122 version 4 id in canonical 8-4-4-4-12 lowercase form.
// Used for session and payment transaction ids.
std::string NewId();

bool IsCanonicalId(std::string_view id);

} // namespace lotgate::util
