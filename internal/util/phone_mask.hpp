#pragma once

#include <string>

namespace handoff::util {

// Replaces everything but the last four characters with '*'. Four or fewer
// characters are returned unchanged.
std::string MaskPhoneNumber(const std::string& phone);

// At least 7 digits, and digits make up more than 70% of the string.
bool LooksLikePhoneNumber(const std::string& s);

std::string MaskIfPhoneNumber(const std::string& s);

} // namespace handoff::util
