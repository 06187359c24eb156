#include "phone_mask.hpp"

namespace handoff::util {

std::string MaskPhoneNumber(const std::string& phone) {
  if (phone.size() <= 4) {
    return phone;
  }
  return std::string(phone.size() - 4, '*') + phone.substr(phone.size() - 4);
}

bool LooksLikePhoneNumber(const std::string& s) {
  if (s.size() < 7) {
    return false;
  }
  std::size_t digits = 0;
  for (char c : s) {
    if (c >= '0' && c <= '9') ++digits;
  }
  return digits >= 7 && static_cast<double>(digits) / static_cast<double>(s.size()) > 0.7;
}

std::string MaskIfPhoneNumber(const std::string& s) {
  return LooksLikePhoneNumber(s) ? MaskPhoneNumber(s) : s;
}

} // namespace handoff::util
