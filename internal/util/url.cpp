#include "url.hpp"

#include <cctype>
#include <stdexcept>

namespace feedstore::util {

namespace {

bool IsSchemeChar(unsigned char c) {
  return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

} // namespace

bool IsValidUrl(std::string_view url) {
  const auto colon = url.find(':');
  if (colon == std::string_view::npos || colon == 0 || colon + 1 == url.size()) {
    return false;
  }

  if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
    return false;
  }
  for (size_t i = 1; i < colon; ++i) {
    if (!IsSchemeChar(static_cast<unsigned char>(url[i]))) return false;
  }

  for (size_t i = colon + 1; i < url.size(); ++i) {
    const auto c = static_cast<unsigned char>(url[i]);
    if (std::isspace(c) || std::iscntrl(c)) return false;
  }
  return true;
}

} // namespace feedstore::util
