#include "store/path_utils.hpp"
#include <cctype>
#include <stdexcept>

namespace chunkvault {
namespace store {

namespace {

bool is_allowed_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
}

} // namespace

bool is_safe_component(const std::string& component) {
  if (component.empty() || component == "." || component == "..") {
    return false;
  }
  for (char c : component) {
    if (!is_allowed_char(c)) {
      return false;
    }
  }
  return true;
}

void require_safe_component(const std::string& component, const std::string& what) {
  if (!is_safe_component(component)) {
    throw std::invalid_argument("Invalid " + what + ": '" + component + "'");
  }
}

std::string sanitize_filename(const std::string& name) {
  // Keep only the last path segment
  std::string base = name;
  const auto slash = base.find_last_of("/\\");
  if (slash != std::string::npos) {
    base = base.substr(slash + 1);
  }

  std::string result;
  result.reserve(base.size());
  for (char c : base) {
    result += is_allowed_char(c) ? c : '_';
  }

  const auto first = result.find_first_not_of('.');
  result = (first == std::string::npos) ? std::string() : result.substr(first);

  if (result.empty()) {
    return "file";
  }
  return result;
}

} // namespace store
} // namespace chunkvault
