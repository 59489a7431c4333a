#ifndef CHUNKVAULT_STORE_PATH_UTILS_HPP
#define CHUNKVAULT_STORE_PATH_UTILS_HPP

#include <string>

namespace chunkvault {
namespace store {

// True if `component` can be used as a single directory/file name: non-empty,
// only [A-Za-z0-9_.-], and not "." or ".."
bool is_safe_component(const std::string& component);

// Throws std::invalid_argument naming `what` unless is_safe_component(component)
void require_safe_component(const std::string& component, const std::string& what);

// Reduces an uploaded file name to [A-Za-z0-9_.-]; never returns an empty or dot-leading name
std::string sanitize_filename(const std::string& name);

} // namespace store
} // namespace chunkvault

#endif // CHUNKVAULT_STORE_PATH_UTILS_HPP
