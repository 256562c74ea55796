#include "recordio/core/platform_utils.hpp"

#include <cstdlib>
#include <new>

namespace recordio::core {

namespace {
constexpr auto fold(char c) noexcept -> char {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}
} // namespace

auto safe_getenv(const char* name) noexcept -> std::optional<std::string> {
  if (name == nullptr || *name == '\0') return std::nullopt;
  try {
#if defined(_WIN32)
    char* buf = nullptr;
    std::size_t len = 0;
    if (_dupenv_s(&buf, &len, name) != 0 || buf == nullptr) {
      std::free(buf);
      return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (v == nullptr) return std::nullopt;
    return std::string(v);
#endif
  } catch (const std::bad_alloc&) {
    return std::nullopt;
  }
}

auto equals_ci(std::string_view a, std::string_view b) noexcept -> bool {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (fold(a[i]) != fold(b[i])) return false;
  }
  return true;
}

} // namespace recordio::core
