#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup miniocpp-strings Strings
 * @ingroup miniocpp-utils
 */
namespace miniocpp {

// --------------------------------------------------------------------- explode

template <typename Container = std::vector<std::string_view>>
inline Container explode(std::string_view input, char delim) {
  Container out;
  auto start = std::begin(input);

  std::string_view::size_type pos0 = 0;
  while (true) {
    auto pos1 = input.find_first_of(delim, pos0);
    auto len = (pos1 == std::string_view::npos) ? input.size() - pos0 : pos1 - pos0;
    out.emplace_back(start + pos0, len);
    if (pos1 == std::string_view::npos) {
      break;
    }
    pos0 = pos1 + 1;
  }

  return out;
}

// ------------------------------------------------------------------------ Trim

std::string& ltrim(std::string& s);
std::string& rtrim(std::string& s);
std::string& trim(std::string& s);
std::string trim_copy(std::string_view s);

// ------------------------------------------------------------------ url decode

/**
 * @ingroup miniocpp-strings
 * @brief Decodes `%XX` escapes and `+` (as space) in a url component.
 * @return `std::nullopt` if there's a truncated or non-hex escape.
 */
std::optional<std::string> url_decode(std::string_view s);

} // namespace miniocpp
