#include "string-utils.hpp"

#include <algorithm>
#include <cctype>

namespace miniocpp {
// ------------------------------------------------------------------------ Trim

std::string& ltrim(std::string& s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(),
                                  [](unsigned char ch) { return !std::isspace(ch); }));
  return s;
}

std::string& rtrim(std::string& s) {
  s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
  return s;
}

std::string& trim(std::string& s) { return ltrim(rtrim(s)); }

std::string trim_copy(std::string_view s) {
  std::string out{s};
  trim(out);
  return out;
}

// ------------------------------------------------------------------ url decode

std::optional<std::string> url_decode(std::string_view s) {
  auto hex_value = [](char ch) -> int {
    if (ch >= '0' && ch <= '9')
      return ch - '0';
    if (ch >= 'a' && ch <= 'f')
      return 10 + (ch - 'a');
    if (ch >= 'A' && ch <= 'F')
      return 10 + (ch - 'A');
    return -1;
  };

  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const char ch = s[i];
    if (ch == '+') {
      out.push_back(' ');
    } else if (ch == '%') {
      if (i + 2 >= s.size())
        return std::nullopt;
      const auto hi = hex_value(s[i + 1]);
      const auto lo = hex_value(s[i + 2]);
      if (hi < 0 || lo < 0)
        return std::nullopt;
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else {
      out.push_back(ch);
    }
  }
  return out;
}

} // namespace miniocpp
