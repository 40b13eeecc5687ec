#include "file-system.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>

namespace miniocpp {
// ------------------------------------------------------------ file-get-contents

error_code file_get_contents(const std::string_view fname, std::string& out) {
  if (!is_regular_file(fname))
    return make_error_code(ecode::file_not_found);

  std::ifstream in{std::string{fname}, std::ios::in | std::ios::binary};
  if (!in.is_open())
    return make_error_code(ecode::fail);

  out.assign(std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{});
  if (in.bad())
    return make_error_code(ecode::fail);

  return {};
}

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename) {
  std::error_code ec;
  return std::filesystem::is_regular_file(std::filesystem::path{filename}, ec);
}

bool is_directory(const std::string_view filename) {
  std::error_code ec;
  return std::filesystem::is_directory(std::filesystem::path{filename}, ec);
}

// ------------------------------------------------------------------- join path

std::string join_path(const std::string_view dirname, const std::string_view filename) {
  if (dirname.empty())
    return std::string{filename};
  const std::string_view delim = (dirname.back() == '/') ? "" : "/";
  std::string out;
  out.reserve(dirname.size() + delim.size() + filename.size());
  out.append(dirname).append(delim).append(filename);
  return out;
}

} // namespace miniocpp
