#pragma once

#include "error-codes.hpp"

#include <string>
#include <string_view>

namespace miniocpp {
// ------------------------------------------------------------ file-get-contents

error_code file_get_contents(const std::string_view fname, std::string& out);

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename);
bool is_directory(const std::string_view filename);

// ------------------------------------------------------------------- join path

/**
 * @brief `dirname` + "/" + `filename`, without doubling up the slash
 */
std::string join_path(const std::string_view dirname, const std::string_view filename);

} // namespace miniocpp
