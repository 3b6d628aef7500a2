#pragma once

#include "taskq/core/error.hpp"

#include <filesystem>
#include <string>

namespace taskq {

// Hex MD5 of a file, read in fixed-size chunks. Used only to notice edits,
// not for integrity.
[[nodiscard]] auto file_fingerprint(const std::filesystem::path &path)
    -> Result<std::string>;

} // namespace taskq
