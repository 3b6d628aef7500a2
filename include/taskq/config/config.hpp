#pragma once

#include "taskq/config/queue_config.hpp"
#include "taskq/core/error.hpp"

#include <filesystem>
#include <string_view>

namespace taskq {

enum class ConfigFormat : std::uint8_t { Json, Toml };

class ConfigLoader {
public:
  // Format follows the extension: ".toml" is TOML, anything else JSON.
  // Relative paths resolve against the file's directory.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<QueueConfig>;

  [[nodiscard]] static auto
  load_from_string(std::string_view text, ConfigFormat format,
                   const std::filesystem::path &base_dir)
      -> Result<QueueConfig>;

  // Error::InvalidConfig when the workspace or a source directory is
  // missing, ids clash, or a timing is not positive.
  [[nodiscard]] static auto validate(const QueueConfig &config)
      -> Result<void>;
};

} // namespace taskq
