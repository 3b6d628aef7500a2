#pragma once

#include "taskq/core/error.hpp"
#include "taskq/queue/models.hpp"

#include <string>
#include <string_view>

namespace taskq {

// Maps QueueState to and from its JSON document. Older schema versions are
// migrated once, inside decode().
class StateCodec {
public:
  [[nodiscard]] static auto encode(const QueueState &state)
      -> Result<std::string>;

  // Error::CorruptState for malformed JSON, unknown versions, or values
  // that do not fit the schema.
  [[nodiscard]] static auto decode(std::string_view text) -> Result<QueueState>;
};

} // namespace taskq
