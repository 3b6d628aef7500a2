#pragma once

#include "taskq/core/error.hpp"
#include "taskq/util/log.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace taskq {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

inline constexpr auto kJsonReadOpts =
    glz::opts{.null_terminated = false, .error_on_unknown_keys = false};
inline constexpr auto kJsonPrettyOpts = glz::opts{.prettify = true};

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  if (auto ec = glz::read<kJsonReadOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

// Decodes a glaze-described struct, ignoring keys it does not know about.
template <typename T>
[[nodiscard]] auto read_document(std::string_view text,
                                 std::string *diagnostic = nullptr)
    -> Result<T> {
  T doc{};
  if (auto ec = glz::read<kJsonReadOpts>(doc, text); ec) {
    if (diagnostic != nullptr) {
      *diagnostic = glz::format_error(ec, text);
    }
    return fail(Error::ParseError);
  }
  return ok(std::move(doc));
}

template <typename T>
[[nodiscard]] auto write_document(const T &doc) -> Result<std::string> {
  auto out = glz::write<kJsonPrettyOpts>(doc);
  if (!out) {
    log::error("JSON serialization failed: {}", glz::format_error(out.error()));
    return fail(Error::ParseError);
  }
  return ok(std::move(*out));
}

} // namespace taskq
