#pragma once

#include "taskq/queue/models.hpp"
#include "taskq/util/id.hpp"
#include "taskq/util/time.hpp"

#include <optional>
#include <span>
#include <vector>

namespace taskq {

// Strict forward round-robin over a stable source order. The cursor always
// moves past the source it last dispatched, even when that source still has
// work, so no eligible source is passed over twice in a row.
//
// Holds its CoordinatorState by value; callers copy it back into QueueState
// after mutating.
class SourceCoordinator {
public:
  SourceCoordinator() = default;
  explicit SourceCoordinator(CoordinatorState state);

  // Next source among `pending` after the cursor, wrapping once. Does not
  // move the cursor.
  [[nodiscard]] auto peek(std::span<const SourceId> pending) const
      -> std::optional<SourceId>;

  // peek() plus moving the cursor onto the chosen source. An empty result
  // leaves the cursor where it was.
  [[nodiscard]] auto dispatch(std::span<const SourceId> pending,
                              util::TimePoint now = util::Clock::now())
      -> std::optional<SourceId>;

  // Moves the cursor without consulting the order, for sources whose own
  // worker claimed a task.
  auto switch_to(const SourceId &source,
                 util::TimePoint now = util::Clock::now()) -> void;

  // Appends unknown sources at the end.
  auto add_source(const SourceId &source) -> void;
  // Drops the source; resets the cursor if it pointed there.
  auto remove_source(const SourceId &source) -> void;
  // Keeps surviving sources in their current order, removes the rest, then
  // appends newcomers in the order given.
  auto reconcile(std::span<const SourceId> live) -> void;

  [[nodiscard]] auto contains(const SourceId &source) const -> bool;
  [[nodiscard]] auto current() const noexcept
      -> const std::optional<SourceId> & {
    return state_.current_source;
  }
  [[nodiscard]] auto order() const noexcept -> const std::vector<SourceId> & {
    return state_.source_order;
  }
  [[nodiscard]] auto state() const noexcept -> const CoordinatorState & {
    return state_;
  }

private:
  CoordinatorState state_;
};

} // namespace taskq
