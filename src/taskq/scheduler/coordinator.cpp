#include "taskq/scheduler/coordinator.hpp"

#include "taskq/util/log.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>

namespace taskq {

SourceCoordinator::SourceCoordinator(CoordinatorState state)
    : state_(std::move(state)) {}

auto SourceCoordinator::peek(std::span<const SourceId> pending) const
    -> std::optional<SourceId> {
  const auto &order = state_.source_order;
  auto is_pending = [&](const SourceId &id) {
    return std::ranges::find(pending, id) != pending.end();
  };

  auto start = order.begin();
  if (state_.current_source) {
    auto cur = std::ranges::find(order, *state_.current_source);
    if (cur != order.end()) {
      start = std::next(cur);
    }
  }

  if (auto it = std::find_if(start, order.end(), is_pending);
      it != order.end()) {
    return *it;
  }
  if (auto it = std::find_if(order.begin(), start, is_pending); it != start) {
    return *it;
  }
  return std::nullopt;
}

auto SourceCoordinator::dispatch(std::span<const SourceId> pending,
                                 util::TimePoint now)
    -> std::optional<SourceId> {
  auto next = peek(pending);
  if (next) {
    switch_to(*next, now);
  }
  return next;
}

auto SourceCoordinator::switch_to(const SourceId &source, util::TimePoint now)
    -> void {
  if (state_.current_source != source) {
    log::debug("Coordinator switched from '{}' to '{}'",
               state_.current_source ? state_.current_source->value()
                                     : std::string_view{"<none>"},
               source);
  }
  state_.current_source = source;
  state_.last_switch = now;
}

auto SourceCoordinator::add_source(const SourceId &source) -> void {
  if (!contains(source)) {
    state_.source_order.push_back(source);
  }
}

auto SourceCoordinator::remove_source(const SourceId &source) -> void {
  std::erase(state_.source_order, source);
  if (state_.current_source == source) {
    state_.current_source.reset();
    state_.last_switch.reset();
  }
}

auto SourceCoordinator::reconcile(std::span<const SourceId> live) -> void {
  const auto stale = state_.source_order |
                     std::views::filter([&](const SourceId &id) {
                       return std::ranges::find(live, id) == live.end();
                     }) |
                     std::ranges::to<std::vector>();
  for (const auto &id : stale) {
    remove_source(id);
  }
  for (const auto &id : live) {
    add_source(id);
  }
}

auto SourceCoordinator::contains(const SourceId &source) const -> bool {
  return std::ranges::find(state_.source_order, source) !=
         state_.source_order.end();
}

} // namespace taskq
