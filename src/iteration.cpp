#include "krylov/iteration.hpp"

#include <algorithm>
#include <stdexcept>

#include "krylov/exceptions.hpp"

namespace krylov {

const VecD &IterationEvent::residual() const {
  if (residual_ == nullptr) {
    throw UnsupportedOperationError("Iteration event carries no residual");
  }
  return *residual_;
}

IterationManager::IterationManager(int max_iterations,
                                   MaxCountExceededCallback on_max_count)
    : max_iterations_(max_iterations), on_max_count_(std::move(on_max_count)) {
  if (max_iterations < 0) {
    throw std::invalid_argument(
        "IterationManager: max_iterations must be non-negative");
  }
}

int IterationManager::add_listener(IterationListener listener) {
  const int handle = next_handle_++;
  listeners_.emplace_back(
      handle, std::make_shared<const IterationListener>(std::move(listener)));
  return handle;
}

bool IterationManager::remove_listener(int handle) {
  auto it = std::find_if(
      listeners_.begin(), listeners_.end(),
      [handle](const std::pair<int, ListenerPtr> &entry) {
        return entry.first == handle;
      });
  if (it == listeners_.end())
    return false;
  listeners_.erase(it);
  return true;
}

void IterationManager::fire(Slot slot, const IterationEvent &e) const {
  // Handles are increasing along listeners_. Listeners may add or remove
  // listeners from inside a callback, so each step looks up the next handle
  // again instead of holding an iterator; listeners added during dispatch
  // are not notified until the next event.
  if (listeners_.empty())
    return;
  const int last = listeners_.back().first;
  int current = 0;
  while (true) {
    auto it = std::upper_bound(
        listeners_.begin(), listeners_.end(), current,
        [](int handle, const std::pair<int, ListenerPtr> &entry) {
          return handle < entry.first;
        });
    if (it == listeners_.end() || it->first > last)
      break;
    current = it->first;
    const ListenerPtr keep = it->second;
    const auto &cb = (*keep).*slot;
    if (cb)
      cb(e);
  }
}

void IterationManager::fire_initialization_event(
    const IterationEvent &e) const {
  fire(&IterationListener::initialization_performed, e);
}

void IterationManager::fire_iteration_started_event(
    const IterationEvent &e) const {
  fire(&IterationListener::iteration_started, e);
}

void IterationManager::fire_iteration_performed_event(
    const IterationEvent &e) const {
  fire(&IterationListener::iteration_performed, e);
}

void IterationManager::fire_termination_event(const IterationEvent &e) const {
  fire(&IterationListener::termination_performed, e);
}

void IterationManager::increment_iteration_count() {
  if (++count_ > max_iterations_) {
    if (on_max_count_) {
      on_max_count_(max_iterations_);
    } else {
      throw MaxCountExceededError(max_iterations_);
    }
  }
}

} // namespace krylov
