#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "krylov/linear_operator.hpp"

namespace krylov {

class IterativeSolver;

/// Snapshot of an iterative solver, passed to iteration listeners.
///
/// Vectors are referenced, not copied: they are only valid for the duration
/// of the notification. Copy them if they must outlive the callback.
class IterationEvent {
public:
  IterationEvent(const IterativeSolver *source, int iterations,
                 const VecD &solution, const VecD &rhs, double residual_norm,
                 const VecD *residual = nullptr)
      : source_(source), iterations_(iterations), solution_(&solution),
        rhs_(&rhs), residual_(residual), residual_norm_(residual_norm) {}

  /// Solver that fired the event.
  const IterativeSolver *source() const { return source_; }

  /// Iteration count at the time of the event (initialization counts as 1).
  int iterations() const { return iterations_; }

  /// Current estimate of the solution.
  const VecD &solution() const { return *solution_; }

  /// Right-hand side of the system being solved.
  const VecD &right_hand_side() const { return *rhs_; }

  /// Norm of the (possibly preconditioned) residual.
  double residual_norm() const { return residual_norm_; }

  bool provides_residual() const { return residual_ != nullptr; }

  /// Residual vector, when the solver maintains one.
  /// @throws UnsupportedOperationError if provides_residual() is false
  const VecD &residual() const;

private:
  const IterativeSolver *source_;
  int iterations_;
  const VecD *solution_;
  const VecD *rhs_;
  const VecD *residual_;
  double residual_norm_;
};

/// Set of callbacks notified by an IterationManager. Empty members are
/// skipped.
struct IterationListener {
  using Callback = std::function<void(const IterationEvent &)>;

  Callback initialization_performed = nullptr;
  Callback iteration_started = nullptr;
  Callback iteration_performed = nullptr;
  Callback termination_performed = nullptr;
};

/// Iteration counter with a cap, plus listener notification.
///
/// Incrementing the counter past max_iterations() invokes the max-count
/// callback. The default callback throws MaxCountExceededError; a custom
/// callback that returns normally lets the iteration continue.
class IterationManager {
public:
  using MaxCountExceededCallback = std::function<void(int max_count)>;

  /// @throws std::invalid_argument if max_iterations < 0
  explicit IterationManager(int max_iterations,
                            MaxCountExceededCallback on_max_count = nullptr);

  /// Register a listener. Returns a handle for remove_listener().
  int add_listener(IterationListener listener);

  /// Unregister a listener. Returns false if the handle is unknown.
  bool remove_listener(int handle);

  std::size_t num_listeners() const { return listeners_.size(); }

  void fire_initialization_event(const IterationEvent &e) const;
  void fire_iteration_started_event(const IterationEvent &e) const;
  void fire_iteration_performed_event(const IterationEvent &e) const;
  void fire_termination_event(const IterationEvent &e) const;

  int iterations() const { return count_; }
  int max_iterations() const { return max_iterations_; }

  /// @throws MaxCountExceededError through the default max-count callback
  void increment_iteration_count();
  void reset_iteration_count() { count_ = 0; }

private:
  using Slot = IterationListener::Callback IterationListener::*;
  using ListenerPtr = std::shared_ptr<const IterationListener>;
  void fire(Slot slot, const IterationEvent &e) const;

  int max_iterations_;
  int count_ = 0;
  MaxCountExceededCallback on_max_count_;
  std::vector<std::pair<int, ListenerPtr>> listeners_;
  int next_handle_ = 1;
};

} // namespace krylov
