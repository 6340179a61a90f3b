#pragma once

#include "krylov/iteration.hpp"
#include "krylov/linear_operator.hpp"

namespace krylov {

/// Base class for preconditioned iterative solvers of A x = b.
///
/// The solver owns an IterationManager that counts iterations, enforces the
/// iteration cap and notifies registered listeners. A solver instance can be
/// reused for any number of solves, but not concurrently.
class IterativeSolver {
public:
  explicit IterativeSolver(int max_iterations);
  explicit IterativeSolver(IterationManager manager);
  virtual ~IterativeSolver() = default;

  IterationManager &iteration_manager() { return manager_; }
  const IterationManager &iteration_manager() const { return manager_; }

  /// Solve A x = b with an optional preconditioner M (may be nullptr).
  /// The result is written to x, which is returned.
  virtual VecD &solve_in_place(const LinearOperator &a,
                               const LinearOperator *m, const VecD &b,
                               VecD &x) = 0;

  VecD &solve_in_place(const LinearOperator &a, const VecD &b, VecD &x);

  /// Solve starting from a zero vector.
  VecD solve(const LinearOperator &a, const VecD &b);
  VecD solve(const LinearOperator &a, const LinearOperator *m, const VecD &b);

  /// Solve on a copy of x0; x0 itself is left untouched.
  VecD solve(const LinearOperator &a, const VecD &b, const VecD &x0);
  VecD solve(const LinearOperator &a, const LinearOperator *m, const VecD &b,
             const VecD &x0);

protected:
  /// Validate that A and M are square and that M, b and x agree with A.
  /// @throws NonSquareOperatorError
  /// @throws DimensionMismatchError
  static void check_parameters(const LinearOperator &a,
                               const LinearOperator *m, const VecD &b,
                               const VecD &x);

private:
  IterationManager manager_;
};

} // namespace krylov
