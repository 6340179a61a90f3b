#pragma once

#include "krylov/iterative_solver.hpp"

namespace krylov {

/// SYMMLQ solver for symmetric, possibly indefinite, systems
/// (A - shift*I) x = b with an optional symmetric positive definite
/// preconditioner M.
///
/// Reference:
/// C. C. Paige and M. A. Saunders, "Solution of sparse indefinite systems
/// of linear equations", SIAM J. Numer. Anal. 12(4), 617-629 (1975).
///
/// Notes:
///  - The vector passed as x is never used as an initial guess; it is
///    always overwritten. For a warm start, solve for the correction
///    A d = b - A x0 and add it to x0.
///  - Initialization counts as iteration 1. With check enabled, the
///    symmetry probes cost one extra product with A (and M) during
///    initialization but are not counted as iterations.
///  - Convergence is declared when the residual estimate of the CG point
///    falls below max(eps, delta) * ||T_k|| * ||x_k||. The reported solution
///    is whichever of the LQ and CG points has the smaller residual estimate.
///  - Iteration events carry min(cgnorm, lqnorm) as residual norm but no
///    residual vector.
class SymmLQ : public IterativeSolver {
public:
  /// Per-solve parameters.
  struct Params {
    /// Apply the rank-one correction along M*b that improves accuracy when
    /// b is close to a multiple of an eigenvector of A.
    bool good_b = false;
    /// Solve (A - shift*I) x = b.
    double shift = 0.0;
    /// Symmetric positive definite preconditioner, or nullptr.
    const LinearOperator *preconditioner = nullptr;
  };

  /// @param max_iterations iteration cap (initialization included)
  /// @param delta relative tolerance of the default stopping test
  /// @param check verify self-adjointness of A and M before iterating
  SymmLQ(int max_iterations, double delta, bool check);
  SymmLQ(IterationManager manager, double delta, bool check);

  double delta() const { return delta_; }
  bool check() const { return check_; }

  using IterativeSolver::solve;
  using IterativeSolver::solve_in_place;

  VecD &solve_in_place(const LinearOperator &a, const LinearOperator *m,
                       const VecD &b, VecD &x) override;

  /// Core entry point: solves into x and returns it.
  /// @throws NonSquareOperatorError
  /// @throws DimensionMismatchError
  /// @throws NonSelfAdjointOperatorError
  /// @throws NonPositiveDefiniteOperatorError
  /// @throws IllConditionedOperatorError
  /// @throws SingularOperatorError
  /// @throws MaxCountExceededError
  VecD &solve_in_place(const LinearOperator &a, const VecD &b, VecD &x,
                       const Params &params);

  VecD solve(const LinearOperator &a, const VecD &b, const Params &params);

  /// x0 only fixes the size of the result; its values are ignored.
  VecD solve(const LinearOperator &a, const VecD &b, const VecD &x0,
             const Params &params);

private:
  double delta_;
  bool check_;
};

} // namespace krylov
