#pragma once

#include "krylov/iterative_solver.hpp"

namespace krylov {

/// Preconditioned conjugate gradient for symmetric positive definite A.
///
/// Unlike SymmLQ, the incoming x is used as the initial guess. Iteration
/// stops when ||b - A x|| <= delta * ||b||. Events carry the residual vector.
/// With check enabled, a non-positive r.z (preconditioner) or p.Ap (operator)
/// raises NonPositiveDefiniteOperatorError.
class ConjugateGradient : public IterativeSolver {
public:
  ConjugateGradient(int max_iterations, double delta, bool check);
  ConjugateGradient(IterationManager manager, double delta, bool check);

  double delta() const { return delta_; }
  bool check() const { return check_; }

  using IterativeSolver::solve_in_place;

  VecD &solve_in_place(const LinearOperator &a, const LinearOperator *m,
                       const VecD &b, VecD &x) override;

private:
  double delta_;
  bool check_;
};

} // namespace krylov
