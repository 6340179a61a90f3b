#include "krylov/iterative_solver.hpp"

#include <utility>

#include "krylov/exceptions.hpp"

namespace krylov {

IterativeSolver::IterativeSolver(int max_iterations)
    : manager_(max_iterations) {}

IterativeSolver::IterativeSolver(IterationManager manager)
    : manager_(std::move(manager)) {}

VecD &IterativeSolver::solve_in_place(const LinearOperator &a, const VecD &b,
                                      VecD &x) {
  return solve_in_place(a, nullptr, b, x);
}

VecD IterativeSolver::solve(const LinearOperator &a, const VecD &b) {
  return solve(a, nullptr, b);
}

VecD IterativeSolver::solve(const LinearOperator &a, const LinearOperator *m,
                            const VecD &b) {
  VecD x = VecD::Zero(a.cols());
  solve_in_place(a, m, b, x);
  return x;
}

VecD IterativeSolver::solve(const LinearOperator &a, const VecD &b,
                            const VecD &x0) {
  return solve(a, nullptr, b, x0);
}

VecD IterativeSolver::solve(const LinearOperator &a, const LinearOperator *m,
                            const VecD &b, const VecD &x0) {
  VecD x = x0;
  solve_in_place(a, m, b, x);
  return x;
}

void IterativeSolver::check_parameters(const LinearOperator &a,
                                       const LinearOperator *m, const VecD &b,
                                       const VecD &x) {
  if (a.rows() != a.cols()) {
    throw NonSquareOperatorError(a.rows(), a.cols());
  }
  if (b.size() != a.rows()) {
    throw DimensionMismatchError(static_cast<int>(b.size()), a.rows());
  }
  if (x.size() != a.cols()) {
    throw DimensionMismatchError(static_cast<int>(x.size()), a.cols());
  }
  if (m != nullptr) {
    if (m->rows() != m->cols()) {
      throw NonSquareOperatorError(m->rows(), m->cols());
    }
    if (m->rows() != a.rows()) {
      throw DimensionMismatchError(m->rows(), a.rows());
    }
  }
}

} // namespace krylov
