#include "krylov/solver.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

#include "krylov/conjugate_gradient.hpp"
#include "krylov/symmlq.hpp"

namespace krylov {
namespace {

IterationListener make_progress_listener(const std::string &method,
                                         const SolveOptions &opt) {
  IterationListener listener;
  listener.iteration_performed = [method, &opt](const IterationEvent &e) {
    if (e.iterations() % opt.progress_interval != 0)
      return;
    if (opt.verbose) {
      std::cerr << "[" << method << "] iteration " << e.iterations()
                << ", residual " << e.residual_norm() << "\n";
    }
    if (opt.progress_callback)
      opt.progress_callback(e.iterations(), e.residual_norm());
  };
  if (opt.verbose) {
    listener.termination_performed = [method](const IterationEvent &e) {
      std::cerr << "[" << method << "] terminated after " << e.iterations()
                << " iterations, residual " << e.residual_norm() << "\n";
    };
  }
  return listener;
}

} // namespace

SolveResult solve_linear(const LinearOperator &A, const VecD &b,
                         const SolveOptions &opt) {
  if (opt.progress_interval <= 0) {
    throw std::invalid_argument("progress_interval must be positive");
  }
  if (!opt.use_symmlq && (opt.shift != 0.0 || opt.good_b)) {
    throw std::invalid_argument(
        "shift and good_b are only supported by SYMMLQ");
  }

  SolveResult res;
  std::unique_ptr<IterativeSolver> solver;
  if (opt.use_symmlq) {
    res.method = "SYMMLQ";
    solver = std::make_unique<SymmLQ>(opt.max_iterations, opt.tolerance,
                                      opt.check_symmetry);
  } else {
    res.method = "CG";
    solver = std::make_unique<ConjugateGradient>(
        opt.max_iterations, opt.tolerance, opt.check_symmetry);
  }
  solver->iteration_manager().add_listener(
      make_progress_listener(res.method, opt));

  res.x = VecD::Zero(A.cols());
  if (opt.use_symmlq) {
    SymmLQ::Params params;
    params.good_b = opt.good_b;
    params.shift = opt.shift;
    params.preconditioner = opt.preconditioner;
    static_cast<SymmLQ &>(*solver).solve_in_place(A, b, res.x, params);
  } else {
    solver->solve_in_place(A, opt.preconditioner, b, res.x);
  }
  res.iters = solver->iteration_manager().iterations();
  res.converged = true;

  const double bnorm = b.norm();
  if (bnorm > 0.0) {
    const VecD r = b - A.operate(res.x) + opt.shift * res.x;
    res.residual = r.norm() / bnorm;
  }
  return res;
}

SolveResult solve_linear(const MatD &A, const VecD &b,
                         const SolveOptions &opt) {
  return solve_linear(MatrixOperator(A), b, opt);
}

SolveResult solve_linear(const SpMatD &A, const VecD &b,
                         const SolveOptions &opt) {
  return solve_linear(SparseMatrixOperator(A), b, opt);
}

} // namespace krylov
