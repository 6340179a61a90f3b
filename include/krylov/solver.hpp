#pragma once

#include <functional>
#include <string>

#include "krylov/linear_operator.hpp"

namespace krylov {

/// Callback function type for solver progress reporting.
/// @param iteration Current iteration number
/// @param residual Current residual norm estimate
using SolverProgressCallback =
    std::function<void(int iteration, double residual)>;

struct SolveOptions {
  /// SYMMLQ when true, preconditioned conjugate gradient otherwise
  bool use_symmlq = true;
  double tolerance = 1e-10;
  int max_iterations = 10000;

  /// Verify that A (and the preconditioner) are self-adjoint before iterating
  bool check_symmetry = false;

  /// SYMMLQ only: rank-one correction along b, and eigenvalue shift
  bool good_b = false;
  double shift = 0.0;

  /// Optional symmetric positive definite preconditioner (not owned)
  const LinearOperator *preconditioner = nullptr;

  /// Enable verbose output to stderr (prints iteration count and residual)
  bool verbose = false;

  /// Optional callback for progress monitoring (called every N iterations)
  SolverProgressCallback progress_callback = nullptr;

  /// How often to call progress_callback (every N iterations)
  int progress_interval = 100;
};

struct SolveResult {
  std::string method;
  int iters = 0;
  /// True relative residual ||b - (A - shift I) x|| / ||b|| of the returned x
  double residual = 0.0;
  bool converged = false;
  VecD x;
};

/// Solve a real symmetric linear system (A - shift I) x = b.
/// Solver errors (see exceptions.hpp) propagate to the caller.
/// @param A System operator
/// @param b Right-hand side vector
/// @param opt Solver options (method, tolerance, max iterations, verbose mode)
/// @return SolveResult containing solution vector and convergence info
SolveResult solve_linear(const LinearOperator &A, const VecD &b,
                         const SolveOptions &opt = SolveOptions());

SolveResult solve_linear(const MatD &A, const VecD &b,
                         const SolveOptions &opt = SolveOptions());

SolveResult solve_linear(const SpMatD &A, const VecD &b,
                         const SolveOptions &opt = SolveOptions());

} // namespace krylov
