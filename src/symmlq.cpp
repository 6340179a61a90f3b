#include "krylov/symmlq.hpp"

#include <utility>

#include "krylov/symmlq_state.hpp"

namespace krylov {

SymmLQ::SymmLQ(int max_iterations, double delta, bool check)
    : IterativeSolver(max_iterations), delta_(delta), check_(check) {}

SymmLQ::SymmLQ(IterationManager manager, double delta, bool check)
    : IterativeSolver(std::move(manager)), delta_(delta), check_(check) {}

VecD &SymmLQ::solve_in_place(const LinearOperator &a, const LinearOperator *m,
                             const VecD &b, VecD &x) {
  Params params;
  params.preconditioner = m;
  return solve_in_place(a, b, x, params);
}

VecD SymmLQ::solve(const LinearOperator &a, const VecD &b,
                   const Params &params) {
  VecD x = VecD::Zero(a.cols());
  solve_in_place(a, b, x, params);
  return x;
}

VecD SymmLQ::solve(const LinearOperator &a, const VecD &b, const VecD &x0,
                   const Params &params) {
  VecD x = x0;
  solve_in_place(a, b, x, params);
  return x;
}

VecD &SymmLQ::solve_in_place(const LinearOperator &a, const VecD &b, VecD &x,
                             const Params &params) {
  const LinearOperator *m = params.preconditioner;
  check_parameters(a, m, b, x);

  IterationManager &manager = iteration_manager();
  // Initialization counts as an iteration, so that the count does not depend
  // on whether symmetry checks were requested.
  manager.reset_iteration_count();
  manager.increment_iteration_count();

  symmlq::State state = symmlq::make_state(a, m, b, params.good_b,
                                           params.shift, delta_, check_);
  symmlq::init(state);
  symmlq::refine_solution(state, x);

  if (symmlq::b_equals_null_vector(state)) {
    // b = 0 exactly: x = 0 is the solution.
    const IterationEvent event(this, manager.iterations(), x, b,
                               symmlq::norm_of_residual(state));
    manager.fire_initialization_event(event);
    manager.fire_termination_event(event);
    return x;
  }

  // Stop right away if beta is essentially zero.
  const bool early_stop =
      symmlq::beta_equals_zero(state) || symmlq::has_converged(state);
  manager.fire_initialization_event(IterationEvent(
      this, manager.iterations(), x, b, symmlq::norm_of_residual(state)));

  if (!early_stop) {
    do {
      manager.increment_iteration_count();
      manager.fire_iteration_started_event(IterationEvent(
          this, manager.iterations(), x, b, symmlq::norm_of_residual(state)));
      symmlq::update(state);
      symmlq::refine_solution(state, x);
      manager.fire_iteration_performed_event(IterationEvent(
          this, manager.iterations(), x, b, symmlq::norm_of_residual(state)));
    } while (!symmlq::has_converged(state));
  }

  manager.fire_termination_event(IterationEvent(
      this, manager.iterations(), x, b, symmlq::norm_of_residual(state)));
  return x;
}

} // namespace krylov
