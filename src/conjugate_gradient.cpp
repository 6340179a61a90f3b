#include "krylov/conjugate_gradient.hpp"

#include <utility>

#include "krylov/exceptions.hpp"

namespace krylov {

ConjugateGradient::ConjugateGradient(int max_iterations, double delta,
                                     bool check)
    : IterativeSolver(max_iterations), delta_(delta), check_(check) {}

ConjugateGradient::ConjugateGradient(IterationManager manager, double delta,
                                     bool check)
    : IterativeSolver(std::move(manager)), delta_(delta), check_(check) {}

VecD &ConjugateGradient::solve_in_place(const LinearOperator &a,
                                        const LinearOperator *m,
                                        const VecD &b, VecD &x) {
  check_parameters(a, m, b, x);
  IterationManager &manager = iteration_manager();

  manager.reset_iteration_count();
  const double rmax = delta_ * b.norm();

  // Initialization phase counts as one iteration.
  manager.increment_iteration_count();

  VecD p = x;
  VecD q = a.operate(p);
  VecD r = b - q;
  double rnorm = r.norm();
  VecD z = r;

  manager.fire_initialization_event(
      IterationEvent(this, manager.iterations(), x, b, rnorm, &r));
  if (rnorm <= rmax) {
    manager.fire_termination_event(
        IterationEvent(this, manager.iterations(), x, b, rnorm, &r));
    return x;
  }

  double rho_prev = 0.0;
  bool first_step = true;
  while (true) {
    manager.increment_iteration_count();
    manager.fire_iteration_started_event(
        IterationEvent(this, manager.iterations(), x, b, rnorm, &r));

    if (m != nullptr) {
      z = m->operate(r);
    } else {
      z = r;
    }
    const double rho_next = r.dot(z);
    if (check_ && rho_next <= 0.0) {
      throw NonPositiveDefiniteOperatorError(m, r);
    }
    if (first_step) {
      p = z;
      first_step = false;
    } else {
      p = (rho_next / rho_prev) * p + z;
    }

    q = a.operate(p);
    const double pq = p.dot(q);
    if (check_ && pq <= 0.0) {
      throw NonPositiveDefiniteOperatorError(&a, p);
    }
    const double alpha = rho_next / pq;
    x += alpha * p;
    r -= alpha * q;
    rho_prev = rho_next;
    rnorm = r.norm();

    const IterationEvent performed(this, manager.iterations(), x, b, rnorm,
                                   &r);
    manager.fire_iteration_performed_event(performed);
    if (rnorm <= rmax) {
      manager.fire_termination_event(performed);
      return x;
    }
  }
}

} // namespace krylov
