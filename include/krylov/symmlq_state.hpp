#pragma once

#include "krylov/linear_operator.hpp"

namespace krylov {
namespace symmlq {

/// Recurrence variables of one SYMMLQ solve.
///
/// The Lanczos process generates an orthonormal basis v_1, v_2, ... of the
/// Krylov subspace of (A - shift*I) preconditioned by M; the resulting
/// tridiagonal matrix T_k is factored as L_k Q_k with Givens rotations as it
/// grows. xL accumulates the LQ point, wbar the last (unrotated) column of
/// V_k Q_k^T, which turns the LQ point into the CG point on request.
///
/// A State is created for a single solve and discarded afterwards. Operators
/// and the right-hand side are referenced, not owned.
struct State {
  const LinearOperator *a = nullptr;
  const LinearOperator *m = nullptr;
  const VecD *b = nullptr;

  bool check = false;
  bool goodb = false;
  double shift = 0.0;
  double delta = 0.0;

  VecD mb;   // M*b, or b without preconditioner
  VecD xL;   // LQ point
  VecD r1;
  VecD r2;
  VecD y;
  VecD wbar;

  double beta = 0.0;
  double beta1 = 0.0;
  double oldb = 0.0;
  double bstep = 0.0;
  double cgnorm = 0.0;
  double lqnorm = 0.0;
  double rnorm = 0.0;
  double dbar = 0.0;
  double gbar = 0.0;
  double gamma_zeta = 0.0;
  double minus_eps_zeta = 0.0;
  double snprod = 0.0;
  double tnorm = 0.0;
  double ynorm2 = 0.0;
  double gmax = 0.0;
  double gmin = 0.0;

  bool converged = false;
  bool b_is_null = false;
};

/// Unit roundoff, ulp(1.0).
double machine_precision();

/// Cube root of machine_precision().
double cbrt_machine_precision();

/// Build the state of a new solve. M may be nullptr.
State make_state(const LinearOperator &a, const LinearOperator *m,
                 const VecD &b, bool goodb, double shift, double delta,
                 bool check);

/// First Lanczos step: preconditioned residual, symmetry probes when
/// state.check is set, seeds for every running quantity. Sets b_is_null and
/// returns early when b is exactly zero.
/// @throws NonSelfAdjointOperatorError
/// @throws NonPositiveDefiniteOperatorError
/// @throws IllConditionedOperatorError
/// @throws SingularOperatorError
void init(State &state);

/// One Lanczos step followed by one rotation of the LQ factorization.
/// @throws NonPositiveDefiniteOperatorError
/// @throws IllConditionedOperatorError
/// @throws SingularOperatorError
void update(State &state);

/// Recompute the residual norm estimates and apply the default stopping test.
/// @throws IllConditionedOperatorError
/// @throws SingularOperatorError
void update_norms(State &state);

/// Write the reported solution to x: the LQ point, or the CG point when its
/// residual estimate is not larger.
void refine_solution(const State &state, VecD &x);

/// Throw NonSelfAdjointOperatorError unless |y.y - x.z| is within
/// (y.y + eps) * cbrt(eps), where y = L x and z = L y.
void check_symmetry(const LinearOperator &l, const VecD &x, const VecD &y,
                    const VecD &z);

inline bool has_converged(const State &state) { return state.converged; }

inline bool b_equals_null_vector(const State &state) {
  return state.b_is_null;
}

inline bool beta_equals_zero(const State &state) {
  return state.beta < machine_precision();
}

/// min(cgnorm, lqnorm) after the last update.
inline double norm_of_residual(const State &state) { return state.rnorm; }

} // namespace symmlq
} // namespace krylov
