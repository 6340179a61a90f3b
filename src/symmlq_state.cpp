#include "krylov/symmlq_state.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "krylov/exceptions.hpp"

namespace krylov {
namespace symmlq {

double machine_precision() {
  return std::numeric_limits<double>::epsilon();
}

double cbrt_machine_precision() {
  static const double cbrt_eps = std::cbrt(machine_precision());
  return cbrt_eps;
}

State make_state(const LinearOperator &a, const LinearOperator *m,
                 const VecD &b, bool goodb, double shift, double delta,
                 bool check) {
  State state;
  state.a = &a;
  state.m = m;
  state.b = &b;
  state.goodb = goodb;
  state.shift = shift;
  state.delta = delta;
  state.check = check;
  state.mb = m == nullptr ? b : m->operate(b);
  state.xL = VecD::Zero(b.size());
  return state;
}

void check_symmetry(const LinearOperator &l, const VecD &x, const VecD &y,
                    const VecD &z) {
  const double s = y.dot(y);
  const double t = x.dot(z);
  const double epsa = (s + machine_precision()) * cbrt_machine_precision();
  if (std::abs(s - t) > epsa) {
    throw NonSelfAdjointOperatorError(&l, x, y, epsa);
  }
}

void init(State &st) {
  const double eps = machine_precision();
  const LinearOperator &a = *st.a;
  const VecD &b = *st.b;

  st.xL.setZero();

  // r1 = b, y = M*b. Without preconditioner beta1 is simply ||b||.
  st.r1 = b;
  st.y = st.m == nullptr ? b : st.m->operate(st.r1);
  if (st.m != nullptr && st.check) {
    check_symmetry(*st.m, st.r1, st.y, st.m->operate(st.y));
  }

  st.beta1 = st.r1.dot(st.y);
  if (st.beta1 < 0.0) {
    throw NonPositiveDefiniteOperatorError(st.m, st.y);
  }
  if (st.beta1 == 0.0) {
    st.b_is_null = true;
    return;
  }
  st.b_is_null = false;
  st.beta1 = std::sqrt(st.beta1);

  // v = y / beta1 is the first Lanczos vector.
  const VecD v = st.y * (1.0 / st.beta1);
  st.y = a.operate(v);
  if (st.check) {
    check_symmetry(a, v, st.y, a.operate(st.y));
  }

  st.y += -st.shift * v;
  const double alpha = v.dot(st.y);
  st.y += (-alpha / st.beta1) * st.r1;

  // Local re-orthogonalization keeps r2 orthogonal to the first v.
  const double vty = v.dot(st.y);
  const double vtv = v.dot(v);
  st.y += (-vty / vtv) * v;

  st.r2 = st.y;
  if (st.m != nullptr) {
    st.y = st.m->operate(st.r2);
  }
  st.oldb = st.beta1;
  st.beta = st.r2.dot(st.y);
  if (st.beta < 0.0) {
    throw NonPositiveDefiniteOperatorError(st.m, st.y);
  }
  st.beta = std::sqrt(st.beta);

  st.cgnorm = st.beta1;
  st.gbar = alpha;
  st.dbar = st.beta;
  st.gamma_zeta = st.beta1;
  st.minus_eps_zeta = 0.0;
  st.bstep = 0.0;
  st.snprod = 1.0;
  st.tnorm = alpha * alpha + st.beta * st.beta;
  st.ynorm2 = 0.0;
  st.gmax = std::abs(alpha) + eps;
  st.gmin = st.gmax;

  if (st.goodb) {
    st.wbar = VecD::Zero(a.rows());
  } else {
    st.wbar = v;
  }
  update_norms(st);
}

void update(State &st) {
  const LinearOperator &a = *st.a;

  // Three-term Lanczos recurrence:
  //   beta_{k+1} v_{k+1} = (A - shift I) v_k - alpha_k v_k - beta_k v_{k-1}
  const VecD v = st.y * (1.0 / st.beta);
  st.y = a.operate(v);
  st.y = -st.shift * v + (-st.beta / st.oldb) * st.r1 + st.y;
  const double alpha = v.dot(st.y);
  st.y += (-alpha / st.beta) * st.r2;

  st.r1 = st.r2;
  st.r2 = st.y;
  if (st.m != nullptr) {
    st.y = st.m->operate(st.r2);
  }
  st.oldb = st.beta;
  st.beta = st.r2.dot(st.y);
  if (st.beta < 0.0) {
    throw NonPositiveDefiniteOperatorError(st.m, st.y);
  }
  st.beta = std::sqrt(st.beta);

  // Frobenius norm of T_k.
  st.tnorm += alpha * alpha + st.oldb * st.oldb + st.beta * st.beta;

  // Rotation Q_{k,k+1} annihilating beta_k from the new column of L.
  const double gamma = std::sqrt(st.gbar * st.gbar + st.oldb * st.oldb);
  const double c = st.gbar / gamma;
  const double s = st.oldb / gamma;
  const double deltak = c * st.dbar + s * alpha;
  st.gbar = s * st.dbar - c * alpha;
  const double eps = s * st.beta;
  st.dbar = -c * st.beta;
  const double zeta = st.gamma_zeta / gamma;

  // xL += zeta * w_k, with w_k = c * wbar + s * v.
  const double zeta_c = zeta * c;
  const double zeta_s = zeta * s;
  st.xL += zeta_c * st.wbar + zeta_s * v;
  st.wbar = s * st.wbar - c * v;

  st.bstep += st.snprod * c * zeta;
  st.snprod *= s;
  st.gmax = std::max(st.gmax, gamma);
  st.gmin = std::min(st.gmin, gamma);
  st.ynorm2 += zeta * zeta;
  st.gamma_zeta = st.minus_eps_zeta - deltak * zeta;
  st.minus_eps_zeta = -eps * zeta;

  update_norms(st);
}

void update_norms(State &st) {
  const double mach = machine_precision();
  const double anorm = std::sqrt(st.tnorm);
  const double ynorm = std::sqrt(st.ynorm2);
  const double epsa = anorm * mach;
  const double epsx = anorm * ynorm * mach;
  const double epsr = anorm * ynorm * st.delta;
  const double diag = st.gbar == 0.0 ? epsa : st.gbar;

  st.lqnorm = std::sqrt(st.gamma_zeta * st.gamma_zeta +
                        st.minus_eps_zeta * st.minus_eps_zeta);
  const double qrnorm = st.snprod * st.beta1;
  st.cgnorm = qrnorm * st.beta / std::abs(diag);

  // Condition estimate of the lower-triangular factor; the pivot of the
  // CG point only enters when the LQ point is the better one.
  double acond;
  if (st.lqnorm <= st.cgnorm) {
    acond = st.gmax / st.gmin;
  } else {
    acond = st.gmax / std::min(st.gmin, std::abs(diag));
  }
  if (acond * mach >= 0.1) {
    throw IllConditionedOperatorError(acond);
  }
  if (st.beta1 <= epsx) {
    throw SingularOperatorError();
  }

  st.rnorm = std::min(st.cgnorm, st.lqnorm);
  st.converged = (st.cgnorm <= epsx) || (st.cgnorm <= epsr);
}

void refine_solution(const State &st, VecD &x) {
  if (st.b_is_null) {
    x = VecD::Zero(st.xL.size());
    return;
  }
  if (st.lqnorm < st.cgnorm) {
    if (!st.goodb) {
      x = st.xL;
    } else {
      const double step = st.bstep / st.beta1;
      x = st.xL + step * st.mb;
    }
    return;
  }

  const double anorm = std::sqrt(st.tnorm);
  const double diag = st.gbar == 0.0 ? anorm * machine_precision() : st.gbar;
  const double zbar = st.gamma_zeta / diag;
  if (!st.goodb) {
    x = st.xL + zbar * st.wbar;
  } else {
    const double step = (st.bstep + st.snprod * zbar) / st.beta1;
    x = st.xL + zbar * st.wbar + step * st.mb;
  }
}

} // namespace symmlq
} // namespace krylov
