#include "krylov/jacobi_preconditioner.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "krylov/exceptions.hpp"

namespace krylov {

JacobiPreconditioner::JacobiPreconditioner(VecD diag) : diag_(std::move(diag)) {
  for (Eigen::Index i = 0; i < diag_.size(); ++i) {
    if (diag_[i] == 0.0) {
      throw std::invalid_argument(
          "JacobiPreconditioner: zero diagonal at row " + std::to_string(i));
    }
  }
}

JacobiPreconditioner JacobiPreconditioner::create(const LinearOperator &a) {
  const int n = a.cols();
  if (a.rows() != n) {
    throw NonSquareOperatorError(a.rows(), n);
  }

  VecD diag(n);
  if (auto dense = dynamic_cast<const MatrixOperator *>(&a)) {
    diag = dense->matrix().diagonal();
  } else if (auto sparse = dynamic_cast<const SparseMatrixOperator *>(&a)) {
    diag = sparse->matrix().diagonal();
  } else if (auto d = dynamic_cast<const DiagonalOperator *>(&a)) {
    diag = d->diagonal();
  } else {
    // Matrix-free: A(i,i) = e_i^T A e_i.
    VecD e = VecD::Zero(n);
    for (int i = 0; i < n; ++i) {
      e[i] = 1.0;
      diag[i] = a.operate(e)[i];
      e[i] = 0.0;
    }
  }
  return JacobiPreconditioner(std::move(diag));
}

DiagonalOperator JacobiPreconditioner::sqrt() const {
  if ((diag_.array() < 0.0).any()) {
    throw std::invalid_argument(
        "JacobiPreconditioner::sqrt requires a positive diagonal");
  }
  return DiagonalOperator(diag_.cwiseSqrt().cwiseInverse());
}

} // namespace krylov
