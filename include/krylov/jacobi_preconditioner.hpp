#pragma once

#include "krylov/linear_operator.hpp"

namespace krylov {

/// Diagonal (Jacobi) preconditioner M = diag(A)^{-1}, applied as
/// x -> x ./ diag.
class JacobiPreconditioner : public LinearOperator {
public:
  /// @throws std::invalid_argument if an entry of diag is zero
  explicit JacobiPreconditioner(VecD diag);

  /// Build the preconditioner from the diagonal of A. Matrix-backed operators
  /// are read directly; other operators are probed with unit vectors, which
  /// costs one product per column.
  /// @throws NonSquareOperatorError if A is not square
  static JacobiPreconditioner create(const LinearOperator &a);

  int rows() const override { return static_cast<int>(diag_.size()); }
  int cols() const override { return static_cast<int>(diag_.size()); }
  bool is_transposable() const override { return true; }

  const VecD &diagonal() const { return diag_; }

  /// Square root of the preconditioner, x -> x ./ sqrt(diag). Useful to
  /// precondition symmetrically; requires a positive diagonal.
  /// @throws std::invalid_argument if an entry of the diagonal is negative
  DiagonalOperator sqrt() const;

protected:
  VecD apply(const VecD &x) const override { return x.cwiseQuotient(diag_); }
  VecD apply_transpose(const VecD &x) const override { return apply(x); }

private:
  VecD diag_;
};

} // namespace krylov
