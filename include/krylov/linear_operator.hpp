#pragma once

#include <functional>
#include <utility>

#include <Eigen/Dense>
#include <Eigen/Sparse>

namespace krylov {

using VecD = Eigen::VectorXd;
using MatD = Eigen::MatrixXd;
using SpMatD = Eigen::SparseMatrix<double>;

/// Linear operator accessed only through matrix-vector products.
///
/// Implementations expose their dimensions and the product y = A*x. They do
/// not expose coefficients; solvers built on this interface work equally well
/// with matrix-free operators.
class LinearOperator {
public:
  virtual ~LinearOperator() = default;

  /// Number of rows (dimension of the codomain).
  virtual int rows() const = 0;

  /// Number of columns (dimension of the domain).
  virtual int cols() const = 0;

  /// Compute A*x.
  /// @throws DimensionMismatchError if x.size() != cols()
  VecD operate(const VecD &x) const;

  /// Compute A^T*x.
  /// @throws UnsupportedOperationError if is_transposable() is false
  /// @throws DimensionMismatchError if x.size() != rows()
  VecD operate_transpose(const VecD &x) const;

  /// Whether operate_transpose() is available.
  virtual bool is_transposable() const { return false; }

protected:
  /// Product with an argument whose size has already been checked.
  virtual VecD apply(const VecD &x) const = 0;

  /// Transposed product; only called when is_transposable() is true.
  virtual VecD apply_transpose(const VecD &x) const;
};

/// Operator backed by a dense matrix.
class MatrixOperator : public LinearOperator {
public:
  explicit MatrixOperator(MatD A) : A_(std::move(A)) {}

  int rows() const override { return static_cast<int>(A_.rows()); }
  int cols() const override { return static_cast<int>(A_.cols()); }
  bool is_transposable() const override { return true; }

  const MatD &matrix() const { return A_; }

protected:
  VecD apply(const VecD &x) const override { return A_ * x; }
  VecD apply_transpose(const VecD &x) const override {
    return A_.transpose() * x;
  }

private:
  MatD A_;
};

/// Operator backed by a compressed sparse matrix.
class SparseMatrixOperator : public LinearOperator {
public:
  explicit SparseMatrixOperator(SpMatD A) : A_(std::move(A)) {}

  int rows() const override { return static_cast<int>(A_.rows()); }
  int cols() const override { return static_cast<int>(A_.cols()); }
  bool is_transposable() const override { return true; }

  const SpMatD &matrix() const { return A_; }

protected:
  VecD apply(const VecD &x) const override { return A_ * x; }
  VecD apply_transpose(const VecD &x) const override {
    return A_.transpose() * x;
  }

private:
  SpMatD A_;
};

/// Square diagonal operator, x -> diag .* x.
class DiagonalOperator : public LinearOperator {
public:
  explicit DiagonalOperator(VecD diag) : diag_(std::move(diag)) {}

  int rows() const override { return static_cast<int>(diag_.size()); }
  int cols() const override { return static_cast<int>(diag_.size()); }
  bool is_transposable() const override { return true; }

  const VecD &diagonal() const { return diag_; }

protected:
  VecD apply(const VecD &x) const override {
    return diag_.cwiseProduct(x);
  }
  VecD apply_transpose(const VecD &x) const override { return apply(x); }

private:
  VecD diag_;
};

/// Matrix-free operator defined by a callable.
///
/// The transpose is optional; without it the operator reports
/// is_transposable() == false.
class FunctionOperator : public LinearOperator {
public:
  using Apply = std::function<VecD(const VecD &)>;

  FunctionOperator(int rows, int cols, Apply fn, Apply fn_transpose = nullptr);

  int rows() const override { return rows_; }
  int cols() const override { return cols_; }
  bool is_transposable() const override {
    return static_cast<bool>(fn_transpose_);
  }

protected:
  VecD apply(const VecD &x) const override;
  VecD apply_transpose(const VecD &x) const override;

private:
  int rows_;
  int cols_;
  Apply fn_;
  Apply fn_transpose_;
};

} // namespace krylov
