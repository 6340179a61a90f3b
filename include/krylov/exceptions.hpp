#pragma once

#include <stdexcept>
#include <string>

#include "krylov/linear_operator.hpp"

namespace krylov {

/// Base class of every error raised by the solvers.
class SolverError : public std::runtime_error {
public:
  explicit SolverError(const std::string &what) : std::runtime_error(what) {}
};

/// Vector or operator dimensions are inconsistent.
class DimensionMismatchError : public SolverError {
public:
  DimensionMismatchError(int actual, int expected);

  int actual() const { return actual_; }
  int expected() const { return expected_; }

protected:
  DimensionMismatchError(const std::string &what, int actual, int expected)
      : SolverError(what), actual_(actual), expected_(expected) {}

private:
  int actual_;
  int expected_;
};

/// Operator is not square. actual() is the row count, expected() the
/// column count.
class NonSquareOperatorError : public DimensionMismatchError {
public:
  NonSquareOperatorError(int rows, int cols);
};

/// Symmetry probe failed: |y.y - x.(L y)| exceeded the threshold, with y = L x.
///
/// The operator is referenced, not owned; it is only valid while the caller's
/// operator is alive.
class NonSelfAdjointOperatorError : public SolverError {
public:
  NonSelfAdjointOperatorError(const LinearOperator *op, VecD vector1,
                              VecD vector2, double threshold);

  const LinearOperator *op() const { return op_; }
  const VecD &vector1() const { return vector1_; }
  const VecD &vector2() const { return vector2_; }
  double threshold() const { return threshold_; }

private:
  const LinearOperator *op_;
  VecD vector1_;
  VecD vector2_;
  double threshold_;
};

/// A quadratic form x^T L x that must be positive was found negative (or
/// non-positive, for conjugate gradient).
class NonPositiveDefiniteOperatorError : public SolverError {
public:
  NonPositiveDefiniteOperatorError(const LinearOperator *op, VecD vector);

  const LinearOperator *op() const { return op_; }
  const VecD &vector() const { return vector_; }

private:
  const LinearOperator *op_;
  VecD vector_;
};

/// Condition number estimate of the projected operator is too large for the
/// solution to be trusted.
class IllConditionedOperatorError : public SolverError {
public:
  explicit IllConditionedOperatorError(double condition_number);

  double condition_number() const { return condition_number_; }

private:
  double condition_number_;
};

/// The starting vector is numerically an eigenvector of the shifted operator.
class SingularOperatorError : public SolverError {
public:
  SingularOperatorError();
};

/// Iteration count went past its cap.
class MaxCountExceededError : public SolverError {
public:
  explicit MaxCountExceededError(int max_count);

  int max_count() const { return max_count_; }

private:
  int max_count_;
};

/// Optional capability (transpose product, residual vector) is absent.
class UnsupportedOperationError : public SolverError {
public:
  explicit UnsupportedOperationError(const std::string &what)
      : SolverError(what) {}
};

} // namespace krylov
