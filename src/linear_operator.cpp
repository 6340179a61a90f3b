#include "krylov/linear_operator.hpp"

#include "krylov/exceptions.hpp"

namespace krylov {

VecD LinearOperator::operate(const VecD &x) const {
  if (x.size() != cols()) {
    throw DimensionMismatchError(static_cast<int>(x.size()), cols());
  }
  return apply(x);
}

VecD LinearOperator::operate_transpose(const VecD &x) const {
  if (!is_transposable()) {
    throw UnsupportedOperationError("Operator does not provide A^T*x");
  }
  if (x.size() != rows()) {
    throw DimensionMismatchError(static_cast<int>(x.size()), rows());
  }
  return apply_transpose(x);
}

VecD LinearOperator::apply_transpose(const VecD &x) const {
  (void)x;
  throw UnsupportedOperationError("Operator does not provide A^T*x");
}

FunctionOperator::FunctionOperator(int rows, int cols, Apply fn,
                                   Apply fn_transpose)
    : rows_(rows), cols_(cols), fn_(std::move(fn)),
      fn_transpose_(std::move(fn_transpose)) {
  if (rows < 0 || cols < 0) {
    throw std::invalid_argument("FunctionOperator: negative dimension");
  }
  if (!fn_) {
    throw std::invalid_argument("FunctionOperator: empty product function");
  }
}

VecD FunctionOperator::apply(const VecD &x) const {
  VecD y = fn_(x);
  if (y.size() != rows_) {
    throw DimensionMismatchError(static_cast<int>(y.size()), rows_);
  }
  return y;
}

VecD FunctionOperator::apply_transpose(const VecD &x) const {
  VecD y = fn_transpose_(x);
  if (y.size() != cols_) {
    throw DimensionMismatchError(static_cast<int>(y.size()), cols_);
  }
  return y;
}

} // namespace krylov
