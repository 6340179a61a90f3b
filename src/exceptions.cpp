#include "krylov/exceptions.hpp"

#include <sstream>
#include <utility>

namespace krylov {

DimensionMismatchError::DimensionMismatchError(int actual, int expected)
    : DimensionMismatchError("Dimension mismatch: got " +
                                 std::to_string(actual) + ", expected " +
                                 std::to_string(expected),
                             actual, expected) {}

NonSquareOperatorError::NonSquareOperatorError(int rows, int cols)
    : DimensionMismatchError("Operator is not square: " +
                                 std::to_string(rows) + "x" +
                                 std::to_string(cols),
                             rows, cols) {}

namespace {

std::string self_adjoint_message(double threshold) {
  std::ostringstream oss;
  oss << "Operator is not self-adjoint (threshold " << threshold << ")";
  return oss.str();
}

} // namespace

NonSelfAdjointOperatorError::NonSelfAdjointOperatorError(
    const LinearOperator *op, VecD vector1, VecD vector2, double threshold)
    : SolverError(self_adjoint_message(threshold)), op_(op),
      vector1_(std::move(vector1)), vector2_(std::move(vector2)),
      threshold_(threshold) {}

NonPositiveDefiniteOperatorError::NonPositiveDefiniteOperatorError(
    const LinearOperator *op, VecD vector)
    : SolverError("Operator is not positive definite"), op_(op),
      vector_(std::move(vector)) {}

namespace {

std::string condition_message(double cond) {
  std::ostringstream oss;
  oss << "Operator is ill-conditioned (condition number estimate " << cond
      << ")";
  return oss.str();
}

} // namespace

IllConditionedOperatorError::IllConditionedOperatorError(
    double condition_number)
    : SolverError(condition_message(condition_number)),
      condition_number_(condition_number) {}

SingularOperatorError::SingularOperatorError()
    : SolverError("Operator is singular: starting vector is an eigenvector "
                  "of the shifted operator") {}

MaxCountExceededError::MaxCountExceededError(int max_count)
    : SolverError("Maximal iteration count exceeded: " +
                  std::to_string(max_count)),
      max_count_(max_count) {}

} // namespace krylov
