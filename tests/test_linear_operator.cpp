#include <Eigen/Dense>
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "krylov/exceptions.hpp"
#include "krylov/linear_operator.hpp"

using namespace krylov;

void test_matrix_operator() {
  std::cout << "test_matrix_operator..." << std::endl;

  MatD A(2, 3);
  A << 1, 2, 3, 4, 5, 6;
  MatrixOperator op(A);
  assert(op.rows() == 2);
  assert(op.cols() == 3);
  assert(op.is_transposable());

  VecD x(3);
  x << 1, 0, -1;
  VecD y = op.operate(x);
  assert(y.size() == 2);
  assert(std::abs(y[0] - (-2.0)) < 1e-14);
  assert(std::abs(y[1] - (-2.0)) < 1e-14);

  VecD u(2);
  u << 1, 1;
  VecD v = op.operate_transpose(u);
  assert(v.size() == 3);
  assert(std::abs(v[0] - 5.0) < 1e-14);
  assert(std::abs(v[2] - 9.0) < 1e-14);
}

void test_dimension_checks() {
  std::cout << "test_dimension_checks..." << std::endl;

  MatrixOperator op(MatD::Identity(3, 3));
  bool threw = false;
  try {
    op.operate(VecD::Ones(4));
  } catch (const DimensionMismatchError &e) {
    threw = true;
    assert(e.actual() == 4);
    assert(e.expected() == 3);
  }
  assert(threw);

  threw = false;
  try {
    op.operate_transpose(VecD::Ones(2));
  } catch (const DimensionMismatchError &) {
    threw = true;
  }
  assert(threw);
}

void test_sparse_and_diagonal() {
  std::cout << "test_sparse_and_diagonal..." << std::endl;

  std::vector<Eigen::Triplet<double>> trips;
  trips.emplace_back(0, 0, 2.0);
  trips.emplace_back(0, 1, -1.0);
  trips.emplace_back(1, 0, -1.0);
  trips.emplace_back(1, 1, 2.0);
  SpMatD S(2, 2);
  S.setFromTriplets(trips.begin(), trips.end());
  SparseMatrixOperator sop(S);

  VecD x(2);
  x << 1, 1;
  VecD y = sop.operate(x);
  assert(std::abs(y[0] - 1.0) < 1e-14);
  assert(std::abs(y[1] - 1.0) < 1e-14);

  VecD d(3);
  d << 1, -2, 3;
  DiagonalOperator dop(d);
  VecD z = dop.operate(VecD::Ones(3));
  assert((z - d).norm() < 1e-14);
  assert((dop.operate_transpose(VecD::Ones(3)) - d).norm() < 1e-14);
}

void test_function_operator() {
  std::cout << "test_function_operator..." << std::endl;

  FunctionOperator twice(3, 3, [](const VecD &x) -> VecD { return 2.0 * x; });
  assert(!twice.is_transposable());
  VecD y = twice.operate(VecD::Ones(3));
  assert(std::abs(y.sum() - 6.0) < 1e-14);

  bool threw = false;
  try {
    twice.operate_transpose(VecD::Ones(3));
  } catch (const UnsupportedOperationError &) {
    threw = true;
  }
  assert(threw);

  // The callable must honour the declared row count.
  FunctionOperator wrong(2, 2, [](const VecD &x) -> VecD {
    return VecD::Zero(x.size() + 1);
  });
  threw = false;
  try {
    wrong.operate(VecD::Ones(2));
  } catch (const DimensionMismatchError &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    FunctionOperator empty(2, 2, nullptr);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  FunctionOperator with_t(
      2, 3, [](const VecD &x) -> VecD { return x.head(2); },
      [](const VecD &x) -> VecD {
        VecD r = VecD::Zero(3);
        r.head(2) = x;
        return r;
      });
  assert(with_t.is_transposable());
  assert(with_t.operate_transpose(VecD::Ones(2)).size() == 3);
}

int main() {
  test_matrix_operator();
  test_dimension_checks();
  test_sparse_and_diagonal();
  test_function_operator();
  std::cout << "All linear operator tests passed!" << std::endl;
  return 0;
}
