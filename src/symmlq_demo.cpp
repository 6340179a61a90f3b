#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "krylov/exceptions.hpp"
#include "krylov/solver.hpp"

// Solves the shifted 1-D Laplacian (tridiag(-1, 2, -1) - shift I) x = 1.
int main(int argc, char **argv) {
  int n = 100;
  double shift = 0.0;
  try {
    if (argc > 1)
      n = std::stoi(argv[1]);
    if (argc > 2)
      shift = std::stod(argv[2]);
  } catch (const std::exception &) {
    std::cerr << "Usage: " << argv[0] << " [n] [shift]\n";
    return 1;
  }
  if (n <= 0) {
    std::cerr << "Usage: " << argv[0] << " [n] [shift]\n";
    return 1;
  }

  std::vector<Eigen::Triplet<double>> trips;
  for (int i = 0; i < n; ++i) {
    trips.emplace_back(i, i, 2.0);
    if (i > 0) {
      trips.emplace_back(i, i - 1, -1.0);
      trips.emplace_back(i - 1, i, -1.0);
    }
  }
  krylov::SpMatD A(n, n);
  A.setFromTriplets(trips.begin(), trips.end());
  krylov::VecD b = krylov::VecD::Ones(n);

  krylov::SolveOptions opt;
  opt.shift = shift;
  opt.check_symmetry = true;
  opt.max_iterations = 10 * n + 10;
  opt.verbose = true;
  opt.progress_interval = std::max(1, n / 10);

  try {
    auto res = krylov::solve_linear(A, b, opt);
    std::cout << "Method: " << res.method << " iters=" << res.iters
              << " resid=" << res.residual << "\n";
    for (int i = 0; i < std::min<int>(5, res.x.size()); ++i) {
      std::cout << "x[" << i << "] = " << res.x[i] << "\n";
    }
  } catch (const krylov::SolverError &e) {
    std::cerr << "Solve failed: " << e.what() << "\n";
    return 2;
  }
  return 0;
}
