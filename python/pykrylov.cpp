#include <pybind11/eigen.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "krylov/exceptions.hpp"
#include "krylov/jacobi_preconditioner.hpp"
#include "krylov/solver.hpp"
#include "krylov/symmlq.hpp"

namespace py = pybind11;
using namespace krylov;

PYBIND11_MODULE(pykrylov, m) {
  m.doc() = "Python bindings for the krylov SYMMLQ solver.";

  auto solver_error =
      py::register_exception<SolverError>(m, "SolverError", PyExc_RuntimeError);
  py::register_exception<DimensionMismatchError>(m, "DimensionMismatchError",
                                                 solver_error.ptr());
  py::register_exception<NonSelfAdjointOperatorError>(
      m, "NonSelfAdjointOperatorError", solver_error.ptr());
  py::register_exception<NonPositiveDefiniteOperatorError>(
      m, "NonPositiveDefiniteOperatorError", solver_error.ptr());
  py::register_exception<IllConditionedOperatorError>(
      m, "IllConditionedOperatorError", solver_error.ptr());
  py::register_exception<SingularOperatorError>(m, "SingularOperatorError",
                                                solver_error.ptr());
  py::register_exception<MaxCountExceededError>(m, "MaxCountExceededError",
                                                solver_error.ptr());

  py::class_<LinearOperator>(m, "LinearOperator",
                             "Operator accessed through products A*x.")
      .def("rows", &LinearOperator::rows)
      .def("cols", &LinearOperator::cols)
      .def("operate", &LinearOperator::operate, "Compute A*x.", py::arg("x"))
      .def("is_transposable", &LinearOperator::is_transposable);

  py::class_<MatrixOperator, LinearOperator>(m, "MatrixOperator")
      .def(py::init<MatD>(), py::arg("A"));

  py::class_<SparseMatrixOperator, LinearOperator>(m, "SparseMatrixOperator")
      .def(py::init<SpMatD>(), py::arg("A"));

  py::class_<DiagonalOperator, LinearOperator>(m, "DiagonalOperator")
      .def(py::init<VecD>(), py::arg("diag"));

  py::class_<FunctionOperator, LinearOperator>(
      m, "FunctionOperator", "Matrix-free operator defined by a callable.")
      .def(py::init<int, int, FunctionOperator::Apply>(), py::arg("rows"),
           py::arg("cols"), py::arg("fn"));

  py::class_<JacobiPreconditioner, LinearOperator>(m, "JacobiPreconditioner")
      .def(py::init<VecD>(), py::arg("diag"))
      .def_static("create", &JacobiPreconditioner::create,
                  "Build from the diagonal of A.", py::arg("A"));

  py::class_<SymmLQ>(m, "SymmLQ", "SYMMLQ solver for symmetric systems.")
      .def(py::init<int, double, bool>(), py::arg("max_iterations"),
           py::arg("delta"), py::arg("check") = false)
      .def(
          "solve",
          [](SymmLQ &s, const LinearOperator &A, const VecD &b, bool good_b,
             double shift, const LinearOperator *preconditioner) {
            SymmLQ::Params params;
            params.good_b = good_b;
            params.shift = shift;
            params.preconditioner = preconditioner;
            return s.solve(A, b, params);
          },
          py::arg("A"), py::arg("b"), py::arg("good_b") = false,
          py::arg("shift") = 0.0, py::arg("preconditioner") = nullptr)
      .def_property_readonly(
          "iterations",
          [](const SymmLQ &s) { return s.iteration_manager().iterations(); },
          "Iteration count of the last solve.")
      .def_property_readonly("delta", &SymmLQ::delta)
      .def_property_readonly("check", &SymmLQ::check);

  py::class_<SolveOptions>(m, "SolveOptions", "Options for the linear solver.")
      .def(py::init<>())
      .def_readwrite("use_symmlq", &SolveOptions::use_symmlq,
                     "Use SYMMLQ (otherwise conjugate gradient).")
      .def_readwrite("tolerance", &SolveOptions::tolerance,
                     "Convergence tolerance.")
      .def_readwrite("max_iterations", &SolveOptions::max_iterations,
                     "Maximum iterations.")
      .def_readwrite("check_symmetry", &SolveOptions::check_symmetry,
                     "Verify self-adjointness before iterating.")
      .def_readwrite("good_b", &SolveOptions::good_b)
      .def_readwrite("shift", &SolveOptions::shift,
                     "Solve (A - shift I) x = b.")
      .def_readwrite("verbose", &SolveOptions::verbose,
                     "Print progress to stderr.")
      .def_readwrite("progress_callback", &SolveOptions::progress_callback)
      .def_readwrite("progress_interval", &SolveOptions::progress_interval);

  py::class_<SolveResult>(m, "SolveResult", "Results from a linear solve.")
      .def_readonly("method", &SolveResult::method, "Solver method used.")
      .def_readonly("iters", &SolveResult::iters, "Number of iterations.")
      .def_readonly("residual", &SolveResult::residual,
                    "Relative residual of the returned solution.")
      .def_readonly("converged", &SolveResult::converged)
      .def_property_readonly(
          "x", [](SolveResult &s) -> VecD & { return s.x; },
          py::return_value_policy::reference_internal, "Solution vector x.");

  // Preconditioner is passed separately: SolveOptions only holds a raw
  // pointer, which Python must keep alive for the duration of the call.
  m.def(
      "solve_linear",
      [](const SpMatD &A, const VecD &b, SolveOptions opt,
         const LinearOperator *preconditioner) {
        opt.preconditioner = preconditioner;
        return solve_linear(A, b, opt);
      },
      "Solves a real symmetric linear system (A - shift I) x = b.",
      py::arg("A"), py::arg("b"), py::arg("options") = SolveOptions(),
      py::arg("preconditioner") = nullptr);

  m.def(
      "solve_linear_dense",
      [](const MatD &A, const VecD &b, SolveOptions opt,
         const LinearOperator *preconditioner) {
        opt.preconditioner = preconditioner;
        return solve_linear(A, b, opt);
      },
      py::arg("A"), py::arg("b"), py::arg("options") = SolveOptions(),
      py::arg("preconditioner") = nullptr);

  m.def(
      "solve_operator",
      [](const LinearOperator &A, const VecD &b, SolveOptions opt,
         const LinearOperator *preconditioner) {
        opt.preconditioner = preconditioner;
        return solve_linear(A, b, opt);
      },
      "Solves with a matrix-free operator.", py::arg("A"), py::arg("b"),
      py::arg("options") = SolveOptions(),
      py::arg("preconditioner") = nullptr);
}
