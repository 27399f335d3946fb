/**
 * @file ndsort.cpp
 * @brief Python bindings for the fast non-dominated sort.
 *
 * The sort is based on the original paper by Deb et al. (2002) titled
 * "A Fast and Elitist Multiobjective Genetic Algorithm: NSGA-II".
 *
 * The module exposes:
 * 1. ind: a solution (objectives, constraint violation, rank).
 * 2. dominates: the pairwise Pareto relation.
 * 3. non_dominated_argsort / rank / nondominated: ranking of bare objective vectors.
 * 4. nondominated_sort: ranking of a list of ind, returned with ranks filled in.
 *
 * Invalid populations raise ndsort.InvalidInput, a subclass of ValueError.
 * Any other rank_error surfaces as RuntimeError.
 */

#include <exception>
#include <utility>
#include <vector>
#include "individual.hpp"
#include "ndsort.h"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace {

frontrank::rank_options options_for(int threads) {
    frontrank::rank_options options;
    options.threads = threads;
    return options;
}

/**
 * @brief Ranks a population of ind and returns a copy with ranks set.
 *
 * @param population The evaluated solutions.
 * @param threads Worker threads for the pairwise stage (0 = all cores).
 * @return The same solutions, in the same order, with rank assigned.
 */
std::vector<frontrank::individual> nondominated_sort(std::vector<frontrank::individual> population,
                                                     int threads) {
    frontrank::assign_ranks(population, options_for(threads));
    return population;
}

} // namespace

namespace py = pybind11;

PYBIND11_MODULE(ndsort, m) {
    using frontrank::individual;
    using frontrank::ranking;

    m.doc() = "Fast non-dominated sorting";

    static py::exception<frontrank::rank_error> invalid_input(m, "InvalidInput", PyExc_ValueError);
    py::register_exception_translator([](std::exception_ptr p) {
        try {
            if (p) std::rethrow_exception(p);
        } catch (const frontrank::rank_error& e) {
            if (e.code() == frontrank::error_code::invalid_input) {
                invalid_input(e.what());
            } else {
                PyErr_SetString(PyExc_RuntimeError, e.what());
            }
        }
    });

    py::class_<individual>(m, "ind")
        .def(py::init<std::vector<double>>(), py::arg("obj"))
        .def(py::init<std::vector<double>, double>(), py::arg("obj"), py::arg("constraint_violation"))
        .def_readwrite("obj", &individual::objectives)
        .def_readwrite("constraint_violation", &individual::constraint_violation)
        .def_readonly("rank", &individual::rank);

    m.def("dominates",
          [](const individual& a, const individual& b) { return frontrank::dominates(a, b); },
          py::arg("a"), py::arg("b"),
          "True if a dominates b");

    m.def("non_dominated_argsort",
          [](const std::vector<std::vector<double>>& objectives, int threads) {
              ranking result = frontrank::non_dominated_argsort(objectives, options_for(threads));
              return std::make_pair(std::move(result.fronts), std::move(result.ranks));
          },
          py::arg("objectives"), py::arg("threads") = 1,
          "Return (fronts, ranks) for a list of objective vectors");

    m.def("rank",
          [](const std::vector<std::vector<double>>& objectives, int threads) {
              return frontrank::non_dominated_argsort(objectives, options_for(threads)).ranks;
          },
          py::arg("objectives"), py::arg("threads") = 1,
          "Return the front index of every objective vector");

    m.def("nondominated",
          [](const std::vector<std::vector<double>>& objectives) {
              ranking result = frontrank::non_dominated_argsort(objectives);
              return result.fronts.empty() ? std::vector<int>() : result.fronts[0];
          },
          py::arg("objectives"),
          "Return the indices of the Pareto-optimal objective vectors");

    m.def("nondominated_sort", &nondominated_sort,
          py::arg("population"), py::arg("threads") = 1,
          "Rank a list of ind and return it with rank set");
}
