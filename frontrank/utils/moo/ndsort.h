/* An implementation of the fast non-dominated sorting algorithm
the algorithm has O(M*N^2) complexity where M is the number of objectives
and N is the size of the population. The algorithm is based on the
original paper by Deb et al. (2002) titled
"A Fast and Elitist Multiobjective Genetic Algorithm: NSGA-II"*/
#ifndef NDSORT_H
#define NDSORT_H

#include <algorithm>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include "dominance.h"
#include "errors.h"
#include "individual.hpp"
#include "logging.h"
#include "options.h"

namespace frontrank {

// fronts[k] lists the indices of front k in ascending input order,
// ranks[i] is the front index of solution i
struct ranking {
    std::vector<std::vector<int>> fronts;
    std::vector<int> ranks;
};

// per-call bookkeeping, indices into the population
struct domination_graph {
    std::vector<int> domination_count; // how many solutions dominate i
    std::vector<std::vector<int>> dominated_solutions; // indices i dominates
};

inline void validate_population(const std::vector<individual>& population) {
    if (population.empty()) return;
    const std::size_t m = population[0].objectives.size();
    if (m == 0) {
        logger()->error("solution 0 has an empty objective vector");
        FRONTRANK_THROW(error_code::invalid_input, "objective vectors must have at least one objective");
    }
    for (std::size_t i = 0; i < population.size(); ++i) {
        const individual& ind = population[i];
        if (ind.objectives.size() != m) {
            std::string msg = "solution " + std::to_string(i) + " has "
                + std::to_string(ind.objectives.size()) + " objectives, expected " + std::to_string(m);
            logger()->error(msg);
            FRONTRANK_THROW(error_code::invalid_input, msg);
        }
        // negated test so NaN is rejected too
        if (!(ind.constraint_violation >= 0.0)) {
            std::string msg = "solution " + std::to_string(i)
                + " has an invalid constraint violation " + std::to_string(ind.constraint_violation);
            logger()->error(msg);
            FRONTRANK_THROW(error_code::invalid_input, msg);
        }
    }
}

inline int worker_count(const rank_options& options) {
    if (options.threads > 0) return options.threads;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? static_cast<int>(hw) : 1;
}

inline domination_graph build_domination_graph(const std::vector<individual>& population,
                                               const rank_options& options) {
    // complexity: O(M * N^2), space O(N^2) in the worst case
    /* pseudocode equivalent
    for each p in population:
        for each q in population, q != p:
            if p dominates q:
                add q to p's dominated_solutions
    for each p in population:
        for each q in p's dominated_solutions:
            increment q's domination_count
    */
    const int n = static_cast<int>(population.size());
    domination_graph graph;
    graph.domination_count.assign(n, 0);
    graph.dominated_solutions.resize(n);

    const int workers = worker_count(options);
    const bool parallel = workers > 1 && n >= options.parallel_threshold;

    // row p is owned by a single worker, so dominated_solutions[p] needs no lock
    #pragma omp parallel for if(parallel) num_threads(workers) schedule(dynamic)
    for (int p = 0; p < n; ++p) {
        std::vector<int>& row = graph.dominated_solutions[p];
        for (int q = 0; q < n; ++q) {
            if (p == q) continue;
            if (dominates(population[p], population[q])) {
                row.push_back(q);
            }
        }
    }

    // merge: counters are derived from the rows after all workers finished
    for (int p = 0; p < n; ++p) {
        for (int q : graph.dominated_solutions[p]) {
            ++graph.domination_count[q];
        }
    }
    return graph;
}

inline ranking non_dominated_argsort(const std::vector<individual>& population,
                                     const rank_options& options = rank_options()) {
    options.validate_or_throw();
    validate_population(population);

    ranking result;
    const int n = static_cast<int>(population.size());
    if (n == 0) return result;

    if (logger()->should_log(spdlog::level::debug)) {
        int with_nan = 0;
        for (const individual& ind : population) {
            if (has_nan(ind.objectives)) ++with_nan;
        }
        logger()->debug("ranking {} solutions with {} objectives on {} worker(s), {} with NaN objectives",
                        n, population[0].objectives.size(), worker_count(options), with_nan);
    }

    domination_graph graph = build_domination_graph(population, options);
    result.ranks.assign(n, -1);

    // front(0): everything nobody dominates
    std::vector<int> current;
    for (int p = 0; p < n; ++p) {
        if (graph.domination_count[p] == 0) {
            result.ranks[p] = 0;
            current.push_back(p);
        }
    }

    // generate subsequent fronts
    /* pseudocode equivalent
    i = 0
    while front(i) is not empty:
        next_front = []
        for each p in front(i):
            for each q in p's dominated_solutions:
                decrement q's domination_count
                if q's domination_count == 0:
                    q's rank = i + 1
                    add q to next_front
        i++
    */
    int assigned = 0;
    int front_index = 0;
    while (!current.empty()) {
        assigned += static_cast<int>(current.size());
        std::vector<int> next_front;
        for (int p : current) {
            for (int q : graph.dominated_solutions[p]) {
                if (--graph.domination_count[q] == 0) {
                    result.ranks[q] = front_index + 1;
                    next_front.push_back(q);
                }
            }
        }
        // keep input order inside a front
        std::sort(next_front.begin(), next_front.end());
        result.fronts.push_back(std::move(current));
        current = std::move(next_front);
        ++front_index;
    }

    FRONTRANK_ENSURE(assigned == n, error_code::internal,
                     "fronts cover " + std::to_string(assigned) + " of " + std::to_string(n) + " solutions");

    logger()->debug("ranked {} solutions into {} fronts", n, result.fronts.size());
    return result;
}

// bare objective vectors, every solution feasible
inline ranking non_dominated_argsort(const std::vector<std::vector<double>>& objectives,
                                     const rank_options& options = rank_options()) {
    std::vector<individual> population;
    population.reserve(objectives.size());
    for (const std::vector<double>& obj : objectives) {
        population.emplace_back(obj);
    }
    return non_dominated_argsort(population, options);
}

// writes rank into every individual; on error nothing is written
inline ranking assign_ranks(std::vector<individual>& population,
                            const rank_options& options = rank_options()) {
    ranking result = non_dominated_argsort(population, options);
    for (std::size_t i = 0; i < population.size(); ++i) {
        population[i].rank = result.ranks[i];
    }
    return result;
}

// the Pareto-optimal subset of the population, in input order
inline std::vector<int> nondominated(const std::vector<individual>& population,
                                     const rank_options& options = rank_options()) {
    ranking result = non_dominated_argsort(population, options);
    if (result.fronts.empty()) return std::vector<int>();
    return result.fronts[0];
}

} // namespace frontrank

#endif // NDSORT_H
