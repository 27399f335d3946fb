/* A solution of the population as seen by the non-dominated sort: an
evaluated objective vector, an optional constraint violation and the rank
written back by the sort. */
#ifndef INDIVIDUAL_H
#define INDIVIDUAL_H
#include <vector>
#include <utility>

namespace frontrank {

struct individual {
    std::vector<double> objectives; // objective values, all minimized
    double constraint_violation = 0.0; // 0 means feasible
    int rank = -1; // front index, -1 until ranked

    individual() = default;
    individual(std::vector<double> obj) : objectives(std::move(obj)) {}
    individual(std::vector<double> obj, double violation)
        : objectives(std::move(obj)), constraint_violation(violation) {}

    bool ranked() const { return rank >= 0; }
};

} // namespace frontrank

#endif // INDIVIDUAL_H
