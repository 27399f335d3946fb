/* Pareto dominance between two solutions, all objectives minimized.
a dominates b iff a is no worse than b in every objective and strictly better
in at least one. Identical objective vectors dominate neither way.
Any NaN objective on either side makes the pair mutually non-dominated,
whatever the constraint violations are. Otherwise, when the violations differ
the smaller violation wins outright; with equal violations (both feasible in
the usual case) objectives decide. */
#ifndef DOMINANCE_H
#define DOMINANCE_H

#include <cmath>
#include <vector>
#include "individual.hpp"

namespace frontrank {

enum class dominance { a_dominates, b_dominates, non_dominated };

inline bool has_nan(const std::vector<double>& objectives) {
    for (double v : objectives) {
        if (std::isnan(v)) return true;
    }
    return false;
}

// objective-only relation; callers guarantee equal sizes
inline bool dominates(const std::vector<double>& a, const std::vector<double>& b) {
    // complexity: O(M) where M is the number of objectives
    if (has_nan(a) || has_nan(b)) return false;
    bool one_better = false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (a[i] > b[i]) {
            return false; // b is better somewhere
        } else if (a[i] < b[i]) {
            one_better = true;
        }
    }
    return one_better;
}

inline bool dominates(const individual& a, const individual& b) {
    if (has_nan(a.objectives) || has_nan(b.objectives)) return false;
    if (a.constraint_violation != b.constraint_violation) {
        return a.constraint_violation < b.constraint_violation;
    }
    return dominates(a.objectives, b.objectives);
}

inline dominance compare_dominance(const individual& a, const individual& b) {
    if (dominates(a, b)) return dominance::a_dominates;
    if (dominates(b, a)) return dominance::b_dominates;
    return dominance::non_dominated;
}

} // namespace frontrank

#endif // DOMINANCE_H
