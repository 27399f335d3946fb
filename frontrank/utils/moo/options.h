/* Knobs for a ranking call. Only the pairwise comparison stage is affected;
the resulting fronts are identical for every valid setting. */
#ifndef OPTIONS_H
#define OPTIONS_H

#include <string>

#include "errors.h"

namespace frontrank {

struct rank_options {
    // worker threads for the pairwise stage: 1 = serial, 0 = hardware concurrency
    int threads = 1;
    // populations below this size are always compared serially
    int parallel_threshold = 256;

    void validate_or_throw() const {
        FRONTRANK_ENSURE(threads >= 0, error_code::invalid_input,
                         "rank_options: threads must be >= 0, got " + std::to_string(threads));
        FRONTRANK_ENSURE(parallel_threshold >= 0, error_code::invalid_input,
                         "rank_options: parallel_threshold must be >= 0, got "
                             + std::to_string(parallel_threshold));
    }

    static rank_options serial() {
        return rank_options();
    }
};

} // namespace frontrank

#endif // OPTIONS_H
