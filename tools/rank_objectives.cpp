#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

#include "frontrank/utils/moo/ndsort.h"
#include "tools/objective_reader.h"

static void usage(const char* prog) {
    std::cerr << "usage: " << prog
              << " [--threads N] [--parallel-threshold N] [--log-level LEVEL] [FILE]\n"
              << "reads one solution per line (objectives separated by commas or spaces)\n"
              << "from FILE or stdin and prints index,rank\n";
}

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    frontrank::rank_options options;
    std::string path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--threads" || arg == "--parallel-threshold" || arg == "--log-level") && i + 1 >= argc) {
            usage(argv[0]);
            return 2;
        }
        if (arg == "--threads") {
            if (!frontrank::parse_int(argv[++i], options.threads)) { usage(argv[0]); return 2; }
        } else if (arg == "--parallel-threshold") {
            if (!frontrank::parse_int(argv[++i], options.parallel_threshold)) { usage(argv[0]); return 2; }
        } else if (arg == "--log-level") {
            spdlog::level::level_enum lvl = spdlog::level::info;
            if (!frontrank::parse_log_level(argv[++i], lvl)) {
                std::cerr << "unknown log level '" << argv[i] << "'\n";
                usage(argv[0]);
                return 2;
            }
            frontrank::logger()->set_level(lvl);
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            usage(argv[0]);
            return 2;
        } else if (path.empty()) {
            path = arg;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    try {
        std::vector<std::vector<double>> objectives;
        if (path.empty()) {
            objectives = frontrank::read_objectives(std::cin);
        } else {
            std::ifstream file(path);
            if (!file) {
                frontrank::logger()->error("cannot open {}", path);
                return 2;
            }
            objectives = frontrank::read_objectives(file);
        }

        frontrank::ranking result = frontrank::non_dominated_argsort(objectives, options);

        std::cout << "index,rank\n";
        for (std::size_t i = 0; i < result.ranks.size(); ++i) {
            std::cout << i << "," << result.ranks[i] << "\n";
        }
        frontrank::logger()->info("{} solutions, {} fronts", result.ranks.size(), result.fronts.size());
    } catch (const frontrank::rank_error& e) {
        frontrank::logger()->error("{}", e.message());
        return 1;
    }

    return 0;
}
