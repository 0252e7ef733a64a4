#include "keel/alias.hpp"
#include "keel/artifact_cache.hpp"
#include "keel/engine.hpp"
#include "keel/manifest.hpp"
#include "keel/resolver.hpp"
#include "keel/target.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace keel;

namespace {

constexpr int EXIT_USAGE = 2;

void print_help() {
    std::cout << R"(keel - incremental build engine

USAGE:
    keel [OPTIONS] [TARGETS...]

With no targets every rule of the build file is built. A target is either
a full name (//path:name) or an alias declared with ALIAS|name|target.

OPTIONS:
    -f <file>       Build file (default: keel.build)
    -j <N>          Parallel jobs (default: number of CPU cores)
    -k              Keep going after a failure (default)
    --fail-fast     Stop dispatching after the first failure
    -n              Dry run: show what would be built
    -v              Verbose output (show every command)
    --clean         Remove generated outputs
    --graph         Print the dependency graph in DOT format
    -h, --help      Show this help message
)";
}

struct Options {
    EngineConfig config;
    bool clean = false;
    bool graph = false;
    bool jobs_set = false;
    bool keep_going_set = false;
    bool verbose_set = false;
    std::vector<std::string> targets;
};

// Returns false (after printing why) on a usage error.
bool parse_args(int argc, char **argv, Options &opts) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_help();
            std::exit(0);
        } else if (arg == "-f") {
            if (++i >= argc) {
                std::cerr << "keel: -f requires a file\n";
                return false;
            }
            opts.config.build_file = argv[i];
        } else if (arg.starts_with("-j")) {
            std::string_view value = arg.substr(2);
            if (value.empty()) {
                if (++i >= argc) {
                    std::cerr << "keel: -j requires a number\n";
                    return false;
                }
                value = argv[i];
            }
            size_t jobs = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
            if (ec != std::errc{} || ptr != value.data() + value.size()) {
                std::cerr << "keel: invalid job count: " << value << '\n';
                return false;
            }
            opts.config.jobs = jobs;
            opts.jobs_set = true;
        } else if (arg == "-k" || arg == "--keep-going") {
            opts.config.keep_going = true;
            opts.keep_going_set = true;
        } else if (arg == "--fail-fast") {
            opts.config.keep_going = false;
            opts.keep_going_set = true;
        } else if (arg == "-n" || arg == "--dry-run") {
            opts.config.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.config.verbose = true;
            opts.verbose_set = true;
        } else if (arg == "--clean") {
            opts.clean = true;
        } else if (arg == "--graph") {
            opts.graph = true;
        } else if (arg.starts_with("-")) {
            std::cerr << "keel: unknown option: " << arg << '\n';
            return false;
        } else {
            opts.targets.emplace_back(arg);
        }
    }
    return true;
}

} // namespace

int main(int argc, char **argv) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        return EXIT_USAGE;
    }

    auto manifest = parse_manifest_file(opts.config.build_file);
    if (!manifest) {
        std::cerr << "keel: " << to_string(manifest.error()) << '\n';
        return EXIT_USAGE;
    }

    // Build file definitions sit below command line flags.
    EngineConfig config = opts.config;
    if (auto res = apply_definitions(manifest->definitions, config); !res) {
        std::cerr << "keel: " << to_string(res.error()) << '\n';
        return EXIT_USAGE;
    }
    if (opts.jobs_set)
        config.jobs = opts.config.jobs;
    if (opts.keep_going_set)
        config.keep_going = opts.config.keep_going;
    if (opts.verbose_set)
        config.verbose = opts.config.verbose;

    auto aliases = AliasTable::create(*manifest);
    if (!aliases) {
        std::cerr << "keel: " << to_string(aliases.error()) << '\n';
        return EXIT_USAGE;
    }

    BuildRuleResolver resolver(config.out_dir);
    if (auto res = add_rules(*manifest, RuleKindRegistry::with_builtin_kinds(), resolver); !res) {
        std::cerr << "keel: " << to_string(res.error()) << '\n';
        return EXIT_USAGE;
    }

    auto graph = resolver.resolve();
    if (!graph) {
        std::cerr << "keel: " << to_string(graph.error()) << '\n';
        return EXIT_USAGE;
    }

    DirArtifactCache cache(config.cache_dir);
    BuildEngine engine(*graph, cache, config);

    if (opts.clean) {
        auto res = engine.clean();
        return res ? 0 : 1;
    }
    if (opts.graph) {
        auto res = engine.emit_graph(std::cout);
        return res ? 0 : 1;
    }

    BuildReport report;
    if (opts.targets.empty()) {
        report = engine.build_all();
    } else {
        std::vector<BuildTarget> targets;
        for (const auto &name : opts.targets) {
            auto target = aliases->resolve(name);
            if (!target) {
                std::cerr << "keel: " << to_string(target.error()) << '\n';
                return EXIT_USAGE;
            }
            targets.push_back(std::move(*target));
        }
        auto res = engine.build(targets);
        if (!res) {
            std::cerr << "keel: " << to_string(res.error()) << '\n';
            return EXIT_USAGE;
        }
        report = std::move(*res);
    }

    for (const auto &outcome : report.outcomes()) {
        if (outcome.state == RuleState::Blocked) {
            std::cerr << "  " << outcome.target.full_name() << ": not attempted (dependency "
                      << outcome.blocked_by->full_name() << " failed)\n";
        } else if (outcome.state == RuleState::Cancelled) {
            std::cerr << "  " << outcome.target.full_name() << ": not attempted (build stopped)\n";
        }
    }

    std::cout << "Built " << report.count(RuleState::Built) << ", reused " << report.count(RuleState::Reused)
              << ", failed " << report.count(RuleState::Failed) << ", not attempted "
              << report.count(RuleState::Blocked) + report.count(RuleState::Cancelled) << '\n';
    return report.exit_code();
}
