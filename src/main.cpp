/// @file src/main.cpp
/// @brief CEW CLI entry point.
///
/// Usage:
///   cew --evaluate <today.csv> [--tomorrow <csv>] [--settings <file>]
///       [--now <iso8601>] [--verbose]
///   cew --help

#include "cew/data_loader.hpp"
#include "cew/engine.hpp"
#include "cew/errors.hpp"
#include "cew/report.hpp"
#include "cew/time_utils.hpp"

#include <fmt/core.h>

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  cew --evaluate <today.csv> [options]   Select today's charge/discharge windows\n"
        "  cew --help                             Show this help\n"
        "\n"
        "Options:\n"
        "  --tomorrow <csv>    Tomorrow's prices; also prints tomorrow's plan\n"
        "  --settings <file>   key = value settings file\n"
        "  --now <iso8601>     Evaluation instant (default: current time)\n"
        "  --verbose           Diagnostics on stderr\n"
        "\n"
        "CSV format (header required):\n"
        "  start,value[,unit]   unit is kwh (default) or mwh\n"
    );
}

struct Options {
    std::string                evaluate;
    std::optional<std::string> tomorrow;
    std::optional<std::string> settings;
    std::optional<std::string> now;
    bool                       verbose = false;
};

/// Returns nullopt and prints the problem if the arguments are unusable.
std::optional<Options> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--evaluate") {
            auto v = value();
            if (!v) return std::nullopt;
            opts.evaluate = *v;
        } else if (arg == "--tomorrow") {
            opts.tomorrow = value();
            if (!opts.tomorrow) return std::nullopt;
        } else if (arg == "--settings") {
            opts.settings = value();
            if (!opts.settings) return std::nullopt;
        } else if (arg == "--now") {
            opts.now = value();
            if (!opts.now) return std::nullopt;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return std::nullopt;
        }
    }
    if (opts.evaluate.empty()) {
        fmt::print(stderr, "Error: --evaluate requires a CSV file path\n");
        return std::nullopt;
    }
    return opts;
}

/// Run today's (and optionally tomorrow's) evaluation.
/// Returns 0 on success, 1 on error.
int run_evaluate(const Options& opts) {
    cew::Settings settings;
    if (opts.settings) {
        auto loaded = cew::DataLoader::load_settings(*opts.settings);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot open settings file '{}'\n", *opts.settings);
            return 1;
        }
        settings = *loaded;
    }

    cew::Timestamp now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    if (opts.now) {
        const auto parsed = cew::time::parse_iso8601(*opts.now, settings.utc_offset);
        if (!parsed) {
            fmt::print(stderr, "Error: cannot parse --now '{}'\n", *opts.now);
            return 1;
        }
        now = *parsed;
    }

    const auto today = cew::DataLoader::load_csv(opts.evaluate, settings.utc_offset);
    if (!today) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", opts.evaluate);
        return 1;
    }
    cew::RawPriceSeries tomorrow;
    if (opts.tomorrow) {
        auto loaded = cew::DataLoader::load_csv(*opts.tomorrow, settings.utc_offset);
        if (!loaded) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *opts.tomorrow);
            return 1;
        }
        tomorrow = std::move(*loaded);
    }

    fmt::print("Loaded {} price points from '{}'\n", today->size(), opts.evaluate);

    cew::Engine engine(cew::EngineConfig{.verbose = opts.verbose});
    auto cache = engine.make_cache();

    const auto result = engine.evaluate(*today, tomorrow, settings, now, *cache);
    fmt::print("{}", cew::report::to_string(result, settings.utc_offset));

    if (opts.tomorrow) {
        const auto next = engine.evaluate_tomorrow(tomorrow, *today, settings, now, *cache);
        fmt::print("\n{}", cew::report::to_string(next, settings.utc_offset));
    }
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    const auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    try {
        return run_evaluate(*opts);
    } catch (const cew::InvalidSettings& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
    } catch (const cew::MalformedSeries& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
    }
    return 1;
}
