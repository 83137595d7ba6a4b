#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "qa_matrix/config_loader.hpp"
#include "qa_matrix/engine.hpp"
#include "qa_matrix/errors.hpp"
#include "qa_matrix/matrix_writer.hpp"

using qa::matrix::ConfigLoader;
using qa::matrix::Declarations;
using qa::matrix::Engine;
using qa::matrix::MatrixWriter;
using qa::matrix::RunReport;
using qa::matrix::RunRequest;
using qa::matrix::Version;
using qa::matrix::VersionSelection;

namespace {

struct Args {
    std::filesystem::path config_path{};
    std::vector<std::string> sessions;
    std::vector<std::string> kinds;
    std::vector<std::string> primary;
    std::vector<std::string> secondary;
    std::vector<std::string> local_versions;
    std::optional<std::string> min_secondary;
    std::optional<std::string> max_secondary;
    std::filesystem::path summary_path{};
    std::filesystem::path github_output_path{};
    bool ci{false};
    bool github_actions{false};
    spdlog::level::level_enum log_level{spdlog::level::info};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "QA Matrix Generator\n"
        << "Usage:\n"
        << "  " << argv0 << " --config <file> [--session <name> ...] [--kind <kind> ...]\n"
        << "                 [--primary <v> ...] [--secondary <v> ...] [--local-version <v> ...]\n"
        << "                 [--min-secondary <v>] [--max-secondary <v>] [--summary <path>]\n"
        << "                 [--github-output <path>] [--ci] [-v|--verbose] [-q|--quiet]\n"
        << "\n"
        << "Options:\n"
        << "  --config         JSON declaration file (default: src_matrix/resources/qa_matrix.json).\n"
        << "  --session        Session to resolve; repeatable (default: the default sessions).\n"
        << "  --kind           sanity, units or integration; repeatable (default: declared kinds).\n"
        << "  --primary        Primary version to test, or 'all' (default: all).\n"
        << "  --secondary      Secondary version or alias to test, or 'all' (default: all).\n"
        << "  --local-version  Secondary version available in the local environment.\n"
        << "  --min-secondary  Lowest secondary version to keep.\n"
        << "  --max-secondary  Highest secondary version to keep.\n"
        << "  --summary        Write the JSON summary to this path (default: $QA_MATRIX_JSON).\n"
        << "  --github-output  Append GitHub output lines to this path (default: $GITHUB_OUTPUT).\n"
        << "  --ci             CI mode (also enabled by $CI).\n"
        << "  -v, --verbose    Debug logging.\n"
        << "  -q, --quiet      Errors only.\n"
        << "  -h, --help       Show this help message.\n"
        << std::endl;
}

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string{value};
}

std::string expect_value(int& i, int argc, char** argv, std::string_view option) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string{option} + " expects a value");
    }
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (tok == "-h" || tok == "--help") {
            args.help = true;
            break;
        } else if (tok == "--config") {
            args.config_path = expect_value(i, argc, argv, tok);
        } else if (tok == "--session") {
            args.sessions.push_back(expect_value(i, argc, argv, tok));
        } else if (tok == "--kind") {
            args.kinds.push_back(expect_value(i, argc, argv, tok));
        } else if (tok == "--primary") {
            args.primary.push_back(expect_value(i, argc, argv, tok));
        } else if (tok == "--secondary") {
            args.secondary.push_back(expect_value(i, argc, argv, tok));
        } else if (tok == "--local-version") {
            args.local_versions.push_back(expect_value(i, argc, argv, tok));
        } else if (tok == "--min-secondary") {
            args.min_secondary = expect_value(i, argc, argv, tok);
        } else if (tok == "--max-secondary") {
            args.max_secondary = expect_value(i, argc, argv, tok);
        } else if (tok == "--summary") {
            args.summary_path = expect_value(i, argc, argv, tok);
        } else if (tok == "--github-output") {
            args.github_output_path = expect_value(i, argc, argv, tok);
        } else if (tok == "--ci") {
            args.ci = true;
        } else if (tok == "-v" || tok == "--verbose") {
            args.log_level = spdlog::level::debug;
        } else if (tok == "-q" || tok == "--quiet") {
            args.log_level = spdlog::level::err;
        } else {
            throw std::runtime_error("Unknown argument: " + std::string{tok});
        }
    }

    if (args.config_path.empty()) {
        const auto fallback = std::filesystem::path("src_matrix/resources/qa_matrix.json");
        if (!std::filesystem::exists(fallback)) {
            throw std::runtime_error("No --config given and " + fallback.string() + " does not exist");
        }
        args.config_path = fallback;
    }

    // Environment is consulted here only; the engine receives explicit values.
    args.ci = args.ci || env("CI").has_value();
    args.github_actions = args.ci && env("GITHUB_ACTION").has_value();
    if (args.summary_path.empty()) {
        if (const auto path = env("QA_MATRIX_JSON")) {
            args.summary_path = *path;
        }
    }
    if (args.github_output_path.empty()) {
        if (const auto path = env("GITHUB_OUTPUT")) {
            args.github_output_path = *path;
        }
    }

    return args;
}

bool selects_all(const std::vector<std::string>& values) {
    for (const auto& value : values) {
        if (value == "all") {
            return true;
        }
    }
    return values.empty();
}

RunRequest build_request(const Args& args, const Declarations& declarations) {
    RunRequest request;
    request.sessions = args.sessions;
    for (const auto& kind : args.kinds) {
        request.kinds.push_back(qa::matrix::parse_test_kind(kind));
    }

    if (!selects_all(args.primary)) {
        std::set<Version> versions;
        for (const auto& text : args.primary) {
            versions.insert(Version::parse(text));
        }
        request.primary = VersionSelection::only(std::move(versions));
    }
    if (!selects_all(args.secondary)) {
        std::set<Version> versions;
        for (const auto& text : args.secondary) {
            versions.insert(declarations.table.parse_secondary(text));
        }
        request.secondary = VersionSelection::only(std::move(versions));
    }
    for (const auto& text : args.local_versions) {
        request.local_versions.insert(declarations.table.parse_secondary(text));
    }
    if (args.min_secondary) {
        request.min_secondary = declarations.table.parse_secondary(*args.min_secondary);
    }
    if (args.max_secondary) {
        request.max_secondary = declarations.table.parse_secondary(*args.max_secondary);
    }
    return request;
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        auto logger = spdlog::stderr_color_mt("qa-matrix");
        logger->set_level(args.log_level);
        spdlog::set_default_logger(logger);

        try {
            ConfigLoader loader;
            const auto declarations = loader.load(args.config_path);
            logger->debug("Loaded declarations from {}", declarations.source);

            Engine engine(Engine::Config{.logger = logger});
            const RunReport report = engine.run(declarations, build_request(args, declarations));

            MatrixWriter writer;
            try {
                if (!args.summary_path.empty()) {
                    logger->info("Writing JSON output to {}", args.summary_path.string());
                    writer.write_summary(args.summary_path, report);
                }
                if (!args.github_output_path.empty()) {
                    logger->info("Writing GitHub output to {}", args.github_output_path.string());
                    writer.write_github_output(args.github_output_path, report.documents);
                }
            } catch (const std::runtime_error& ex) {
                logger->error("Cannot write output: {}", ex.what());
                return 2; // output file problem
            }

            std::cout << writer.render_console(report, args.github_actions) << std::flush;
            return report.ok() ? 0 : 1;
        } catch (const qa::matrix::Error& ex) {
            logger->error("{}: {}", qa::matrix::to_string(ex.kind()), ex.what());
            return 2; // declaration or request problem
        }
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
