#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include "config_loader.hpp"
#include "errors.hpp"
#include "matrix_generator.hpp"

namespace qa::matrix {

/**
 * \brief What one invocation asks for, on top of the loaded declarations.
 */
struct RunRequest {
    std::vector<std::string> sessions{};     ///< Empty: default sessions
    std::vector<TestKind> kinds{};           ///< Empty: kinds from the declarations
    VersionSelection primary{};
    VersionSelection secondary{};
    std::set<Version> local_versions{};      ///< Merged with the declared local versions
    std::optional<Version> min_secondary{};  ///< Overrides the declared bound
    std::optional<Version> max_secondary{};
};

struct RunReport {
    std::vector<MatrixDocument> documents;
    std::vector<std::string> sessions;
    std::vector<ValidationError> validation_errors;
    bool action_groups_checked{false};

    [[nodiscard]] bool ok() const noexcept { return validation_errors.empty(); }
};

/**
 * \brief Runs matrix generation, session resolution and action-group validation for one
 * set of declarations.
 *
 * Action groups are validated only when the extra-checks section enables them.
 * Errors from the components propagate unchanged; a run either produces a complete
 * report or throws.
 */
class Engine {
public:
    struct Config {
        std::shared_ptr<spdlog::logger> logger{spdlog::default_logger()};
    };

    explicit Engine(Config config);

    [[nodiscard]] RunReport run(const Declarations& declarations, const RunRequest& request) const;

    [[nodiscard]] SessionRegistry registry_for(const Declarations& declarations) const;

    [[nodiscard]] std::vector<MatrixRequest> requests_for(const Declarations& declarations,
                                                          const RunRequest& request) const;

private:
    Config config_;
};

}  // namespace qa::matrix
