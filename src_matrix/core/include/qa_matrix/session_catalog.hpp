#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "compat_table.hpp"
#include "session_registry.hpp"
#include "version.hpp"

namespace qa::matrix {

struct LintSessionConfig {
    bool is_default{true};
    bool run_isort{true};
    bool run_black{true};
    bool run_flake8{true};
    bool run_pylint{true};
    bool run_yamllint{true};
    bool run_mypy{true};
    bool run_config_lint{false};
};

struct DocsCheckSessionConfig {
    bool is_default{true};
    std::optional<std::string> validate_collection_refs{};  ///< `self`, `dependent` or `all`
};

struct LicenseCheckSessionConfig {
    bool is_default{true};
    bool run_reuse{true};
    bool run_license_check{true};
};

struct ExtraChecksSessionConfig {
    bool is_default{true};
    bool run_no_unwanted_files{true};
    bool run_action_groups{false};
};

struct BuildImportCheckSessionConfig {
    bool is_default{true};
    bool run_galaxy_importer{true};
};

/**
 * \brief Which companion versions get their own ansible-test session.
 */
struct AnsibleTestSessionConfig {
    bool is_default{false};
    bool include_devel{false};
    bool include_milestone{false};
    VersionBounds bounds{};
    /// Integration only: primary versions to use for a given companion version.
    std::map<Version, std::vector<Version>> core_python_versions{};
    /// Integration only: without an explicit list, use controller-capable primaries only.
    bool controller_python_versions_only{false};
};

struct AnsibleLintSessionConfig {
    bool is_default{true};
    bool strict{false};
};

/**
 * \brief Declarative session section. Absent sections add no sessions.
 */
struct SessionsConfig {
    std::optional<LintSessionConfig> lint{};
    std::optional<DocsCheckSessionConfig> docs_check{};
    std::optional<LicenseCheckSessionConfig> license_check{};
    std::optional<ExtraChecksSessionConfig> extra_checks{};
    std::optional<BuildImportCheckSessionConfig> build_import_check{};
    std::optional<AnsibleTestSessionConfig> ansible_test_sanity{};
    std::optional<AnsibleTestSessionConfig> ansible_test_units{};
    std::optional<AnsibleTestSessionConfig> ansible_test_integration{};
    std::optional<AnsibleLintSessionConfig> ansible_lint{};
};

/**
 * \brief Joins program names into a session description.
 *
 * Programs mapped to `std::nullopt` are inactive and skipped; an empty string means
 * "active, no detail". The prefix is chosen by the number of active programs:
 * `("Run extra checker:", "Run extra checkers:")`.
 *
 * \code
 * compose_description({"Run license checker:", "Run license checkers:"},
 *                     {{"reuse", ""}, {"license-check", "ensure GPLv3+ for plugins"}});
 * // "Run license checkers: reuse and license-check (ensure GPLv3+ for plugins)"
 * \endcode
 */
[[nodiscard]] std::string compose_description(
    const std::pair<std::string, std::string>& prefix,
    const std::vector<std::pair<std::string, std::optional<std::string>>>& programs);

/**
 * \brief Builds the registry of standard QA sessions plus the matrix-generator session.
 *
 * ansible-test sessions are derived from the secondary axis of `table`: one session per
 * selected companion version and a meta session depending on all of them. Throws
 * `Error(UnknownVersion)` when `core_python_versions` names a version not in the table.
 */
[[nodiscard]] SessionRegistry build_session_registry(const SessionsConfig& config,
                                                     const CompatibilityTable& table);

}  // namespace qa::matrix
