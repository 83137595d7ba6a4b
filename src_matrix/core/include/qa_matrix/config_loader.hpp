#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "action_groups.hpp"
#include "compat_table.hpp"
#include "matrix_generator.hpp"
#include "session_catalog.hpp"
#include "session_registry.hpp"

namespace qa::matrix {

/**
 * \brief Matrix settings shared by every test kind of one invocation.
 */
struct MatrixSettings {
    std::vector<TestKind> kinds{TestKind::Sanity, TestKind::Units, TestKind::Integration};
    std::set<Version> local_versions{};
    VersionBounds secondary_bounds{};
};

/**
 * \brief Everything one declaration file provides, validated and typed.
 */
struct Declarations {
    std::string source;
    CompatibilityTable table{};
    SessionsConfig sessions{};
    std::vector<Session> custom_sessions{};
    std::vector<ActionGroup> action_groups{};
    std::vector<InventoryItem> inventory{};
    MatrixSettings matrix{};
};

/**
 * \brief Loads declarations from a JSON document.
 *
 * Top-level keys (all optional):
 *   - `compatibility`: `{ "entries": [ {"primary", "secondary": [...], "controller_only"} ],
 *                        "aliases": { "devel": "2.19" } }`. Absent: built-in table.
 *   - `sessions`: `lint`, `docs_check`, `license_check`, `extra_checks`,
 *                 `build_import_check`, `ansible_test_sanity`, `ansible_test_units`,
 *                 `ansible_test_integration`, `ansible_lint` sections.
 *   - `custom_sessions`: `[ {"name", "depends_on": [...], "default", "group", "description"} ]`.
 *   - `action_groups`: `[ {"name", "pattern", "required_attribute", "exclusions": [...]} ]`.
 *   - `inventory`: `[ {"name", "attributes": [...]} ]`.
 *   - `matrix`: `{ "kinds": [...], "local_versions": [...], "min_secondary", "max_secondary",
 *                  "except_secondary": [...] }`.
 *
 * Secondary versions accept table aliases (`devel`). Unknown keys are ignored. Type errors
 * throw `Error(InvalidConfig)`, malformed versions `Error(InvalidVersionFormat)`; both name
 * the source and the JSON path of the offending value.
 *
 * Example:
 * \code{.json}
 * {
 *   "compatibility": { "entries": [ { "primary": "3.9", "secondary": ["2.14", "2.15"] } ] },
 *   "sessions": { "lint": { "default": true, "run_mypy": false } },
 *   "action_groups": [ { "name": "docker", "pattern": "^docker_",
 *                        "required_attribute": "community.docker.attributes.actiongroup_docker" } ]
 * }
 * \endcode
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    [[nodiscard]] Declarations load(const std::filesystem::path& file) const;

    [[nodiscard]] Declarations parse(std::string_view text, const std::string& source) const;
};

}  // namespace qa::matrix
