#include "qa_matrix/session_catalog.hpp"
#include "qa_matrix/errors.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

using qa::matrix::AnsibleTestSessionConfig;
using qa::matrix::CompatibilityTable;
using qa::matrix::Session;
using qa::matrix::SessionGroup;
using qa::matrix::SessionRegistry;
using qa::matrix::Version;

using Program = std::pair<std::string, std::optional<std::string>>;

std::optional<std::string> active_if(bool enabled, std::string detail = {}) {
    if (!enabled) {
        return std::nullopt;
    }
    return detail;
}

Session make_session(std::string name,
                     SessionGroup group,
                     bool is_default,
                     std::string description,
                     std::vector<std::string> depends_on = {}) {
    Session session;
    session.name = std::move(name);
    session.group = group;
    session.is_default = is_default;
    session.description = std::move(description);
    session.depends_on = std::move(depends_on);
    return session;
}

struct CompanionVersion {
    std::string label;  ///< Version string or alias name used in session names
    Version version;
};

// Concrete companion versions older than the development release, then milestone/devel.
std::vector<CompanionVersion> select_companions(const CompatibilityTable& table,
                                                const AnsibleTestSessionConfig& config) {
    std::vector<CompanionVersion> result;
    const auto& aliases = table.aliases();
    const auto devel = aliases.find("devel");
    const auto milestone = aliases.find("milestone");

    for (const auto& version : table.select_secondary(config.bounds)) {
        if (devel != aliases.end() && !(version < devel->second)) {
            continue;
        }
        result.push_back(CompanionVersion{version.to_string(), version});
    }
    if (config.include_milestone && milestone != aliases.end()) {
        result.push_back(CompanionVersion{milestone->first, milestone->second});
    }
    if (config.include_devel && devel != aliases.end()) {
        result.push_back(CompanionVersion{devel->first, devel->second});
    }
    return result;
}

void add_lint_sessions(SessionRegistry& registry, const qa::matrix::LintSessionConfig& lint) {
    std::vector<std::string> members;

    if (lint.run_isort || lint.run_black) {
        registry.add(make_session("formatters", SessionGroup::Formatters, false,
                                  qa::matrix::compose_description(
                                      {"Run code formatter:", "Run code formatters:"},
                                      {{"isort", active_if(lint.run_isort)},
                                       {"black", active_if(lint.run_black)}})));
        members.emplace_back("formatters");
    }
    if (lint.run_flake8 || lint.run_pylint) {
        registry.add(make_session("codeqa", SessionGroup::CodeQa, false,
                                  qa::matrix::compose_description(
                                      {"Run code QA tool:", "Run code QA tools:"},
                                      {{"flake8", active_if(lint.run_flake8)},
                                       {"pylint", active_if(lint.run_pylint)}})));
        members.emplace_back("codeqa");
    }
    if (lint.run_yamllint) {
        registry.add(make_session("yamllint", SessionGroup::CodeQa, false,
                                  "Run YAML checker: yamllint"));
        members.emplace_back("yamllint");
    }
    if (lint.run_mypy) {
        registry.add(make_session("typing", SessionGroup::Typing, false, "Run type checker: mypy"));
        members.emplace_back("typing");
    }
    if (lint.run_config_lint) {
        registry.add(make_session("antsibull-nox-config", SessionGroup::Custom, false,
                                  "Lint antsibull-nox config"));
        members.emplace_back("antsibull-nox-config");
    }

    std::vector<Program> programs;
    programs.reserve(members.size());
    for (const auto& member : members) {
        programs.emplace_back(member, std::string{});
    }
    registry.add(make_session(
        "lint", SessionGroup::CodeQa, lint.is_default,
        qa::matrix::compose_description({"Meta session for triggering the following session:",
                                         "Meta session for triggering the following sessions:"},
                                        programs),
        members));
}

void add_simple_test_sessions(SessionRegistry& registry,
                              const CompatibilityTable& table,
                              const AnsibleTestSessionConfig& config,
                              const std::string& kind,
                              const std::string& what) {
    std::vector<std::string> members;
    for (const auto& companion : select_companions(table, config)) {
        auto name = "ansible-test-" + kind + "-" + companion.label;
        registry.add(make_session(name, SessionGroup::Custom, false,
                                  "Run " + what + " with ansible-core " + companion.label +
                                      "'s ansible-test"));
        members.push_back(std::move(name));
    }
    registry.add(make_session("ansible-test-" + kind, SessionGroup::Custom, config.is_default,
                              "Meta session for running all ansible-test-" + kind + "-* sessions.",
                              std::move(members)));
}

std::vector<Version> integration_primaries(const CompatibilityTable& table,
                                           const AnsibleTestSessionConfig& config,
                                           const Version& companion) {
    const auto it = config.core_python_versions.find(companion);
    if (it == config.core_python_versions.end()) {
        return config.controller_python_versions_only ? table.controller_primaries_for(companion)
                                                      : table.primaries_for(companion);
    }
    auto primaries = it->second;
    std::sort(primaries.begin(), primaries.end());
    primaries.erase(std::unique(primaries.begin(), primaries.end()), primaries.end());
    return primaries;
}

void check_core_python_versions(const CompatibilityTable& table, const AnsibleTestSessionConfig& config) {
    const auto companions = table.secondary_versions();
    for (const auto& [companion, primaries] : config.core_python_versions) {
        if (!std::binary_search(companions.begin(), companions.end(), companion)) {
            throw qa::matrix::Error(qa::matrix::ErrorKind::UnknownVersion,
                                    "core_python_versions names unknown companion version " +
                                        companion.to_string(),
                                    {companion.to_string()});
        }
        for (const auto& primary : primaries) {
            if (!table.contains(primary)) {
                throw qa::matrix::Error(qa::matrix::ErrorKind::UnknownVersion,
                                        "core_python_versions names unknown primary version " +
                                            primary.to_string(),
                                        {primary.to_string()});
            }
        }
    }
}

void add_integration_sessions(SessionRegistry& registry,
                              const CompatibilityTable& table,
                              const AnsibleTestSessionConfig& config) {
    check_core_python_versions(table, config);

    std::vector<std::string> per_companion;
    for (const auto& companion : select_companions(table, config)) {
        const auto base = "ansible-test-integration-" + companion.label;
        std::vector<std::string> members;
        for (const auto& primary : integration_primaries(table, config, companion.version)) {
            auto name = base + "-" + primary.to_string();
            registry.add(make_session(name, SessionGroup::Custom, false,
                                      "Run integration tests from ansible-core " + companion.label +
                                          "'s ansible-test with Python " + primary.to_string()));
            members.push_back(std::move(name));
        }
        if (members.empty()) {
            continue;
        }
        registry.add(make_session(base, SessionGroup::Custom, false,
                                  "Meta session for running all " + base + "-* sessions.",
                                  std::move(members)));
        per_companion.push_back(base);
    }
    registry.add(make_session("ansible-test-integration", SessionGroup::Custom, config.is_default,
                              "Meta session for running all ansible-test-integration-* sessions.",
                              std::move(per_companion)));
}

}  // namespace

namespace qa::matrix {

std::string compose_description(const std::pair<std::string, std::string>& prefix,
                                const std::vector<std::pair<std::string, std::optional<std::string>>>& programs) {
    std::string result;
    auto add = [&result](const std::string& text, bool comma) {
        if (!result.empty()) {
            result += comma ? ", " : " ";
        }
        result += text;
    };

    std::vector<const Program*> active;
    for (const auto& program : programs) {
        if (program.second) {
            active.push_back(&program);
        }
    }

    const auto& chosen = active.size() == 1 ? prefix.first : prefix.second;
    if (!chosen.empty()) {
        add(chosen, false);
    }

    for (std::size_t index = 0; index < active.size(); ++index) {
        const auto& [program, detail] = *active[index];
        const bool last = index + 1 == active.size();
        if (last && index > 0) {
            add("and", index > 1);
        }
        add(program, index > 0 && !last);
        if (!detail->empty()) {
            add("(" + *detail + ")", false);
        }
    }
    return result;
}

SessionRegistry build_session_registry(const SessionsConfig& config, const CompatibilityTable& table) {
    SessionRegistry registry;

    if (config.lint) {
        add_lint_sessions(registry, *config.lint);
    }
    if (config.docs_check) {
        std::string description = "Run 'antsibull-docs lint-collection-docs'";
        if (config.docs_check->validate_collection_refs) {
            description += " (validate collection refs: " + *config.docs_check->validate_collection_refs + ")";
        }
        registry.add(make_session("docs-check", SessionGroup::Docs, config.docs_check->is_default,
                                  std::move(description)));
    }
    if (config.license_check) {
        const auto& license = *config.license_check;
        registry.add(make_session(
            "license-check", SessionGroup::License, license.is_default,
            compose_description({"Run license checker:", "Run license checkers:"},
                                {{"reuse", active_if(license.run_reuse)},
                                 {"license-check",
                                  active_if(license.run_license_check, "ensure GPLv3+ for plugins")}})));
    }
    if (config.extra_checks) {
        const auto& extra = *config.extra_checks;
        registry.add(make_session(
            "extra-checks", SessionGroup::Extra, extra.is_default,
            compose_description({"Run extra checker:", "Run extra checkers:"},
                                {{"no-unwanted-files",
                                  active_if(extra.run_no_unwanted_files, "checks for unwanted files in plugins/")},
                                 {"action-groups", active_if(extra.run_action_groups, "validate action groups")}})));
    }
    if (config.build_import_check) {
        const auto& build = *config.build_import_check;
        registry.add(make_session(
            "build-import-check", SessionGroup::Build, build.is_default,
            compose_description({"Run build and import checker:", "Run build and import checkers:"},
                                {{"build-collection", active_if(true)},
                                 {"galaxy-importer",
                                  active_if(build.run_galaxy_importer,
                                            "test whether Galaxy will import built collection")}})));
    }
    if (config.ansible_test_sanity) {
        add_simple_test_sessions(registry, table, *config.ansible_test_sanity, "sanity", "sanity tests");
    }
    if (config.ansible_test_units) {
        add_simple_test_sessions(registry, table, *config.ansible_test_units, "units", "unit tests");
    }
    if (config.ansible_test_integration) {
        add_integration_sessions(registry, table, *config.ansible_test_integration);
    }
    if (config.ansible_lint) {
        registry.add(make_session("ansible-lint", SessionGroup::Custom, config.ansible_lint->is_default,
                                  config.ansible_lint->strict ? "Run ansible-lint in strict mode"
                                                              : "Run ansible-lint"));
    }

    registry.add(make_session("matrix-generator", SessionGroup::Custom, false,
                              "Generate matrix for CI systems."));
    return registry;
}

}  // namespace qa::matrix
