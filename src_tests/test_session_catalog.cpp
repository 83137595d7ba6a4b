/**
 * @file test_session_catalog.cpp
 * @brief Unit tests for the standard QA session catalog
 *
 * Covers:
 * - session descriptions composed from the enabled tools
 * - lint meta session and its members
 * - ansible-test sessions derived from the compatibility table
 * - resolution of the default selection through the catalog
 */

#include <catch2/catch_test_macros.hpp>

#include "qa_matrix/compat_table.hpp"
#include "qa_matrix/errors.hpp"
#include "qa_matrix/session_catalog.hpp"
#include "qa_matrix/session_registry.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

using qa::matrix::AnsibleTestSessionConfig;
using qa::matrix::CompatibilityTable;
using qa::matrix::Error;
using qa::matrix::ErrorKind;
using qa::matrix::SessionGroup;
using qa::matrix::SessionsConfig;
using qa::matrix::Version;

namespace {

using Names = std::vector<std::string>;

Version v(const char* text) {
    return Version::parse(text);
}

CompatibilityTable small_table() {
    return CompatibilityTable({{v("3.9"), {v("2.14"), v("2.15")}, false},
                               {v("3.10"), {v("2.15"), v("2.16")}, false}},
                              {{"devel", v("2.16")}});
}

Names names_of(const qa::matrix::SessionRegistry& registry) {
    Names names;
    for (const auto& session : registry.sessions()) {
        names.push_back(session.name);
    }
    return names;
}

} // namespace

TEST_CASE("Descriptions list the enabled programs", "[catalog][description]") {
    const std::pair<std::string, std::string> prefix{"Run license checker:", "Run license checkers:"};

    REQUIRE(qa::matrix::compose_description(prefix, {{"reuse", ""}, {"license-check", "ensure GPLv3+ for plugins"}}) ==
            "Run license checkers: reuse and license-check (ensure GPLv3+ for plugins)");
    REQUIRE(qa::matrix::compose_description(prefix, {{"reuse", ""}, {"license-check", std::nullopt}}) ==
            "Run license checker: reuse");
    REQUIRE(qa::matrix::compose_description({"", ""}, {{"a", ""}, {"b", ""}, {"c", "x"}}) == "a, b, and c (x)");
    REQUIRE(qa::matrix::compose_description(prefix, {}) == "Run license checkers:");
}

TEST_CASE("Empty configuration only registers the matrix generator", "[catalog]") {
    const auto registry = qa::matrix::build_session_registry(SessionsConfig{}, small_table());
    REQUIRE(names_of(registry) == Names{"matrix-generator"});
    REQUIRE_FALSE(registry.at(0).is_default);
    REQUIRE(registry.at(0).description == "Generate matrix for CI systems.");
}

TEST_CASE("Lint meta session depends on the enabled lint sessions", "[catalog][lint]") {
    SessionsConfig config;
    config.lint = qa::matrix::LintSessionConfig{};

    const auto registry = qa::matrix::build_session_registry(config, small_table());
    const auto* lint = registry.find("lint");
    REQUIRE(lint != nullptr);
    REQUIRE(lint->is_default);
    REQUIRE(lint->depends_on == Names{"formatters", "codeqa", "yamllint", "typing"});
    REQUIRE(lint->description ==
            "Meta session for triggering the following sessions: formatters, codeqa, yamllint, and typing");
    REQUIRE(registry.find("formatters")->description == "Run code formatters: isort and black");
    REQUIRE(registry.find("formatters")->group == SessionGroup::Formatters);

    SECTION("disabled tools drop their sessions") {
        config.lint->run_isort = false;
        config.lint->run_black = false;
        config.lint->run_pylint = false;
        config.lint->run_mypy = false;
        const auto reduced = qa::matrix::build_session_registry(config, small_table());
        REQUIRE(reduced.find("formatters") == nullptr);
        REQUIRE(reduced.find("typing") == nullptr);
        REQUIRE(reduced.find("codeqa")->description == "Run code QA tool: flake8");
        REQUIRE(reduced.find("lint")->depends_on == Names{"codeqa", "yamllint"});
    }
}

TEST_CASE("Default selection resolves through the catalog", "[catalog][resolve]") {
    SessionsConfig config;
    config.lint = qa::matrix::LintSessionConfig{};
    config.lint->run_yamllint = false;
    config.license_check = qa::matrix::LicenseCheckSessionConfig{};
    config.docs_check = qa::matrix::DocsCheckSessionConfig{};
    config.docs_check->is_default = false;

    const auto registry = qa::matrix::build_session_registry(config, small_table());
    REQUIRE(qa::matrix::resolve_names(registry, {}) ==
            Names{"formatters", "codeqa", "typing", "lint", "license-check"});
}

TEST_CASE("ansible-test sessions follow the secondary axis", "[catalog][ansible_test]") {
    SessionsConfig config;
    config.ansible_test_sanity = AnsibleTestSessionConfig{};
    config.ansible_test_sanity->include_devel = true;

    const auto registry = qa::matrix::build_session_registry(config, small_table());
    REQUIRE(names_of(registry) == Names{"ansible-test-sanity-2.14", "ansible-test-sanity-2.15",
                                        "ansible-test-sanity-devel", "ansible-test-sanity",
                                        "matrix-generator"});
    REQUIRE(registry.find("ansible-test-sanity")->depends_on ==
            Names{"ansible-test-sanity-2.14", "ansible-test-sanity-2.15", "ansible-test-sanity-devel"});
    REQUIRE_FALSE(registry.find("ansible-test-sanity")->is_default);

    SECTION("bounds restrict the companion versions") {
        config.ansible_test_sanity->include_devel = false;
        config.ansible_test_sanity->bounds.min = v("2.15");
        const auto bounded = qa::matrix::build_session_registry(config, small_table());
        REQUIRE(bounded.find("ansible-test-sanity")->depends_on == Names{"ansible-test-sanity-2.15"});
    }
}

TEST_CASE("Integration sessions expand per companion and primary version", "[catalog][ansible_test]") {
    SessionsConfig config;
    config.ansible_test_integration = AnsibleTestSessionConfig{};

    SECTION("primary versions from the table") {
        const auto registry = qa::matrix::build_session_registry(config, small_table());
        REQUIRE(registry.find("ansible-test-integration-2.15")->depends_on ==
                Names{"ansible-test-integration-2.15-3.9", "ansible-test-integration-2.15-3.10"});
        REQUIRE(registry.find("ansible-test-integration")->depends_on ==
                Names{"ansible-test-integration-2.14", "ansible-test-integration-2.15"});
    }
    SECTION("primary versions overridden per companion") {
        config.ansible_test_integration->core_python_versions[v("2.15")] = {v("3.10")};
        const auto registry = qa::matrix::build_session_registry(config, small_table());
        REQUIRE(registry.find("ansible-test-integration-2.15")->depends_on ==
                Names{"ansible-test-integration-2.15-3.10"});
    }
    SECTION("controller interpreters only") {
        const CompatibilityTable table({{v("3.9"), {v("2.14"), v("2.15")}, false, {v("2.14")}},
                                        {v("3.10"), {v("2.15"), v("2.16")}, false, {v("2.15")}}},
                                       {{"devel", v("2.16")}});
        config.ansible_test_integration->controller_python_versions_only = true;

        const auto registry = qa::matrix::build_session_registry(config, table);
        REQUIRE(registry.find("ansible-test-integration-2.14")->depends_on ==
                Names{"ansible-test-integration-2.14-3.9"});
        REQUIRE(registry.find("ansible-test-integration-2.15")->depends_on ==
                Names{"ansible-test-integration-2.15-3.10"});

        config.ansible_test_integration->core_python_versions[v("2.15")] = {v("3.9"), v("3.10")};
        const auto overridden = qa::matrix::build_session_registry(config, table);
        REQUIRE(overridden.find("ansible-test-integration-2.15")->depends_on ==
                Names{"ansible-test-integration-2.15-3.9", "ansible-test-integration-2.15-3.10"});
    }
    SECTION("override naming an unknown version") {
        config.ansible_test_integration->core_python_versions[v("2.15")] = {v("2.7")};
        try {
            (void)qa::matrix::build_session_registry(config, small_table());
            FAIL("expected UnknownVersion");
        } catch (const Error& ex) {
            REQUIRE(ex.kind() == ErrorKind::UnknownVersion);
            REQUIRE(ex.context() == Names{"2.7"});
        }
    }
}

TEST_CASE("Remaining standard sessions", "[catalog]") {
    SessionsConfig config;
    config.extra_checks = qa::matrix::ExtraChecksSessionConfig{};
    config.extra_checks->run_action_groups = true;
    config.build_import_check = qa::matrix::BuildImportCheckSessionConfig{};
    config.build_import_check->run_galaxy_importer = false;
    config.ansible_lint = qa::matrix::AnsibleLintSessionConfig{};
    config.ansible_lint->strict = true;

    const auto registry = qa::matrix::build_session_registry(config, small_table());
    REQUIRE(registry.find("extra-checks")->description ==
            "Run extra checkers: no-unwanted-files (checks for unwanted files in plugins/) and "
            "action-groups (validate action groups)");
    REQUIRE(registry.find("build-import-check")->description ==
            "Run build and import checker: build-collection");
    REQUIRE(registry.find("ansible-lint")->description == "Run ansible-lint in strict mode");
    REQUIRE(registry.default_names() == Names{"extra-checks", "build-import-check", "ansible-lint"});
}
