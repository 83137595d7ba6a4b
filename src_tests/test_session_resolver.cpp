/**
 * @file test_session_resolver.cpp
 * @brief Unit tests for session registration and dependency resolution
 */

#include <catch2/catch_test_macros.hpp>

#include "qa_matrix/errors.hpp"
#include "qa_matrix/session_registry.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using qa::matrix::Error;
using qa::matrix::ErrorKind;
using qa::matrix::Session;
using qa::matrix::SessionGroup;
using qa::matrix::SessionRegistry;

namespace {

Session session(std::string name, std::vector<std::string> depends_on = {}, bool is_default = false) {
    Session result;
    result.name = std::move(name);
    result.depends_on = std::move(depends_on);
    result.is_default = is_default;
    return result;
}

SessionRegistry lint_registry() {
    return SessionRegistry({
        session("formatters"),
        session("codeqa"),
        session("typing"),
        session("lint", {"formatters", "codeqa", "typing"}, true),
        session("docs-check"),
    });
}

using Names = std::vector<std::string>;

} // namespace

TEST_CASE("Empty request resolves the default sessions with dependencies first", "[sessions]") {
    REQUIRE(qa::matrix::resolve_names(lint_registry(), {}) == Names{"formatters", "codeqa", "typing", "lint"});
}

TEST_CASE("Explicit request is expanded in request order", "[sessions]") {
    const auto registry = lint_registry();
    REQUIRE(qa::matrix::resolve_names(registry, {"docs-check", "lint"}) ==
            Names{"docs-check", "formatters", "codeqa", "typing", "lint"});
    REQUIRE(qa::matrix::resolve_names(registry, {"typing"}) == Names{"typing"});
}

TEST_CASE("Shared dependencies appear once", "[sessions]") {
    const SessionRegistry registry({
        session("base"),
        session("a", {"base"}),
        session("b", {"base", "a"}),
    });
    REQUIRE(qa::matrix::resolve_names(registry, {"b", "a", "base"}) == Names{"base", "a", "b"});
}

TEST_CASE("Resolution is idempotent", "[sessions]") {
    const auto registry = lint_registry();
    const auto first = qa::matrix::resolve_names(registry, {"lint"});
    REQUIRE(qa::matrix::resolve_names(registry, first) == first);
}

TEST_CASE("Resolved sessions carry their declarations", "[sessions]") {
    auto registry = lint_registry();
    auto custom = session("changelog", {"lint"});
    custom.group = SessionGroup::Extra;
    custom.description = "Validate changelog fragments";
    registry.add(custom);

    const auto resolved = qa::matrix::resolve(registry, {"changelog"});
    REQUIRE(resolved.size() == 5);
    REQUIRE(resolved.back().name == "changelog");
    REQUIRE(resolved.back().group == SessionGroup::Extra);
    REQUIRE(resolved.back().description == "Validate changelog fragments");
}

TEST_CASE("Dependency cycles are reported with their path", "[sessions][error]") {
    const SessionRegistry registry({
        session("A", {"B"}),
        session("B", {"A"}),
    });
    try {
        (void)qa::matrix::resolve(registry, {"A"});
        FAIL("expected SessionCycle");
    } catch (const Error& ex) {
        REQUIRE(ex.kind() == ErrorKind::SessionCycle);
        REQUIRE(ex.context() == Names{"A", "B", "A"});
        REQUIRE(std::string{ex.what()} == "Session dependency cycle: A -> B -> A");
    }

    SECTION("requested from the other end") {
        try {
            (void)qa::matrix::resolve(registry, {"B"});
            FAIL("expected SessionCycle");
        } catch (const Error& ex) {
            REQUIRE(ex.context() == Names{"B", "A", "B"});
        }
    }
    SECTION("self dependency") {
        const SessionRegistry self({session("loop", {"loop"})});
        try {
            (void)qa::matrix::resolve(self, {"loop"});
            FAIL("expected SessionCycle");
        } catch (const Error& ex) {
            REQUIRE(ex.kind() == ErrorKind::SessionCycle);
            REQUIRE(ex.context() == Names{"loop", "loop"});
        }
    }
}

TEST_CASE("Cycle reached through a longer chain reports only the cycle", "[sessions][error]") {
    const SessionRegistry registry({
        session("entry", {"x"}),
        session("x", {"y"}),
        session("y", {"z"}),
        session("z", {"x"}),
    });
    try {
        (void)qa::matrix::resolve(registry, {"entry"});
        FAIL("expected SessionCycle");
    } catch (const Error& ex) {
        REQUIRE(ex.context() == Names{"x", "y", "z", "x"});
    }
}

TEST_CASE("Unknown sessions are rejected", "[sessions][error]") {
    const auto registry = lint_registry();

    SECTION("every unknown requested name is listed") {
        try {
            (void)qa::matrix::resolve(registry, {"lint", "nope", "missing"});
            FAIL("expected UnknownSession");
        } catch (const Error& ex) {
            REQUIRE(ex.kind() == ErrorKind::UnknownSession);
            REQUIRE(ex.context() == Names{"nope", "missing"});
        }
    }
    SECTION("unknown dependency names the dependant") {
        const SessionRegistry broken({session("lint", {"formatters"})});
        try {
            (void)qa::matrix::resolve(broken, {"lint"});
            FAIL("expected UnknownSession");
        } catch (const Error& ex) {
            REQUIRE(ex.kind() == ErrorKind::UnknownSession);
            REQUIRE(ex.context() == Names{"formatters", "lint"});
        }
    }
}

TEST_CASE("Registry rejects duplicate and empty names", "[sessions][error]") {
    auto registry = lint_registry();
    REQUIRE_THROWS_AS(registry.add(session("lint")), Error);
    REQUIRE_THROWS_AS(registry.add(session("")), Error);
    REQUIRE(registry.size() == 5);
    REQUIRE(registry.index_of("typing") == std::size_t{2});
    REQUIRE(registry.find("absent") == nullptr);
}

TEST_CASE("Session groups round-trip through their names", "[sessions]") {
    REQUIRE(qa::matrix::parse_session_group("codeqa") == SessionGroup::CodeQa);
    REQUIRE(qa::matrix::to_string(SessionGroup::License) == "license");
    REQUIRE_THROWS_AS(qa::matrix::parse_session_group("misc"), Error);
}
