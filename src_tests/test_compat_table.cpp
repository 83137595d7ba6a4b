/**
 * @file test_compat_table.cpp
 * @brief Unit tests for the version compatibility table
 *
 * Covers:
 * - ordering and invariant checks on construction
 * - secondary axis queries, bounds and aliases
 * - the built-in ansible-core / Python table
 */

#include <catch2/catch_test_macros.hpp>

#include "qa_matrix/compat_table.hpp"
#include "qa_matrix/errors.hpp"

#include <set>
#include <vector>

using qa::matrix::CompatibilityEntry;
using qa::matrix::CompatibilityTable;
using qa::matrix::Error;
using qa::matrix::ErrorKind;
using qa::matrix::Version;
using qa::matrix::VersionBounds;

namespace {

Version v(const char* text) {
    return Version::parse(text);
}

CompatibilityTable sample_table() {
    return CompatibilityTable({{v("3.10"), {v("2.15"), v("2.16")}, false},
                               {v("3.9"), {v("2.14"), v("2.15")}, false}},
                              {{"devel", v("2.16")}});
}

} // namespace

TEST_CASE("Compatibility table sorts entries by primary version", "[compat]") {
    const auto table = sample_table();
    REQUIRE(table.primary_versions() == std::vector<Version>{v("3.9"), v("3.10")});
    REQUIRE(table.contains(v("3.9")));
    REQUIRE_FALSE(table.contains(v("2.7")));
    REQUIRE(table.find(v("3.8")) == nullptr);
}

TEST_CASE("Secondary axis queries", "[compat]") {
    const auto table = sample_table();
    REQUIRE(table.secondary_versions() == std::vector<Version>{v("2.14"), v("2.15"), v("2.16")});
    REQUIRE(table.primaries_for(v("2.15")) == std::vector<Version>{v("3.9"), v("3.10")});
    REQUIRE(table.primaries_for(v("2.16")) == std::vector<Version>{v("3.10")});
    REQUIRE(table.primaries_for(v("2.99")).empty());

    VersionBounds bounds;
    bounds.min = v("2.15");
    REQUIRE(table.select_secondary(bounds) == std::vector<Version>{v("2.15"), v("2.16")});
    bounds.except = {v("2.16")};
    REQUIRE(table.select_secondary(bounds) == std::vector<Version>{v("2.15")});
}

TEST_CASE("Aliases resolve on the secondary axis", "[compat][alias]") {
    const auto table = sample_table();
    REQUIRE(table.parse_secondary("devel") == v("2.16"));
    REQUIRE(table.parse_secondary("2.14") == v("2.14"));
    REQUIRE_THROWS_AS(table.parse_secondary("stable"), Error);
}

TEST_CASE("Compatibility table rejects inconsistent declarations", "[compat][error]") {
    SECTION("duplicate primary") {
        try {
            CompatibilityTable table({{v("3.9"), {v("2.14")}, false}, {v("3.9"), {v("2.15")}, false}});
            FAIL("expected InvalidConfig");
        } catch (const Error& ex) {
            REQUIRE(ex.kind() == ErrorKind::InvalidConfig);
        }
    }
    SECTION("empty secondary set without controller_only") {
        REQUIRE_THROWS_AS(CompatibilityTable({{v("3.9"), {}, false}}), Error);
        REQUIRE_NOTHROW(CompatibilityTable({{v("3.9"), {}, true}}));
    }
    SECTION("controller version missing from the secondary set") {
        REQUIRE_THROWS_AS(CompatibilityTable({{v("3.9"), {v("2.14")}, false, {v("2.15")}}}), Error);
    }
    SECTION("alias pointing outside the table") {
        REQUIRE_THROWS_AS(CompatibilityTable({{v("3.9"), {v("2.14")}, false}}, {{"devel", v("2.99")}}), Error);
    }
}

TEST_CASE("Built-in table covers released ansible-core versions", "[compat][builtin]") {
    const auto table = qa::matrix::builtin_compatibility_table();
    REQUIRE_FALSE(table.entries().empty());

    const auto* py39 = table.find(v("3.9"));
    REQUIRE(py39 != nullptr);
    REQUIRE(py39->secondary_versions.count(v("2.15")) == 1);
    REQUIRE(py39->secondary_versions.count(v("2.9")) == 0);

    const auto devel = table.parse_secondary("devel");
    REQUIRE_FALSE(table.primaries_for(devel).empty());
    REQUIRE(table.aliases().count("milestone") == 1);
}

TEST_CASE("Built-in table records controller interpreters", "[compat][builtin][controller]") {
    const auto table = qa::matrix::builtin_compatibility_table();

    REQUIRE(table.controller_primaries_for(v("2.15")) == std::vector<Version>{v("3.9"), v("3.10"), v("3.11")});
    REQUIRE(table.controller_primaries_for(v("2.19")) == std::vector<Version>{v("3.11"), v("3.12"), v("3.13")});
    REQUIRE(table.primaries_for(v("2.15")).size() > table.controller_primaries_for(v("2.15")).size());

    const auto* py27 = table.find(v("2.7"));
    REQUIRE(py27 != nullptr);
    REQUIRE(py27->controller_secondary_versions == std::set<Version>{v("2.9"), v("2.10"), v("2.11")});
    REQUIRE(table.find(v("2.6"))->controller_secondary_versions.empty());
}
