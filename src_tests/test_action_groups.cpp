/**
 * @file test_action_groups.cpp
 * @brief Unit tests for action-group validation
 *
 * Covers:
 * - consistent declarations produce an empty report
 * - MissingAttribute, StaleExclusion and UnexpectedGroupMembership findings
 * - pattern anchoring and invalid patterns
 */

#include <catch2/catch_test_macros.hpp>

#include "qa_matrix/action_groups.hpp"
#include "qa_matrix/errors.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

using qa::matrix::ActionGroup;
using qa::matrix::Error;
using qa::matrix::ErrorKind;
using qa::matrix::InventoryItem;

namespace {

const std::string kAttribute = "action_group.docker";

std::vector<ActionGroup> docker_group(std::set<std::string> exclusions = {}) {
    return {ActionGroup("docker", "^docker_", kAttribute, std::move(exclusions))};
}

InventoryItem item(std::string name, bool declares) {
    InventoryItem result;
    result.name = std::move(name);
    if (declares) {
        result.attributes.insert(kAttribute);
    }
    return result;
}

} // namespace

TEST_CASE("Consistent declarations validate cleanly", "[action_groups]") {
    const std::vector<InventoryItem> inventory = {
        item("docker_container", true),
        item("docker_image", true),
        item("docker_context_info", false),
        item("current_container_facts", false),
    };
    REQUIRE(qa::matrix::validate(docker_group({"docker_context_info"}), inventory).empty());
}

TEST_CASE("Dropping a needed exclusion yields exactly one finding", "[action_groups]") {
    const std::vector<InventoryItem> inventory = {
        item("docker_container", true),
        item("docker_context_info", false),
    };
    REQUIRE(qa::matrix::validate(docker_group({"docker_context_info"}), inventory).empty());

    const auto errors = qa::matrix::validate(docker_group(), inventory);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors.front().kind == ErrorKind::MissingAttribute);
    REQUIRE(errors.front().item == "docker_context_info");
}

TEST_CASE("Member without the attribute is reported once", "[action_groups]") {
    const std::vector<InventoryItem> inventory = {
        item("docker_container", true),
        item("docker_network", false),
    };
    const auto errors = qa::matrix::validate(docker_group(), inventory);

    REQUIRE(errors.size() == 1);
    REQUIRE(errors.front().kind == ErrorKind::MissingAttribute);
    REQUIRE(errors.front().item == "docker_network");
    REQUIRE(errors.front().group == "docker");
    REQUIRE(errors.front().message.find(kAttribute) != std::string::npos);
}

TEST_CASE("Excluded item declaring the attribute is accepted", "[action_groups]") {
    const std::vector<InventoryItem> inventory = {item("docker_login", true)};
    REQUIRE(qa::matrix::validate(docker_group({"docker_login"}), inventory).empty());
}

TEST_CASE("Stale exclusions are reported", "[action_groups]") {
    SECTION("exclusion that does not match the pattern") {
        const std::vector<InventoryItem> inventory = {item("podman_container", false)};
        const auto errors = qa::matrix::validate(docker_group({"podman_container"}), inventory);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors.front().kind == ErrorKind::StaleExclusion);
        REQUIRE(errors.front().item == "podman_container");
        REQUIRE(errors.front().group == "docker");
    }
    SECTION("exclusion naming no inventory item") {
        const std::vector<InventoryItem> inventory = {item("docker_container", true)};
        const auto errors = qa::matrix::validate(docker_group({"docker_removed"}), inventory);
        REQUIRE(errors.size() == 1);
        REQUIRE(errors.front().kind == ErrorKind::StaleExclusion);
        REQUIRE(errors.front().item == "docker_removed");
    }
}

TEST_CASE("Attribute outside the pattern is an unexpected membership", "[action_groups]") {
    const std::vector<InventoryItem> inventory = {item("podman_image", true)};
    const auto errors = qa::matrix::validate(docker_group(), inventory);
    REQUIRE(errors.size() == 1);
    REQUIRE(errors.front().kind == ErrorKind::UnexpectedGroupMembership);
    REQUIRE(errors.front().item == "podman_image");
}

TEST_CASE("Findings follow inventory order and cover every item", "[action_groups]") {
    const std::vector<InventoryItem> inventory = {
        item("podman_image", true),
        item("docker_volume", false),
        item("docker_swarm", false),
    };
    const auto errors = qa::matrix::validate(docker_group(), inventory);
    REQUIRE(errors.size() == 3);
    REQUIRE(errors[0].kind == ErrorKind::UnexpectedGroupMembership);
    REQUIRE(errors[1].item == "docker_volume");
    REQUIRE(errors[2].item == "docker_swarm");
}

TEST_CASE("Patterns are anchored at the start of the item name", "[action_groups]") {
    const ActionGroup group("docker", "docker_", kAttribute);
    REQUIRE(group.matches("docker_container"));
    REQUIRE_FALSE(group.matches("community_docker_container"));
}

TEST_CASE("Invalid group declarations are rejected", "[action_groups][error]") {
    try {
        ActionGroup group("broken", "docker_(", kAttribute);
        FAIL("expected InvalidConfig");
    } catch (const Error& ex) {
        REQUIRE(ex.kind() == ErrorKind::InvalidConfig);
    }
    REQUIRE_THROWS_AS(ActionGroup("docker", "^docker_", ""), Error);
    REQUIRE_THROWS_AS(ActionGroup("", "^docker_", kAttribute), Error);
}
