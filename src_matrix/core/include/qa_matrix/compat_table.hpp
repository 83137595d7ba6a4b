#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "version.hpp"

namespace qa::matrix {

/**
 * \brief Declares which secondary (companion) versions a primary version supports.
 *
 * `controller_only` entries may leave `secondary_versions` empty; they then stand for a
 * primary version exercised without a companion. `controller_secondary_versions` is the
 * subset of `secondary_versions` for which the primary version also runs the controller.
 */
struct CompatibilityEntry {
    Version primary_version{};
    std::set<Version> secondary_versions{};
    bool controller_only{false};
    std::set<Version> controller_secondary_versions{};
};

/**
 * \brief Inclusive range plus explicit exclusions over one version axis.
 */
struct VersionBounds {
    std::optional<Version> min{};
    std::optional<Version> max{};
    std::set<Version> except{};

    [[nodiscard]] bool contains(const Version& version) const;
    [[nodiscard]] bool unbounded() const { return !min && !max && except.empty(); }
};

/**
 * \brief Immutable compatibility table, ordered by primary version.
 *
 * The constructor enforces the table invariants (unique primaries, non-empty secondary
 * sets unless controller-only, controller sets within the secondary sets, aliases
 * pointing at known secondary versions) and throws
 * `Error(InvalidConfig)` on violation.
 */
class CompatibilityTable {
public:
    CompatibilityTable() = default;
    explicit CompatibilityTable(std::vector<CompatibilityEntry> entries,
                                std::map<std::string, Version> aliases = {});

    [[nodiscard]] const std::vector<CompatibilityEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::map<std::string, Version>& aliases() const noexcept { return aliases_; }

    [[nodiscard]] const CompatibilityEntry* find(const Version& primary) const;
    [[nodiscard]] bool contains(const Version& primary) const { return find(primary) != nullptr; }

    [[nodiscard]] std::vector<Version> primary_versions() const;

    /// Union of every entry's secondary versions, ascending.
    [[nodiscard]] std::vector<Version> secondary_versions() const;

    /// Secondary versions within `bounds`, ascending.
    [[nodiscard]] std::vector<Version> select_secondary(const VersionBounds& bounds) const;

    /// Primary versions whose entry lists `secondary`, ascending.
    [[nodiscard]] std::vector<Version> primaries_for(const Version& secondary) const;

    /// Primary versions that run the controller for `secondary`, ascending.
    [[nodiscard]] std::vector<Version> controller_primaries_for(const Version& secondary) const;

    /// Resolves an alias such as `devel`, otherwise parses `text` as a version.
    [[nodiscard]] Version parse_secondary(std::string_view text) const;

private:
    std::vector<CompatibilityEntry> entries_{};
    std::map<std::string, Version> aliases_{};
};

/**
 * \brief Interpreter/companion table shipped with the tool.
 *
 * Primary axis: Python interpreter versions. Secondary axis: ansible-core releases that
 * support the interpreter on the target side, with the releases that also support it on
 * the controller recorded per entry. `devel` and `milestone` alias the current development
 * release.
 */
[[nodiscard]] CompatibilityTable builtin_compatibility_table();

}  // namespace qa::matrix
