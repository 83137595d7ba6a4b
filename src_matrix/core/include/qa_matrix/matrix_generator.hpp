#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "compat_table.hpp"
#include "version.hpp"

namespace qa::matrix {

enum class TestKind { Sanity, Units, Integration };

[[nodiscard]] std::string_view to_string(TestKind kind) noexcept;

/// Parses `sanity`, `units` or `integration`. Throws `Error(InvalidConfig)` otherwise.
[[nodiscard]] TestKind parse_test_kind(std::string_view text);

/**
 * \brief Either every version on an axis (`"all"`) or an explicit set.
 */
struct VersionSelection {
    bool all{true};
    std::set<Version> versions{};

    [[nodiscard]] static VersionSelection everything() { return VersionSelection{}; }
    [[nodiscard]] static VersionSelection only(std::set<Version> versions) {
        return VersionSelection{false, std::move(versions)};
    }
};

struct MatrixRequest {
    TestKind test_kind{TestKind::Units};
    VersionSelection primary{};
    VersionSelection secondary{};
    std::set<Version> local_versions{};   ///< Secondary versions found in the local environment
    VersionBounds secondary_bounds{};     ///< Applied after selection and local extension
};

/// How an entry came to exist; not part of the serialised document.
enum class EntryOrigin { Requested, LocalEnvironment, Placeholder };

struct MatrixEntry {
    TestKind test_kind{TestKind::Units};
    std::optional<Version> primary_version{};
    std::optional<Version> secondary_version{};
    bool skip{false};
    std::optional<std::string> skip_reason{};
    EntryOrigin origin{EntryOrigin::Requested};

    bool operator==(const MatrixEntry&) const = default;
};

struct MatrixDocument {
    TestKind test_kind{TestKind::Units};
    std::vector<MatrixEntry> entries{};
};

inline constexpr std::string_view kNoCompatibleVersions =
    "no compatible versions for requested constraints";

/**
 * \brief Expands one request against the compatibility table.
 *
 * Entries are ordered by primary then secondary version and are unique per
 * (test kind, primary, secondary). A request that reaches no combination yields a single
 * `skip` placeholder rather than an empty list.
 *
 * Throws `Error(UnknownVersion)` when an explicitly requested primary or secondary version
 * is not in the table. Local-environment versions outside the table are ignored.
 */
[[nodiscard]] std::vector<MatrixEntry> generate(const CompatibilityTable& table,
                                                const MatrixRequest& request);

/// One document per request. Two requests for the same test kind are rejected.
[[nodiscard]] std::vector<MatrixDocument> generate_all(const CompatibilityTable& table,
                                                       const std::vector<MatrixRequest>& requests);

}  // namespace qa::matrix
