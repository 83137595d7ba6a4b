#include "qa_matrix/matrix_generator.hpp"
#include "qa_matrix/errors.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

using qa::matrix::CompatibilityEntry;
using qa::matrix::EntryOrigin;
using qa::matrix::MatrixEntry;
using qa::matrix::MatrixRequest;
using qa::matrix::Version;

using EntryKey = std::pair<Version, std::optional<Version>>;

// Decides which of two entries with the same key survives. Only the placeholder carries a
// reason today, and it never reaches merge(); the reason rule stays first so that a
// reasoned entry can never displace an unreasoned one.
bool should_replace(const MatrixEntry& kept, const MatrixEntry& candidate) {
    if (kept.skip_reason.has_value() != candidate.skip_reason.has_value()) {
        return !candidate.skip_reason.has_value();
    }
    return kept.origin == EntryOrigin::LocalEnvironment &&
           candidate.origin == EntryOrigin::Requested;
}

void merge(std::map<EntryKey, MatrixEntry>& accepted, MatrixEntry candidate) {
    EntryKey key{*candidate.primary_version, candidate.secondary_version};
    auto it = accepted.find(key);
    if (it == accepted.end()) {
        accepted.emplace(std::move(key), std::move(candidate));
        return;
    }
    if (should_replace(it->second, candidate)) {
        it->second = std::move(candidate);
    }
}

MatrixEntry make_entry(const MatrixRequest& request,
                       const Version& primary,
                       std::optional<Version> secondary,
                       EntryOrigin origin) {
    MatrixEntry entry;
    entry.test_kind = request.test_kind;
    entry.primary_version = primary;
    entry.secondary_version = std::move(secondary);
    entry.origin = origin;
    return entry;
}

[[noreturn]] void throw_unknown(const std::string& axis, std::vector<std::string> missing) {
    std::string joined;
    for (const auto& version : missing) {
        joined += joined.empty() ? version : ", " + version;
    }
    throw qa::matrix::Error(qa::matrix::ErrorKind::UnknownVersion,
                            "Unknown " + axis + " version(s) requested: " + joined,
                            std::move(missing));
}

std::vector<const CompatibilityEntry*> effective_primaries(const qa::matrix::CompatibilityTable& table,
                                                           const MatrixRequest& request) {
    std::vector<const CompatibilityEntry*> result;
    if (request.primary.all) {
        for (const auto& entry : table.entries()) {
            result.push_back(&entry);
        }
        return result;
    }

    std::vector<std::string> missing;
    for (const auto& version : request.primary.versions) {
        const auto* entry = table.find(version);
        if (entry == nullptr) {
            missing.push_back(version.to_string());
        } else {
            result.push_back(entry);
        }
    }
    if (!missing.empty()) {
        throw_unknown("primary", std::move(missing));
    }
    return result;
}

void check_secondaries(const qa::matrix::CompatibilityTable& table, const MatrixRequest& request) {
    if (request.secondary.all) {
        return;
    }
    const auto known = table.secondary_versions();
    std::vector<std::string> missing;
    for (const auto& version : request.secondary.versions) {
        if (!std::binary_search(known.begin(), known.end(), version)) {
            missing.push_back(version.to_string());
        }
    }
    if (!missing.empty()) {
        throw_unknown("secondary", std::move(missing));
    }
}

void expand_primary(const CompatibilityEntry& entry,
                    const MatrixRequest& request,
                    std::map<EntryKey, MatrixEntry>& accepted) {
    const auto& primary = entry.primary_version;

    if (entry.secondary_versions.empty()) {
        // Controller-only entry without a companion axis.
        if (request.secondary.all) {
            merge(accepted, make_entry(request, primary, std::nullopt, EntryOrigin::Requested));
        }
        return;
    }

    for (const auto& secondary : entry.secondary_versions) {
        if (!request.secondary_bounds.contains(secondary)) {
            continue;
        }
        if (request.secondary.all || request.secondary.versions.count(secondary) != 0) {
            merge(accepted, make_entry(request, primary, secondary, EntryOrigin::Requested));
        }
        if (request.local_versions.count(secondary) != 0) {
            merge(accepted, make_entry(request, primary, secondary, EntryOrigin::LocalEnvironment));
        }
    }
}

}  // namespace

namespace qa::matrix {

std::string_view to_string(TestKind kind) noexcept {
    switch (kind) {
        case TestKind::Sanity:
            return "sanity";
        case TestKind::Units:
            return "units";
        case TestKind::Integration:
            return "integration";
    }
    return "unknown";
}

TestKind parse_test_kind(std::string_view text) {
    if (text == "sanity") {
        return TestKind::Sanity;
    }
    if (text == "units") {
        return TestKind::Units;
    }
    if (text == "integration") {
        return TestKind::Integration;
    }
    throw Error(ErrorKind::InvalidConfig,
                "Unknown test kind '" + std::string{text} +
                    "' (expected sanity, units or integration)",
                {std::string{text}});
}

std::vector<MatrixEntry> generate(const CompatibilityTable& table, const MatrixRequest& request) {
    const auto primaries = effective_primaries(table, request);
    check_secondaries(table, request);

    std::map<EntryKey, MatrixEntry> accepted;
    for (const auto* entry : primaries) {
        expand_primary(*entry, request, accepted);
    }

    std::vector<MatrixEntry> result;
    if (accepted.empty()) {
        MatrixEntry placeholder;
        placeholder.test_kind = request.test_kind;
        placeholder.skip = true;
        placeholder.skip_reason = std::string{kNoCompatibleVersions};
        placeholder.origin = EntryOrigin::Placeholder;
        result.push_back(std::move(placeholder));
        return result;
    }

    result.reserve(accepted.size());
    for (auto& [key, entry] : accepted) {
        result.push_back(std::move(entry));
    }
    return result;
}

std::vector<MatrixDocument> generate_all(const CompatibilityTable& table,
                                         const std::vector<MatrixRequest>& requests) {
    std::set<TestKind> seen;
    std::vector<MatrixDocument> documents;
    documents.reserve(requests.size());
    for (const auto& request : requests) {
        if (!seen.insert(request.test_kind).second) {
            throw Error(ErrorKind::InvalidConfig,
                        "Duplicate matrix request for test kind '" +
                            std::string{to_string(request.test_kind)} + "'",
                        {std::string{to_string(request.test_kind)}});
        }
        documents.push_back(MatrixDocument{request.test_kind, generate(table, request)});
    }
    return documents;
}

}  // namespace qa::matrix
