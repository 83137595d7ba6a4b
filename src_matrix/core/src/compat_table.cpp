#include "qa_matrix/compat_table.hpp"
#include "qa_matrix/errors.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

using qa::matrix::Version;

struct CoreSupport {
    const char* core;
    std::vector<const char*> controller_python;
    std::vector<const char*> remote_python;
};

// ansible-core support matrix: controller-side and target-side Python versions per release.
const std::vector<CoreSupport> kCoreSupport = {
    {"2.9", {"2.7", "3.5", "3.6", "3.7", "3.8"}, {"2.6", "2.7", "3.5", "3.6", "3.7", "3.8"}},
    {"2.10", {"2.7", "3.5", "3.6", "3.7", "3.8", "3.9"}, {"2.6", "2.7", "3.5", "3.6", "3.7", "3.8", "3.9"}},
    {"2.11", {"2.7", "3.5", "3.6", "3.7", "3.8", "3.9"}, {"2.6", "2.7", "3.5", "3.6", "3.7", "3.8", "3.9"}},
    {"2.12", {"3.8", "3.9", "3.10"}, {"2.6", "2.7", "3.5", "3.6", "3.7", "3.8", "3.9", "3.10"}},
    {"2.13", {"3.8", "3.9", "3.10"}, {"2.7", "3.5", "3.6", "3.7", "3.8", "3.9", "3.10"}},
    {"2.14", {"3.9", "3.10", "3.11"}, {"2.7", "3.5", "3.6", "3.7", "3.8", "3.9", "3.10", "3.11"}},
    {"2.15", {"3.9", "3.10", "3.11"}, {"2.7", "3.5", "3.6", "3.7", "3.8", "3.9", "3.10", "3.11"}},
    {"2.16", {"3.10", "3.11", "3.12"}, {"2.7", "3.6", "3.7", "3.8", "3.9", "3.10", "3.11", "3.12"}},
    {"2.17", {"3.10", "3.11", "3.12"}, {"3.7", "3.8", "3.9", "3.10", "3.11", "3.12"}},
    {"2.18", {"3.11", "3.12", "3.13"}, {"3.8", "3.9", "3.10", "3.11", "3.12", "3.13"}},
    {"2.19", {"3.11", "3.12", "3.13"}, {"3.8", "3.9", "3.10", "3.11", "3.12", "3.13"}},
    {"2.20", {"3.12", "3.13", "3.14"}, {"3.9", "3.10", "3.11", "3.12", "3.13", "3.14"}},
    {"2.21", {"3.12", "3.13", "3.14"}, {"3.9", "3.10", "3.11", "3.12", "3.13", "3.14"}},
    {"2.22", {"3.13", "3.14", "3.15"}, {"3.10", "3.11", "3.12", "3.13", "3.14", "3.15"}},
    {"2.23", {"3.13", "3.14", "3.15"}, {"3.10", "3.11", "3.12", "3.13", "3.14", "3.15"}},
    {"2.24", {"3.14", "3.15", "3.16"}, {"3.11", "3.12", "3.13", "3.14", "3.15", "3.16"}},
    {"2.25", {"3.14", "3.15", "3.16"}, {"3.11", "3.12", "3.13", "3.14", "3.15", "3.16"}},
};

constexpr const char* kCurrentDevel = "2.19";
constexpr const char* kCurrentMilestone = "2.19";

}  // namespace

namespace qa::matrix {

bool VersionBounds::contains(const Version& version) const {
    if (min && version < *min) {
        return false;
    }
    if (max && version > *max) {
        return false;
    }
    return except.find(version) == except.end();
}

CompatibilityTable::CompatibilityTable(std::vector<CompatibilityEntry> entries,
                                       std::map<std::string, Version> aliases)
    : entries_(std::move(entries)), aliases_(std::move(aliases)) {
    std::sort(entries_.begin(), entries_.end(),
              [](const CompatibilityEntry& lhs, const CompatibilityEntry& rhs) {
                  return lhs.primary_version < rhs.primary_version;
              });

    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& entry = entries_[i];
        if (i > 0 && entries_[i - 1].primary_version == entry.primary_version) {
            throw Error(ErrorKind::InvalidConfig,
                        "Duplicate primary version " + entry.primary_version.to_string() +
                            " in compatibility table",
                        {entry.primary_version.to_string()});
        }
        if (entry.secondary_versions.empty() && !entry.controller_only) {
            throw Error(ErrorKind::InvalidConfig,
                        "Primary version " + entry.primary_version.to_string() +
                            " declares no secondary versions and is not controller-only",
                        {entry.primary_version.to_string()});
        }
        for (const auto& controller : entry.controller_secondary_versions) {
            if (entry.secondary_versions.count(controller) == 0) {
                throw Error(ErrorKind::InvalidConfig,
                            "Primary version " + entry.primary_version.to_string() +
                                " runs the controller for " + controller.to_string() +
                                " but does not list it as a secondary version",
                            {entry.primary_version.to_string(), controller.to_string()});
            }
        }
    }

    const auto known = secondary_versions();
    for (const auto& [name, target] : aliases_) {
        if (!std::binary_search(known.begin(), known.end(), target)) {
            throw Error(ErrorKind::InvalidConfig,
                        "Alias '" + name + "' points to unknown secondary version " +
                            target.to_string(),
                        {name, target.to_string()});
        }
    }
}

const CompatibilityEntry* CompatibilityTable::find(const Version& primary) const {
    const auto it = std::lower_bound(entries_.begin(), entries_.end(), primary,
                                     [](const CompatibilityEntry& entry, const Version& value) {
                                         return entry.primary_version < value;
                                     });
    if (it == entries_.end() || it->primary_version != primary) {
        return nullptr;
    }
    return &*it;
}

std::vector<Version> CompatibilityTable::primary_versions() const {
    std::vector<Version> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.primary_version);
    }
    return result;
}

std::vector<Version> CompatibilityTable::secondary_versions() const {
    std::set<Version> all;
    for (const auto& entry : entries_) {
        all.insert(entry.secondary_versions.begin(), entry.secondary_versions.end());
    }
    return {all.begin(), all.end()};
}

std::vector<Version> CompatibilityTable::select_secondary(const VersionBounds& bounds) const {
    std::vector<Version> result;
    for (const auto& version : secondary_versions()) {
        if (bounds.contains(version)) {
            result.push_back(version);
        }
    }
    return result;
}

std::vector<Version> CompatibilityTable::primaries_for(const Version& secondary) const {
    std::vector<Version> result;
    for (const auto& entry : entries_) {
        if (entry.secondary_versions.count(secondary) != 0) {
            result.push_back(entry.primary_version);
        }
    }
    return result;
}

std::vector<Version> CompatibilityTable::controller_primaries_for(const Version& secondary) const {
    std::vector<Version> result;
    for (const auto& entry : entries_) {
        if (entry.controller_secondary_versions.count(secondary) != 0) {
            result.push_back(entry.primary_version);
        }
    }
    return result;
}

Version CompatibilityTable::parse_secondary(std::string_view text) const {
    const auto alias = aliases_.find(std::string{text});
    if (alias != aliases_.end()) {
        return alias->second;
    }
    return Version::parse(text);
}

CompatibilityTable builtin_compatibility_table() {
    std::map<Version, CompatibilityEntry> by_python;
    for (const auto& support : kCoreSupport) {
        const auto core = Version::parse(support.core);
        for (const char* python : support.remote_python) {
            by_python[Version::parse(python)].secondary_versions.insert(core);
        }
        for (const char* python : support.controller_python) {
            by_python[Version::parse(python)].controller_secondary_versions.insert(core);
        }
    }

    std::vector<CompatibilityEntry> entries;
    entries.reserve(by_python.size());
    for (auto& [python, entry] : by_python) {
        entry.primary_version = python;
        entries.push_back(std::move(entry));
    }

    return CompatibilityTable(std::move(entries),
                              {{"devel", Version::parse(kCurrentDevel)},
                               {"milestone", Version::parse(kCurrentMilestone)}});
}

}  // namespace qa::matrix
