#include "qa_matrix/config_loader.hpp"
#include "qa_matrix/errors.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;
using qa::matrix::CompatibilityTable;
using qa::matrix::Error;
using qa::matrix::ErrorKind;
using qa::matrix::Version;

/**
 * Typed accessors that report problems with the source name and JSON path attached.
 */
class Reader {
public:
    explicit Reader(std::string source) : source_(std::move(source)) {}

    [[noreturn]] void fail(const std::string& path, const std::string& what) const {
        throw Error(ErrorKind::InvalidConfig, source_ + ": " + path + ": " + what, {path});
    }

    static std::string child(const std::string& path, std::string_view key) {
        return path.empty() ? std::string{key} : path + "." + std::string{key};
    }

    static std::string element(const std::string& path, std::size_t index) {
        return path + "[" + std::to_string(index) + "]";
    }

    // Missing keys and explicit nulls are treated alike.
    const json* member(const json& object, std::string_view key) const {
        const auto it = object.find(key);
        if (it == object.end() || it->is_null()) {
            return nullptr;
        }
        return &*it;
    }

    void expect_object(const json& value, const std::string& path) const {
        if (!value.is_object()) {
            fail(path, "expected an object");
        }
    }

    void expect_array(const json& value, const std::string& path) const {
        if (!value.is_array()) {
            fail(path, "expected an array");
        }
    }

    bool boolean(const json& object, std::string_view key, const std::string& path, bool fallback) const {
        const auto* value = member(object, key);
        if (value == nullptr) {
            return fallback;
        }
        if (!value->is_boolean()) {
            fail(child(path, key), "expected true or false");
        }
        return value->get<bool>();
    }

    std::string text(const json& value, const std::string& path) const {
        if (!value.is_string()) {
            fail(path, "expected a string");
        }
        return value.get<std::string>();
    }

    std::string required_string(const json& object, std::string_view key, const std::string& path) const {
        const auto* value = member(object, key);
        if (value == nullptr) {
            fail(child(path, key), "missing required value");
        }
        return text(*value, child(path, key));
    }

    std::optional<std::string> optional_string(const json& object,
                                               std::string_view key,
                                               const std::string& path) const {
        const auto* value = member(object, key);
        if (value == nullptr) {
            return std::nullopt;
        }
        return text(*value, child(path, key));
    }

    std::vector<std::string> string_list(const json& object, std::string_view key, const std::string& path) const {
        std::vector<std::string> result;
        const auto* value = member(object, key);
        if (value == nullptr) {
            return result;
        }
        const auto list_path = child(path, key);
        expect_array(*value, list_path);
        for (std::size_t i = 0; i < value->size(); ++i) {
            result.push_back(text((*value)[i], element(list_path, i)));
        }
        return result;
    }

    // `table` enables alias resolution on the secondary axis.
    Version version(const json& value, const std::string& path, const CompatibilityTable* table) const {
        const auto raw = text(value, path);
        try {
            return table != nullptr ? table->parse_secondary(raw) : Version::parse(raw);
        } catch (const Error& ex) {
            throw Error(ex.kind(), source_ + ": " + path + ": " + ex.what(), ex.context());
        }
    }

    std::optional<Version> optional_version(const json& object,
                                            std::string_view key,
                                            const std::string& path,
                                            const CompatibilityTable* table) const {
        const auto* value = member(object, key);
        if (value == nullptr) {
            return std::nullopt;
        }
        return version(*value, child(path, key), table);
    }

    std::set<Version> version_set(const json& object,
                                  std::string_view key,
                                  const std::string& path,
                                  const CompatibilityTable* table) const {
        std::set<Version> result;
        const auto* value = member(object, key);
        if (value == nullptr) {
            return result;
        }
        const auto list_path = child(path, key);
        expect_array(*value, list_path);
        for (std::size_t i = 0; i < value->size(); ++i) {
            result.insert(version((*value)[i], element(list_path, i), table));
        }
        return result;
    }

private:
    std::string source_;
};

CompatibilityTable read_table(const Reader& reader, const json& document) {
    const auto* section = reader.member(document, "compatibility");
    if (section == nullptr) {
        return qa::matrix::builtin_compatibility_table();
    }
    const std::string path = "compatibility";
    reader.expect_object(*section, path);

    std::vector<qa::matrix::CompatibilityEntry> entries;
    if (const auto* list = reader.member(*section, "entries")) {
        const auto list_path = Reader::child(path, "entries");
        reader.expect_array(*list, list_path);
        for (std::size_t i = 0; i < list->size(); ++i) {
            const auto& raw = (*list)[i];
            const auto entry_path = Reader::element(list_path, i);
            reader.expect_object(raw, entry_path);

            const auto* primary = reader.member(raw, "primary");
            if (primary == nullptr) {
                reader.fail(Reader::child(entry_path, "primary"), "missing required value");
            }
            qa::matrix::CompatibilityEntry entry;
            entry.primary_version = reader.version(*primary, Reader::child(entry_path, "primary"), nullptr);
            entry.secondary_versions = reader.version_set(raw, "secondary", entry_path, nullptr);
            entry.controller_only = reader.boolean(raw, "controller_only", entry_path, false);
            entry.controller_secondary_versions =
                reader.version_set(raw, "controller_secondary", entry_path, nullptr);
            entries.push_back(std::move(entry));
        }
    }

    std::map<std::string, Version> aliases;
    if (const auto* raw_aliases = reader.member(*section, "aliases")) {
        const auto aliases_path = Reader::child(path, "aliases");
        reader.expect_object(*raw_aliases, aliases_path);
        for (const auto& [name, target] : raw_aliases->items()) {
            aliases.emplace(name, reader.version(target, Reader::child(aliases_path, name), nullptr));
        }
    }

    return CompatibilityTable(std::move(entries), std::move(aliases));
}

qa::matrix::AnsibleTestSessionConfig read_ansible_test(const Reader& reader,
                                                       const json& section,
                                                       const std::string& path,
                                                       const CompatibilityTable& table,
                                                       bool integration) {
    reader.expect_object(section, path);
    qa::matrix::AnsibleTestSessionConfig config;
    config.is_default = reader.boolean(section, "default", path, false);
    config.include_devel = reader.boolean(section, "include_devel", path, false);
    config.include_milestone = reader.boolean(section, "include_milestone", path, false);
    config.bounds.min = reader.optional_version(section, "min_version", path, &table);
    config.bounds.max = reader.optional_version(section, "max_version", path, &table);
    config.bounds.except = reader.version_set(section, "except_versions", path, &table);

    if (!integration) {
        return config;
    }
    config.controller_python_versions_only =
        reader.boolean(section, "controller_python_versions_only", path, false);
    if (const auto* mapping = reader.member(section, "core_python_versions")) {
        const auto mapping_path = Reader::child(path, "core_python_versions");
        reader.expect_object(*mapping, mapping_path);
        for (const auto& [companion, primaries] : mapping->items()) {
            const auto key_path = Reader::child(mapping_path, companion);
            const auto version = reader.version(json(companion), key_path, &table);
            reader.expect_array(primaries, key_path);
            auto& target = config.core_python_versions[version];
            for (std::size_t i = 0; i < primaries.size(); ++i) {
                target.push_back(reader.version(primaries[i], Reader::element(key_path, i), nullptr));
            }
        }
    }
    return config;
}

qa::matrix::SessionsConfig read_sessions(const Reader& reader,
                                         const json& document,
                                         const CompatibilityTable& table) {
    qa::matrix::SessionsConfig config;
    const auto* sessions = reader.member(document, "sessions");
    if (sessions == nullptr) {
        return config;
    }
    const std::string root = "sessions";
    reader.expect_object(*sessions, root);

    auto section = [&](std::string_view key) -> std::pair<const json*, std::string> {
        const auto* value = reader.member(*sessions, key);
        const auto path = Reader::child(root, key);
        if (value != nullptr) {
            reader.expect_object(*value, path);
        }
        return {value, path};
    };

    if (auto [value, path] = section("lint"); value != nullptr) {
        qa::matrix::LintSessionConfig lint;
        lint.is_default = reader.boolean(*value, "default", path, true);
        lint.run_isort = reader.boolean(*value, "run_isort", path, true);
        lint.run_black = reader.boolean(*value, "run_black", path, true);
        lint.run_flake8 = reader.boolean(*value, "run_flake8", path, true);
        lint.run_pylint = reader.boolean(*value, "run_pylint", path, true);
        lint.run_yamllint = reader.boolean(*value, "run_yamllint", path, true);
        lint.run_mypy = reader.boolean(*value, "run_mypy", path, true);
        lint.run_config_lint = reader.boolean(*value, "run_config_lint", path, false);
        config.lint = lint;
    }
    if (auto [value, path] = section("docs_check"); value != nullptr) {
        qa::matrix::DocsCheckSessionConfig docs;
        docs.is_default = reader.boolean(*value, "default", path, true);
        docs.validate_collection_refs = reader.optional_string(*value, "validate_collection_refs", path);
        if (docs.validate_collection_refs && *docs.validate_collection_refs != "self" &&
            *docs.validate_collection_refs != "dependent" && *docs.validate_collection_refs != "all") {
            reader.fail(Reader::child(path, "validate_collection_refs"),
                        "expected one of self, dependent, all");
        }
        config.docs_check = docs;
    }
    if (auto [value, path] = section("license_check"); value != nullptr) {
        qa::matrix::LicenseCheckSessionConfig license;
        license.is_default = reader.boolean(*value, "default", path, true);
        license.run_reuse = reader.boolean(*value, "run_reuse", path, true);
        license.run_license_check = reader.boolean(*value, "run_license_check", path, true);
        config.license_check = license;
    }
    if (auto [value, path] = section("extra_checks"); value != nullptr) {
        qa::matrix::ExtraChecksSessionConfig extra;
        extra.is_default = reader.boolean(*value, "default", path, true);
        extra.run_no_unwanted_files = reader.boolean(*value, "run_no_unwanted_files", path, true);
        extra.run_action_groups = reader.boolean(*value, "run_action_groups", path, false);
        config.extra_checks = extra;
    }
    if (auto [value, path] = section("build_import_check"); value != nullptr) {
        qa::matrix::BuildImportCheckSessionConfig build;
        build.is_default = reader.boolean(*value, "default", path, true);
        build.run_galaxy_importer = reader.boolean(*value, "run_galaxy_importer", path, true);
        config.build_import_check = build;
    }
    if (auto [value, path] = section("ansible_test_sanity"); value != nullptr) {
        config.ansible_test_sanity = read_ansible_test(reader, *value, path, table, false);
    }
    if (auto [value, path] = section("ansible_test_units"); value != nullptr) {
        config.ansible_test_units = read_ansible_test(reader, *value, path, table, false);
    }
    if (auto [value, path] = section("ansible_test_integration"); value != nullptr) {
        config.ansible_test_integration = read_ansible_test(reader, *value, path, table, true);
    }
    if (auto [value, path] = section("ansible_lint"); value != nullptr) {
        qa::matrix::AnsibleLintSessionConfig lint;
        lint.is_default = reader.boolean(*value, "default", path, true);
        lint.strict = reader.boolean(*value, "strict", path, false);
        config.ansible_lint = lint;
    }
    return config;
}

std::vector<qa::matrix::Session> read_custom_sessions(const Reader& reader, const json& document) {
    std::vector<qa::matrix::Session> result;
    const auto* list = reader.member(document, "custom_sessions");
    if (list == nullptr) {
        return result;
    }
    const std::string path = "custom_sessions";
    reader.expect_array(*list, path);
    for (std::size_t i = 0; i < list->size(); ++i) {
        const auto& raw = (*list)[i];
        const auto item_path = Reader::element(path, i);
        reader.expect_object(raw, item_path);

        qa::matrix::Session session;
        session.name = reader.required_string(raw, "name", item_path);
        session.depends_on = reader.string_list(raw, "depends_on", item_path);
        session.is_default = reader.boolean(raw, "default", item_path, false);
        session.description = reader.optional_string(raw, "description", item_path).value_or("");
        if (const auto group = reader.optional_string(raw, "group", item_path)) {
            try {
                session.group = qa::matrix::parse_session_group(*group);
            } catch (const Error& ex) {
                reader.fail(Reader::child(item_path, "group"), ex.what());
            }
        }
        result.push_back(std::move(session));
    }
    return result;
}

std::vector<qa::matrix::ActionGroup> read_action_groups(const Reader& reader, const json& document) {
    std::vector<qa::matrix::ActionGroup> result;
    const auto* list = reader.member(document, "action_groups");
    if (list == nullptr) {
        return result;
    }
    const std::string path = "action_groups";
    reader.expect_array(*list, path);
    for (std::size_t i = 0; i < list->size(); ++i) {
        const auto& raw = (*list)[i];
        const auto item_path = Reader::element(path, i);
        reader.expect_object(raw, item_path);

        auto name = reader.required_string(raw, "name", item_path);
        auto pattern = reader.required_string(raw, "pattern", item_path);
        auto attribute = reader.required_string(raw, "required_attribute", item_path);
        const auto exclusions = reader.string_list(raw, "exclusions", item_path);
        try {
            result.emplace_back(std::move(name), std::move(pattern), std::move(attribute),
                                std::set<std::string>(exclusions.begin(), exclusions.end()));
        } catch (const Error& ex) {
            reader.fail(item_path, ex.what());
        }
    }
    return result;
}

std::vector<qa::matrix::InventoryItem> read_inventory(const Reader& reader, const json& document) {
    std::vector<qa::matrix::InventoryItem> result;
    const auto* list = reader.member(document, "inventory");
    if (list == nullptr) {
        return result;
    }
    const std::string path = "inventory";
    reader.expect_array(*list, path);
    for (std::size_t i = 0; i < list->size(); ++i) {
        const auto& raw = (*list)[i];
        const auto item_path = Reader::element(path, i);
        reader.expect_object(raw, item_path);

        qa::matrix::InventoryItem item;
        item.name = reader.required_string(raw, "name", item_path);
        const auto attributes = reader.string_list(raw, "attributes", item_path);
        item.attributes.insert(attributes.begin(), attributes.end());
        result.push_back(std::move(item));
    }
    return result;
}

qa::matrix::MatrixSettings read_matrix(const Reader& reader,
                                       const json& document,
                                       const CompatibilityTable& table) {
    qa::matrix::MatrixSettings settings;
    const auto* section = reader.member(document, "matrix");
    if (section == nullptr) {
        return settings;
    }
    const std::string path = "matrix";
    reader.expect_object(*section, path);

    if (reader.member(*section, "kinds") != nullptr) {
        settings.kinds.clear();
        std::set<qa::matrix::TestKind> seen;
        const auto kinds = reader.string_list(*section, "kinds", path);
        for (std::size_t i = 0; i < kinds.size(); ++i) {
            const auto kind_path = Reader::element(Reader::child(path, "kinds"), i);
            qa::matrix::TestKind kind{};
            try {
                kind = qa::matrix::parse_test_kind(kinds[i]);
            } catch (const Error& ex) {
                reader.fail(kind_path, ex.what());
            }
            if (!seen.insert(kind).second) {
                reader.fail(kind_path, "duplicate test kind '" + kinds[i] + "'");
            }
            settings.kinds.push_back(kind);
        }
    }
    settings.local_versions = reader.version_set(*section, "local_versions", path, &table);
    settings.secondary_bounds.min = reader.optional_version(*section, "min_secondary", path, &table);
    settings.secondary_bounds.max = reader.optional_version(*section, "max_secondary", path, &table);
    settings.secondary_bounds.except = reader.version_set(*section, "except_secondary", path, &table);
    return settings;
}

}  // namespace

namespace qa::matrix {

Declarations ConfigLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw Error(ErrorKind::InvalidConfig, "Declaration file does not exist: " + file.string(),
                    {file.string()});
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw Error(ErrorKind::InvalidConfig, "Declaration path is not a regular file: " + file.string(),
                    {file.string()});
    }

    std::ifstream input(file, std::ios::binary);
    if (!input.is_open()) {
        throw Error(ErrorKind::InvalidConfig, "Unable to open declaration file: " + file.string(),
                    {file.string()});
    }
    std::ostringstream content;
    content << input.rdbuf();
    return parse(content.str(), file.string());
}

Declarations ConfigLoader::parse(std::string_view text, const std::string& source) const {
    json document;
    try {
        document = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& ex) {
        throw Error(ErrorKind::InvalidConfig, source + ": invalid JSON: " + ex.what(), {source});
    }

    const Reader reader(source);
    reader.expect_object(document, "$");

    Declarations declarations;
    declarations.source = source;
    declarations.table = read_table(reader, document);
    declarations.sessions = read_sessions(reader, document, declarations.table);
    declarations.custom_sessions = read_custom_sessions(reader, document);
    declarations.action_groups = read_action_groups(reader, document);
    declarations.inventory = read_inventory(reader, document);
    declarations.matrix = read_matrix(reader, document, declarations.table);
    return declarations;
}

}  // namespace qa::matrix
