#include "qa_matrix/matrix_writer.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <ios>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json version_or_null(const std::optional<qa::matrix::Version>& version) {
    return version ? json(version->to_string()) : json(nullptr);
}

json entry_to_json(const qa::matrix::MatrixEntry& entry) {
    return json{
        {"test_kind", std::string{qa::matrix::to_string(entry.test_kind)}},
        {"primary_version", version_or_null(entry.primary_version)},
        {"secondary_version", version_or_null(entry.secondary_version)},
        {"skip", entry.skip},
        {"skip_reason", entry.skip_reason ? json(*entry.skip_reason) : json(nullptr)},
    };
}

json document_to_json(const qa::matrix::MatrixDocument& document) {
    json entries = json::array();
    for (const auto& entry : document.entries) {
        entries.push_back(entry_to_json(entry));
    }
    return entries;
}

json build_summary(const qa::matrix::RunReport& report) {
    json summary = json::object();
    for (const auto& document : report.documents) {
        summary[std::string{qa::matrix::to_string(document.test_kind)}] = document_to_json(document);
    }
    summary["sessions"] = report.sessions;

    json errors = json::array();
    for (const auto& error : report.validation_errors) {
        errors.push_back(json{
            {"kind", std::string{qa::matrix::to_string(error.kind)}},
            {"item", error.item},
            {"group", error.group},
            {"message", error.message},
        });
    }
    summary["validation_errors"] = std::move(errors);
    return summary;
}

std::string describe(const qa::matrix::MatrixEntry& entry) {
    if (entry.skip) {
        return "skip (" + entry.skip_reason.value_or("no reason given") + ")";
    }
    std::string text = "primary " + entry.primary_version->to_string();
    if (entry.secondary_version) {
        text += ", secondary " + entry.secondary_version->to_string();
    }
    return text;
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content, std::ios::openmode mode) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary | mode);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
    if (!output) {
        throw std::runtime_error("Unable to write output file: " + destination.string());
    }
}

}  // namespace

namespace qa::matrix {

std::string MatrixWriter::render_summary(const RunReport& report) const {
    return build_summary(report).dump(2);
}

std::string MatrixWriter::render_github_output(const std::vector<MatrixDocument>& documents) const {
    std::ostringstream oss;
    for (const auto& document : documents) {
        oss << to_string(document.test_kind) << '=' << document_to_json(document).dump() << '\n';
    }
    return oss.str();
}

std::string MatrixWriter::render_console(const RunReport& report, bool github_groups) const {
    std::vector<const MatrixDocument*> sorted;
    for (const auto& document : report.documents) {
        sorted.push_back(&document);
    }
    std::sort(sorted.begin(), sorted.end(), [](const MatrixDocument* lhs, const MatrixDocument* rhs) {
        return to_string(lhs->test_kind) < to_string(rhs->test_kind);
    });

    std::ostringstream oss;
    for (const auto* document : sorted) {
        const auto kind = to_string(document->test_kind);
        if (github_groups) {
            oss << "::group::" << kind << '\n';
        }
        oss << kind << " (" << document->entries.size() << "):\n";
        for (const auto& entry : document->entries) {
            oss << "  " << describe(entry) << '\n';
        }
        if (github_groups) {
            oss << "::endgroup::\n";
        }
    }

    oss << "sessions (" << report.sessions.size() << "):\n";
    for (const auto& session : report.sessions) {
        oss << "  " << session << '\n';
    }

    if (report.action_groups_checked) {
        oss << "action group validation: "
            << (report.validation_errors.empty() ? std::string{"ok"}
                                                 : std::to_string(report.validation_errors.size()) + " error(s)")
            << '\n';
        for (const auto& error : report.validation_errors) {
            oss << "  " << to_string(error.kind) << ": " << error.message << '\n';
        }
    }
    return oss.str();
}

void MatrixWriter::write_summary(const std::filesystem::path& destination, const RunReport& report) const {
    write_file(destination, render_summary(report), std::ios::trunc);
}

void MatrixWriter::write_github_output(const std::filesystem::path& destination,
                                       const std::vector<MatrixDocument>& documents) const {
    write_file(destination, render_github_output(documents), std::ios::app);
}

}  // namespace qa::matrix
