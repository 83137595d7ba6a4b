#pragma once

#include "engine.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace qa::matrix {

/**
 * \brief Emits machine-readable and human-friendly reports for a run.
 *
 * - write_summary(): JSON object keyed by test kind, plus `sessions` and `validation_errors`.
 * - write_github_output(): appends `<kind>=<compact JSON array>` lines.
 * - render_console(): per-kind listing, optionally wrapped in GitHub Actions group markers.
 */
class MatrixWriter {
public:
    MatrixWriter() = default;

    [[nodiscard]] std::string render_summary(const RunReport& report) const;

    [[nodiscard]] std::string render_github_output(const std::vector<MatrixDocument>& documents) const;

    [[nodiscard]] std::string render_console(const RunReport& report, bool github_groups) const;

    void write_summary(const std::filesystem::path& destination, const RunReport& report) const;

    void write_github_output(const std::filesystem::path& destination,
                             const std::vector<MatrixDocument>& documents) const;
};

}  // namespace qa::matrix
