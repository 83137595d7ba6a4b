#include "qa_matrix/engine.hpp"
#include "qa_matrix/action_groups.hpp"
#include "qa_matrix/session_catalog.hpp"
#include "qa_matrix/session_registry.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ' ';
        }
        result += item;
    }
    return result;
}

std::size_t count_skipped(const qa::matrix::MatrixDocument& document) {
    std::size_t skipped = 0;
    for (const auto& entry : document.entries) {
        if (entry.skip) {
            ++skipped;
        }
    }
    return skipped;
}

}  // namespace

namespace qa::matrix {

Engine::Engine(Config config) : config_(std::move(config)) {
    if (!config_.logger) {
        config_.logger = spdlog::default_logger();
    }
}

SessionRegistry Engine::registry_for(const Declarations& declarations) const {
    auto registry = build_session_registry(declarations.sessions, declarations.table);
    for (const auto& session : declarations.custom_sessions) {
        registry.add(session);
    }
    config_.logger->debug("{}: {} session(s) registered", declarations.source, registry.size());
    return registry;
}

std::vector<MatrixRequest> Engine::requests_for(const Declarations& declarations,
                                                const RunRequest& request) const {
    const auto& kinds = request.kinds.empty() ? declarations.matrix.kinds : request.kinds;

    auto local_versions = declarations.matrix.local_versions;
    local_versions.insert(request.local_versions.begin(), request.local_versions.end());

    auto bounds = declarations.matrix.secondary_bounds;
    if (request.min_secondary) {
        bounds.min = request.min_secondary;
    }
    if (request.max_secondary) {
        bounds.max = request.max_secondary;
    }

    std::vector<MatrixRequest> requests;
    requests.reserve(kinds.size());
    for (const auto kind : kinds) {
        MatrixRequest matrix_request;
        matrix_request.test_kind = kind;
        matrix_request.primary = request.primary;
        matrix_request.secondary = request.secondary;
        matrix_request.local_versions = local_versions;
        matrix_request.secondary_bounds = bounds;
        requests.push_back(std::move(matrix_request));
    }
    return requests;
}

RunReport Engine::run(const Declarations& declarations, const RunRequest& request) const {
    auto& log = *config_.logger;
    RunReport report;

    const auto registry = registry_for(declarations);
    report.sessions = resolve_names(registry, request.sessions);
    log.info("Resolved {} session(s): {}", report.sessions.size(), join(report.sessions));

    report.documents = generate_all(declarations.table, requests_for(declarations, request));
    for (const auto& document : report.documents) {
        const auto skipped = count_skipped(document);
        log.debug("{}: {} matrix entr{}", to_string(document.test_kind), document.entries.size(),
                  document.entries.size() == 1 ? "y" : "ies");
        if (skipped > 0) {
            log.warn("{}: no compatible versions, emitting skip placeholder", to_string(document.test_kind));
        }
    }

    const auto& extra = declarations.sessions.extra_checks;
    if (!extra || !extra->run_action_groups) {
        return report;
    }
    if (declarations.action_groups.empty()) {
        log.warn("Skipping action-groups since config is not provided");
    } else {
        report.validation_errors = validate(declarations.action_groups, declarations.inventory);
        report.action_groups_checked = true;
        for (const auto& error : report.validation_errors) {
            log.error("{}: {}", to_string(error.kind), error.message);
        }
        log.debug("Validated {} action group(s) against {} inventory item(s)",
                  declarations.action_groups.size(), declarations.inventory.size());
    }

    return report;
}

}  // namespace qa::matrix
