#include "qa_matrix/session_registry.hpp"
#include "qa_matrix/errors.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

enum class Mark { Unvisited, Expanding, Placed };

struct Frame {
    std::size_t node;
    std::size_t next_dependency;
};

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string result;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

}  // namespace

namespace qa::matrix {

std::string_view to_string(SessionGroup group) noexcept {
    switch (group) {
        case SessionGroup::Formatters:
            return "formatters";
        case SessionGroup::CodeQa:
            return "codeqa";
        case SessionGroup::Typing:
            return "typing";
        case SessionGroup::Docs:
            return "docs";
        case SessionGroup::License:
            return "license";
        case SessionGroup::Extra:
            return "extra";
        case SessionGroup::Build:
            return "build";
        case SessionGroup::Custom:
            return "custom";
    }
    return "custom";
}

SessionGroup parse_session_group(std::string_view text) {
    for (auto group : {SessionGroup::Formatters, SessionGroup::CodeQa, SessionGroup::Typing,
                       SessionGroup::Docs, SessionGroup::License, SessionGroup::Extra,
                       SessionGroup::Build, SessionGroup::Custom}) {
        if (to_string(group) == text) {
            return group;
        }
    }
    throw Error(ErrorKind::InvalidConfig, "Unknown session group '" + std::string{text} + "'",
                {std::string{text}});
}

SessionRegistry::SessionRegistry(std::vector<Session> sessions) {
    sessions_.reserve(sessions.size());
    for (auto& session : sessions) {
        add(std::move(session));
    }
}

std::size_t SessionRegistry::add(Session session) {
    if (session.name.empty()) {
        throw Error(ErrorKind::InvalidConfig, "Session name must not be empty");
    }
    if (index_.find(session.name) != index_.end()) {
        throw Error(ErrorKind::InvalidConfig, "Duplicate session '" + session.name + "'",
                    {session.name});
    }
    const auto index = sessions_.size();
    index_.emplace(session.name, index);
    sessions_.push_back(std::move(session));
    return index;
}

std::optional<std::size_t> SessionRegistry::index_of(std::string_view name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Session* SessionRegistry::find(std::string_view name) const {
    const auto index = index_of(name);
    return index ? &sessions_[*index] : nullptr;
}

std::vector<std::string> SessionRegistry::default_names() const {
    std::vector<std::string> result;
    for (const auto& session : sessions_) {
        if (session.is_default) {
            result.push_back(session.name);
        }
    }
    return result;
}

std::vector<Session> resolve(const SessionRegistry& registry,
                             const std::vector<std::string>& requested_names) {
    const auto requested = requested_names.empty() ? registry.default_names() : requested_names;

    // Validate the whole request before touching the graph.
    std::vector<std::size_t> roots;
    std::vector<std::string> unknown;
    roots.reserve(requested.size());
    for (const auto& name : requested) {
        const auto index = registry.index_of(name);
        if (index) {
            roots.push_back(*index);
        } else {
            unknown.push_back(name);
        }
    }
    if (!unknown.empty()) {
        throw Error(ErrorKind::UnknownSession, "Unknown session(s): " + join(unknown, ", "),
                    std::move(unknown));
    }

    std::vector<Mark> marks(registry.size(), Mark::Unvisited);
    std::vector<std::size_t> order;
    std::vector<Frame> stack;

    for (const auto root : roots) {
        if (marks[root] != Mark::Unvisited) {
            continue;
        }
        marks[root] = Mark::Expanding;
        stack.push_back(Frame{root, 0});

        while (!stack.empty()) {
            auto& frame = stack.back();
            const auto& session = registry.at(frame.node);

            if (frame.next_dependency == session.depends_on.size()) {
                marks[frame.node] = Mark::Placed;
                order.push_back(frame.node);
                stack.pop_back();
                continue;
            }

            const auto& dependency = session.depends_on[frame.next_dependency++];
            const auto next = registry.index_of(dependency);
            if (!next) {
                throw Error(ErrorKind::UnknownSession,
                            "Unknown session '" + dependency + "' required by '" + session.name + "'",
                            {dependency, session.name});
            }

            switch (marks[*next]) {
                case Mark::Placed:
                    break;
                case Mark::Expanding: {
                    std::vector<std::string> cycle;
                    bool on_cycle = false;
                    for (const auto& entry : stack) {
                        on_cycle = on_cycle || entry.node == *next;
                        if (on_cycle) {
                            cycle.push_back(registry.at(entry.node).name);
                        }
                    }
                    cycle.push_back(dependency);
                    throw Error(ErrorKind::SessionCycle,
                                "Session dependency cycle: " + join(cycle, " -> "),
                                std::move(cycle));
                }
                case Mark::Unvisited:
                    marks[*next] = Mark::Expanding;
                    stack.push_back(Frame{*next, 0});
                    break;
            }
        }
    }

    std::vector<Session> result;
    result.reserve(order.size());
    for (const auto index : order) {
        result.push_back(registry.at(index));
    }
    return result;
}

std::vector<std::string> resolve_names(const SessionRegistry& registry,
                                       const std::vector<std::string>& requested_names) {
    std::vector<std::string> names;
    for (auto& session : resolve(registry, requested_names)) {
        names.push_back(std::move(session.name));
    }
    return names;
}

}  // namespace qa::matrix
