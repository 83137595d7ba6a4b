#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qa::matrix {

enum class SessionGroup { Formatters, CodeQa, Typing, Docs, License, Extra, Build, Custom };

[[nodiscard]] std::string_view to_string(SessionGroup group) noexcept;

/// Parses the lower-case group name (`formatters`, `codeqa`, ...). Throws `Error(InvalidConfig)`.
[[nodiscard]] SessionGroup parse_session_group(std::string_view text);

/**
 * \brief A named, independently invocable check.
 */
struct Session {
    std::string name;
    std::vector<std::string> depends_on;
    bool is_default{false};
    SessionGroup group{SessionGroup::Custom};
    std::string description;
};

/**
 * \brief Arena of sessions addressed by index, with a name index on the side.
 *
 * Declaration order is preserved and used as the final tie-breaker by `resolve()`.
 * Dependency names are not checked on insertion so sessions may be declared in any
 * order; unknown dependencies surface when they are reached during resolution.
 */
class SessionRegistry {
public:
    SessionRegistry() = default;
    explicit SessionRegistry(std::vector<Session> sessions);

    /// Appends a session. Throws `Error(InvalidConfig)` on an empty or duplicate name.
    std::size_t add(Session session);

    [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const;
    [[nodiscard]] const Session& at(std::size_t index) const { return sessions_.at(index); }
    [[nodiscard]] const Session* find(std::string_view name) const;

    [[nodiscard]] const std::vector<Session>& sessions() const noexcept { return sessions_; }
    [[nodiscard]] std::size_t size() const noexcept { return sessions_.size(); }
    [[nodiscard]] bool empty() const noexcept { return sessions_.empty(); }

    /// Sessions flagged `is_default`, in declaration order.
    [[nodiscard]] std::vector<std::string> default_names() const;

private:
    std::vector<Session> sessions_{};
    std::map<std::string, std::size_t, std::less<>> index_{};
};

/**
 * \brief Expands a session request into an ordered execution list.
 *
 * An empty request selects the default sessions. Every requested name is checked before
 * expansion starts (`Error(UnknownSession)`). Dependencies are placed before their
 * dependants; a session already placed is not emitted again. A dependency cycle raises
 * `Error(SessionCycle)` with the cycle path as context (first and last element equal).
 */
[[nodiscard]] std::vector<Session> resolve(const SessionRegistry& registry,
                                           const std::vector<std::string>& requested_names);

/// Convenience wrapper returning only the names of `resolve()`.
[[nodiscard]] std::vector<std::string> resolve_names(const SessionRegistry& registry,
                                                     const std::vector<std::string>& requested_names);

}  // namespace qa::matrix
