#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace qa::matrix {

/**
 * \brief Classification of every failure the core can report.
 *
 * The first four kinds are raised as exceptions by the pure components; the three
 * action-group kinds are collected into a validation report instead.
 */
enum class ErrorKind {
    UnknownVersion,
    InvalidVersionFormat,
    SessionCycle,
    UnknownSession,
    MissingAttribute,
    StaleExclusion,
    UnexpectedGroupMembership,
    InvalidConfig,  ///< Malformed declarations (duplicate names, bad regex, wrong JSON type)
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * \brief Exception raised by the matrix generator, session resolver and loader.
 *
 * `context()` carries the offending values (unknown version strings, the session names
 * forming a cycle, ...) so callers do not have to parse the message.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message, std::vector<std::string> context = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::vector<std::string>& context() const noexcept { return context_; }

private:
    ErrorKind kind_;
    std::vector<std::string> context_;
};

/**
 * \brief One finding of the action-group validator.
 */
struct ValidationError {
    ErrorKind kind{ErrorKind::MissingAttribute};
    std::string item;
    std::string group;
    std::string message;

    bool operator==(const ValidationError&) const = default;
};

}  // namespace qa::matrix
