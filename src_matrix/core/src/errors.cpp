#include "qa_matrix/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace qa::matrix {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnknownVersion:
            return "UnknownVersion";
        case ErrorKind::InvalidVersionFormat:
            return "InvalidVersionFormat";
        case ErrorKind::SessionCycle:
            return "SessionCycle";
        case ErrorKind::UnknownSession:
            return "UnknownSession";
        case ErrorKind::MissingAttribute:
            return "MissingAttribute";
        case ErrorKind::StaleExclusion:
            return "StaleExclusion";
        case ErrorKind::UnexpectedGroupMembership:
            return "UnexpectedGroupMembership";
        case ErrorKind::InvalidConfig:
            return "InvalidConfig";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message, std::vector<std::string> context)
    : std::runtime_error(message), kind_(kind), context_(std::move(context)) {}

}  // namespace qa::matrix
