#include "qa_matrix/version.hpp"
#include "qa_matrix/errors.hpp"

#include <cctype>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace {

// Plain decimal component: digits only, no sign, no whitespace, no leading zero.
std::optional<int> parse_component(std::string_view part) {
    if (part.empty() || (part.size() > 1 && part.front() == '0')) {
        return std::nullopt;
    }
    long long value = 0;
    for (unsigned char ch : part) {
        if (!std::isdigit(ch)) {
            return std::nullopt;
        }
        value = value * 10 + (ch - '0');
        if (value > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
    }
    return static_cast<int>(value);
}

}  // namespace

namespace qa::matrix {

Version Version::parse(std::string_view text) {
    const auto dot = text.find('.');
    if (dot == std::string_view::npos) {
        throw Error(ErrorKind::InvalidVersionFormat,
                    "Invalid version '" + std::string{text} + "': expected <major>.<minor>",
                    {std::string{text}});
    }

    const auto major_part = parse_component(text.substr(0, dot));
    const auto minor_part = parse_component(text.substr(dot + 1));
    if (!major_part || !minor_part) {
        throw Error(ErrorKind::InvalidVersionFormat,
                    "Invalid version '" + std::string{text} + "': expected <major>.<minor>",
                    {std::string{text}});
    }
    return Version{*major_part, *minor_part};
}

std::string Version::to_string() const {
    return std::to_string(major_number) + "." + std::to_string(minor_number);
}

}  // namespace qa::matrix
