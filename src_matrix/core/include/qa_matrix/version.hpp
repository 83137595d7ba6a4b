#pragma once

#include <compare>
#include <string>
#include <string_view>

namespace qa::matrix {

/**
 * \brief `major.minor` version used on both matrix axes.
 *
 * Ordering is numeric per component, so `3.9 < 3.10`.
 */
struct Version {
    int major_number{0};
    int minor_number{0};

    /// Parses `"<major>.<minor>"`. Throws `Error(InvalidVersionFormat)` for anything else.
    [[nodiscard]] static Version parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const Version&) const = default;
};

}  // namespace qa::matrix
