#pragma once

#include <regex>
#include <set>
#include <string>
#include <vector>

#include "errors.hpp"

namespace qa::matrix {

/**
 * \brief A named set of plugin items that must share one declared attribute.
 *
 * Every item whose name matches `pattern` belongs to the group unless it is listed in
 * `exclusions`. Members must declare `required_attribute`; nothing else may declare it.
 * The pattern is matched from the start of the item name.
 */
class ActionGroup {
public:
    /// Throws `Error(InvalidConfig)` if `pattern` is not a valid ECMAScript regular expression.
    ActionGroup(std::string name,
                std::string pattern,
                std::string required_attribute,
                std::set<std::string> exclusions = {});

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }
    [[nodiscard]] const std::string& required_attribute() const noexcept { return required_attribute_; }
    [[nodiscard]] const std::set<std::string>& exclusions() const noexcept { return exclusions_; }

    [[nodiscard]] bool matches(const std::string& item_name) const;
    [[nodiscard]] bool excludes(const std::string& item_name) const {
        return exclusions_.count(item_name) != 0;
    }

private:
    std::string name_;
    std::string pattern_;
    std::regex regex_;
    std::string required_attribute_;
    std::set<std::string> exclusions_;
};

struct InventoryItem {
    std::string name;
    std::set<std::string> attributes;

    [[nodiscard]] bool declares(const std::string& attribute) const {
        return attributes.count(attribute) != 0;
    }
};

/**
 * \brief Cross-checks group declarations against the inventory.
 *
 * Returns every finding (empty means consistent):
 *   - `MissingAttribute`: item matches the pattern, is not excluded, lacks the attribute.
 *   - `StaleExclusion`: excluded item does not match the pattern, or the exclusion names
 *     no inventory item at all.
 *   - `UnexpectedGroupMembership`: item declares the attribute without matching the pattern.
 *
 * Items are visited in inventory order and groups in declaration order; exclusions that
 * name no inventory item are reported afterwards, group by group.
 */
[[nodiscard]] std::vector<ValidationError> validate(const std::vector<ActionGroup>& groups,
                                                    const std::vector<InventoryItem>& inventory);

}  // namespace qa::matrix
