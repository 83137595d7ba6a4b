#include "qa_matrix/action_groups.hpp"

#include <regex>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

using qa::matrix::ActionGroup;
using qa::matrix::ErrorKind;
using qa::matrix::InventoryItem;
using qa::matrix::ValidationError;

ValidationError make_error(ErrorKind kind,
                           const std::string& item,
                           const ActionGroup& group,
                           std::string message) {
    return ValidationError{kind, item, group.name(), std::move(message)};
}

void check_item(const InventoryItem& item, const ActionGroup& group, std::vector<ValidationError>& out) {
    const bool matches = group.matches(item.name);
    const bool excluded = group.excludes(item.name);
    const bool declares = item.declares(group.required_attribute());

    if (matches && !excluded && !declares) {
        out.push_back(make_error(ErrorKind::MissingAttribute, item.name, group,
                                 item.name + " matches action group " + group.name() +
                                     " but does not declare " + group.required_attribute()));
    }
    if (excluded && !matches) {
        out.push_back(make_error(ErrorKind::StaleExclusion, item.name, group,
                                 item.name + " is excluded from action group " + group.name() +
                                     " but does not match its pattern " + group.pattern()));
    }
    if (declares && !matches) {
        out.push_back(make_error(ErrorKind::UnexpectedGroupMembership, item.name, group,
                                 item.name + " declares " + group.required_attribute() +
                                     " but does not match the pattern of action group " +
                                     group.name()));
    }
}

}  // namespace

namespace qa::matrix {

ActionGroup::ActionGroup(std::string name,
                         std::string pattern,
                         std::string required_attribute,
                         std::set<std::string> exclusions)
    : name_(std::move(name)),
      pattern_(std::move(pattern)),
      required_attribute_(std::move(required_attribute)),
      exclusions_(std::move(exclusions)) {
    if (name_.empty()) {
        throw Error(ErrorKind::InvalidConfig, "Action group name must not be empty");
    }
    if (required_attribute_.empty()) {
        throw Error(ErrorKind::InvalidConfig,
                    "Action group " + name_ + " has an empty required attribute", {name_});
    }
    try {
        regex_ = std::regex(pattern_, std::regex::ECMAScript);
    } catch (const std::regex_error& ex) {
        throw Error(ErrorKind::InvalidConfig,
                    "Action group " + name_ + " has an invalid pattern '" + pattern_ + "': " + ex.what(),
                    {name_, pattern_});
    }
}

bool ActionGroup::matches(const std::string& item_name) const {
    return std::regex_search(item_name, regex_, std::regex_constants::match_continuous);
}

std::vector<ValidationError> validate(const std::vector<ActionGroup>& groups,
                                      const std::vector<InventoryItem>& inventory) {
    std::vector<ValidationError> errors;
    std::set<std::string> known;

    for (const auto& item : inventory) {
        known.insert(item.name);
        for (const auto& group : groups) {
            check_item(item, group, errors);
        }
    }

    for (const auto& group : groups) {
        for (const auto& excluded : group.exclusions()) {
            if (known.count(excluded) == 0) {
                errors.push_back(make_error(ErrorKind::StaleExclusion, excluded, group,
                                            excluded + " is excluded from action group " +
                                                group.name() + " but is not in the inventory"));
            }
        }
    }

    return errors;
}

}  // namespace qa::matrix
