#ifndef NAME_GUARD_KEYWORD_H
#define NAME_GUARD_KEYWORD_H

#include <array>
#include <iostream>
#include <string>

namespace nameguard {

/**
 * What a generated identifier is used for
 *
 * The category decides how a name colliding with a reserved word is treated:
 *
 * ```
 * Category  | Keyword collision resolved by
 * class     | suffix and counter until free (see `validateUnique`)
 * operation | prefix and capitalize, once
 * attribute | nothing, attributes may be reserved words
 * constant  | prefix and capitalize, once
 * type      | suffix, once
 * ```
 */
enum class NameCategory : size_t {
    Class = 0,
    Operation,
    Attribute,
    Constant,
    Type,
    // ------
    NumCategories,
};

constexpr std::array nameCategoryNames = {
    "class", "operation", "attribute", "constant", "type",
};
static_assert(nameCategoryNames.size() == (size_t)NameCategory::NumCategories);

inline std::ostream &operator<<(std::ostream &os, NameCategory category) {
    return os << nameCategoryNames.at((size_t)category);
}

NameCategory parseNameCategory(const std::string &str);

/**
 * Check a name against the PHP reserved words, case-insensitively
 */
bool isKeyword(const std::string &name);

} // namespace nameguard

#endif // NAME_GUARD_KEYWORD_H
