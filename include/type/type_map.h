#ifndef NAME_GUARD_TYPE_MAP_H
#define NAME_GUARD_TYPE_MAP_H

#include <array>
#include <iostream>
#include <optional>
#include <string>

namespace nameguard {

/**
 * PHP types a schema primitive can map to
 */
enum class BuiltinType : size_t {
    Int = 0,
    Float,
    String,
    DateTime,
    // ------
    NumTypes,
};

constexpr std::array builtinTypeNames = {
    "int",
    "float",
    "string",
    "\\DateTime",
};
static_assert(builtinTypeNames.size() == (size_t)BuiltinType::NumTypes);

inline std::ostream &operator<<(std::ostream &os, BuiltinType type) {
    return os << builtinTypeNames.at((size_t)type);
}

inline std::string toString(BuiltinType type) {
    return builtinTypeNames.at((size_t)type);
}

/**
 * Marks an array of the preceding type, both in schema type names and in
 * validated types
 */
constexpr const char *ARRAY_MARKER = "[]";

/**
 * Type hint for array types
 */
constexpr const char *ARRAY_TYPE_HINT = "array";

/**
 * Look up a schema primitive (`int`, `nonNegativeInteger`, `dateTime`, ...)
 * case-insensitively
 *
 * @return The builtin type, or `std::nullopt` if the name is not a known
 * primitive
 */
std::optional<BuiltinType> lookupBuiltinType(const std::string &schemaType);

} // namespace nameguard

#endif // NAME_GUARD_TYPE_MAP_H
