#ifndef NAME_GUARD_VALIDATOR_H
#define NAME_GUARD_VALIDATOR_H

#include <optional>
#include <string>

#include <keyword.h>
#include <symbol_registry.h>
#include <unique_name.h>

namespace nameguard {

/**
 * Validate a class name against the naming convention, the reserved words and
 * already existing classes and interfaces
 *
 * A conflicting name gets `Config::nameSuffix()` appended, then a counter
 * (`Return` -> `ReturnCustom`, then `ReturnCustom2`, ...)
 *
 * @param name : The raw name
 * @param exists : Returns true if a symbol with the given fully-qualified name
 * already exists. Null if nothing exists yet
 * @param ns : Namespace the class will be declared in. Only used to qualify
 * the names passed to `exists`
 */
std::string validateClass(const std::string &name, const NamePredicate &exists,
                          const std::string &ns = "");
std::string validateClass(const std::string &name,
                          const SymbolRegistry &registry,
                          const std::string &ns = "");

/**
 * Validate an operation (method) name. A reserved word gets
 * `Config::namePrefix()` prepended and is capitalized (`class` -> `aClass`)
 */
std::string validateOperation(const std::string &name);

/**
 * Validate an attribute (property) name. Reserved words are allowed here
 */
std::string validateAttribute(const std::string &name);

/**
 * Validate a constant name. Reserved words are treated as in
 * `validateOperation`
 */
std::string validateConstant(const std::string &name);

/**
 * Validate a schema type name
 *
 * - `T[]` becomes the validated `T` followed by `[]`
 * - A known primitive becomes its PHP builtin (`nonNegativeInteger` -> `int`,
 * `dateTime` -> `\DateTime`)
 * - Anything else is validated as a name, with `Config::nameSuffix()`
 * appended if it is a reserved word (`array` -> `arrayCustom`)
 */
std::string validateType(const std::string &typeName);

/**
 * Type hint usable for a parameter of the given type
 *
 * Only arrays (`array`) and date-times (`\DateTime`) have one. Either a
 * validated type or a raw schema type name is accepted
 *
 * @return The hint, or `std::nullopt` if the type cannot be hinted
 */
std::optional<std::string> validateTypeHint(const std::string &typeName);

/**
 * Validate a name of any category
 *
 * `exists` and `ns` are only used for `NameCategory::Class`
 */
std::string validateName(const std::string &name, NameCategory category,
                         const NamePredicate &exists = nullptr,
                         const std::string &ns = "");

} // namespace nameguard

#endif // NAME_GUARD_VALIDATOR_H
