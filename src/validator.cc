#include <config.h>
#include <container_utils.h>
#include <debug/logger.h>
#include <except.h>
#include <naming_convention.h>
#include <type/type_map.h>
#include <validator.h>

namespace nameguard {

static void logRename(NameCategory category, const std::string &from,
                      const std::string &to) {
    if (Config::logRename()) {
        logger() << "Renamed " << category << " \"" << from << "\" to \"" << to
                 << "\", which is a reserved word" << std::endl;
    }
}

/**
 * A legal prefix or suffix can still turn a reserved word into another one
 * (`end` + `For`, `include` + `_once`). Such a rename is not retried
 */
static void checkRenamed(const std::string &name, const std::string &renamed) {
    if (!isIdentifier(renamed) || isKeyword(renamed)) {
        throw InvalidName(name, NG_MSG << "Renaming reserved word \"" << name
                                       << "\" gives \"" << renamed
                                       << "\", which is not a free identifier");
    }
}

/**
 * Rename a keyword by prefixing it (`class` -> `aClass`), once
 */
static std::string prefixKeyword(const std::string &_name,
                                 NameCategory category) {
    auto name = enforceNamingConvention(_name);
    if (isKeyword(name)) {
        auto renamed = Config::namePrefix() + ucfirst(name);
        checkRenamed(name, renamed);
        logRename(category, name, renamed);
        return renamed;
    }
    return name;
}

std::string validateClass(const std::string &_name, const NamePredicate &exists,
                          const std::string &ns) {
    auto name = enforceNamingConvention(_name);
    return validateUnique(
        name,
        [&](const std::string &candidate) {
            return !isKeyword(candidate) &&
                   !(exists && exists(SymbolRegistry::qualify(ns, candidate)));
        },
        Config::nameSuffix());
}

std::string validateClass(const std::string &name,
                          const SymbolRegistry &registry,
                          const std::string &ns) {
    return validateClass(name, registry.existence(), ns);
}

std::string validateOperation(const std::string &name) {
    return prefixKeyword(name, NameCategory::Operation);
}

std::string validateAttribute(const std::string &name) {
    // Attributes are rendered as property names, which may be keywords
    return enforceNamingConvention(name);
}

std::string validateConstant(const std::string &name) {
    return prefixKeyword(name, NameCategory::Constant);
}

std::string validateType(const std::string &typeName) {
    if (endsWith(typeName, ARRAY_MARKER)) {
        auto element = typeName.substr(0, typeName.length() - 2);
        return enforceNamingConvention(element) + ARRAY_MARKER;
    }

    if (auto builtin = lookupBuiltinType(typeName); builtin.has_value()) {
        return toString(*builtin);
    }

    auto name = enforceNamingConvention(typeName);
    if (isKeyword(name)) {
        auto renamed = name + Config::nameSuffix();
        checkRenamed(name, renamed);
        logRename(NameCategory::Type, name, renamed);
        return renamed;
    }
    return name;
}

std::optional<std::string> validateTypeHint(const std::string &typeName) {
    // Generated classes could be hinted too, but enumerations are generated
    // as plain strings, and they cannot be told apart here
    if (endsWith(typeName, ARRAY_MARKER)) {
        return ARRAY_TYPE_HINT;
    }
    if (typeName == toString(BuiltinType::DateTime) ||
        lookupBuiltinType(typeName) == BuiltinType::DateTime) {
        return toString(BuiltinType::DateTime);
    }
    return std::nullopt;
}

std::string validateName(const std::string &name, NameCategory category,
                         const NamePredicate &exists, const std::string &ns) {
    switch (category) {
    case NameCategory::Class:
        return validateClass(name, exists, ns);
    case NameCategory::Operation:
        return validateOperation(name);
    case NameCategory::Attribute:
        return validateAttribute(name);
    case NameCategory::Constant:
        return validateConstant(name);
    case NameCategory::Type:
        return validateType(name);
    default:
        ERROR(NG_MSG << "Invalid name category " << (size_t)category);
    }
}

} // namespace nameguard
