#include <unordered_map>

#include <container_utils.h>
#include <type/type_map.h>

namespace nameguard {

static const std::unordered_map<std::string, BuiltinType> &typeTable() {
    static const std::unordered_map<std::string, BuiltinType> table = {
        {"int", BuiltinType::Int},
        {"integer", BuiltinType::Int},
        {"long", BuiltinType::Int},
        {"byte", BuiltinType::Int},
        {"short", BuiltinType::Int},
        {"negativeinteger", BuiltinType::Int},
        {"nonnegativeinteger", BuiltinType::Int},
        {"nonpositiveinteger", BuiltinType::Int},
        {"positiveinteger", BuiltinType::Int},
        {"unsignedbyte", BuiltinType::Int},
        {"unsignedint", BuiltinType::Int},
        {"unsignedlong", BuiltinType::Int},
        {"unsignedshort", BuiltinType::Int},
        {"float", BuiltinType::Float},
        {"double", BuiltinType::Float},
        {"decimal", BuiltinType::Float},
        {"<anyxml>", BuiltinType::String},
        {"string", BuiltinType::String},
        {"token", BuiltinType::String},
        {"normalizedstring", BuiltinType::String},
        {"hexbinary", BuiltinType::String},
        {"datetime", BuiltinType::DateTime},
    };
    return table;
}

std::optional<BuiltinType> lookupBuiltinType(const std::string &schemaType) {
    auto &&table = typeTable();
    if (auto it = table.find(tolower(schemaType)); it != table.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace nameguard
