#include <config.h>
#include <debug/logger.h>
#include <unique_name.h>

namespace nameguard {

std::string validateUnique(const std::string &name, const NamePredicate &isFree,
                           const std::string &suffix) {
    auto newName = name;
    for (size_t i = 1; !isFree(newName); i++) {
        if (suffix.empty()) {
            newName = name + std::to_string(i + 1);
        } else if (i == 1) {
            newName = name + suffix;
        } else {
            newName = name + suffix + std::to_string(i);
        }
    }
    if (newName != name && Config::logRename()) {
        logger() << "Name \"" << name << "\" is taken, using \"" << newName
                 << "\"" << std::endl;
    }
    return newName;
}

std::string getUniqueName(const std::string &name,
                          const std::unordered_set<std::string> &used,
                          const std::string &suffix) {
    return validateUnique(
        name,
        [&](const std::string &candidate) { return !used.count(candidate); },
        suffix);
}

} // namespace nameguard
