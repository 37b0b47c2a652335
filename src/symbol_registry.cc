#include <container_utils.h>
#include <symbol_registry.h>

namespace nameguard {

SymbolRegistry::SymbolRegistry(std::initializer_list<std::string> names) {
    for (auto &&name : names) {
        names_.emplace(tolower(name));
    }
}

std::string SymbolRegistry::qualify(const std::string &ns,
                                    const std::string &name) {
    return ns.empty() ? name : ns + "\\" + name;
}

bool SymbolRegistry::declare(const std::string &qualifiedName) {
    std::lock_guard<std::mutex> guard(lock_);
    return names_.emplace(tolower(qualifiedName)).second;
}

bool SymbolRegistry::contains(const std::string &qualifiedName) const {
    std::lock_guard<std::mutex> guard(lock_);
    return names_.count(tolower(qualifiedName));
}

size_t SymbolRegistry::size() const {
    std::lock_guard<std::mutex> guard(lock_);
    return names_.size();
}

void SymbolRegistry::clear() {
    std::lock_guard<std::mutex> guard(lock_);
    names_.clear();
}

NamePredicate SymbolRegistry::existence() const {
    return [this](const std::string &qualifiedName) {
        return contains(qualifiedName);
    };
}

} // namespace nameguard
