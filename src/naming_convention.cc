#include <algorithm>
#include <iterator>

#include <config.h>
#include <container_utils.h>
#include <except.h>
#include <naming_convention.h>
#include <transliterate.h>

namespace nameguard {

static bool isAsciiStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentifier(const std::string &name) {
    return !name.empty() && isIdentStart(name[0]) &&
           std::all_of(name.begin(), name.end(), isIdentChar);
}

std::string enforceNamingConvention(const std::string &name) {
    auto text = transliterate(name);

    if (text.empty() || !isAsciiStart(text[0])) {
        if (!name.empty() &&
            std::none_of(text.begin(), text.end(), isIdentChar)) {
            WARNING(NG_MSG << "Name \"" << name
                           << "\" has no legal identifier character, only \""
                           << Config::namePrefix() << "\" is kept");
        }
        text = Config::namePrefix() + ucfirst(text);
    }

    auto begin = std::find_if(text.begin(), text.end(), isIdentStart);
    std::string ret;
    ret.reserve(text.end() - begin);
    std::copy_if(begin, text.end(), std::back_inserter(ret), isIdentChar);

    if (ret.empty()) {
        throw InvalidName(name, NG_MSG << "Unable to make an identifier from \""
                                       << name << "\" with prefix \""
                                       << Config::namePrefix() << "\"");
    }
    return ret;
}

} // namespace nameguard
