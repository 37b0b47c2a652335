#include <unordered_set>

#include <container_utils.h>
#include <except.h>
#include <keyword.h>

namespace nameguard {

// http://www.php.net/manual/en/reserved.keywords.php
static const std::unordered_set<std::string> &keywords() {
    static const std::unordered_set<std::string> set = {
        "__halt_compiler",
        "abstract",
        "and",
        "array",
        "as",
        "break",
        "callable",
        "case",
        "catch",
        "class",
        "clone",
        "const",
        "continue",
        "declare",
        "default",
        "die",
        "do",
        "echo",
        "else",
        "elseif",
        "empty",
        "enddeclare",
        "endfor",
        "endforeach",
        "endif",
        "endswitch",
        "endwhile",
        "eval",
        "exit",
        "extends",
        "float",
        "final",
        "finally",
        "for",
        "foreach",
        "function",
        "global",
        "goto",
        "if",
        "implements",
        "include",
        "include_once",
        "int",
        "instanceof",
        "insteadof",
        "interface",
        "isset",
        "list",
        "namespace",
        "new",
        "or",
        "parent",
        "print",
        "private",
        "protected",
        "public",
        "require",
        "require_once",
        "return",
        "static",
        "string",
        "switch",
        "throw",
        "trait",
        "try",
        "unset",
        "use",
        "var",
        "while",
        "xor",
        "yield",
    };
    return set;
}

bool isKeyword(const std::string &name) {
    return keywords().count(tolower(name));
}

NameCategory parseNameCategory(const std::string &_str) {
    auto &&str = tolower(_str);
    for (auto &&[i, s] : views::enumerate(nameCategoryNames)) {
        if (s == str) {
            return (NameCategory)i;
        }
    }
    ERROR(NG_MSG << "Unrecognized name category \"" << _str
                 << "\". Candidates are (case-insensitive): "
                 << (nameCategoryNames | join(", ")));
}

} // namespace nameguard
