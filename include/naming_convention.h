#ifndef NAME_GUARD_NAMING_CONVENTION_H
#define NAME_GUARD_NAMING_CONVENTION_H

#include <string>

namespace nameguard {

/**
 * Whether a byte may start an identifier: an ASCII letter, an underscore, or
 * a byte of a multi-byte UTF-8 sequence (0x80 - 0xff)
 */
inline bool isIdentStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           (unsigned char)c >= 0x80;
}

inline bool isIdentChar(char c) {
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

/**
 * Check a string against `[A-Za-z_\x80-\xff][A-Za-z0-9_\x80-\xff]*`
 */
bool isIdentifier(const std::string &name);

/**
 * Turn an arbitrary string into a bare PHP identifier
 *
 * Accented Latin letters are transliterated first. A name not starting with an
 * ASCII letter or underscore gets `Config::namePrefix()` prepended and its
 * first letter capitalized (`1st` -> `a1st`, `-x` -> `ax`). All other illegal
 * bytes are then dropped
 *
 * Keywords are not checked here
 *
 * @throw InvalidName if nothing legal remains
 */
std::string enforceNamingConvention(const std::string &name);

} // namespace nameguard

#endif // NAME_GUARD_NAMING_CONVENTION_H
