#ifndef NAME_GUARD_TRANSLITERATE_H
#define NAME_GUARD_TRANSLITERATE_H

#include <string>

namespace nameguard {

/**
 * Replace accented and decorated Latin letters in a UTF-8 string with their
 * closest ASCII spelling
 *
 * The table covers Latin-1 Supplement, Latin Extended-A and a few letters of
 * Latin Extended-B. Ligatures expand to two letters (Æ -> AE). Anything not
 * in the table, malformed UTF-8 included, is copied unchanged
 */
std::string transliterate(const std::string &text);

} // namespace nameguard

#endif // NAME_GUARD_TRANSLITERATE_H
