#pragma once

#include <string>

namespace signrec {

// Canonical form used to compare gesture names coming from different
// sources (model labels, lesson content, user input):
// trimmed, upper-case, "_DIR"/"_ESQ" hand suffixes dropped, en/em dashes
// turned into '-', runs of whitespace collapsed, aliases applied, then
// Portuguese diacritics removed (UTF-8 input).
std::string canonicalize_gesture_name(const std::string& name);

// False when a canonicalizes to an empty string
bool gesture_names_match(const std::string& a, const std::string& b);

} // namespace signrec
