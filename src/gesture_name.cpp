#include "gesture_name.hpp"
#include <cctype>
#include <map>
#include <regex>

namespace signrec {

namespace {

// The model was labelled OBRIGADA; lesson content says OBRIGADO
const std::map<std::string, std::string>& aliases() {
    static const std::map<std::string, std::string> table = {
        {"OBRIGADO", "OBRIGADA"},
    };
    return table;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// ASCII and Latin-1 (U+00E0..U+00FE) upper-casing on UTF-8 bytes
std::string to_upper_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == 0xC3 && i + 1 < s.size()) {
            unsigned char n = static_cast<unsigned char>(s[i + 1]);
            // U+00F7 (division sign) has no upper-case form
            if (n >= 0xA0 && n <= 0xBE && n != 0xB7) n = static_cast<unsigned char>(n - 0x20);
            out.push_back(static_cast<char>(c));
            out.push_back(static_cast<char>(n));
            ++i;
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

std::string replace_dashes(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        // U+2013 / U+2014: E2 80 93 / E2 80 94
        if (static_cast<unsigned char>(s[i]) == 0xE2 && i + 2 < s.size() &&
            static_cast<unsigned char>(s[i + 1]) == 0x80 &&
            (static_cast<unsigned char>(s[i + 2]) == 0x93 || static_cast<unsigned char>(s[i + 2]) == 0x94)) {
            out.push_back('-');
            i += 2;
            continue;
        }
        out.push_back(s[i]);
    }
    return out;
}

// Base letter for an upper-case Latin-1 letter (second byte after 0xC3), 0 if none
char latin1_base(unsigned char n) {
    if (n >= 0x80 && n <= 0x85) return 'A';
    if (n == 0x87) return 'C';
    if (n >= 0x88 && n <= 0x8B) return 'E';
    if (n >= 0x8C && n <= 0x8F) return 'I';
    if (n == 0x91) return 'N';
    if ((n >= 0x92 && n <= 0x96) || n == 0x98) return 'O';
    if (n >= 0x99 && n <= 0x9C) return 'U';
    if (n == 0x9D) return 'Y';
    return 0;
}

std::string strip_diacritics(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (i + 1 < s.size()) {
            unsigned char n = static_cast<unsigned char>(s[i + 1]);
            // Precomposed letter
            if (c == 0xC3) {
                char base = latin1_base(n);
                if (base) {
                    out.push_back(base);
                    ++i;
                    continue;
                }
            }
            // Combining marks U+0300..U+036F (decomposed input)
            if ((c == 0xCC && n >= 0x80 && n <= 0xBF) || (c == 0xCD && n >= 0x80 && n <= 0xAF)) {
                ++i;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace

std::string canonicalize_gesture_name(const std::string& name) {
    std::string value = to_upper_utf8(trim(name));
    if (value.empty()) return value;

    static const std::regex hand_suffix("_(DIR|ESQ)\\b");
    static const std::regex spaces("\\s+");

    value = std::regex_replace(value, hand_suffix, "");
    value = replace_dashes(value);
    value = std::regex_replace(value, spaces, " ");

    // Aliases before diacritics so accented keys stay distinct
    auto alias = aliases().find(value);
    if (alias != aliases().end()) value = alias->second;

    return strip_diacritics(value);
}

bool gesture_names_match(const std::string& a, const std::string& b) {
    std::string ca = canonicalize_gesture_name(a);
    if (ca.empty()) return false;
    return ca == canonicalize_gesture_name(b);
}

} // namespace signrec
