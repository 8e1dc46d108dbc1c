#include "case_fold.hpp"
#include <cstddef>
#include <cstdint>

namespace dfl::text {

namespace {

constexpr char32_t invalid_cp = 0xFFFFFFFF;

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Returns the decoded code point and advances `pos`, or returns invalid_cp
// and leaves `pos` untouched.
char32_t decode(std::string_view str, std::size_t& pos) {
    const auto lead = static_cast<unsigned char>(str[pos]);
    const std::size_t left = str.size() - pos;

    auto at = [&](std::size_t i) {
        return static_cast<unsigned char>(str[pos + i]);
    };

    if (lead >= 0xC2 && lead <= 0xDF) {
        if (left < 2 || !is_continuation(at(1))) {
            return invalid_cp;
        }
        const char32_t cp = (char32_t{lead} & 0x1F) << 6 | (at(1) & 0x3F);
        pos += 2;
        return cp;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (left < 3 || !is_continuation(at(1)) || !is_continuation(at(2))) {
            return invalid_cp;
        }
        if ((lead == 0xE0 && at(1) < 0xA0) || (lead == 0xED && at(1) > 0x9F)) {
            return invalid_cp;
        }
        const char32_t cp = (char32_t{lead} & 0x0F) << 12 |
                            (char32_t{at(1)} & 0x3F) << 6 | (at(2) & 0x3F);
        pos += 3;
        return cp;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (left < 4 || !is_continuation(at(1)) || !is_continuation(at(2)) ||
            !is_continuation(at(3))) {
            return invalid_cp;
        }
        if ((lead == 0xF0 && at(1) < 0x90) || (lead == 0xF4 && at(1) > 0x8F)) {
            return invalid_cp;
        }
        const char32_t cp = (char32_t{lead} & 0x07) << 18 |
                            (char32_t{at(1)} & 0x3F) << 12 |
                            (char32_t{at(2)} & 0x3F) << 6 | (at(3) & 0x3F);
        pos += 4;
        return cp;
    }
    return invalid_cp;
}

void encode(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool in_range(char32_t cp, char32_t lo, char32_t hi) {
    return cp >= lo && cp <= hi;
}

// Upper case at the even code point, lower case right after it.
char32_t even_pair(char32_t cp) {
    return (cp % 2 == 0) ? cp + 1 : cp;
}

char32_t odd_pair(char32_t cp) {
    return (cp % 2 == 1) ? cp + 1 : cp;
}

char32_t fold_latin(char32_t cp) {
    if (in_range(cp, 0x00C0, 0x00DE) && cp != 0x00D7) {
        return cp + 0x20;
    }
    if (cp == 0x0130) {
        return U'i';
    }
    if (cp == 0x0178) {
        return 0x00FF;
    }
    if (in_range(cp, 0x0100, 0x012F) || in_range(cp, 0x0132, 0x0137) ||
        in_range(cp, 0x014A, 0x0177)) {
        return even_pair(cp);
    }
    if (in_range(cp, 0x0139, 0x0148) || in_range(cp, 0x0179, 0x017E)) {
        return odd_pair(cp);
    }
    return cp;
}

char32_t fold_greek(char32_t cp) {
    switch (cp) {
        case 0x0370:
        case 0x0372:
        case 0x0376:
            return cp + 1;
        case 0x037F:
            return 0x03F3;
        case 0x0386:
            return 0x03AC;
        case 0x038C:
            return 0x03CC;
        case 0x03CF:
            return 0x03D7;
        case 0x03F4:
            return 0x03B8;
        case 0x03F7:
            return 0x03F8;
        case 0x03F9:
            return 0x03F2;
        case 0x03FA:
            return 0x03FB;
        default:
            break;
    }
    if (in_range(cp, 0x0388, 0x038A)) {
        return cp + 0x25;
    }
    if (in_range(cp, 0x038E, 0x038F)) {
        return cp + 0x3F;
    }
    if (in_range(cp, 0x0391, 0x03AB) && cp != 0x03A2) {
        return cp + 0x20;
    }
    if (in_range(cp, 0x03D8, 0x03EF)) {
        return even_pair(cp);
    }
    if (in_range(cp, 0x03FD, 0x03FF)) {
        return cp - 0x82;
    }
    return cp;
}

char32_t fold_cyrillic(char32_t cp) {
    if (in_range(cp, 0x0400, 0x040F)) {
        return cp + 0x50;
    }
    if (in_range(cp, 0x0410, 0x042F)) {
        return cp + 0x20;
    }
    if (cp == 0x04C0) {
        return 0x04CF;
    }
    if (in_range(cp, 0x0460, 0x0481) || in_range(cp, 0x048A, 0x04BF) ||
        in_range(cp, 0x04D0, 0x052F)) {
        return even_pair(cp);
    }
    if (in_range(cp, 0x04C1, 0x04CE)) {
        return odd_pair(cp);
    }
    return cp;
}

}  // namespace

char32_t fold_code_point(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= U'A' && cp <= U'Z') ? cp + 0x20 : cp;
    }
    if (cp < 0x0180) {
        return fold_latin(cp);
    }
    if (in_range(cp, 0x0370, 0x03FF)) {
        return fold_greek(cp);
    }
    if (in_range(cp, 0x0400, 0x052F)) {
        return fold_cyrillic(cp);
    }
    if (in_range(cp, 0x0531, 0x0556)) {
        return cp + 0x30;
    }
    if (in_range(cp, 0xFF21, 0xFF3A)) {
        return cp + 0x20;
    }
    return cp;
}

void fold_case_into(std::string_view str, std::string& out) {
    out.clear();
    out.reserve(str.size());

    std::size_t pos = 0;
    while (pos < str.size()) {
        const auto c = static_cast<unsigned char>(str[pos]);
        if (c < 0x80) {
            out.push_back(
                static_cast<char>((c >= 'A' && c <= 'Z') ? c + 0x20 : c));
            ++pos;
            continue;
        }

        const std::size_t start = pos;
        const char32_t cp = decode(str, pos);
        if (cp == invalid_cp) {
            out.push_back(str[pos++]);
            continue;
        }

        const char32_t folded = fold_code_point(cp);
        if (folded == cp) {
            out.append(str.substr(start, pos - start));
        } else {
            encode(folded, out);
        }
    }
}

std::string fold_case(std::string_view str) {
    std::string out;
    fold_case_into(str, out);
    return out;
}

std::string_view trim(std::string_view str) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    const auto start = str.find_first_not_of(whitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

}  // namespace dfl::text
