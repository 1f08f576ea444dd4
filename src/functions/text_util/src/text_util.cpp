#include "text_util.hpp"

#include <cctype>

bool utf8_next(const std::string& s, size_t& i, char32_t& cp) {
    const unsigned char c = (unsigned char)s[i];
    if (c < 0x80) { cp = c; ++i; return true; }

    size_t len = 0;
    char32_t min = 0;
    if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; min = 0x80; }
    else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; min = 0x800; }
    else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; min = 0x10000; }
    else { cp = 0xFFFD; ++i; return false; }

    if (i + len > s.size()) { cp = 0xFFFD; ++i; return false; }
    for (size_t k = 1; k < len; ++k) {
        const unsigned char cc = (unsigned char)s[i + k];
        if ((cc & 0xC0) != 0x80) { cp = 0xFFFD; ++i; return false; }
        cp = (cp << 6) | (cc & 0x3F);
    }
    // overlong / 서로게이트 / 범위 초과
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD; ++i; return false;
    }
    i += len;
    return true;
}

void utf8_append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back((char)cp);
    } else if (cp < 0x800) {
        out.push_back((char)(0xC0 | (cp >> 6)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back((char)(0xE0 | (cp >> 12)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | (cp >> 18)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    size_t i = 0;
    char32_t cp;
    while (i < s.size()) { utf8_next(s, i, cp); ++n; }
    return n;
}

bool is_space_cp(char32_t cp) {
    if (cp < 0x80) return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20);
    switch (cp) {
    case 0x85: case 0xA0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool is_printable_cp(char32_t cp) {
    if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F)) return false;   // 제어 문자
    if (cp < 0x7F) return true;
    if (is_space_cp(cp)) return false;                            // 공백 구분자는 ' ' 외 모두 출력 불가
    if (cp == 0xAD || cp == 0x61C || cp == 0x6DD || cp == 0x70F || cp == 0x180E) return false;
    if (cp >= 0x600 && cp <= 0x605) return false;
    if (cp >= 0x200B && cp <= 0x200F) return false;              // zero width, LRM/RLM
    if (cp >= 0x202A && cp <= 0x202E) return false;              // bidi embedding
    if (cp >= 0x2060 && cp <= 0x206F) return false;
    if (cp == 0xFEFF) return false;                              // BOM
    if (cp >= 0xFFF9 && cp <= 0xFFFB) return false;
    if ((cp & 0xFFFE) == 0xFFFE) return false;                   // 비문자
    if (cp >= 0xFDD0 && cp <= 0xFDEF) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    if (cp >= 0xE000 && cp <= 0xF8FF) return false;              // 사용자 정의 영역
    if (cp >= 0xE0000 && cp <= 0xE007F) return false;            // 태그
    if (cp >= 0xF0000) return false;
    return true;
}

std::string trim_text(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    char32_t cp;

    // 앞쪽
    size_t i = 0;
    while (i < s.size()) {
        size_t at = i;
        utf8_next(s, i, cp);
        if (!is_space_cp(cp)) { begin = at; break; }
        begin = i;
    }
    if (begin >= s.size()) return std::string();

    // 뒤쪽: 앞에서부터 훑으며 마지막 비공백 글자의 끝 위치 기록
    end = begin;
    i = begin;
    while (i < s.size()) {
        utf8_next(s, i, cp);
        if (!is_space_cp(cp)) end = i;
    }
    return s.substr(begin, end - begin);
}

std::string strip_invisible(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    char32_t cp;
    while (i < s.size()) {
        if (!utf8_next(s, i, cp)) continue;   // 잘못된 바이트는 버림
        if (is_space_cp(cp) || !is_printable_cp(cp)) continue;
        utf8_append(out, cp);
    }
    return out;
}

std::string to_lower_ascii(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool iequals_ascii(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}
