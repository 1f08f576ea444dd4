#include "tokenizer.hpp"
#include "functions/text_util/src/text_util.hpp"

#include <algorithm>

static std::vector<char32_t> delimiter_set(const std::string& split_chars) {
    std::vector<char32_t> set;
    size_t i = 0;
    char32_t cp;
    while (i < split_chars.size()) {
        if (!utf8_next(split_chars, i, cp)) continue;
        if (std::find(set.begin(), set.end(), cp) == set.end()) set.push_back(cp);
    }
    return set;
}

std::vector<std::string> split_tokens(const std::string& text,
                                      const std::string& split_chars,
                                      bool split_whitespace) {
    std::vector<std::string> out;
    if (split_chars.empty() && !split_whitespace) {
        out.push_back(trim_text(text));
        return out;
    }

    const std::vector<char32_t> delims = delimiter_set(split_chars);
    auto is_delim = [&delims, split_whitespace](char32_t cp) {
        if (split_whitespace && is_space_cp(cp)) return true;
        return std::find(delims.begin(), delims.end(), cp) != delims.end();
    };

    size_t start = 0;        // 현재 조각 시작 (바이트)
    bool in_piece = false;
    size_t i = 0;
    char32_t cp;
    while (i < text.size()) {
        const size_t at = i;
        const bool valid = utf8_next(text, i, cp);
        if (valid && is_delim(cp)) {
            if (in_piece) {
                out.push_back(trim_text(text.substr(start, at - start)));
                in_piece = false;
            }
            continue;
        }
        if (!in_piece) { start = at; in_piece = true; }
    }
    if (in_piece) out.push_back(trim_text(text.substr(start)));
    return out;
}
