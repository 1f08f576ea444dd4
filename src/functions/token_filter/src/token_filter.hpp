#pragma once
#include <array>
#include <functional>
#include <string>

// 복잡도 규칙: 토큰 → 통과 여부
using ComplexityRule = std::function<bool(const std::string&)>;

// 대문자/소문자/숫자/특수문자 네 종류를 모두 포함하는지
bool four_class_complexity(const std::string& token);

// 기본 특수문자 집합
extern const char* const kSpecialChars;

struct FilterConfig {
    std::string split_chars;                        // 비어 있으면 나누지 않음
    bool split_whitespace = false;                  // 모든 공백 글자로도 나눔 (-w)
    size_t max_length = 32;                         // 글자 수 기준
    bool require_complexity = false;
    ComplexityRule complexity = four_class_complexity;
};

// 제외 사유 (순서 = 판정 순서)
enum class SkipReason {
    Empty = 0,
    TooLong,
    EmptyAfterCleaning,
    LowComplexity
};
constexpr size_t kSkipReasonCount = 4;
using SkipCounts = std::array<size_t, kSkipReasonCount>;

const char* skip_reason_name(SkipReason r);

struct FilterResult {
    bool accepted = false;
    std::string token;                  // accepted 일 때만 유효
    SkipReason reason = SkipReason::Empty;
};

// 후보 문자열 하나를 판정
// 1) 빈 문자열 2) 길이 초과(정리 전 기준) 3) 공백/출력 불가 글자 제거 후 빈 문자열 4) 복잡도
FilterResult filter_token(const std::string& candidate, const FilterConfig& config);
