#pragma once
#include "functions/token_filter/src/token_filter.hpp"
#include "functions/xlsx_reader/src/xlsx_reader.hpp"

#include <set>
#include <string>

// 파일 하나의 추출 결과
struct FileResult {
    std::string path;
    std::set<std::string> tokens;       // 파일 내 고유 토큰
    size_t found = 0;                   // 파일 내에서 처음 추가된 토큰 수
    size_t skipped = 0;                 // 필터에서 제외된 후보 수
    SkipCounts skipped_by_reason{};
    bool unreadable = false;            // 열기/파싱 실패 (토큰/카운트 0)
    std::string error;
};

// 셀 스트림을 정규화 → 분리 → 필터 순으로 처리
// 소스의 예외는 그대로 전파
FileResult extract_tokens(CellSource& source,
                          const FilterConfig& config,
                          const std::string& path);

// .xlsx 파일 하나 처리. 열기/파싱 실패는 로그 후 빈 결과(unreadable) 반환
FileResult extract_xlsx_file(const std::string& path,
                             const FilterConfig& config);
