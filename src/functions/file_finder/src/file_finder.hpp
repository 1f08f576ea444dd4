#pragma once
#include <filesystem>
#include <string>
#include <vector>

extern const char* const kXlsxExtension;   // ".xlsx"

// 파일 이름 필터 정규화: 확장자가 없으면 ".xlsx" 를 붙임
std::string normalize_name_filter(const std::string& name);

// root 아래의 모든 .xlsx 파일 (확장자 대소문자 무시, 경로 순 정렬)
// name_filter 가 있으면 파일 이름이 정확히 같은 것만 (대소문자 무시)
std::vector<std::filesystem::path> find_xlsx_files(const std::filesystem::path& root,
                                                   const std::string& name_filter = {});
