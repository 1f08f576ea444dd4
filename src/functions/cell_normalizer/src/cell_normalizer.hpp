#pragma once
#include "functions/xlsx_reader/src/xlsx_reader.hpp"

#include <optional>
#include <string>

// 셀 값 → 앞뒤 공백을 제거한 텍스트. 빈 셀/공백뿐이면 nullopt
std::optional<std::string> normalize_cell(const CellValue& value);

// 숫자 표기: 정수면 소수점 없이, 아니면 왕복 가능한 가장 짧은 표기
std::string format_number(double d);
