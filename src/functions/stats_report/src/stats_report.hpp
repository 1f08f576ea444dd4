#pragma once
#include "functions/run_aggregator/src/run_aggregator.hpp"

#include <nlohmann/json.hpp>
#include <string>

// 실행 설정 + 합계 + 사유별 제외 수 + 파일별 요약
nlohmann::json build_stats_report(const RunOptions& opts, const RunState& state);

// 보고서를 path 에 저장. 실패 시 std::runtime_error
void write_stats_report(const std::string& path, const RunOptions& opts, const RunState& state);
