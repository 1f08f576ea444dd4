#pragma once
#include "functions/run_aggregator/src/run_aggregator.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

using EnvMap = std::unordered_map<std::string, std::string>;

// .env 파일 로드 (KEY=VALUE, '#' 주석). 파일이 없으면 빈 맵
EnvMap load_env(const std::filesystem::path& path);

// .env 위치: 현재 디렉토리 → 실행 파일 옆. 못 찾으면 빈 경로
std::filesystem::path locate_env_file(const std::filesystem::path& exe_dir);

// 프로세스 환경 변수가 .env 값을 덮어씀 (XLSXTRACT_* 만)
void overlay_process_env(EnvMap& env);

// XLSXTRACT_* 값을 옵션 기본값으로 적용. 잘못된 값은 [warn] 후 무시
void apply_env(const EnvMap& env, RunOptions& opts);

// 문자열 → 값 변환 (실패 시 false)
bool parse_size(const std::string& s, size_t& out);
bool parse_flag(const std::string& s, bool& out);
