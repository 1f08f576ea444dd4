#pragma once
#include "functions/file_extractor/src/file_extractor.hpp"
#include "functions/token_filter/src/token_filter.hpp"

#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

// 동시 추출 파일 수 상한
constexpr unsigned kMaxThreads = 64;

// 실행 옵션 (기본값 ← .env ← 환경 변수 ← 명령줄)
struct RunOptions {
    std::string directory;                      // 필수
    std::string output = "passwords.txt";
    std::string name_filter;                    // 비어 있으면 모든 .xlsx
    FilterConfig filter;
    bool show_progress = false;
    std::chrono::milliseconds progress_delay{100};
    unsigned threads = 1;
    std::string stats_json;                     // 비어 있으면 보고서 없음
};

// 실행 전체의 누적 상태: 생성 → merge → finalize
class RunState {
public:
    // 파일 결과 하나를 합침 (단일 호출자에서만)
    void merge(FileResult&& result);

    size_t files() const { return files_; }
    size_t found() const { return found_; }
    size_t skipped() const { return skipped_; }
    size_t unreadable_files() const { return unreadable_; }
    const SkipCounts& skipped_by_reason() const { return skipped_by_reason_; }
    size_t unique() const { return tokens_.size(); }
    const std::set<std::string>& tokens() const { return tokens_; }

    // 파일별 요약 (보고서용, 토큰은 보관하지 않음)
    struct FileSummary {
        std::string path;
        size_t found = 0;
        size_t skipped = 0;
        bool unreadable = false;
        std::string error;
    };
    const std::vector<FileSummary>& file_summaries() const { return summaries_; }

    // 정렬된 토큰 목록 (바이트 순 = UTF-8 코드 포인트 순)
    std::vector<std::string> sorted_tokens() const;

    // 한 줄에 하나씩 임시 파일에 쓴 뒤 output 으로 교체. 실패 시 XlsxtractError(OutputWriteFailure)
    void write_output(const std::filesystem::path& output) const;

private:
    std::set<std::string> tokens_;
    size_t files_ = 0;
    size_t found_ = 0;
    size_t skipped_ = 0;
    size_t unreadable_ = 0;
    SkipCounts skipped_by_reason_{};
    std::vector<FileSummary> summaries_;
};

// 파일 목록을 처리해 RunState 로 접음 (threads > 1 이면 병렬 추출, 합치기는 호출 스레드에서만)
RunState process_files(const std::vector<std::filesystem::path>& files, const RunOptions& opts);

// 전체 실행: 루트 확인 → 파일 탐색 → 추출 → 정렬/쓰기 → 통계 출력
// InvalidRoot / NoFilesFound / OutputWriteFailure 는 XlsxtractError 로 던짐
RunState run_extraction(const RunOptions& opts);
