#include "stats_report.hpp"

#include <fstream>
#include <stdexcept>

nlohmann::json build_stats_report(const RunOptions& opts, const RunState& state) {
    nlohmann::json j;
    j["config"] = {
        {"directory", opts.directory},
        {"output", opts.output},
        {"split_chars", opts.filter.split_chars},
        {"split_whitespace", opts.filter.split_whitespace},
        {"max_length", opts.filter.max_length},
        {"require_complexity", opts.filter.require_complexity},
        {"name_filter", opts.name_filter},
        {"threads", opts.threads},
    };
    j["files_processed"] = state.files();
    j["unreadable_files"] = state.unreadable_files();
    j["total_found"] = state.found();
    j["total_skipped"] = state.skipped();
    j["unique_written"] = state.unique();

    nlohmann::json reasons = nlohmann::json::object();
    for (size_t i = 0; i < kSkipReasonCount; ++i)
        reasons[skip_reason_name(static_cast<SkipReason>(i))] = state.skipped_by_reason()[i];
    j["skipped_by_reason"] = reasons;

    nlohmann::json files = nlohmann::json::array();
    for (const auto& f : state.file_summaries()) {
        nlohmann::json e = {
            {"path", f.path},
            {"found", f.found},
            {"skipped", f.skipped},
            {"unreadable", f.unreadable},
        };
        if (f.unreadable) e["error"] = f.error;
        files.push_back(e);
    }
    j["files"] = files;
    return j;
}

void write_stats_report(const std::string& path, const RunOptions& opts, const RunState& state) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) throw std::runtime_error("failed to create: " + path);
    ofs << build_stats_report(opts, state).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    if (!ofs) throw std::runtime_error("failed to write: " + path);
}
