#include "run_aggregator.hpp"
#include "functions/file_finder/src/file_finder.hpp"
#include "functions/progress/src/progress.hpp"
#include "functions/xlsxtract_error/src/xlsxtract_error.hpp"

#include <algorithm>
#include <fstream>
#include <future>
#include <iomanip>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

void RunState::merge(FileResult&& result) {
    FileSummary s;
    s.path = result.path;
    s.found = result.found;
    s.skipped = result.skipped;
    s.unreadable = result.unreadable;
    s.error = result.error;
    summaries_.push_back(std::move(s));

    ++files_;
    found_ += result.found;
    skipped_ += result.skipped;
    if (result.unreadable) ++unreadable_;
    for (size_t i = 0; i < kSkipReasonCount; ++i)
        skipped_by_reason_[i] += result.skipped_by_reason[i];

    tokens_.merge(result.tokens);
}

std::vector<std::string> RunState::sorted_tokens() const {
    // std::set<std::string> 은 이미 바이트 순
    return std::vector<std::string>(tokens_.begin(), tokens_.end());
}

void RunState::write_output(const fs::path& output) const {
    fs::path tmp = output;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw XlsxtractError(ErrorKind::OutputWriteFailure, "failed to create: " + tmp.string());
        for (const auto& t : tokens_) ofs << t << '\n';
        ofs.flush();
        if (!ofs) {
            ofs.close();
            std::error_code ec;
            fs::remove(tmp, ec);
            throw XlsxtractError(ErrorKind::OutputWriteFailure, "failed to write: " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, output, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw XlsxtractError(ErrorKind::OutputWriteFailure,
                             "failed to write " + output.string() + ": " + ec.message());
    }
}

RunState process_files(const std::vector<fs::path>& files, const RunOptions& opts) {
    RunState state;
    const size_t width = terminal_width();

    auto report = [&](const FileResult& r) {
        if (opts.show_progress)
            show_token_progress(std::cout, r.path, r.tokens, opts.progress_delay, width);
        else
            std::cout << "Processed: " << r.path << " - Found " << r.found << " words\n";
    };

    if (opts.threads <= 1 || files.size() <= 1) {
        for (const auto& p : files) {
            FileResult r = extract_xlsx_file(p.string(), opts.filter);
            report(r);
            state.merge(std::move(r));
        }
        return state;
    }

    // threads 개씩 async 로 추출, 합치기는 이 스레드에서만
    size_t next = 0;
    while (next < files.size()) {
        std::vector<std::future<FileResult>> batch;
        const size_t end = std::min(files.size(), next + opts.threads);
        for (; next < end; ++next) {
            const std::string path = files[next].string();
            const FilterConfig& filter = opts.filter;
            batch.emplace_back(std::async(std::launch::async, [path, &filter]() {
                return extract_xlsx_file(path, filter);
            }));
        }
        for (auto& f : batch) {
            FileResult r = f.get();
            report(r);
            state.merge(std::move(r));
        }
    }
    return state;
}

RunState run_extraction(const RunOptions& opts) {
    const fs::path root(opts.directory);
    std::error_code ec;
    if (opts.directory.empty() || !fs::is_directory(root, ec))
        throw XlsxtractError(ErrorKind::InvalidRoot,
                             "Directory '" + opts.directory + "' does not exist");

    StepTimer total;

    print_step("First pass: Collecting XLSX files...");
    const auto files = find_xlsx_files(root, opts.name_filter);
    if (files.empty()) {
        if (opts.name_filter.empty())
            throw XlsxtractError(ErrorKind::NoFilesFound, "No XLSX files found in " + opts.directory);
        throw XlsxtractError(ErrorKind::NoFilesFound,
                             "No XLSX file named '" + normalize_name_filter(opts.name_filter) +
                             "' found in " + opts.directory);
    }
    std::cout << "Found " << files.size() << " XLSX files\n";

    print_step("Extracting words...");
    StepTimer t_extract;
    RunState state = process_files(files, opts);
    std::cout << "    (extract: " << std::fixed << std::setprecision(1) << t_extract.elapsed_ms() << " ms)\n";

    print_step("Writing final sorted and unique word list...");
    state.write_output(opts.output);

    std::cout << "\nProcessing complete!\n";
    std::cout << "Statistics:\n";
    std::cout << "- Files processed: " << state.files() << "\n";
    std::cout << "- Total words found: " << state.found() << "\n";
    std::cout << "- Unique words written: " << state.unique() << "\n";
    if (state.unreadable_files() > 0)
        std::cout << "- Unreadable files: " << state.unreadable_files() << "\n";
    if (opts.filter.require_complexity)
        std::cout << "- Skipped for complexity: "
                  << state.skipped_by_reason()[static_cast<size_t>(SkipReason::LowComplexity)] << "\n";
    std::cout << "- Results written to: " << opts.output << "\n";

    std::cout << "[✓] Done. Total: " << std::fixed << std::setprecision(1)
              << total.elapsed_ms() << " ms\n";
    return state;
}
