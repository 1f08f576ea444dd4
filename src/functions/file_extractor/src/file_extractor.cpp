#include "file_extractor.hpp"
#include "functions/cell_normalizer/src/cell_normalizer.hpp"
#include "functions/tokenizer/src/tokenizer.hpp"
#include "functions/xlsxtract_error/src/xlsxtract_error.hpp"

#include <iostream>
#include <stdexcept>

FileResult extract_tokens(CellSource& source,
                          const FilterConfig& config,
                          const std::string& path) {
    FileResult result;
    result.path = path;

    CellValue cell;
    while (source.next(cell)) {
        auto cleaned = normalize_cell(cell);
        if (!cleaned) continue;

        for (const auto& candidate : split_tokens(*cleaned, config.split_chars, config.split_whitespace)) {
            FilterResult fr = filter_token(candidate, config);
            if (!fr.accepted) {
                ++result.skipped;
                ++result.skipped_by_reason[static_cast<size_t>(fr.reason)];
                continue;
            }
            // 같은 파일 안의 중복은 found/skipped 어느 쪽에도 세지 않음
            if (result.tokens.insert(std::move(fr.token)).second) ++result.found;
        }
    }
    return result;
}

FileResult extract_xlsx_file(const std::string& path,
                             const FilterConfig& config) {
    try {
        XlsxCellSource source(path);
        return extract_tokens(source, config, path);
    }
    catch (const std::exception& e) {
        // FileUnreadable: 이 파일만 건너뛰고 실행은 계속
        std::cerr << "\n[error] " << error_kind_name(ErrorKind::FileUnreadable)
                  << ": Error processing " << path << ": " << e.what() << "\n";

        FileResult empty;
        empty.path = path;
        empty.unreadable = true;
        empty.error = e.what();
        return empty;
    }
}
