#include "file_finder.hpp"
#include "functions/text_util/src/text_util.hpp"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

const char* const kXlsxExtension = ".xlsx";

std::string normalize_name_filter(const std::string& name) {
    const std::string ext = kXlsxExtension;
    if (name.empty()) return name;
    if (name.size() >= ext.size() &&
        iequals_ascii(name.substr(name.size() - ext.size()), ext))
        return name;
    return name + ext;
}

std::vector<fs::path> find_xlsx_files(const fs::path& root, const std::string& name_filter) {
    std::vector<fs::path> out;
    const std::string wanted = normalize_name_filter(name_filter);

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        std::cerr << "[warn] cannot scan " << root.string() << ": " << ec.message() << "\n";
        return out;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "[warn] directory scan stopped: " << ec.message() << "\n";
            break;
        }
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;

        const fs::path& p = it->path();
        if (!iequals_ascii(p.extension().string(), kXlsxExtension)) continue;
        if (!wanted.empty() && !iequals_ascii(p.filename().string(), wanted)) continue;
        out.push_back(p);
    }

    std::sort(out.begin(), out.end());
    return out;
}
