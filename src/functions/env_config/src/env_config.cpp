#include "env_config.hpp"
#include "functions/text_util/src/text_util.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

static const char* const kEnvKeys[] = {
    "XLSXTRACT_OUTPUT",
    "XLSXTRACT_SPLIT_CHARS",
    "XLSXTRACT_SPLIT_WORDS",
    "XLSXTRACT_MAX_LENGTH",
    "XLSXTRACT_COMPLEXITY",
    "XLSXTRACT_PROGRESS",
    "XLSXTRACT_THREADS",
    "XLSXTRACT_STATS_JSON",
};

EnvMap load_env(const fs::path& path) {
    EnvMap env;
    std::ifstream in(path);
    if (!in) return env;

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trim_text(line.substr(0, pos));
        std::string val = line.substr(pos + 1);

        // 따옴표로 감싼 값은 안쪽 그대로 (구분자에 공백을 넣을 수 있게)
        std::string tv = trim_text(val);
        if (tv.size() >= 2 && (tv.front() == '"' || tv.front() == '\'') && tv.back() == tv.front())
            val = tv.substr(1, tv.size() - 2);
        else
            val = tv;

        if (!key.empty()) env[key] = val;
    }
    return env;
}

fs::path locate_env_file(const fs::path& exe_dir) {
    std::error_code ec;
    const fs::path cand1 = fs::current_path(ec) / ".env";  // CWD
    if (!ec && fs::exists(cand1, ec)) return cand1;
    if (!exe_dir.empty()) {
        const fs::path cand2 = exe_dir / ".env";            // exe 옆
        if (fs::exists(cand2, ec)) return cand2;
    }
    return {};
}

void overlay_process_env(EnvMap& env) {
    for (const char* key : kEnvKeys) {
        if (const char* v = std::getenv(key)) env[key] = v;
    }
}

bool parse_size(const std::string& s, size_t& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = static_cast<size_t>(v);
    return true;
}

bool parse_flag(const std::string& s, bool& out) {
    const std::string v = to_lower_ascii(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on")  { out = true;  return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

static const std::string* find_value(const EnvMap& env, const char* key) {
    auto it = env.find(key);
    return it == env.end() ? nullptr : &it->second;
}

static void warn_bad(const char* key, const std::string& value) {
    std::cerr << "[warn] ignoring " << key << "=" << value << " (invalid value)\n";
}

void apply_env(const EnvMap& env, RunOptions& opts) {
    if (auto v = find_value(env, "XLSXTRACT_OUTPUT")) {
        if (!v->empty()) opts.output = *v;
    }
    if (auto v = find_value(env, "XLSXTRACT_SPLIT_CHARS")) {
        opts.filter.split_chars = *v;
    }
    if (auto v = find_value(env, "XLSXTRACT_SPLIT_WORDS")) {
        bool b = false;
        if (parse_flag(*v, b)) opts.filter.split_whitespace = b;
        else warn_bad("XLSXTRACT_SPLIT_WORDS", *v);
    }
    if (auto v = find_value(env, "XLSXTRACT_MAX_LENGTH")) {
        size_t n = 0;
        if (parse_size(*v, n) && n > 0) opts.filter.max_length = n;
        else warn_bad("XLSXTRACT_MAX_LENGTH", *v);
    }
    if (auto v = find_value(env, "XLSXTRACT_COMPLEXITY")) {
        bool b = false;
        if (parse_flag(*v, b)) opts.filter.require_complexity = b;
        else warn_bad("XLSXTRACT_COMPLEXITY", *v);
    }
    if (auto v = find_value(env, "XLSXTRACT_PROGRESS")) {
        bool b = false;
        if (parse_flag(*v, b)) opts.show_progress = b;
        else warn_bad("XLSXTRACT_PROGRESS", *v);
    }
    if (auto v = find_value(env, "XLSXTRACT_THREADS")) {
        size_t n = 0;
        if (parse_size(*v, n) && n > 0 && n <= kMaxThreads) opts.threads = static_cast<unsigned>(n);
        else warn_bad("XLSXTRACT_THREADS", *v);
    }
    if (auto v = find_value(env, "XLSXTRACT_STATS_JSON")) {
        opts.stats_json = *v;
    }
}
