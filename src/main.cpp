#include "functions/cli_options/src/cli_options.hpp"
#include "functions/env_config/src/env_config.hpp"
#include "functions/run_aggregator/src/run_aggregator.hpp"
#include "functions/stats_report/src/stats_report.hpp"
#include "functions/xlsxtract_error/src/xlsxtract_error.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

#ifdef _WIN32
  #include <windows.h>
#endif

namespace fs = std::filesystem;

// exe가 있는 디렉토리
static fs::path exe_dir() {
#ifdef _WIN32
    wchar_t buf[MAX_PATH];
    DWORD n = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    return n ? fs::path(buf).parent_path() : fs::current_path();
#else
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fs::current_path(ec) : self.parent_path();
#endif
}

int main(int argc, char* argv[]) {
    RunOptions opts;

    // 기본값 ← .env ← 환경 변수 ← 명령줄
    try {
        EnvMap env;
        const fs::path env_path = locate_env_file(exe_dir());
        if (!env_path.empty()) env = load_env(env_path);
        overlay_process_env(env);
        apply_env(env, opts);

        if (parse_args(argc, argv, opts) == CliAction::Help) {
            print_usage(std::cout);
            return 0;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return 1;
    }

    try {
        RunState state = run_extraction(opts);

        if (!opts.stats_json.empty()) {
            write_stats_report(opts.stats_json, opts, state);
            std::cout << "[info] Saved statistics to " << opts.stats_json << "\n";
        }
        return 0;
    } catch (const XlsxtractError& e) {
        std::cerr << "[error] " << e.what() << "\n";
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
