#include "cli_options.hpp"
#include "functions/env_config/src/env_config.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

void print_usage(std::ostream& os) {
    os
        << "usage:\n"
        << "  xlsxtract -d <dir> [options]\n"
        << "\n"
        << "Extract text from XLSX files for password generation.\n"
        << "\n"
        << "options:\n"
        << "  -d, --directory <dir>        directory to scan for XLSX files (required)\n"
        << "  -o, --output <path>          default: passwords.txt\n"
        << "  -s, --split <chars>          split cell text on any of these characters\n"
        << "  -w, --split-words            split cell text on any whitespace character\n"
        << "  -m, --max-length <n>         default: 32\n"
        << "  -f, --file <name>            only process files with this name (.xlsx optional)\n"
        << "  -c, --complexity             require upper, lower, digit and special character\n"
        << "  -p, --progress               show real-time progress of word extraction\n"
        << "      --progress-delay <ms>    default: 100\n"
        << "  -j, --threads <n>            default: 1, at most 64\n"
        << "      --stats-json <path>      write run statistics as JSON\n"
        << "  -h, --help\n"
        << "\n"
        << "defaults can also be set in .env or the environment:\n"
        << "  XLSXTRACT_OUTPUT, XLSXTRACT_SPLIT_CHARS, XLSXTRACT_SPLIT_WORDS, XLSXTRACT_MAX_LENGTH,\n"
        << "  XLSXTRACT_COMPLEXITY, XLSXTRACT_PROGRESS, XLSXTRACT_THREADS, XLSXTRACT_STATS_JSON\n";
}

static size_t positive_arg(const std::string& flag, const std::string& value) {
    size_t n = 0;
    if (!parse_size(value, n) || n == 0)
        throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
    return n;
}

CliAction parse_args(int argc, char** argv, RunOptions& opts) {
    // 명령줄의 -s/-w 는 .env 값을 대체하고, 명령줄 안에서는 누적
    bool split_from_cli = false;
    auto split_on_cli = [&]() {
        if (split_from_cli) return;
        opts.filter.split_chars.clear();
        opts.filter.split_whitespace = false;
        split_from_cli = true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string inline_value;
        bool has_inline = false;

        // --key=value
        if (arg.rfind("--", 0) == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        auto value = [&]() -> std::string {
            if (has_inline) return inline_value;
            if (i + 1 >= argc) throw std::invalid_argument(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") return CliAction::Help;
        else if (arg == "-d" || arg == "--directory") opts.directory = value();
        else if (arg == "-o" || arg == "--output") opts.output = value();
        else if (arg == "-s" || arg == "--split") {
            const std::string v = value();
            split_on_cli();
            opts.filter.split_chars += v;
        }
        else if (arg == "-w" || arg == "--split-words") {
            split_on_cli();
            opts.filter.split_whitespace = true;
        }
        else if (arg == "-m" || arg == "--max-length") opts.filter.max_length = positive_arg(arg, value());
        else if (arg == "-f" || arg == "--file") opts.name_filter = value();
        else if (arg == "-c" || arg == "--complexity") opts.filter.require_complexity = true;
        else if (arg == "-p" || arg == "--progress") opts.show_progress = true;
        else if (arg == "--progress-delay") {
            size_t ms = 0;
            const std::string v = value();
            if (!parse_size(v, ms))
                throw std::invalid_argument(arg + " expects milliseconds, got '" + v + "'");
            opts.progress_delay = std::chrono::milliseconds(ms);
        }
        else if (arg == "-j" || arg == "--threads") {
            const std::string v = value();
            const size_t n = positive_arg(arg, v);
            if (n > kMaxThreads)
                throw std::invalid_argument(arg + " must be at most " + std::to_string(kMaxThreads) + ", got '" + v + "'");
            opts.threads = static_cast<unsigned>(n);
        }
        else if (arg == "--stats-json") opts.stats_json = value();
        else throw std::invalid_argument("unknown option: " + arg);
    }

    if (opts.directory.empty())
        throw std::invalid_argument("the following arguments are required: -d/--directory");
    if (opts.output.empty())
        throw std::invalid_argument("output path must not be empty");
    return CliAction::Run;
}
