#include "progress.hpp"
#include "functions/text_util/src/text_util.hpp"

#include <cstdlib>
#include <iostream>
#include <thread>

#ifdef _WIN32
  #include <windows.h>
#else
  #include <sys/ioctl.h>
  #include <unistd.h>
#endif

void print_step(const char* msg) {
    std::cout << "[*] " << msg << std::endl;
}

size_t terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO info;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &info))
        return static_cast<size_t>(info.srWindow.Right - info.srWindow.Left + 1);
#else
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
#endif
    if (const char* cols = std::getenv("COLUMNS")) {
        long n = std::strtol(cols, nullptr, 10);
        if (n > 0) return static_cast<size_t>(n);
    }
    return 80;
}

std::string truncate_to_width(const std::string& line, size_t width) {
    if (utf8_length(line) <= width) return line;
    if (width <= 3) return std::string(width, '.');

    std::string out;
    size_t i = 0, n = 0;
    char32_t cp;
    while (i < line.size() && n < width - 3) {
        if (utf8_next(line, i, cp)) utf8_append(out, cp);
        ++n;
    }
    return out + "...";
}

void show_token_progress(std::ostream& os,
                         const std::string& path,
                         const std::set<std::string>& tokens,
                         std::chrono::milliseconds delay,
                         size_t width) {
    os << "\nProcessing: " << path << "\n";
    for (const auto& t : tokens) {
        // 줄 지우고 같은 줄에 덮어쓰기
        os << "\r\033[K" << truncate_to_width("Extracting: " + t, width > 0 ? width - 1 : 0) << std::flush;
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
    }
    os << "\n";
}
