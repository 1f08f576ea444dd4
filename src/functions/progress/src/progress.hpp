#pragma once
#include <chrono>
#include <iosfwd>
#include <set>
#include <string>

void print_step(const char* msg);

// 간단 타이머
struct StepTimer {
    std::chrono::steady_clock::time_point t0;
    StepTimer(): t0(std::chrono::steady_clock::now()) {}
    double elapsed_ms() const {
        using namespace std::chrono;
        return duration_cast<duration<double, std::milli>>(steady_clock::now() - t0).count();
    }
};

// 터미널 폭 (ioctl → COLUMNS → 80)
size_t terminal_width();

// 폭을 넘으면 글자 단위로 자르고 "..." 를 붙임
std::string truncate_to_width(const std::string& line, size_t width);

// 파일 하나의 토큰을 같은 줄에 덮어쓰며 보여줌 (토큰마다 delay 만큼 대기)
void show_token_progress(std::ostream& os,
                         const std::string& path,
                         const std::set<std::string>& tokens,
                         std::chrono::milliseconds delay,
                         size_t width);
