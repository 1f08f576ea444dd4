#pragma once
#include <string>

// UTF-8 한 글자 디코드. 잘못된 바이트면 1바이트 전진하고 false (cp = U+FFFD)
bool utf8_next(const std::string& s, size_t& i, char32_t& cp);

// 코드 포인트를 UTF-8 로 덧붙임
void utf8_append(std::string& out, char32_t cp);

// 글자 수 (코드 포인트 단위, 잘못된 바이트는 1글자)
size_t utf8_length(const std::string& s);

// 유니코드 공백 여부 (탭/개행/NBSP/전각 공백 포함)
bool is_space_cp(char32_t cp);

// 출력 가능한 글자 여부 (제어/서식/구분자/사용자 정의 영역 등은 false)
bool is_printable_cp(char32_t cp);

// 앞뒤 유니코드 공백 제거
std::string trim_text(const std::string& s);

// 공백이거나 출력 불가능한 글자를 모두 제거
std::string strip_invisible(const std::string& s);

// ASCII 소문자화 / 대소문자 무시 비교
std::string to_lower_ascii(std::string s);
bool iequals_ascii(const std::string& a, const std::string& b);
