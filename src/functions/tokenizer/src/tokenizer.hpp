#pragma once
#include <string>
#include <vector>

// 구분자 집합(split_chars 의 각 글자, UTF-8) 으로 텍스트를 나눈다
// - split_whitespace 이면 모든 공백 글자(is_space_cp)도 구분자
// - 구분자가 하나도 없으면 [text] 그대로
// - 연속된 구분자는 하나로 취급, 앞뒤 구분자는 빈 조각을 만들지 않음
// - 각 조각은 앞뒤 공백 제거 (공백만 있던 조각은 빈 문자열로 남는다)
std::vector<std::string> split_tokens(const std::string& text,
                                      const std::string& split_chars,
                                      bool split_whitespace = false);
