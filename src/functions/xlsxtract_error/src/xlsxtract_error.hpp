#pragma once
#include <stdexcept>
#include <string>

// 실행 단위 오류 종류
enum class ErrorKind {
    InvalidRoot,          // 루트 디렉토리가 없거나 디렉토리가 아님
    NoFilesFound,         // 대상 .xlsx 파일 없음 (출력 파일은 건드리지 않음)
    FileUnreadable,       // 파일 하나를 열거나 파싱하지 못함 (건너뛰고 계속)
    OutputWriteFailure    // 결과 파일 쓰기 실패
};

class XlsxtractError : public std::runtime_error {
public:
    XlsxtractError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
    case ErrorKind::InvalidRoot:        return "InvalidRoot";
    case ErrorKind::NoFilesFound:       return "NoFilesFound";
    case ErrorKind::FileUnreadable:     return "FileUnreadable";
    case ErrorKind::OutputWriteFailure: return "OutputWriteFailure";
    }
    return "Unknown";
}

// 프로세스 종료 코드 (0=성공, 1=사용법 오류)
inline int exit_code_for(ErrorKind k) {
    switch (k) {
    case ErrorKind::InvalidRoot:        return 2;
    case ErrorKind::NoFilesFound:       return 3;
    case ErrorKind::OutputWriteFailure: return 4;
    case ErrorKind::FileUnreadable:     return 1;   // 실행 중에는 파일 단위로 복구됨
    }
    return 1;
}
