#pragma once
#include <zip.h>
#include <pugixml.hpp>

#include <string>
#include <vector>

// 셀 값 종류
enum class CellKind {
    Empty,
    Text,
    Number,
    Boolean,
    Date
};

// 셀 하나에서 읽은 원본 값
// Text/Date 는 text, Number 는 number, Boolean 은 boolean 사용
struct CellValue {
    CellKind kind = CellKind::Empty;
    std::string text;
    double number = 0.0;
    bool boolean = false;

    static CellValue empty() { return CellValue{}; }
    static CellValue of_text(std::string s) {
        CellValue v; v.kind = CellKind::Text; v.text = std::move(s); return v;
    }
    static CellValue of_number(double d) {
        CellValue v; v.kind = CellKind::Number; v.number = d; return v;
    }
    static CellValue of_bool(bool b) {
        CellValue v; v.kind = CellKind::Boolean; v.boolean = b; return v;
    }
    static CellValue of_date(std::string s) {
        CellValue v; v.kind = CellKind::Date; v.text = std::move(s); return v;
    }
};

// 셀 값을 한 번만 앞으로 읽을 수 있는 스트림 (재시작 불가)
class CellSource {
public:
    virtual ~CellSource() = default;
    // 다음 셀을 out 에 채움. 더 이상 없으면 false
    virtual bool next(CellValue& out) = 0;
};

// .xlsx 파일 (zip + SpreadsheetML) 을 시트 → 행 → 셀 순서로 읽는 소스
// 시트 XML 은 스트림이 해당 시트에 도달했을 때 하나씩 파싱한다
// 오류 시 예외(std::runtime_error) 발생
class XlsxCellSource : public CellSource {
public:
    explicit XlsxCellSource(const std::string& xlsx_path);
    ~XlsxCellSource() override;

    XlsxCellSource(const XlsxCellSource&) = delete;
    XlsxCellSource& operator=(const XlsxCellSource&) = delete;

    bool next(CellValue& out) override;

    const std::vector<std::string>& sheet_names() const { return sheet_names_; }

private:
    void load_workbook();
    void load_shared_strings(const std::string& entry);
    void load_styles(const std::string& entry);
    bool open_next_sheet();
    CellValue convert_cell(const pugi::xml_node& c) const;

    zip_t* zip_ = nullptr;

    std::vector<std::string> sheet_names_;
    std::vector<std::string> sheet_entries_;
    size_t next_sheet_ = 0;

    std::vector<std::string> shared_strings_;
    std::vector<bool> date_styles_;   // cellXfs 인덱스 → 날짜 서식 여부
    bool date1904_ = false;

    pugi::xml_document sheet_doc_;
    pugi::xml_node row_;
    pugi::xml_node cell_;
};

// zip 안의 항목 하나를 통째로 읽음 (이름 대소문자 무시)
std::string read_zip_entry(zip_t* z, const std::string& name);

// 숫자 서식 코드가 날짜/시간 서식인지 판정 (예: "yyyy-mm-dd", "h:mm")
bool is_date_format_code(const std::string& code);

// Excel 일련번호 → "YYYY-MM-DD HH:MM:SS" (1보다 작으면 "HH:MM:SS")
std::string excel_serial_to_string(double serial, bool date1904);
