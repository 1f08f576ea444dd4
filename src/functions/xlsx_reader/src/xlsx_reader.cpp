#include "xlsx_reader.hpp"
#include "functions/text_util/src/text_util.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// ---- zip에서 파일 읽기 ----
std::string read_zip_entry(zip_t* z, const std::string& name) {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat(z, name.c_str(), ZIP_FL_NOCASE, &st) != 0)
        throw std::runtime_error("zip_stat failed: " + name);

    zip_file_t* f = zip_fopen(z, name.c_str(), ZIP_FL_NOCASE);
    if (!f)
        throw std::runtime_error("zip_fopen failed: " + name);

    std::string buf;
    buf.resize(static_cast<size_t>(st.size));
    zip_int64_t n = zip_fread(f, buf.data(), st.size);
    zip_fclose(f);

    if (n < 0 || n != static_cast<zip_int64_t>(st.size))
        throw std::runtime_error("zip_fread incomplete: " + name);
    return buf;
}

static bool has_zip_entry(zip_t* z, const std::string& name) {
    return zip_name_locate(z, name.c_str(), ZIP_FL_NOCASE) >= 0;
}

// ---- 경로 유틸 ----
static std::string dirname_of(const std::string& p) {
    auto pos = p.find_last_of("/\\");
    if (pos == std::string::npos) return std::string();
    return p.substr(0, pos);
}

static std::string basename_of(const std::string& p) {
    auto pos = p.find_last_of("/\\");
    if (pos == std::string::npos) return p;
    return p.substr(pos + 1);
}

static void normalize_path(std::vector<std::string>& parts) {
    std::vector<std::string> out;
    for (auto& s : parts) {
        if (s.empty() || s == ".") continue;
        if (s == "..") {
            if (!out.empty()) out.pop_back();
        } else {
            out.push_back(s);
        }
    }
    parts.swap(out);
}

// rels 의 Target 을 zip 항목 이름으로 변환 ("/xl/..." 는 패키지 루트 기준)
static std::string join_path(const std::string& base, const std::string& rel) {
    if (rel.empty()) return base;
    std::string tmp;
    if (rel[0] == '/' || rel[0] == '\\') tmp = rel.substr(1);
    else if (base.empty()) tmp = rel;
    else tmp = base + "/" + rel;

    std::vector<std::string> parts;
    size_t i = 0;
    while (i < tmp.size()) {
        size_t j = tmp.find('/', i);
        if (j == std::string::npos) j = tmp.size();
        parts.emplace_back(tmp.substr(i, j - i));
        i = j + 1;
    }
    normalize_path(parts);
    std::string res;
    for (size_t k = 0; k < parts.size(); ++k) {
        if (k) res.push_back('/');
        res += parts[k];
    }
    return res;
}

static bool ends_with(const std::string& s, const char* suffix) {
    const size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

// ---- XML 유틸 (접두사 "x:" 등이 붙어도 로컬 이름으로 비교) ----
static const char* local_name(const char* name) {
    const char* p = std::strrchr(name, ':');
    return p ? p + 1 : name;
}

static pugi::xml_node child_local(const pugi::xml_node& n, const char* name) {
    for (pugi::xml_node ch = n.first_child(); ch; ch = ch.next_sibling()) {
        if (ch.type() == pugi::node_element && std::strcmp(local_name(ch.name()), name) == 0)
            return ch;
    }
    return pugi::xml_node();
}

static pugi::xml_node next_local(const pugi::xml_node& n, const char* name) {
    for (pugi::xml_node ch = n.next_sibling(); ch; ch = ch.next_sibling()) {
        if (ch.type() == pugi::node_element && std::strcmp(local_name(ch.name()), name) == 0)
            return ch;
    }
    return pugi::xml_node();
}

static pugi::xml_attribute attr_local(const pugi::xml_node& n, const char* name) {
    for (pugi::xml_attribute a = n.first_attribute(); a; a = a.next_attribute()) {
        if (std::strcmp(local_name(a.name()), name) == 0) return a;
    }
    return pugi::xml_attribute();
}

static const unsigned kParseFlags = pugi::parse_default | pugi::parse_ws_pcdata_single;

static void parse_entry(zip_t* z, const std::string& entry, pugi::xml_document& doc) {
    std::string xml = read_zip_entry(z, entry);
    pugi::xml_parse_result r = doc.load_buffer(xml.data(), xml.size(), kParseFlags);
    if (!r)
        throw std::runtime_error("Failed to parse " + entry + ": " + r.description());
}

// _x000D_ 형태의 OOXML 이스케이프 해제
static std::string unescape_ooxml(const std::string& s) {
    if (s.find("_x") == std::string::npos) return s;
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '_' && i + 6 < s.size() && s[i + 1] == 'x' && s[i + 6] == '_') {
            // 정확히 16진수 네 자리만 (부호/공백 불가)
            char32_t cp = 0;
            size_t k = 2;
            for (; k < 6; ++k) {
                const unsigned char h = static_cast<unsigned char>(s[i + k]);
                if (!std::isxdigit(h)) break;
                cp = cp * 16 + static_cast<char32_t>(std::isdigit(h) ? h - '0' : std::tolower(h) - 'a' + 10);
            }
            if (k == 6) {
                utf8_append(out, cp);
                i += 6;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

// <si> / <is> : 단일 <t> 또는 서식 run(<r><t>) 의 연결. 발음 run(<rPh>) 은 제외
static std::string collect_rich_text(const pugi::xml_node& node) {
    std::string out;
    for (pugi::xml_node ch = node.first_child(); ch; ch = ch.next_sibling()) {
        if (ch.type() != pugi::node_element) continue;
        const char* nm = local_name(ch.name());
        if (std::strcmp(nm, "t") == 0) {
            out += ch.text().get();
        } else if (std::strcmp(nm, "r") == 0) {
            pugi::xml_node t = child_local(ch, "t");
            if (t) out += t.text().get();
        }
    }
    return unescape_ooxml(out);
}

// ---- 날짜 ----
bool is_date_format_code(const std::string& code) {
    // 따옴표 문자열, [색상]/[$-409] 구간, 이스케이프 문자는 제외하고 판정
    std::string stripped;
    std::string bracket;
    bool in_quote = false;
    bool in_bracket = false;
    for (size_t i = 0; i < code.size(); ++i) {
        char c = code[i];
        if (in_quote) { if (c == '"') in_quote = false; continue; }
        if (in_bracket) {
            if (c != ']') { bracket.push_back(c); continue; }
            in_bracket = false;
            // 경과 시간 [h], [mm], [ss] 만 남김
            if (!bracket.empty() && bracket.find_first_not_of("hHmMsS") == std::string::npos)
                stripped += bracket;
            continue;
        }
        if (c == '"') { in_quote = true; continue; }
        if (c == '[') { in_bracket = true; bracket.clear(); continue; }
        if (c == '\\' || c == '_' || c == '*') { ++i; continue; }
        stripped.push_back(c);
    }
    // 양수 구간만 본다
    auto semi = stripped.find(';');
    if (semi != std::string::npos) stripped.resize(semi);

    for (char& c : stripped) c = (char)std::tolower((unsigned char)c);
    if (stripped == "general") return false;
    return stripped.find_first_of("dmyhs") != std::string::npos;
}

// Howard Hinnant 의 civil_from_days (1970-01-01 기준 일수 → 연/월/일)
static void civil_from_days(long long z, long long& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<long long>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

std::string excel_serial_to_string(double serial, bool date1904) {
    long long total = std::llround(serial * 86400.0);
    long long days = total / 86400;
    long long secs = total % 86400;
    if (secs < 0) { secs += 86400; days -= 1; }

    const long long hh = secs / 3600;
    const long long mi = (secs % 3600) / 60;
    const long long ss = secs % 60;

    char buf[64];
    if (!date1904 && days == 0) {
        std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", hh, mi, ss);
        return buf;
    }

    // 1900 체계: 1899-12-30 기준, 존재하지 않는 1900-02-29(60) 이전은 하루 보정
    long long epoch_days;
    if (date1904) {
        epoch_days = -24107 + days;
    } else {
        epoch_days = -25569 + days;
        if (days < 61) epoch_days += 1;
    }

    long long y = 0;
    unsigned m = 0, d = 0;
    civil_from_days(epoch_days, y, m, d);
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld", y, m, d, hh, mi, ss);
    return buf;
}

// ---- XlsxCellSource ----
XlsxCellSource::XlsxCellSource(const std::string& xlsx_path) {
    int errcode = 0;
    zip_ = zip_open(xlsx_path.c_str(), ZIP_RDONLY, &errcode);
    if (!zip_) {
        zip_error_t ze;
        zip_error_init_with_code(&ze, errcode);
        std::string msg = "zip_open failed: " + std::string(zip_error_strerror(&ze));
        zip_error_fini(&ze);
        throw std::runtime_error(msg);
    }

    try {
        load_workbook();
    }
    catch (...) {
        zip_close(zip_);
        zip_ = nullptr;
        throw;  // 예외 다시 던짐
    }
}

XlsxCellSource::~XlsxCellSource() {
    if (zip_) zip_close(zip_);
}

void XlsxCellSource::load_workbook() {
    // _rels/.rels → workbook 경로
    std::string wb_path = "xl/workbook.xml";
    if (has_zip_entry(zip_, "_rels/.rels")) {
        pugi::xml_document pkg_rels;
        parse_entry(zip_, "_rels/.rels", pkg_rels);
        pugi::xml_node rels = child_local(pkg_rels, "Relationships");
        for (pugi::xml_node r = child_local(rels, "Relationship"); r; r = next_local(r, "Relationship")) {
            std::string type = r.attribute("Type").as_string();
            if (ends_with(type, "/officeDocument")) {
                wb_path = join_path("", r.attribute("Target").as_string());
                break;
            }
        }
    }

    pugi::xml_document wb;
    parse_entry(zip_, wb_path, wb);
    pugi::xml_node workbook = child_local(wb, "workbook");
    if (!workbook)
        throw std::runtime_error("No <workbook> element");

    pugi::xml_node pr = child_local(workbook, "workbookPr");
    if (pr) date1904_ = pr.attribute("date1904").as_bool(false);

    // workbook rels → 시트/공유 문자열/스타일 위치
    const std::string wb_dir = dirname_of(wb_path);
    const std::string rels_path = join_path(wb_dir, "_rels/" + basename_of(wb_path) + ".rels");

    std::unordered_map<std::string, std::string> id_to_target;
    std::string shared_strings_entry;
    std::string styles_entry;

    pugi::xml_document rels_doc;
    parse_entry(zip_, rels_path, rels_doc);
    pugi::xml_node rels = child_local(rels_doc, "Relationships");
    for (pugi::xml_node r = child_local(rels, "Relationship"); r; r = next_local(r, "Relationship")) {
        std::string id     = r.attribute("Id").as_string();
        std::string type   = r.attribute("Type").as_string();
        std::string target = join_path(wb_dir, r.attribute("Target").as_string());
        if (!id.empty() && !target.empty()) id_to_target[id] = target;
        if (ends_with(type, "/sharedStrings")) shared_strings_entry = target;
        else if (ends_with(type, "/styles")) styles_entry = target;
    }

    pugi::xml_node sheets = child_local(workbook, "sheets");
    for (pugi::xml_node s = child_local(sheets, "sheet"); s; s = next_local(s, "sheet")) {
        std::string rid = attr_local(s, "id").as_string();
        auto it = id_to_target.find(rid);
        if (it == id_to_target.end()) continue;
        sheet_names_.push_back(s.attribute("name").as_string());
        sheet_entries_.push_back(it->second);
    }
    if (sheet_entries_.empty())
        throw std::runtime_error("No <sheet> element in " + wb_path);

    if (!shared_strings_entry.empty() && has_zip_entry(zip_, shared_strings_entry))
        load_shared_strings(shared_strings_entry);
    if (!styles_entry.empty() && has_zip_entry(zip_, styles_entry))
        load_styles(styles_entry);
}

void XlsxCellSource::load_shared_strings(const std::string& entry) {
    pugi::xml_document doc;
    parse_entry(zip_, entry, doc);
    pugi::xml_node sst = child_local(doc, "sst");
    for (pugi::xml_node si = child_local(sst, "si"); si; si = next_local(si, "si")) {
        shared_strings_.push_back(collect_rich_text(si));
    }
}

void XlsxCellSource::load_styles(const std::string& entry) {
    pugi::xml_document doc;
    parse_entry(zip_, entry, doc);
    pugi::xml_node style_sheet = child_local(doc, "styleSheet");

    // 사용자 정의 서식
    std::unordered_map<unsigned, bool> custom_is_date;
    pugi::xml_node num_fmts = child_local(style_sheet, "numFmts");
    for (pugi::xml_node f = child_local(num_fmts, "numFmt"); f; f = next_local(f, "numFmt")) {
        custom_is_date[f.attribute("numFmtId").as_uint()] =
            is_date_format_code(f.attribute("formatCode").as_string());
    }

    pugi::xml_node xfs = child_local(style_sheet, "cellXfs");
    for (pugi::xml_node xf = child_local(xfs, "xf"); xf; xf = next_local(xf, "xf")) {
        const unsigned id = xf.attribute("numFmtId").as_uint(0);
        bool is_date = false;
        auto it = custom_is_date.find(id);
        if (it != custom_is_date.end()) is_date = it->second;
        else is_date = (id >= 14 && id <= 22) || (id >= 45 && id <= 47);  // 내장 날짜 서식
        date_styles_.push_back(is_date);
    }
}

bool XlsxCellSource::open_next_sheet() {
    row_ = pugi::xml_node();
    cell_ = pugi::xml_node();
    if (next_sheet_ >= sheet_entries_.size()) return false;

    const std::string& entry = sheet_entries_[next_sheet_++];
    sheet_doc_.reset();
    parse_entry(zip_, entry, sheet_doc_);

    // 차트 시트 등 sheetData 가 없으면 빈 시트로 취급
    pugi::xml_node root = sheet_doc_.document_element();
    pugi::xml_node data = child_local(root, "sheetData");
    row_ = child_local(data, "row");
    if (row_) cell_ = child_local(row_, "c");
    return true;
}

bool XlsxCellSource::next(CellValue& out) {
    for (;;) {
        while (!cell_ && row_) {
            row_ = next_local(row_, "row");
            if (row_) cell_ = child_local(row_, "c");
        }
        if (cell_) {
            out = convert_cell(cell_);
            cell_ = next_local(cell_, "c");
            return true;
        }
        if (!open_next_sheet()) return false;
    }
}

CellValue XlsxCellSource::convert_cell(const pugi::xml_node& c) const {
    const std::string t = c.attribute("t").as_string();

    if (t == "inlineStr") {
        pugi::xml_node is = child_local(c, "is");
        if (!is) return CellValue::empty();
        return CellValue::of_text(collect_rich_text(is));
    }

    pugi::xml_node v = child_local(c, "v");
    if (!v) return CellValue::empty();
    const std::string raw = v.text().get();

    if (t == "s") {
        char* end = nullptr;
        unsigned long idx = std::strtoul(raw.c_str(), &end, 10);
        if (raw.empty() || *end != '\0' || idx >= shared_strings_.size())
            throw std::runtime_error("shared string index out of range: " + raw);
        return CellValue::of_text(shared_strings_[idx]);
    }
    if (t == "str" || t == "e") return CellValue::of_text(unescape_ooxml(raw));
    if (t == "b") return CellValue::of_bool(raw == "1" || raw == "true");
    if (t == "d") return CellValue::of_date(raw);

    // 숫자 (t="n" 또는 생략)
    char* end = nullptr;
    double d = std::strtod(raw.c_str(), &end);
    if (raw.empty() || *end != '\0' || !std::isfinite(d)) return CellValue::of_text(raw);

    const unsigned style = c.attribute("s").as_uint(0);
    if (style < date_styles_.size() && date_styles_[style])
        return CellValue::of_date(excel_serial_to_string(d, date1904_));
    return CellValue::of_number(d);
}
