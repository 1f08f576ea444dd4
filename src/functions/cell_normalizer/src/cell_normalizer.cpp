#include "cell_normalizer.hpp"
#include "functions/text_util/src/text_util.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

std::string format_number(double d) {
    char buf[64];
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
        std::snprintf(buf, sizeof(buf), "%.0f", d);
        // -0 → 0
        if (buf[0] == '-' && buf[1] == '0' && buf[2] == '\0') return "0";
        return buf;
    }
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    if (std::strtod(buf, nullptr) != d)
        std::snprintf(buf, sizeof(buf), "%.17g", d);
    return buf;
}

std::optional<std::string> normalize_cell(const CellValue& value) {
    std::string text;
    switch (value.kind) {
    case CellKind::Empty:
        return std::nullopt;
    case CellKind::Text:
    case CellKind::Date:
        text = value.text;
        break;
    case CellKind::Number:
        text = format_number(value.number);
        break;
    case CellKind::Boolean:
        text = value.boolean ? "True" : "False";
        break;
    }

    std::string cleaned = trim_text(text);
    if (cleaned.empty()) return std::nullopt;
    return cleaned;
}
