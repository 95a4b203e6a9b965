#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tsbase::diag {

enum class Code : uint16_t {
    T_INVALID_UTF8 = 1,
    T_INVALID_UTF16,

    U_INVALID_BOOL = 100,
    U_WILDCARD_UNSUPPORTED,
    U_MALFORMED_LINK,

    Y_MISSING_UNIT_HEADER = 200,
    Y_MALFORMED_FILE_HEADER,
    Y_ASSERTION_OUTSIDE_FILE,
    Y_MALFORMED_ASSERTION,

    E_EMPTY_BASELINE = 300,
    E_SUMMARY_TERMINATOR,
    E_SUMMARY_ORDER,
    E_HINT_WITHOUT_ERROR,
    E_MALFORMED_SUMMARY_LINE,
    E_MALFORMED_RELATED,
    E_MALFORMED_SECTION_HEADER,
    E_UNSORTED_SUMMARY,
    E_MISSING_LOCATION,
    E_MISSING_UNDERLINE,
    E_NEGATIVE_LENGTH,
    E_RELATED_COUNT_MISMATCH,
    E_ANNOTATION_MISMATCH,
    E_MALFORMED_PRETTY_BLOCK,

    F_READ_FAILED = 400,
    F_MISSING_BASELINE,
    F_CASE_DIR_NOT_FOUND,
};

inline const char* code_name(Code c) {
    switch (c) {
        case Code::T_INVALID_UTF8: return "T_INVALID_UTF8";
        case Code::T_INVALID_UTF16: return "T_INVALID_UTF16";
        case Code::U_INVALID_BOOL: return "U_INVALID_BOOL";
        case Code::U_WILDCARD_UNSUPPORTED: return "U_WILDCARD_UNSUPPORTED";
        case Code::U_MALFORMED_LINK: return "U_MALFORMED_LINK";
        case Code::Y_MISSING_UNIT_HEADER: return "Y_MISSING_UNIT_HEADER";
        case Code::Y_MALFORMED_FILE_HEADER: return "Y_MALFORMED_FILE_HEADER";
        case Code::Y_ASSERTION_OUTSIDE_FILE: return "Y_ASSERTION_OUTSIDE_FILE";
        case Code::Y_MALFORMED_ASSERTION: return "Y_MALFORMED_ASSERTION";
        case Code::E_EMPTY_BASELINE: return "E_EMPTY_BASELINE";
        case Code::E_SUMMARY_TERMINATOR: return "E_SUMMARY_TERMINATOR";
        case Code::E_SUMMARY_ORDER: return "E_SUMMARY_ORDER";
        case Code::E_HINT_WITHOUT_ERROR: return "E_HINT_WITHOUT_ERROR";
        case Code::E_MALFORMED_SUMMARY_LINE: return "E_MALFORMED_SUMMARY_LINE";
        case Code::E_MALFORMED_RELATED: return "E_MALFORMED_RELATED";
        case Code::E_MALFORMED_SECTION_HEADER: return "E_MALFORMED_SECTION_HEADER";
        case Code::E_UNSORTED_SUMMARY: return "E_UNSORTED_SUMMARY";
        case Code::E_MISSING_LOCATION: return "E_MISSING_LOCATION";
        case Code::E_MISSING_UNDERLINE: return "E_MISSING_UNDERLINE";
        case Code::E_NEGATIVE_LENGTH: return "E_NEGATIVE_LENGTH";
        case Code::E_RELATED_COUNT_MISMATCH: return "E_RELATED_COUNT_MISMATCH";
        case Code::E_ANNOTATION_MISMATCH: return "E_ANNOTATION_MISMATCH";
        case Code::E_MALFORMED_PRETTY_BLOCK: return "E_MALFORMED_PRETTY_BLOCK";
        case Code::F_READ_FAILED: return "F_READ_FAILED";
        case Code::F_MISSING_BASELINE: return "F_MISSING_BASELINE";
        case Code::F_CASE_DIR_NOT_FOUND: return "F_CASE_DIR_NOT_FOUND";
    }
    return "UNKNOWN";
}

struct Diagnostic {
    Code code{};
    std::string file;
    uint32_t line = 1;
    uint32_t column = 1;
    std::string message;
};

class Bag {
public:
    void add(Code code, std::string file, uint32_t line, uint32_t column, std::string message) {
        diagnostics_.push_back(Diagnostic{code, std::move(file), line, column, std::move(message)});
    }

    bool has_error() const { return !diagnostics_.empty(); }

    bool has_code(Code code) const {
        for (const auto& d : diagnostics_) {
            if (d.code == code) return true;
        }
        return false;
    }

    const std::vector<Diagnostic>& all() const { return diagnostics_; }

    void clear() { diagnostics_.clear(); }

    std::string render_text() const {
        std::ostringstream oss;
        for (const auto& d : diagnostics_) {
            oss << "error[" << code_name(d.code) << "]: " << d.message << "\n";
            oss << " --> " << d.file << ":" << d.line << ":" << d.column << "\n";
        }
        return oss.str();
    }

private:
    std::vector<Diagnostic> diagnostics_{};
};

// Renders a line for a diagnostic message with control bytes escaped.
inline std::string escape_line(std::string_view line) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(line.size());
    for (const char ch : line) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '\t') {
            out += "\\t";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c < 0x20 || c == 0x7F) {
            out += "\\x";
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0xF]);
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

} // namespace tsbase::diag
