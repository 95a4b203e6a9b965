#include "errors_internal.hpp"

#include <tsbase/text/Bytes.hpp>
#include <tsbase/text/Utf8.hpp>

#include <charconv>
#include <string>

namespace tsbase::baseline {

namespace {

bool is_lib_file(std::string_view name) {
    return text::starts_with(name, "lib.") && text::ends_with(name, ".d.ts");
}

} // namespace

int cmp_file(std::string_view a, std::string_view b) {
    if (a == b) return 0;
    if (a == "tsconfig.json") return -1;
    if (b == "tsconfig.json") return 1;

    const bool lib_a = is_lib_file(a);
    const bool lib_b = is_lib_file(b);
    if (lib_a != lib_b) return lib_a ? 1 : -1;
    return a < b ? -1 : 1;
}

namespace detail {

std::optional<uint32_t> parse_u32(std::string_view s) {
    if (s.empty()) return std::nullopt;
    uint32_t v = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    const auto r = std::from_chars(first, last, v);
    if (r.ec != std::errc{} || r.ptr != last) return std::nullopt;
    return v;
}

Hint make_hint(std::string_view line) {
    const auto text = text::trim_space_start(line);
    const std::size_t depth = (line.size() - text.size()) / 2;
    return Hint{static_cast<uint8_t>(depth > 0xFF ? 0xFF : depth), text};
}

std::vector<SgrRun> split_sgr(std::string_view line) {
    std::vector<SgrRun> runs{};
    std::size_t i = line.find('\x1b');
    if (i == std::string_view::npos) {
        runs.push_back(SgrRun{{}, line});
        return runs;
    }
    if (i > 0) runs.push_back(SgrRun{{}, line.substr(0, i)});

    while (i < line.size()) {
        // ESC '[' params 'm'
        const std::size_t params = i + 2;
        const std::size_t m = line.find('m', params);
        if (i + 1 >= line.size() || line[i + 1] != '[' || m == std::string_view::npos) {
            // stray escape, kept as plain text
            std::size_t next = line.find('\x1b', i + 1);
            if (next == std::string_view::npos) next = line.size();
            runs.push_back(SgrRun{{}, line.substr(i, next - i)});
            i = next;
            continue;
        }

        const std::size_t text_start = m + 1;
        std::size_t next = line.find('\x1b', text_start);
        if (next == std::string_view::npos) next = line.size();
        runs.push_back(SgrRun{line.substr(params, m - params), line.substr(text_start, next - text_start)});
        i = next;
    }
    return runs;
}

} // namespace detail

namespace {

using detail::Reporter;
using detail::tail;

enum class SummaryState : uint8_t {
    kEntries,    // "error TS..." or "<file>(l,c): error TS..." lines and their hints
    kTerminator, // one empty line seen, a second one must follow
};

// Reads the summary block of a plain baseline up to its two empty lines.
class PlainSummaryParser {
public:
    PlainSummaryParser(Reporter& rep, text::LineIter& iter, ErrorsBaseline& out)
        : rep_(rep), iter_(iter), out_(out) {}

    bool run() {
        text::Line line{};
        while (iter_.next(line)) {
            if (state_ == SummaryState::kTerminator) {
                if (!line.content.empty()) {
                    return rep_.fail(diag::Code::E_SUMMARY_TERMINATOR, line,
                                     "expected 2 empty lines at the end of summary block");
                }
                return true;
            }
            if (!step_(line)) return false;
        }
        return rep_.fail(diag::Code::E_SUMMARY_TERMINATOR, line,
                         "expected 2 empty lines at the end of summary block");
    }

private:
    bool step_(const text::Line& line) {
        const auto content = line.content;
        if (content.empty()) {
            state_ = SummaryState::kTerminator;
            return true;
        }

        if (content[0] == ' ') {
            std::vector<Hint>* hints = nullptr;
            if (!out_.file_errors.empty()) {
                hints = &out_.file_errors.back().hints;
            } else if (!out_.config_errors.empty()) {
                hints = &out_.config_errors.back().hints;
            }
            if (hints == nullptr) {
                return rep_.fail(diag::Code::E_HINT_WITHOUT_ERROR, line, "hint line before any error");
            }
            hints->push_back(detail::make_hint(content));
            return true;
        }

        if (text::starts_with(content, "error TS")) {
            if (!out_.file_errors.empty()) {
                return rep_.fail(diag::Code::E_SUMMARY_ORDER, line,
                                 "config errors are expected before file errors");
            }
            return config_error_(line);
        }
        return file_error_(line);
    }

    bool config_error_(const text::Line& line) {
        const auto content = line.content;
        constexpr std::size_t code_start = 8;
        const auto code_end = content.find(':', code_start);
        if (code_end == std::string_view::npos) {
            return rep_.fail(diag::Code::E_MALFORMED_SUMMARY_LINE, line, "failed to find end of error code");
        }
        ConfigError err{};
        err.code = content.substr(code_start, code_end - code_start);
        err.message = tail(content, code_end + 2);
        out_.config_errors.push_back(std::move(err));
        return true;
    }

    // <file>(<line>,<column>): error TS<code>: <message>
    bool file_error_(const text::Line& line) {
        const auto content = line.content;
        const auto name_end = content.find('(');
        if (name_end == std::string_view::npos) {
            return rep_.fail(diag::Code::E_MALFORMED_SUMMARY_LINE, line, "failed to find end of file name");
        }
        const std::size_t line_start = name_end + 1;
        const auto line_end = content.find(',', line_start);
        if (line_end == std::string_view::npos) {
            return rep_.fail(diag::Code::E_MALFORMED_SUMMARY_LINE, line, "failed to find end of line number");
        }
        const std::size_t column_start = line_end + 1;
        const auto column_end = content.find(')', column_start);
        if (column_end == std::string_view::npos) {
            return rep_.fail(diag::Code::E_MALFORMED_SUMMARY_LINE, line, "failed to find end of column number");
        }

        // "): error TS"
        const auto category = tail(content, column_end + 1);
        const auto ts = category.find(" TS");
        if (!text::starts_with(category, ": ") || ts == std::string_view::npos) {
            return rep_.fail(diag::Code::E_MALFORMED_SUMMARY_LINE, line, "failed to find start of error code");
        }
        const std::size_t code_start = column_end + 1 + ts + 3;
        const auto code_end = content.find(':', code_start);
        if (code_end == std::string_view::npos) {
            return rep_.fail(diag::Code::E_MALFORMED_SUMMARY_LINE, line, "failed to find end of error code");
        }

        FileError err{};
        err.file = content.substr(0, name_end);
        if (const auto line_no = detail::parse_u32(content.substr(line_start, line_end - line_start))) {
            const auto column = detail::parse_u32(content.substr(column_start, column_end - column_start));
            if (!column.has_value()) {
                return rep_.fail(diag::Code::E_MALFORMED_SUMMARY_LINE, line, "column number is not an integer");
            }
            err.loc = Location{*line_no, *column};
        }
        err.code = content.substr(code_start, code_end - code_start);
        err.message = tail(content, code_end + 2);
        out_.file_errors.push_back(std::move(err));
        return true;
    }

    Reporter& rep_;
    text::LineIter& iter_;
    ErrorsBaseline& out_;
    SummaryState state_ = SummaryState::kEntries;
};

} // namespace

namespace detail {

bool parse_plain(Reporter& rep, std::string_view data, ErrorsBaseline& out) {
    text::LineIter iter(data);
    PlainSummaryParser summary(rep, iter, out);
    if (!summary.run()) return false;

    SectionScanner sections(rep, iter, out.file_errors, AnnotationStyle::kPlain);
    return sections.run();
}

} // namespace detail

std::optional<ErrorsBaseline> parse_errors_baseline(std::string_view path, std::string_view data, diag::Bag& bag) {
    if (data.empty()) {
        bag.add(diag::Code::E_EMPTY_BASELINE, std::string(path), 1, 1, "errors baseline is empty");
        return std::nullopt;
    }
    if (!text::check_utf8(path, data, bag)) return std::nullopt;

    Reporter rep(path, bag);
    ErrorsBaseline out{};
    const bool ok = data[0] == '\x1b' ? detail::parse_pretty(rep, data, out) : detail::parse_plain(rep, data, out);
    if (!ok) return std::nullopt;
    return out;
}

} // namespace tsbase::baseline
