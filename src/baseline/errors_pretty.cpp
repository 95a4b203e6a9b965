#include "errors_internal.hpp"

#include <tsbase/text/Bytes.hpp>

#include <string>

namespace tsbase::baseline::detail {

namespace {

constexpr std::string_view k_file_sgr = "96";
constexpr std::string_view k_number_sgr = "93";
constexpr std::string_view k_code_sgr = "90";

enum class PrettyState : uint8_t {
    kHeader,    // "<file>:<line>:<col> - error TS<code>: <message>"
    kHints,     // indented hint lines, the blank line before the snippet ends them
    kUnderline, // gutter + "~~~" under the snippet line
    kGap,       // blank line after the snippet
    kRelated,   // "  <file>:<line>:<col>" followed by source, underline and message
};

class PrettySummaryParser {
public:
    PrettySummaryParser(Reporter& rep, text::LineIter& iter, ErrorsBaseline& out)
        : rep_(rep), iter_(iter), out_(out) {}

    bool run() {
        text::Line line{};
        while (iter_.next(line)) {
            if (state_ == PrettyState::kHeader && !text::starts_with(line.content, "\x1b[96m")) {
                // a blank line separates a related block from the next diagnostic
                if (line.content.empty() && text::starts_with(iter_.rest(), "\x1b[96m")) continue;
                return true;
            }
            if (!step_(line)) return false;
        }
        if (state_ != PrettyState::kHeader) {
            return rep_.fail(diag::Code::E_MALFORMED_PRETTY_BLOCK, line, "coloured diagnostic is not terminated");
        }
        return true;
    }

private:
    bool step_(const text::Line& line) {
        switch (state_) {
            case PrettyState::kHeader:
                cur_ = FileError{};
                if (!header_(line, false, cur_)) return false;
                state_ = PrettyState::kHints;
                return true;

            case PrettyState::kHints:
                if (iter_.peek() == '\x1b') {
                    text::Line snippet{};
                    iter_.next(snippet);
                    state_ = PrettyState::kUnderline;
                    return true;
                }
                cur_.hints.push_back(make_hint(line.content));
                return true;

            case PrettyState::kUnderline:
                if (cur_.loc.has_value() && !underline_length_(line, cur_.loc->column, cur_.length)) return false;
                if (text::starts_with(iter_.rest(), "\x1b[7m")) {
                    // the span continues over further snippet lines
                    text::Line more{};
                    while (text::starts_with(iter_.rest(), "\x1b[7m")) iter_.next(more);
                    cur_.length.reset();
                }
                state_ = PrettyState::kGap;
                return true;

            case PrettyState::kGap:
                return after_block_();

            case PrettyState::kRelated: {
                FileError related{};
                if (!related_(line, related)) return false;
                cur_.related.push_back(std::move(related));
                return after_block_();
            }
        }
        return true;
    }

    bool after_block_() {
        if (text::starts_with(iter_.rest(), "  \x1b")) {
            state_ = PrettyState::kRelated;
            return true;
        }
        out_.file_errors.push_back(std::move(cur_));
        cur_ = FileError{};
        state_ = PrettyState::kHeader;
        return true;
    }

    // Related block: header, source, underline, message (indented by 4).
    bool related_(const text::Line& line, FileError& out) {
        if (!header_(line, true, out)) return false;

        text::Line source{};
        text::Line underline{};
        text::Line message{};
        if (!iter_.next(source) || !iter_.next(underline) || !iter_.next(message)) {
            return rep_.fail(diag::Code::E_MALFORMED_PRETTY_BLOCK, line, "related diagnostic block is truncated");
        }
        if (out.loc.has_value() && !underline_length_(underline, out.loc->column, out.length)) return false;
        out.message = tail(message.content, 4);
        return true;
    }

    bool header_(const text::Line& line, bool related, FileError& out) {
        const auto content = line.content;
        const auto runs = split_sgr(content);
        std::size_t i = 0;
        auto next_run = [&](std::string_view sgr) -> const SgrRun* {
            while (i < runs.size()) {
                const auto& r = runs[i++];
                if (r.sgr == sgr) return &r;
            }
            return nullptr;
        };

        const SgrRun* file = next_run(k_file_sgr);
        if (file == nullptr) {
            return rep_.fail(diag::Code::E_MALFORMED_PRETTY_BLOCK, line, "failed to find file name");
        }
        const SgrRun* line_no = next_run(k_number_sgr);
        if (line_no == nullptr) {
            return rep_.fail(diag::Code::E_MALFORMED_PRETTY_BLOCK, line, "failed to find line number");
        }
        const SgrRun* column = next_run(k_number_sgr);
        if (column == nullptr) {
            return rep_.fail(diag::Code::E_MALFORMED_PRETTY_BLOCK, line, "failed to find column number");
        }

        out.file = file->text;
        if (const auto l = parse_u32(line_no->text)) {
            const auto c = parse_u32(column->text);
            if (!c.has_value()) {
                return rep_.fail(diag::Code::E_MALFORMED_PRETTY_BLOCK, line, "column number is not an integer");
            }
            out.loc = Location{*l, *c};
        }
        if (related) return true;

        const SgrRun* code = next_run(k_code_sgr);
        if (code == nullptr || i >= runs.size()) {
            return rep_.fail(diag::Code::E_MALFORMED_PRETTY_BLOCK, line, "failed to find error code");
        }
        // " TS2353: "
        const auto code_text = text::trim_space(code->text);
        if (!text::starts_with(code_text, "TS") || !text::ends_with(code_text, ":")) {
            return rep_.fail(diag::Code::E_MALFORMED_PRETTY_BLOCK, line, "malformed error code");
        }
        out.code = code_text.substr(2, code_text.size() - 3);
        out.message = tail(content, static_cast<std::size_t>(runs[i].text.data() - content.data()));
        return true;
    }

    // Width of the underline, counted from the coloured run that holds the
    // last '~'; that run starts at source column 1.
    bool underline_length_(const text::Line& line, uint32_t column, std::optional<uint32_t>& out) {
        out.reset();
        const auto content = line.content;
        const auto last = content.find_last_of('~');
        if (last == std::string_view::npos) return true;

        for (const auto& run : split_sgr(content)) {
            const auto begin = static_cast<std::size_t>(run.text.data() - content.data());
            if (last < begin || last >= begin + run.text.size()) continue;

            const std::size_t end = last - begin + 2;
            if (end < column) {
                return rep_.fail(diag::Code::E_NEGATIVE_LENGTH, line,
                                 "underline ends before the error column " + std::to_string(column));
            }
            out = static_cast<uint32_t>(end - column);
            return true;
        }
        return true;
    }

    Reporter& rep_;
    text::LineIter& iter_;
    ErrorsBaseline& out_;
    PrettyState state_ = PrettyState::kHeader;
    FileError cur_{};
};

} // namespace

bool parse_pretty(Reporter& rep, std::string_view data, ErrorsBaseline& out) {
    text::LineIter iter(data);
    PrettySummaryParser summary(rep, iter, out);
    if (!summary.run()) return false;

    SectionScanner sections(rep, iter, out.file_errors, AnnotationStyle::kPretty);
    return sections.run();
}

} // namespace tsbase::baseline::detail
