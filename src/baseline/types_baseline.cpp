#include <tsbase/baseline/TypesBaseline.hpp>

#include <tsbase/text/Bytes.hpp>
#include <tsbase/text/LineIter.hpp>
#include <tsbase/text/Utf8.hpp>

#include <cctype>
#include <string>

namespace tsbase::baseline {

namespace {

enum class TypesState : uint8_t {
    kUnitHeader,     // "//// [tests/cases/...] ////"
    kBody,           // file headers, source lines, blank lines
    kAssertion,      // pending assertion line, next line may be its underline
    kAfterUnderline, // underline consumed, next line continues or ends the block
};

class TypesParser {
public:
    TypesParser(std::string_view path, std::string_view data, diag::Bag& bag)
        : path_(path), data_(data), bag_(bag), iter_(data) {}

    std::optional<TypesBaseline> run() {
        text::Line line{};
        while (iter_.next(line)) {
            if (!step_(line)) return std::nullopt;
        }

        if (state_ == TypesState::kUnitHeader) {
            fail_(diag::Code::Y_MISSING_UNIT_HEADER, 1, "expected baseline to start with test unit path");
            return std::nullopt;
        }
        // the trailing empty line has closed any assertion block by now;
        // a statement still pending here has no assertions and is not recorded
        return std::move(result_);
    }

private:
    bool fail_(diag::Code code, uint32_t line_no, std::string message) {
        bag_.add(code, std::string(path_), line_no, 1, std::move(message));
        return false;
    }

    bool fail_at_(diag::Code code, const text::Line& line, std::string message) {
        return fail_(code, line.index + 1, std::move(message) + "\n  line: " + diag::escape_line(line.content));
    }

    bool step_(const text::Line& line) {
        switch (state_) {
            case TypesState::kUnitHeader:
                if (!text::starts_with(line.content, "//// [") || !text::ends_with(line.content, "] ////")) {
                    return fail_at_(diag::Code::Y_MISSING_UNIT_HEADER, line,
                                    "expected baseline to start with test unit path");
                }
                state_ = TypesState::kBody;
                return true;
            case TypesState::kBody:
                return body_line_(line);
            case TypesState::kAssertion:
                return assertion_(line);
            case TypesState::kAfterUnderline:
                return close_or_continue_(line);
        }
        return true;
    }

    bool body_line_(const text::Line& line) {
        const auto content = line.content;
        if (content.empty()) {
            // blank lines join a statement only when more source follows
            if (expr_end_.has_value()) expr_end_ = line.start;
            return true;
        }

        if (text::starts_with(content, "=== ")) {
            if (!file_header_(line)) return false;
        }

        const bool assertion = content.size() >= 2 && content[0] == '>' &&
                               is_assertion_lead(static_cast<unsigned char>(content[1]));
        if (!assertion) {
            expr_end_ = line.start + content.size();
            return true;
        }

        if (result_.files.empty() || !expr_start_.has_value()) {
            return fail_at_(diag::Code::Y_ASSERTION_OUTSIDE_FILE, line, "expected baseline file to exist");
        }

        const std::size_t start = *expr_start_;
        const std::size_t end = expr_end_.value_or(start);
        if (end < start) {
            return fail_at_(diag::Code::Y_MALFORMED_ASSERTION, line, "statement bounds reversed before assertion");
        }
        push_statement_(data_.substr(start, end - start));
        expr_end_.reset();

        pending_ = line;
        state_ = TypesState::kAssertion;
        return true;
    }

    bool file_header_(const text::Line& line) {
        const auto content = line.content;
        if (content.size() < 8 || !text::ends_with(content, " ===")) {
            return fail_at_(diag::Code::Y_MALFORMED_FILE_HEADER, line, "expected filename header");
        }

        if (expr_start_.has_value() && *expr_start_ < line.start && expr_end_.has_value()) {
            if (*expr_start_ > *expr_end_) {
                return fail_at_(diag::Code::Y_MALFORMED_FILE_HEADER, line,
                                "statement bounds reversed: [" + std::to_string(*expr_start_) + ", " +
                                    std::to_string(*expr_end_) + ")");
            }
            push_statement_(data_.substr(*expr_start_, *expr_end_ - *expr_start_));
        }

        result_.names.push_back(content.substr(4, content.size() - 8));
        result_.files.emplace_back();
        expr_start_ = iter_.line_start();
        return true;
    }

    void push_statement_(std::string_view stmt) {
        auto& file = result_.files.back();
        file.statements.push_back(stmt);
        file.assertions.emplace_back();
    }

    // line is the one following pending_: an underline or not
    bool assertion_(const text::Line& line) {
        const auto a = pending_.content;
        const bool has_underline = text::starts_with(line.content, "> ");

        const auto delim_src = has_underline ? line.content : a;
        const auto delim = delim_src.find(':');
        if (delim == std::string_view::npos) {
            return fail_at_(diag::Code::Y_MALFORMED_ASSERTION, pending_,
                            "assertion should contain delimiter\n  underline: " + diag::escape_line(line.content));
        }
        if (delim > a.size()) {
            return fail_at_(diag::Code::Y_MALFORMED_ASSERTION, pending_,
                            "delimiter should be in bounds\n  underline: " + diag::escape_line(line.content));
        }

        std::size_t offset = 0;
        if (has_underline) {
            // underline columns count UTF-16 units of the assertion line
            std::size_t last = 0;
            if (!text::last_char_before_utf16_column(a.substr(1), 1, delim, last)) {
                return fail_at_(diag::Code::Y_MALFORMED_ASSERTION, pending_, "delimiter to be within line bounds");
            }
            offset = 1 + last;
        } else {
            if (delim < 2) {
                return fail_at_(diag::Code::Y_MALFORMED_ASSERTION, pending_, "assertion has an empty expression");
            }
            offset = delim - 1;
        }

        if (offset + 3 > a.size()) {
            return fail_at_(diag::Code::Y_MALFORMED_ASSERTION, pending_, "assertion has no expected type");
        }

        result_.files.back().assertions.back().push_back(Assertion{a.substr(1, offset - 1), a.substr(offset + 3)});

        if (has_underline) {
            state_ = TypesState::kAfterUnderline;
            return true;
        }
        return close_or_continue_(line);
    }

    bool close_or_continue_(const text::Line& line) {
        if (text::starts_with(line.content, ">")) {
            pending_ = line;
            state_ = TypesState::kAssertion;
            return true;
        }

        // A source line directly after the block only opens the next statement.
        // It becomes part of one once a later source line sets expr_end_, so it
        // is not recorded when a file header or the end of input follows.
        expr_start_ = line.content.empty() ? iter_.line_start() : line.start;
        state_ = TypesState::kBody;
        return true;
    }

    std::string_view path_{};
    std::string_view data_{};
    diag::Bag& bag_;
    text::LineIter iter_;

    TypesState state_ = TypesState::kUnitHeader;
    TypesBaseline result_{};
    std::optional<std::size_t> expr_start_{};
    std::optional<std::size_t> expr_end_{};
    text::Line pending_{};
};

} // namespace

bool is_assertion_lead(unsigned char c) {
    if (c >= 0x80) return c != 0xD7 && c != 0xF7;
    return std::isalnum(c) != 0 || c == '_' || c == '$' || c == '\'' || c == '"';
}

const TypeBaselineFile* TypesBaseline::find(std::string_view name) const {
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return &files[i];
    }
    return nullptr;
}

std::optional<TypesBaseline> parse_types_baseline(std::string_view path, std::string_view data, diag::Bag& bag) {
    if (!text::check_utf8(path, data, bag)) return std::nullopt;
    TypesParser parser(path, data, bag);
    return parser.run();
}

} // namespace tsbase::baseline
