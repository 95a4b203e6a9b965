#include "errors_internal.hpp"

#include <tsbase/text/Bytes.hpp>

#include <algorithm>
#include <string>

namespace tsbase::baseline::detail {

namespace {

constexpr std::size_t k_related_code_start = 14; // "!!! related TS"

bool is_related_line(std::string_view content) {
    return content.size() > 4 && content[4] == 'r';
}

} // namespace

// "!!! related TS<code> <file>:<line>:<column>: <message>" or
// "!!! related TS<code>: <message>" for a location inherited from the parent.
bool parse_related_plain(Reporter& rep, const text::Line& line, const FileError& parent, FileError& out) {
    const auto content = line.content;
    const auto code_end = content.find_first_of(" :", k_related_code_start);
    if (content.size() <= k_related_code_start || code_end == std::string_view::npos) {
        return rep.fail(diag::Code::E_MALFORMED_RELATED, line, "failed to find end of related error code");
    }

    out = FileError{};
    out.code = content.substr(k_related_code_start, code_end - k_related_code_start);

    if (content[code_end] == ':') {
        out.file = parent.file;
        out.loc = parent.loc;
        out.length = parent.length;
        out.message = tail(content, code_end + 2);
        return true;
    }

    const std::size_t name_start = code_end + 1;
    const auto name_end = content.find(':', name_start);
    if (name_end == std::string_view::npos) {
        return rep.fail(diag::Code::E_MALFORMED_RELATED, line, "failed to find end of file name");
    }
    const auto line_end = content.find(':', name_end + 1);
    if (line_end == std::string_view::npos) {
        return rep.fail(diag::Code::E_MALFORMED_RELATED, line, "failed to find end of line number");
    }
    const auto column_end = content.find(':', line_end + 1);
    if (column_end == std::string_view::npos) {
        return rep.fail(diag::Code::E_MALFORMED_RELATED, line, "failed to find end of column number");
    }

    out.file = content.substr(name_start, name_end - name_start);
    if (const auto line_no = parse_u32(content.substr(name_end + 1, line_end - name_end - 1))) {
        const auto column = parse_u32(content.substr(line_end + 1, column_end - line_end - 1));
        if (!column.has_value()) {
            return rep.fail(diag::Code::E_MALFORMED_RELATED, line, "column number is not an integer");
        }
        out.loc = Location{*line_no, *column};
    }
    out.message = tail(content, column_end + 2);
    return true;
}

bool SectionScanner::run() {
    for (std::size_t i = 1; i < errors_.size(); ++i) {
        if (cmp_file(errors_[i - 1].file, errors_[i].file) > 0) {
            const text::Line at{0, 0, errors_[i].file};
            return rep_.fail(diag::Code::E_UNSORTED_SUMMARY, at,
                             "summary lists '" + std::string(errors_[i].file) + "' after '" +
                                 std::string(errors_[i - 1].file) + "'");
        }
    }

    text::Line line{};
    text::Line last{};
    while (iter_.next(line)) {
        if (!step_(line)) return false;
        last = line;
    }
    return close_section_(last);
}

bool SectionScanner::step_(const text::Line& line) {
    if (!line.content.empty() && line.content[0] == '=') {
        if (state_ == State::kInSection && !close_section_(line)) return false;
        return open_section_(line);
    }

    if (state_ == State::kSeekFirstSection) return true;
    if (text::starts_with(line.content, "!!!")) {
        return rep_.fail(diag::Code::E_ANNOTATION_MISMATCH, line,
                         "annotation in '" + std::string(file_) + "' has no matching summary error");
    }
    if (queue_.empty()) return true;

    ++code_line_;
    return annotate_(line);
}

// "==== <file> (<n> errors) ===="
bool SectionScanner::open_section_(const text::Line& line) {
    const auto content = line.content;
    const auto name_end = content.find(' ', 5);
    if (content.size() <= 5 || name_end == std::string_view::npos) {
        return rep_.fail(diag::Code::E_MALFORMED_SECTION_HEADER, line, "failed to find end of file name");
    }

    file_ = content.substr(5, name_end - 5);
    if (text::starts_with(file_, "./")) file_.remove_prefix(2);

    const auto count_start = name_end + 2;
    const auto count_end = content.find(' ', count_start);
    if (count_start >= content.size() || content[name_end + 1] != '(' || count_end == std::string_view::npos) {
        return rep_.fail(diag::Code::E_MALFORMED_SECTION_HEADER, line, "failed to find error count");
    }
    const auto declared = parse_u32(content.substr(count_start, count_end - count_start));
    if (!declared.has_value()) {
        return rep_.fail(diag::Code::E_MALFORMED_SECTION_HEADER, line, "error count is not an integer");
    }

    const auto lo = std::partition_point(errors_.begin(), errors_.end(),
                                         [&](const FileError& e) { return cmp_file(e.file, file_) < 0; });
    const auto hi = std::partition_point(lo, errors_.end(),
                                         [&](const FileError& e) { return cmp_file(e.file, file_) <= 0; });

    queue_.clear();
    for (auto it = lo; it != hi; ++it) {
        if (it->file != file_) {
            return rep_.fail(diag::Code::E_UNSORTED_SUMMARY, line,
                             "expected summary errors to be ordered by file, found '" + std::string(it->file) + "'");
        }
        queue_.push_back(static_cast<std::size_t>(it - errors_.begin()));
    }
    if (queue_.size() != *declared) {
        return rep_.fail(diag::Code::E_ANNOTATION_MISMATCH, line,
                         "section declares " + std::to_string(*declared) + " error(s) but the summary lists " +
                             std::to_string(queue_.size()));
    }

    code_line_ = 0;
    state_ = State::kInSection;
    return true;
}

bool SectionScanner::close_section_(const text::Line& line) {
    if (state_ != State::kInSection || queue_.empty()) return true;
    const auto& first = errors_[queue_.front()];
    std::string msg = std::to_string(queue_.size()) + " error(s) in '" + std::string(file_) +
                      "' have no annotation, first: TS" + std::string(first.code);
    return rep_.fail(diag::Code::E_ANNOTATION_MISMATCH, line, std::move(msg));
}

bool SectionScanner::annotate_(const text::Line& line) {
    std::vector<std::size_t> done{};
    for (std::size_t k = 0; k < queue_.size(); ++k) {
        FileError& err = errors_[queue_[k]];
        if (!err.loc.has_value()) {
            return rep_.fail(diag::Code::E_MISSING_LOCATION, line,
                             "error TS" + std::string(err.code) + " in '" + std::string(file_) + "' has no location");
        }
        if (err.loc->line > code_line_) break;

        if (style_ == AnnotationStyle::kPlain) {
            text::Line underline{};
            if (!iter_.next(underline) || iter_.at_end()) {
                return rep_.fail(diag::Code::E_MISSING_UNDERLINE, line, "expected error or code line after underline");
            }
            if (iter_.peek() != '!') continue;

            done.push_back(k);
            if (code_line_ == err.loc->line) {
                const auto last = underline.content.find_last_of('~');
                const std::size_t start = 2 + static_cast<std::size_t>(err.loc->column);
                if (last != std::string_view::npos) {
                    if (last < start) {
                        return rep_.fail(diag::Code::E_NEGATIVE_LENGTH, underline,
                                         "underline ends before the error column " +
                                             std::to_string(err.loc->column));
                    }
                    err.length = static_cast<uint32_t>(last - start);
                }
            }
            if (!consume_plain_annotations_(err)) return false;
        } else {
            if (iter_.peek() != '!') continue;
            done.push_back(k);
            if (!consume_pretty_annotations_(err, line)) return false;
        }
    }

    for (auto it = done.rbegin(); it != done.rend(); ++it) {
        queue_.erase(queue_.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    return true;
}

bool SectionScanner::consume_plain_annotations_(FileError& err) {
    text::Line bang{};
    while (!iter_.at_end() && iter_.peek() == '!') {
        iter_.next(bang);
        if (!is_related_line(bang.content)) continue;

        FileError related{};
        if (!parse_related_plain(rep_, bang, err, related)) return false;
        err.related.push_back(std::move(related));
    }
    return true;
}

// Coloured baselines carry related codes only in the per-file section.
bool SectionScanner::consume_pretty_annotations_(FileError& err, const text::Line& line) {
    std::size_t filled = 0;
    text::Line bang{};
    while (!iter_.at_end() && iter_.peek() == '!') {
        iter_.next(bang);
        if (!is_related_line(bang.content)) continue;

        if (filled >= err.related.size()) {
            return rep_.fail(diag::Code::E_RELATED_COUNT_MISMATCH, bang,
                             "more related annotations than related errors for TS" + std::string(err.code));
        }
        const auto code_end = bang.content.find(' ', k_related_code_start);
        if (bang.content.size() <= k_related_code_start || code_end == std::string_view::npos) {
            return rep_.fail(diag::Code::E_MALFORMED_RELATED, bang, "failed to find end of related error code");
        }
        err.related[filled++].code =
            bang.content.substr(k_related_code_start, code_end - k_related_code_start);
    }

    if (filled != err.related.size()) {
        return rep_.fail(diag::Code::E_RELATED_COUNT_MISMATCH, line,
                         std::to_string(err.related.size()) + " related error(s) for TS" + std::string(err.code) +
                             " but " + std::to_string(filled) + " annotation(s)");
    }
    return true;
}

} // namespace tsbase::baseline::detail
