#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tsbase::text {

struct Line {
    uint32_t index = 0;
    std::size_t start = 0;
    std::string_view content{};
};

/// @brief Splits a buffer into lines without copying.
///
/// Content excludes the terminator ("\r\n" or "\n"). A final line without a
/// terminator is returned as-is. Once the cursor reaches the end of the buffer
/// one extra empty line is produced (the line after a trailing newline), after
/// which the iterator is exhausted.
class LineIter {
public:
    explicit LineIter(std::string_view data) : data_(data) {}

    bool next(Line& out) {
        if (done_) return false;

        if (line_start_ >= data_.size()) {
            out = Line{index_++, line_start_, data_.substr(data_.size())};
            done_ = true;
            return true;
        }

        const std::size_t start = line_start_;
        const std::size_t nl = data_.find('\n', start);
        std::size_t end = 0;
        if (nl == std::string_view::npos) {
            end = data_.size();
            line_start_ = data_.size();
        } else {
            end = nl;
            if (end > start && data_[end - 1] == '\r') --end;
            line_start_ = nl + 1;
        }

        out = Line{index_++, start, data_.substr(start, end - start)};
        return true;
    }

    // start of the line next() will produce
    std::size_t line_start() const { return line_start_; }

    bool at_end() const { return line_start_ >= data_.size(); }

    // first byte of the next line, or 0 when there is none
    char peek() const { return at_end() ? '\0' : data_[line_start_]; }

    std::string_view rest() const { return at_end() ? std::string_view{} : data_.substr(line_start_); }

    std::string_view data() const { return data_; }

private:
    std::string_view data_{};
    std::size_t line_start_ = 0;
    uint32_t index_ = 0;
    bool done_ = false;
};

struct LineCol {
    uint32_t line = 1; // 1-based
    uint32_t col = 1;  // 1-based, bytes
};

inline LineCol line_col_at(std::string_view data, std::size_t off) {
    LineCol lc{};
    if (off > data.size()) off = data.size();
    for (std::size_t i = 0; i < off; ++i) {
        if (data[i] == '\n') {
            ++lc.line;
            lc.col = 1;
        } else {
            ++lc.col;
        }
    }
    return lc;
}

} // namespace tsbase::text
