#pragma once

#include <tsbase/baseline/ErrorsBaseline.hpp>
#include <tsbase/text/LineIter.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsbase::baseline::detail {

// s.substr(pos) that yields an empty view past the end
inline std::string_view tail(std::string_view s, std::size_t pos) {
    if (pos >= s.size()) return s.substr(s.size());
    return s.substr(pos);
}

std::optional<uint32_t> parse_u32(std::string_view s);

Hint make_hint(std::string_view line);

// One SGR-coloured run: ESC[<sgr>m followed by text up to the next ESC.
// Text before the first escape forms a run with an empty sgr.
struct SgrRun {
    std::string_view sgr{};
    std::string_view text{};
};

std::vector<SgrRun> split_sgr(std::string_view line);

// Shared error reporting for the errors baseline parsers.
class Reporter {
public:
    Reporter(std::string_view path, diag::Bag& bag) : path_(path), bag_(bag) {}

    bool fail(diag::Code code, const text::Line& line, std::string message) {
        bag_.add(code, std::string(path_), line.index + 1, 1,
                 std::move(message) + "\n  line: " + diag::escape_line(line.content));
        return false;
    }

    std::string_view path() const { return path_; }

private:
    std::string_view path_{};
    diag::Bag& bag_;
};

enum class AnnotationStyle : uint8_t {
    kPlain,  // underline below every error line, related entries parsed from "!!! related"
    kPretty, // errors already complete, "!!! related" lines only supply codes
};

/// @brief Walks the `==== file (N errors) ====` sections that follow the
/// summary and matches every summary diagnostic against its `!!!` annotation.
class SectionScanner {
public:
    SectionScanner(Reporter& rep, text::LineIter& iter, std::vector<FileError>& errors, AnnotationStyle style)
        : rep_(rep), iter_(iter), errors_(errors), style_(style) {}

    bool run();

private:
    enum class State : uint8_t {
        kSeekFirstSection,
        kInSection,
    };

    bool step_(const text::Line& line);
    bool open_section_(const text::Line& line);
    bool close_section_(const text::Line& line);
    bool annotate_(const text::Line& line);
    bool consume_plain_annotations_(FileError& err);
    bool consume_pretty_annotations_(FileError& err, const text::Line& line);

    Reporter& rep_;
    text::LineIter& iter_;
    std::vector<FileError>& errors_;
    AnnotationStyle style_;

    State state_ = State::kSeekFirstSection;
    std::string_view file_{};
    std::vector<std::size_t> queue_{}; // indices into errors_, summary order
    uint32_t code_line_ = 0;
};

bool parse_related_plain(Reporter& rep, const text::Line& line, const FileError& parent, FileError& out);

bool parse_plain(Reporter& rep, std::string_view data, ErrorsBaseline& out);
bool parse_pretty(Reporter& rep, std::string_view data, ErrorsBaseline& out);

} // namespace tsbase::baseline::detail
