#include <tsbase/config/TomlLite.hpp>

#include <cctype>
#include <charconv>
#include <fstream>

namespace tsbase::config::toml_lite {

namespace {

std::string_view trim(std::string_view s) {
    const auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

// length of the line before an unquoted '#'
std::size_t comment_start(std::string_view line) {
    bool in_string = false;
    bool escaped = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (!in_string) {
            if (c == '#') return i;
            if (c == '"') in_string = true;
            continue;
        }
        if (escaped) {
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == '"') {
            in_string = false;
        }
    }
    return line.size();
}

bool parse_string_literal(std::string_view text, std::string& out, std::string& err) {
    if (text.size() < 2 || text.front() != '"' || text.back() != '"') {
        err = "invalid string literal";
        return false;
    }
    out.clear();
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < text.size(); ++i) {
        const char c = text[i];
        if (escaped) {
            switch (c) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                default: out.push_back(c); break;
            }
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        out.push_back(c);
    }
    if (escaped) {
        err = "unterminated escape in string literal";
        return false;
    }
    return true;
}

bool parse_int_literal(std::string_view text, int64_t& out) {
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return false;
    const auto r = std::from_chars(text.data(), text.data() + text.size(), out);
    return r.ec == std::errc{} && r.ptr == text.data() + text.size();
}

bool split_array_items(std::string_view text, std::vector<std::string_view>& out, std::string& err) {
    out.clear();
    bool in_string = false;
    bool escaped = false;
    std::size_t start = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == ',') {
            const auto item = trim(text.substr(start, i - start));
            if (!item.empty()) out.push_back(item);
            start = i + 1;
        }
    }
    if (in_string) {
        err = "unterminated string in array";
        return false;
    }
    const auto item = trim(text.substr(start));
    if (!item.empty()) out.push_back(item);
    return true;
}

bool parse_array(std::string_view inner, Value& out, std::string& err) {
    std::vector<std::string_view> items{};
    if (!split_array_items(inner, items, err)) return false;

    std::vector<std::string> svals{};
    std::vector<int64_t> ivals{};
    for (const auto it : items) {
        if (it.front() == '"') {
            std::string sv{};
            if (!parse_string_literal(it, sv, err)) return false;
            svals.push_back(std::move(sv));
            continue;
        }
        int64_t iv = 0;
        if (!parse_int_literal(it, iv)) {
            err = "unsupported array element: " + std::string(it);
            return false;
        }
        ivals.push_back(iv);
    }

    if (!svals.empty() && !ivals.empty()) {
        err = "array values must be homogeneous strings or integers";
        return false;
    }
    if (!ivals.empty()) {
        out = std::move(ivals);
    } else {
        out = std::move(svals);
    }
    return true;
}

bool parse_value(std::string_view text, Value& out, std::string& err) {
    const auto v = trim(text);
    if (v.empty()) {
        err = "empty value";
        return false;
    }
    if (v == "true" || v == "false") {
        out = v == "true";
        return true;
    }

    int64_t iv = 0;
    if (parse_int_literal(v, iv)) {
        out = iv;
        return true;
    }
    if (v.front() == '"') {
        std::string sv{};
        if (!parse_string_literal(v, sv, err)) return false;
        out = std::move(sv);
        return true;
    }
    if (v.front() == '[' && v.back() == ']') {
        return parse_array(trim(v.substr(1, v.size() - 2)), out, err);
    }

    err = "unsupported TOML value";
    return false;
}

bool valid_key(std::string_view key) {
    if (key.empty()) return false;
    for (const char c : key) {
        const bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        if (!ok) return false;
    }
    return true;
}

} // namespace

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err) {
    out.clear();
    err.clear();

    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        err = "failed to open file: " + path.string();
        return false;
    }

    const auto where = [&](std::size_t line_no) {
        return path.string() + ":" + std::to_string(line_no) + ": ";
    };

    std::string section{};
    std::string raw{};
    std::size_t line_no = 0;
    while (std::getline(ifs, raw)) {
        ++line_no;
        const std::string_view line(raw);
        const auto content = trim(line.substr(0, comment_start(line)));
        if (content.empty()) continue;

        if (content.front() == '[') {
            const auto name = content.back() == ']' ? trim(content.substr(1, content.size() - 2)) : std::string_view{};
            if (!valid_key(name)) {
                err = where(line_no) + "invalid section header";
                return false;
            }
            section = std::string(name);
            continue;
        }

        const auto eq = content.find('=');
        if (eq == std::string_view::npos) {
            err = where(line_no) + "expected '='";
            return false;
        }
        const auto key = trim(content.substr(0, eq));
        if (!valid_key(key)) {
            err = where(line_no) + "invalid key";
            return false;
        }

        Value parsed{};
        std::string parse_err{};
        if (!parse_value(content.substr(eq + 1), parsed, parse_err)) {
            err = where(line_no) + parse_err;
            return false;
        }

        const std::string fq = section.empty() ? std::string(key) : section + "." + std::string(key);
        if (out.contains(fq)) {
            warnings.push_back(where(line_no) + "duplicate key '" + fq + "', overriding");
        }
        out[fq] = std::move(parsed);
    }

    return true;
}

} // namespace tsbase::config::toml_lite
