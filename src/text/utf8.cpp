#include <tsbase/text/Utf8.hpp>

#include <tsbase/text/LineIter.hpp>

namespace tsbase::text {

bool validate_utf8_strict(std::string_view s, uint32_t& bad_off) {
    const auto is_cont = [](unsigned char b) -> bool {
        return (b & 0xC0) == 0x80;
    };

    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char b0 = static_cast<unsigned char>(s[i]);

        if (b0 < 0x80) {
            i += 1;
            continue;
        }

        if (b0 >= 0xC2 && b0 <= 0xDF) {
            if (i + 1 >= s.size() || !is_cont(static_cast<unsigned char>(s[i + 1]))) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            i += 2;
            continue;
        }

        if (b0 >= 0xE0 && b0 <= 0xEF) {
            if (i + 2 >= s.size()) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
            const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
            if (!is_cont(b1) || !is_cont(b2)) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            // overlong / surrogate range
            if ((b0 == 0xE0 && b1 < 0xA0) || (b0 == 0xED && b1 >= 0xA0)) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            i += 3;
            continue;
        }

        if (b0 >= 0xF0 && b0 <= 0xF4) {
            if (i + 3 >= s.size()) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
            const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
            const unsigned char b3 = static_cast<unsigned char>(s[i + 3]);
            if (!is_cont(b1) || !is_cont(b2) || !is_cont(b3)) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            if ((b0 == 0xF0 && b1 < 0x90) || (b0 == 0xF4 && b1 > 0x8F)) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            i += 4;
            continue;
        }

        // continuation byte in lead position, 0xC0/0xC1, or > 0xF4
        bad_off = static_cast<uint32_t>(i);
        return false;
    }

    return true;
}

std::size_t utf8_seq_len(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xF0) return 4;
    if (lead >= 0xE0) return 3;
    if (lead >= 0xC0) return 2;
    return 1;
}

bool last_char_before_utf16_column(std::string_view s,
                                   std::size_t first_col,
                                   std::size_t limit,
                                   std::size_t& out_off) {
    bool found = false;
    std::size_t col = first_col;
    std::size_t i = 0;
    while (i < s.size() && col < limit) {
        const unsigned char lead = static_cast<unsigned char>(s[i]);
        out_off = i;
        found = true;
        col += utf16_len(lead);
        i += utf8_seq_len(lead);
    }
    return found;
}

namespace {

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace

bool decode_utf16(std::string_view bytes, bool big_endian, std::string& out, uint32_t& bad_off) {
    out.clear();
    out.reserve(bytes.size());

    const auto unit_at = [&](std::size_t i) -> uint32_t {
        const uint32_t a = static_cast<unsigned char>(bytes[i]);
        const uint32_t b = static_cast<unsigned char>(bytes[i + 1]);
        return big_endian ? ((a << 8) | b) : ((b << 8) | a);
    };

    std::size_t i = 0;
    while (i < bytes.size()) {
        if (i + 1 >= bytes.size()) {
            bad_off = static_cast<uint32_t>(i);
            return false;
        }

        const uint32_t u = unit_at(i);
        if (u >= 0xD800 && u <= 0xDBFF) {
            if (i + 3 >= bytes.size()) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            const uint32_t lo = unit_at(i + 2);
            if (lo < 0xDC00 || lo > 0xDFFF) {
                bad_off = static_cast<uint32_t>(i);
                return false;
            }
            append_utf8(out, 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00));
            i += 4;
            continue;
        }

        if (u >= 0xDC00 && u <= 0xDFFF) {
            bad_off = static_cast<uint32_t>(i);
            return false;
        }

        append_utf8(out, u);
        i += 2;
    }

    return true;
}

bool check_utf8(std::string_view path, std::string_view data, diag::Bag& bag) {
    uint32_t bad_off = 0;
    if (validate_utf8_strict(data, bad_off)) return true;

    const LineCol lc = line_col_at(data, bad_off);
    bag.add(diag::Code::T_INVALID_UTF8, std::string(path), lc.line, lc.col,
            "invalid UTF-8 sequence at byte offset " + std::to_string(bad_off));
    return false;
}

} // namespace tsbase::text
