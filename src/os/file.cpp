#include <tsbase/os/File.hpp>

#include <tsbase/text/Utf8.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>

namespace tsbase::os {

namespace {

bool read_bytes(std::string_view path, std::string& out, std::string& err) {
    std::FILE* fp = std::fopen(std::string(path).c_str(), "rb");
    if (!fp) {
        err = std::string("cannot open file: ") + std::strerror(errno);
        return false;
    }

    std::fseek(fp, 0, SEEK_END);
    const long sz = std::ftell(fp);
    std::fseek(fp, 0, SEEK_SET);
    if (sz < 0) {
        std::fclose(fp);
        err = "cannot read file size";
        return false;
    }

    out.resize(static_cast<std::size_t>(sz));
    const std::size_t n = std::fread(out.data(), 1, out.size(), fp);
    std::fclose(fp);

    if (n != out.size()) {
        out.clear();
        err = "short read";
        return false;
    }
    return true;
}

bool has_prefix(const std::string& s, const char* bytes, std::size_t n) {
    return s.size() >= n && std::memcmp(s.data(), bytes, n) == 0;
}

} // namespace

ReadTextResult read_source_file(std::string_view path) {
    ReadTextResult r{};
    std::string raw{};
    if (!read_bytes(path, raw, r.err)) return r;

    uint32_t bad_off = 0;
    if (has_prefix(raw, "\xFE\xFF", 2) || has_prefix(raw, "\xFF\xFE", 2)) {
        const bool big_endian = static_cast<unsigned char>(raw[0]) == 0xFE;
        if (!text::decode_utf16(std::string_view(raw).substr(2), big_endian, r.text, bad_off)) {
            r.text.clear();
            r.err = "invalid UTF-16 at byte " + std::to_string(bad_off + 2);
            return r;
        }
        r.ok = true;
        return r;
    }

    std::size_t bom = 0;
    if (has_prefix(raw, "\xEF\xBB\xBF", 3)) {
        raw.erase(0, 3);
        bom = 3;
    }
    if (!text::validate_utf8_strict(raw, bad_off)) {
        r.err = "invalid UTF-8 at byte " + std::to_string(bad_off + bom);
        return r;
    }
    r.text = std::move(raw);
    r.ok = true;
    return r;
}

bool file_exists(std::string_view path) {
    std::error_code ec{};
    return std::filesystem::is_regular_file(std::filesystem::path(path), ec);
}

} // namespace tsbase::os
