#pragma once

#include <tsbase/diag/DiagCode.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tsbase::text {

bool validate_utf8_strict(std::string_view s, uint32_t& bad_off);

// byte length of the UTF-8 sequence introduced by lead (1 for stray bytes)
std::size_t utf8_seq_len(unsigned char lead);

// UTF-16 code units of the code point introduced by lead
inline std::size_t utf16_len(unsigned char lead) {
    return lead >= 0xF0 ? 2 : 1;
}

/// @brief Column accounting used by the types baseline.
///
/// Walks the characters of s, with the first character sitting at UTF-16
/// column first_col. Every character whose starting column is below limit is
/// visited; out_off receives the byte offset of the last one.
/// Returns false when no character starts before limit.
bool last_char_before_utf16_column(std::string_view s,
                                   std::size_t first_col,
                                   std::size_t limit,
                                   std::size_t& out_off);

/// @brief UTF-16 (BE or LE) to UTF-8. Rejects unpaired surrogates and an odd
/// trailing byte; bad_off is the byte offset of the offending unit.
bool decode_utf16(std::string_view bytes, bool big_endian, std::string& out, uint32_t& bad_off);

// validate_utf8_strict() over a whole parser input, reporting T_INVALID_UTF8
bool check_utf8(std::string_view path, std::string_view data, diag::Bag& bag);

} // namespace tsbase::text
