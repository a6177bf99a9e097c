#pragma once
#include <string>
#include <string_view>

// Strict UTF-8: rejects overlong forms, surrogates and code points past U+10FFFF.
bool is_valid_utf8(std::string_view s);

// True when s consists only of Unicode white space (ASCII or multibyte).
// Invalid UTF-8 bytes count as content.
bool is_blank(std::string_view s);

std::string to_lower_ascii(std::string_view s);

// Simple (one code point to one code point) lowercase mapping over UTF-8 text.
// Covers ASCII, Latin-1, Latin Extended-A, Greek, Cyrillic, fullwidth Latin and
// the letterlike symbols that lowercase into ASCII (U+0130, U+212A).
// Bytes that are not valid UTF-8 are copied through unchanged.
std::string to_lower_unicode(std::string_view s);

std::string sha256_hex(std::string_view bytes);

// Log-safe rendering of arbitrary bytes: non-printables become \xHH, long input is cut.
std::string printable(std::string_view bytes, size_t max_len = 64);
