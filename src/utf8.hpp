#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: convert between UTF-8 bytes and Unicode scalar values.
 * Note: malformed input decodes to U+FFFD per bad byte; never throws.
 */
#include <string>
#include <string_view>

std::u32string utf8_decode(std::string_view s);
std::string utf8_encode(std::u32string_view s);
void utf8_append(std::string& out, char32_t c);
/* expected length of a sequence from its lead byte, 0 for a continuation/invalid byte */
int utf8_sequence_length(unsigned char lead);
size_t utf8_length(std::string_view s);
