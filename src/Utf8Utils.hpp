#pragma once
#include <cstddef>

// Strict UTF-8 check: rejects overlong forms, surrogates (U+D800..U+DFFF),
// code points above U+10FFFF and truncated sequences.
bool is_valid_utf8(const char* data, size_t size);
