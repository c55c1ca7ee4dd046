#include "Utf8Utils.hpp"

bool is_valid_utf8(const char* data, size_t size) {
	const unsigned char* s = reinterpret_cast<const unsigned char*>(data);
	size_t pos = 0;

	while (pos < size) {
		unsigned char lead = s[pos];
		if (lead < 0x80) {
			++pos;
			continue;
		}

		size_t extra = 0;
		// Bounds for the first continuation byte; they rule out overlongs and surrogates.
		unsigned char lo = 0x80;
		unsigned char hi = 0xBF;
		if (lead >= 0xC2 && lead <= 0xDF) {
			extra = 1;
		} else if (lead == 0xE0) {
			extra = 2;
			lo = 0xA0;
		} else if (lead == 0xED) {
			extra = 2;
			hi = 0x9F;
		} else if (lead >= 0xE1 && lead <= 0xEF) {
			extra = 2;
		} else if (lead == 0xF0) {
			extra = 3;
			lo = 0x90;
		} else if (lead == 0xF4) {
			extra = 3;
			hi = 0x8F;
		} else if (lead >= 0xF1 && lead <= 0xF3) {
			extra = 3;
		} else {
			// 0x80..0xC1 and 0xF5..0xFF never start a sequence
			return false;
		}

		if (size - pos <= extra) {
			return false;
		}
		if (s[pos + 1] < lo || s[pos + 1] > hi) {
			return false;
		}
		for (size_t i = 2; i <= extra; ++i) {
			if ((s[pos + i] & 0xC0) != 0x80) {
				return false;
			}
		}
		pos += extra + 1;
	}
	return true;
}
