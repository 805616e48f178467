#include "network/frameCodec.hpp"

#include <cstdint>

namespace ttt::network {

static constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

static bool isHighSurrogate(char16_t unit) {
	return unit >= 0xD800 && unit <= 0xDBFF;
}
static bool isLowSurrogate(char16_t unit) {
	return unit >= 0xDC00 && unit <= 0xDFFF;
}

//! Decode one code point starting at pos. Advances pos past the consumed bytes.
static char32_t decodeUtf8(std::string_view utf8, std::size_t& pos) {
	const auto lead = static_cast<unsigned char>(utf8[pos++]);
	if (lead < 0x80) {
		return lead;
	}

	std::size_t extra = 0;
	char32_t codePoint{};
	char32_t minimum{};
	if ((lead & 0xE0) == 0xC0) {
		extra     = 1;
		codePoint = lead & 0x1F;
		minimum   = 0x80;
	} else if ((lead & 0xF0) == 0xE0) {
		extra     = 2;
		codePoint = lead & 0x0F;
		minimum   = 0x800;
	} else if ((lead & 0xF8) == 0xF0) {
		extra     = 3;
		codePoint = lead & 0x07;
		minimum   = 0x10000;
	} else {
		return REPLACEMENT_CHARACTER;
	}

	for (std::size_t i = 0; i != extra; ++i) {
		if (pos == utf8.size()) {
			return REPLACEMENT_CHARACTER;
		}
		const auto next = static_cast<unsigned char>(utf8[pos]);
		if ((next & 0xC0) != 0x80) {
			return REPLACEMENT_CHARACTER; // Do not consume, next byte may start a new sequence.
		}
		codePoint = (codePoint << 6) | (next & 0x3F);
		++pos;
	}

	if (codePoint < minimum || codePoint > 0x10FFFF || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
		return REPLACEMENT_CHARACTER;
	}
	return codePoint;
}

static void appendUtf8(std::string& out, char32_t codePoint) {
	if (codePoint < 0x80) {
		out.push_back(static_cast<char>(codePoint));
	} else if (codePoint < 0x800) {
		out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
		out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
	} else if (codePoint < 0x10000) {
		out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
		out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
	} else {
		out.push_back(static_cast<char>(0xF0 | (codePoint >> 18)));
		out.push_back(static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
		out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
	}
}

std::u16string toUtf16(std::string_view utf8) {
	std::u16string out;
	out.reserve(utf8.size());

	std::size_t pos = 0;
	while (pos < utf8.size()) {
		const auto codePoint = decodeUtf8(utf8, pos);
		if (codePoint < 0x10000) {
			out.push_back(static_cast<char16_t>(codePoint));
		} else {
			const auto offset = codePoint - 0x10000;
			out.push_back(static_cast<char16_t>(0xD800 + (offset >> 10)));
			out.push_back(static_cast<char16_t>(0xDC00 + (offset & 0x3FF)));
		}
	}
	return out;
}

std::optional<std::string> toUtf8(std::u16string_view utf16) {
	std::string out;
	out.reserve(utf16.size());

	for (std::size_t i = 0; i < utf16.size(); ++i) {
		const auto unit = utf16[i];
		if (isHighSurrogate(unit)) {
			if (i + 1 == utf16.size() || !isLowSurrogate(utf16[i + 1])) {
				return {};
			}
			const auto low = utf16[++i];
			appendUtf8(out, 0x10000 + ((static_cast<char32_t>(unit) - 0xD800) << 10) + (static_cast<char32_t>(low) - 0xDC00));
		} else if (isLowSurrogate(unit)) {
			return {};
		} else {
			appendUtf8(out, unit);
		}
	}
	return out;
}

Message encodeFrame(std::string_view text) {
	const auto utf16     = toUtf16(text);
	const auto byteCount = static_cast<std::uint32_t>(utf16.size() * 2);

	Message frame;
	frame.reserve(FRAME_HEADER_BYTES + byteCount);
	for (std::size_t i = 0; i != FRAME_HEADER_BYTES; ++i) {
		frame.push_back(static_cast<char>((byteCount >> (8 * i)) & 0xFF));
	}
	for (const auto unit: utf16) {
		frame.push_back(static_cast<char>(unit & 0xFF));
		frame.push_back(static_cast<char>((unit >> 8) & 0xFF));
	}
	return frame;
}

std::optional<std::string> decodeFrame(std::string_view payload) {
	if (payload.size() < FRAME_HEADER_BYTES) {
		return {};
	}

	std::uint32_t raw = 0;
	for (std::size_t i = 0; i != FRAME_HEADER_BYTES; ++i) {
		raw |= static_cast<std::uint32_t>(static_cast<unsigned char>(payload[i])) << (8 * i);
	}

	const auto byteCount = static_cast<std::int32_t>(raw);
	const auto body      = payload.substr(FRAME_HEADER_BYTES);
	if (byteCount < 0 || byteCount % 2 != 0 || static_cast<std::size_t>(byteCount) != body.size()) {
		return {};
	}

	std::u16string utf16;
	utf16.reserve(body.size() / 2);
	for (std::size_t i = 0; i < body.size(); i += 2) {
		const auto lo = static_cast<unsigned char>(body[i]);
		const auto hi = static_cast<unsigned char>(body[i + 1]);
		utf16.push_back(static_cast<char16_t>(lo | (hi << 8)));
	}

	return toUtf8(utf16);
}

} // namespace ttt::network
