#pragma once

#include "network/protocol.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ttt::network {

//! Application frame carried in one transport payload:
//! 4 byte little endian signed byte count, then exactly that many bytes of UTF-16LE text.
inline constexpr std::size_t FRAME_HEADER_BYTES = 4;

//! UTF-8 text to application frame.
Message encodeFrame(std::string_view text);

//! Application frame to UTF-8 text. Returns empty if the count does not match or the text is not valid UTF-16.
std::optional<std::string> decodeFrame(std::string_view payload);

//! UTF-8 to UTF-16. Invalid sequences become U+FFFD.
std::u16string toUtf16(std::string_view utf8);
//! UTF-16 to UTF-8. Returns empty on unpaired surrogates.
std::optional<std::string> toUtf8(std::u16string_view utf16);

} // namespace ttt::network
