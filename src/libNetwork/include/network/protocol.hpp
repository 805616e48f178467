#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>

#include <string>

namespace ttt {
namespace network {

using ConnectionId = std::uint32_t; //!< Identifies a connection on network layer. 0 is never assigned.
using Message      = std::string;   //!< Raw bytes of one transport payload.

inline constexpr std::uint16_t DEFAULT_PORT           = 9001;
inline constexpr std::size_t DEFAULT_MAX_CONNECTIONS = 1000;

//! Maximum payload we are willing to read.
//! \note A full state frame is below 100 bytes. Anything larger is a broken or hostile peer.
inline constexpr std::uint32_t MAX_PAYLOAD_BYTES = 4 * 1024;

//! Transport frames are prefixed with the payload size.
struct BasicMessageHeader {
	std::uint32_t payload_size{};
};

// Local helpers to move integers to/from network byte order without relying on platform headers.
constexpr std::uint32_t byteswap_u32(std::uint32_t value) {
	return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) | ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

constexpr std::uint32_t to_network_u32(std::uint32_t value) {
	if constexpr (std::endian::native == std::endian::big) {
		return value;
	}
	return byteswap_u32(value);
}

constexpr std::uint32_t from_network_u32(std::uint32_t value) {
	return to_network_u32(value);
}

} // namespace network
} // namespace ttt
