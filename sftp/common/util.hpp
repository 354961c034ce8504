#ifndef SP_SFTP_UTIL_HEADER
#define SP_SFTP_UTIL_HEADER

#include "types.hpp"

#include <algorithm>
#include <cstring>
#include <iosfwd>
#include <string_view>
#include <type_traits>

namespace securepath::sftp {

inline void u16ton(std::uint16_t v, std::byte* out) {
	out[0] = std::byte((v >> 8) & 0xff);
	out[1] = std::byte(v & 0xff);
}

inline std::uint16_t ntou16(std::byte const* in) {
	return std::uint16_t((std::to_integer<std::uint16_t>(in[0]) << 8)
		| (std::to_integer<std::uint16_t>(in[1])));
}

inline void u32ton(std::uint32_t v, std::byte* out) {
	out[0] = std::byte((v >> 24) & 0xff);
	out[1] = std::byte((v >> 16) & 0xff);
	out[2] = std::byte((v >> 8) & 0xff);
	out[3] = std::byte(v & 0xff);
}

inline std::uint32_t ntou32(std::byte const* in) {
	return (std::to_integer<std::uint32_t>(in[0]) << 24)
		| (std::to_integer<std::uint32_t>(in[1]) << 16)
		| (std::to_integer<std::uint32_t>(in[2]) << 8)
		| (std::to_integer<std::uint32_t>(in[3]));
}

template<class T> concept Byte = std::is_same_v<std::remove_cv_t<T>, std::byte>;

/// std::span doesn't clamp the count to the size-offset which is what we want
template<Byte T>
inline std::span<T> safe_subspan(std::span<T> s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	if(offset >= s.size()) {
		return {};
	}
	if(count != std::dynamic_extent) {
		count = std::min(count, s.size()-offset);
	}
	return s.subspan(offset, count);
}

inline span safe_subspan(byte_vector& s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	return safe_subspan(span(s), offset, count);
}

inline const_span safe_subspan(byte_vector const& s, std::size_t offset, std::size_t count = std::dynamic_extent) {
	return safe_subspan(const_span(s), offset, count);
}

/// lower case hex without separators, e.g. "0a1b"
std::string to_hex(const_span);

/// space separated hex bytes for logging
std::ostream& operator<<(std::ostream&, const_span);

}

#endif
