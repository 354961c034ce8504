#ifndef SP_SFTP_TYPES_HEADER
#define SP_SFTP_TYPES_HEADER

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace securepath::sftp {

using byte_vector = std::vector<std::byte>;
using span = std::span<std::byte>;
using const_span = std::span<std::byte const>;

inline std::string_view to_string_view(const_span s) {
	return std::string_view((char const*)s.data(), s.size());
}

inline const_span to_span(std::string_view v) {
	return const_span((std::byte const*)v.data(), v.size());
}

inline byte_vector to_byte_vector(const_span s) {
	return byte_vector(s.begin(), s.end());
}

inline byte_vector to_byte_vector(std::string_view v) {
	return to_byte_vector(to_span(v));
}

#if !defined(SPSFTP_ASSERT)
#	if !defined(NDEBUG)
#		define SPSFTP_ASSERT(cond, message) assert((cond) && (message))
#	else
#		define SPSFTP_ASSERT(cond, message) ((void)0)
#	endif
#endif

}

#endif
