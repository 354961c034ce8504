
#include "util.hpp"

#include <iomanip>
#include <ostream>

namespace securepath::sftp {

char const hex_digits[] = "0123456789abcdef";

std::string to_hex(const_span s) {
	std::string res;
	res.reserve(s.size()*2);
	for(auto v : s) {
		auto b = std::to_integer<std::uint8_t>(v);
		res += hex_digits[b >> 4];
		res += hex_digits[b & 0x0f];
	}
	return res;
}

std::ostream& operator<<(std::ostream& out, const_span s) {
	bool first = true;
	for(auto v : s) {
		if(!first) {
			out << " ";
		}
		out << std::hex << std::setw(2) << std::setfill('0') << int(v);
		first = false;
	}
	return out << std::dec;
}

}
