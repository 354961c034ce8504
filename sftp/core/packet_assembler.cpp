#include "packet_assembler.hpp"
#include "errors.hpp"
#include "sftp_packet.hpp"

#include "sftp/common/util.hpp"

#include <cstring>

namespace securepath::sftp {

packet_assembler::packet_assembler(std::size_t max_packet_size)
: max_packet_size_(max_packet_size)
{
}

void packet_assembler::add(const_span s, packet_handler const& handler) {
	if(in_data_.size() - in_used_ < s.size()) {
		in_data_.resize(in_used_ + s.size());
	}
	if(!s.empty()) {
		std::memcpy(in_data_.data() + in_used_, s.data(), s.size());
		in_used_ += s.size();
	}

	std::size_t used_size{};
	while(true) {
		auto length = peek_packet_size(safe_subspan(in_data_, used_size, in_used_ - used_size));
		if(!length) {
			break;
		}
		if(*length > max_packet_size_ || *length <= packet_length_size) {
			throw packet_error(packet_error_code::invalid_packet, "Invalid packet length");
		}
		if(in_used_ - used_size < *length) {
			break;
		}
		auto packet = const_span(in_data_).subspan(used_size, *length);
		used_size += *length;
		handler(packet);
	}

	if(used_size) {
		std::memmove(in_data_.data(), in_data_.data() + used_size, in_used_ - used_size);
		in_used_ -= used_size;
	}
}

}
