#ifndef SP_SFTP_PACKET_ASSEMBLER_HEADER
#define SP_SFTP_PACKET_ASSEMBLER_HEADER

#include "sftp/common/types.hpp"

#include <functional>

namespace securepath::sftp {

/** \brief Splits byte stream to sftp packets using the length field
 *
 *  Packets handed out include the length field, so they can be given to sftp_packet_reader as they are.
 */
class packet_assembler {
public:
	using packet_handler = std::function<void(const_span)>;

	packet_assembler(std::size_t max_packet_size);

	/// buffers the data and calls handler for every complete packet, throws packet_error if packet exceeds the maximum size
	void add(const_span data, packet_handler const& handler);

	/// bytes waiting for the rest of a packet
	std::size_t buffered() const { return in_used_; }

private:
	std::size_t const max_packet_size_;
	byte_vector in_data_;
	std::size_t in_used_{};
};

}

#endif
