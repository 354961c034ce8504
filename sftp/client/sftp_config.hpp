#ifndef SP_SFTP_CLIENT_CONFIG_HEADER
#define SP_SFTP_CLIENT_CONFIG_HEADER

#include "sftp/core/packet_types.hpp"

namespace securepath::sftp {

/** \brief SFTP client session configuration
 */
struct sftp_config {
	// reads are shortened to this
	std::uint32_t max_read_block_length{256*1024};

	// writes longer than this are rejected
	std::uint32_t max_write_block_length{32*1024};

	// extra space for request header, added to max_write_block_length for the request buffer
	std::uint32_t packet_slack{1024};

	// times an empty data response is retried before failing the read
	std::uint32_t empty_read_retries{4};

	// version sent in init and required from the server
	std::uint32_t protocol_version{sftp_version};

public:
	/// room for the write request header: length, type, id, handle, offset and data length
	static std::uint32_t const min_packet_slack = 4 + 1 + 4 + 4 + max_handle_length + 8 + 4;

	bool valid() const;

	/// largest packet we expect from the server
	std::size_t max_in_packet_size() const {
		return std::size_t(max_read_block_length) + packet_slack;
	}

	std::size_t request_buffer_size() const {
		return std::size_t(max_write_block_length) + packet_slack;
	}
};

}

#endif
