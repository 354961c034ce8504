#include "sftp_config.hpp"

namespace securepath::sftp {

bool sftp_config::valid() const {
	return max_read_block_length != 0
		&& max_write_block_length != 0
		&& packet_slack >= min_packet_slack
		&& protocol_version == sftp_version;
}

}
