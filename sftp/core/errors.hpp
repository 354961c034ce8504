#ifndef SP_SFTP_ERRORS_HEADER
#define SP_SFTP_ERRORS_HEADER

#include "sftp/common/types.hpp"

#include <stdexcept>

namespace securepath::sftp {

/// caller defect detected before anything is sent (bad path, handle, buffer range, ...)
struct usage_error : std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

enum class packet_error_code {
	unexpected_end,
	invalid_packet,
	insufficient_space
};

/// encoding or decoding of the binary format failed
class packet_error : public std::runtime_error {
public:
	packet_error(packet_error_code code, std::string const& what)
	: std::runtime_error(what)
	, code_(code)
	{}

	packet_error_code code() const { return code_; }

private:
	packet_error_code code_;
};

/// the remote side sent something the protocol does not allow, the session cannot continue
struct protocol_violation : std::runtime_error {
	using std::runtime_error::runtime_error;
};

/// internal invariant broken, indicates a bug in this library
struct sftp_defect : std::logic_error {
	using std::logic_error::logic_error;
};

}

#endif
