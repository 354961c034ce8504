#ifndef SP_SFTP_CLIENT_CHANNEL_HEADER
#define SP_SFTP_CLIENT_CHANNEL_HEADER

#include "sftp/common/types.hpp"

#include <optional>

namespace securepath::sftp {

/// close codes as in websocket close frames
enum class close_reason : std::uint16_t {
	normal               = 1000,
	going_away           = 1001,
	protocol_error       = 1002,
	unsupported          = 1003,
	abnormal             = 1006,
	unexpected_condition = 1011,

	// application defined, used when the sftp session is aborted
	sftp_protocol_error  = 3002
};

/// transport level failure, code is e.g. "ECONNREFUSED" or "EPROTOTYPE"
struct channel_error {
	std::string code;
	std::string message;
};

class channel_listener {
public:
	/// one whole sftp packet
	virtual void on_message(const_span packet) = 0;
	/// out-of-band text frame
	virtual void on_text(std::string_view text) = 0;
	/// the channel was closed, no error for clean close
	virtual void on_close(std::optional<channel_error> error) = 0;

protected:
	~channel_listener() = default;
};

/** \brief Bidirectional message channel carrying sftp packets
 *
 *  The channel must not call the listener from inside send() or close().
 */
class sftp_channel {
public:
	virtual ~sftp_channel() = default;

	virtual void send(const_span packet) = 0;
	virtual void send_text(std::string_view text) = 0;
	virtual void close(close_reason reason = close_reason::normal, std::string_view description = {}) = 0;

	/// set nullptr to stop receiving events
	virtual void set_listener(channel_listener*) = 0;
};

}

#endif
