#ifndef SP_SFTP_TOOLS_SPSFTP_CLIENT_TCP_CHANNEL_HEADER
#define SP_SFTP_TOOLS_SPSFTP_CLIENT_TCP_CHANNEL_HEADER

#include "sftp/client/channel.hpp"
#include "sftp/common/logger.hpp"
#include "sftp/core/packet_assembler.hpp"

#include <asio.hpp>

#include <deque>
#include <functional>
#include <memory>

namespace securepath::sftp {

/** \brief sftp_channel over plain tcp stream (e.g. sftp-server behind socat)
 *
 *  The stream is split to packets with packet_assembler. All functions must be called from the io_context thread.
 */
class tcp_channel : public sftp_channel, public std::enable_shared_from_this<tcp_channel> {
public:
	using connect_handler = std::function<void(std::optional<channel_error>)>;

	tcp_channel(asio::io_context& io_context, logger& log, std::size_t max_packet_size);

	asio::awaitable<void> connect(asio::ip::tcp::endpoint ep, connect_handler);

	void send(const_span packet) override;
	void send_text(std::string_view text) override;
	void close(close_reason reason, std::string_view description) override;
	void set_listener(channel_listener*) override;

private:
	void start();
	asio::awaitable<void> reader();
	asio::awaitable<void> writer();
	void stop(std::optional<channel_error>);

private:
	asio::ip::tcp::socket socket_;
	asio::steady_timer timer_;
	logger& log_;

	packet_assembler assembler_;
	std::deque<byte_vector> out_queue_;
	channel_listener* listener_{};
	// close after the queued data has been written
	bool closing_{};
};

}

#endif
