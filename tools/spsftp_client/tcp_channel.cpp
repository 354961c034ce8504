#include "tcp_channel.hpp"
#include "sftp/core/errors.hpp"

#include <coroutine>
#include <utility>
#include <asio/experimental/as_tuple.hpp>

namespace securepath::sftp {

using tcp = asio::ip::tcp;

static std::size_t const read_buffer_size = 64*1024;

static channel_error to_channel_error(asio::error_code const& e) {
	if(e == asio::error::connection_refused) {
		return channel_error{"ECONNREFUSED", e.message()};
	}
	if(e == asio::error::connection_reset) {
		return channel_error{"ECONNRESET", e.message()};
	}
	return channel_error{"EIO", e.message()};
}

tcp_channel::tcp_channel(asio::io_context& io_context, logger& log, std::size_t max_packet_size)
: socket_(io_context)
, timer_(io_context)
, log_(log)
, assembler_(max_packet_size)
{
	timer_.expires_at(std::chrono::steady_clock::time_point::max());
}

asio::awaitable<void> tcp_channel::connect(tcp::endpoint ep, connect_handler handler) {
	log_.log(logger::info, "Connecting to {}", ep);

	auto [e] = co_await socket_.async_connect(ep, asio::experimental::as_tuple(asio::use_awaitable));
	if(!e) {
		start();
		handler(std::nullopt);
	} else {
		log_.log(logger::error, "Connect failed: {}", e.message());
		handler(to_channel_error(e));
	}
}

void tcp_channel::start() {
	log_.log(logger::info, "Connected");

	asio::co_spawn(socket_.get_executor(),
		[self = shared_from_this()]{ return self->reader(); }, asio::detached);

	asio::co_spawn(socket_.get_executor(),
		[self = shared_from_this()]{ return self->writer(); }, asio::detached);
}

void tcp_channel::send(const_span packet) {
	if(socket_.is_open() && !closing_) {
		out_queue_.push_back(to_byte_vector(packet));
		timer_.cancel_one();
	} else {
		log_.log(logger::warning, "Dropping packet, channel is closed");
	}
}

void tcp_channel::send_text(std::string_view text) {
	// a byte stream has no separate text frames
	log_.log(logger::debug, "Ignoring text frame: {}", text);
}

void tcp_channel::close(close_reason reason, std::string_view description) {
	log_.log(logger::info, "Closing channel [reason={}, description={}]", std::uint16_t(reason), description);
	closing_ = true;
	timer_.cancel_one();
}

void tcp_channel::set_listener(channel_listener* l) {
	listener_ = l;
}

asio::awaitable<void> tcp_channel::reader() {
	byte_vector read_data(read_buffer_size);
	while(socket_.is_open()) {
		auto [e, n] = co_await socket_.async_read_some(
			asio::buffer(read_data.data(), read_data.size()), asio::experimental::as_tuple(asio::use_awaitable));

		if(e) {
			if(e == asio::error::eof) {
				stop(std::nullopt);
			} else if(e != asio::error::operation_aborted) {
				stop(to_channel_error(e));
			}
			co_return;
		}

		try {
			assembler_.add(const_span(read_data).first(n),
				[&](const_span packet)
				{
					if(listener_) {
						listener_->on_message(packet);
					}
				});
		} catch(packet_error const& ex) {
			log_.log(logger::error, "Invalid data from server: {}", ex.what());
			stop(channel_error{"EPROTO", ex.what()});
			co_return;
		}
	}
}

asio::awaitable<void> tcp_channel::writer() {
	while(socket_.is_open()) {
		if(!out_queue_.empty()) {
			byte_vector buf = std::move(out_queue_.front());
			out_queue_.pop_front();
			log_.log(logger::debug_trace, "writing out: {}", const_span(buf));

			auto [e, n] = co_await asio::async_write(socket_, asio::buffer(buf.data(), buf.size()),
				asio::experimental::as_tuple(asio::use_awaitable));
			if(e) {
				stop(to_channel_error(e));
			}
		} else if(closing_) {
			stop(std::nullopt);
		} else {
			asio::error_code ec;
			co_await timer_.async_wait(asio::redirect_error(asio::use_awaitable, ec));
		}
	}
}

void tcp_channel::stop(std::optional<channel_error> error) {
	if(!socket_.is_open()) {
		return;
	}

	log_.log(logger::info, "Closing connection");
	asio::error_code ec;
	socket_.shutdown(tcp::socket::shutdown_both, ec);
	socket_.close(ec);
	timer_.cancel();
	out_queue_.clear();

	// the listener is not notified when the close was requested
	if(listener_ && !closing_) {
		std::exchange(listener_, nullptr)->on_close(std::move(error));
	}
	closing_ = true;
}

}
