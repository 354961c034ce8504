#ifndef SP_SFTP_TEST_UTIL_HEADER
#define SP_SFTP_TEST_UTIL_HEADER

#include "sftp/client/channel.hpp"
#include "sftp/client/scheduler.hpp"
#include "sftp/core/file_attributes.hpp"
#include "sftp/core/sftp_packet.hpp"

#include <deque>
#include <utility>

namespace securepath::sftp::test {

/// records everything the client sends
struct test_channel : sftp_channel {
	void send(const_span packet) override {
		sent.push_back(to_byte_vector(packet));
	}

	void send_text(std::string_view text) override {
		texts.emplace_back(text);
	}

	void close(close_reason reason, std::string_view description) override {
		closed = reason;
		close_description = description;
	}

	void set_listener(channel_listener* l) override {
		listener = l;
	}

	sftp_packet_reader request(std::size_t index) const {
		return sftp_packet_reader(sent.at(index));
	}

	sftp_packet_reader last_request() const {
		return sftp_packet_reader(sent.at(sent.size()-1));
	}

	std::uint32_t last_id() const {
		return last_request().id().value();
	}

	std::vector<byte_vector> sent;
	std::vector<std::string> texts;
	std::optional<close_reason> closed;
	std::string close_description;
	channel_listener* listener{};
};

/// runs posted functions only when asked
struct manual_scheduler : scheduler {
	void post(std::function<void()> f) override {
		queue.push_back(std::move(f));
	}

	std::size_t run_all() {
		std::size_t count{};
		while(!queue.empty()) {
			auto f = std::move(queue.front());
			queue.pop_front();
			f();
			++count;
		}
		return count;
	}

	std::deque<std::function<void()>> queue;
};

template<typename Func>
byte_vector make_packet(sftp_packet_type type, std::uint32_t id, Func&& f) {
	sftp_packet_writer w(256*1024);
	w.start(type, id);
	f(w);
	return to_byte_vector(w.finish());
}

inline byte_vector status_packet(std::uint32_t id, status_code code, std::string_view message = {}) {
	return make_packet(fxp_status, id, [&](sftp_packet_writer& w) {
		w.write_uint32(code);
		w.write_string(message);
		w.write_string("en");
	});
}

inline byte_vector handle_packet(std::uint32_t id, std::string_view handle) {
	return make_packet(fxp_handle, id, [&](sftp_packet_writer& w) {
		w.write_string(handle);
	});
}

inline byte_vector data_packet(std::uint32_t id, std::string_view data) {
	return make_packet(fxp_data, id, [&](sftp_packet_writer& w) {
		w.write_string(data);
	});
}

inline byte_vector attrs_packet(std::uint32_t id, file_stats const& stats) {
	return make_packet(fxp_attrs, id, [&](sftp_packet_writer& w) {
		file_attributes::from_stats(stats).write(w);
	});
}

/// name response with empty attributes for each entry
inline byte_vector name_packet(std::uint32_t id, std::vector<std::pair<std::string, std::string>> const& names) {
	return make_packet(fxp_name, id, [&](sftp_packet_writer& w) {
		w.write_uint32(std::uint32_t(names.size()));
		for(auto&& [filename, longname] : names) {
			w.write_string(filename);
			w.write_string(longname);
			w.write_uint32(0);
		}
	});
}

inline byte_vector version_packet(std::uint32_t version, std::vector<std::pair<std::string, std::string>> const& extensions = {}) {
	return make_packet(fxp_version, 0, [&](sftp_packet_writer& w) {
		w.write_uint32(version);
		for(auto&& [name, value] : extensions) {
			w.write_string(name);
			w.write_string(value);
		}
	});
}

}

#endif
