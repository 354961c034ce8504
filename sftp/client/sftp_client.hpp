#ifndef SP_SFTP_CLIENT_HEADER
#define SP_SFTP_CLIENT_HEADER

#include "channel.hpp"
#include "scheduler.hpp"
#include "sftp_config.hpp"
#include "sftp/common/logger.hpp"
#include "sftp/core/extensions.hpp"
#include "sftp/core/file_attributes.hpp"
#include "sftp/core/sftp_error.hpp"
#include "sftp/core/sftp_packet.hpp"

#include <functional>
#include <map>
#include <optional>

namespace securepath::sftp {

enum class session_state {
	unbound,
	initializing,
	ready,
	closed
};

/// client side capabilities derived from the server extensions
enum class sftp_feature {
	hardlink,
	posix_rename
};

struct directory_entry {
	std::string filename;
	std::string longname;
	file_stats stats;
};

/** \brief SFTP version 3 client protocol engine
 *
 *  Driven by the caller (operations) and the channel (incoming packets), no internal threading.
 *  Every operation either sends a request or, if it cannot be sent (not connected, unsupported),
 *  posts the failure to the scheduler. Invalid arguments throw usage_error synchronously.
 *  Responses are matched to requests by id and may complete in any order.
 */
class sftp_client : public channel_listener {
public:
	/// opaque handle of open file or directory, only valid with the client that created it
	class file_handle {
	public:
		file_handle() = default;

		const_span raw() const { return handle_; }

		/// "0x" followed by the handle bytes in hex
		std::string to_string() const;

		explicit operator bool() const { return owner_ != nullptr; }

	private:
		friend class sftp_client;
		file_handle(byte_vector h, sftp_client const* owner)
		: handle_(std::move(h))
		, owner_(owner)
		{}

		byte_vector handle_;
		sftp_client const* owner_{};
	};

	using status_callback = std::function<void(sftp_error)>;
	using handle_callback = std::function<void(sftp_error, file_handle)>;
	using data_callback = std::function<void(sftp_error, byte_vector)>;
	using stats_callback = std::function<void(sftp_error, file_stats)>;
	using entries_callback = std::function<void(sftp_error, std::vector<directory_entry>)>;
	using path_callback = std::function<void(sftp_error, std::string)>;

public:
	sftp_client(std::uint32_t session_id, logger&, scheduler&, sftp_config const& = {});
	~sftp_client();

	sftp_client(sftp_client const&) = delete;
	sftp_client& operator=(sftp_client const&) = delete;

	/// attach to channel and send init, the callback is called when version is received or the handshake failed
	void bind(sftp_channel&, status_callback);

	/// close the channel and fail all pending requests with connection lost
	void end();

	/// handle single incoming packet, throws packet_error or protocol_violation after aborting the session
	/// (exceptions from the completed callback propagate without aborting)
	void process(const_span packet);

	void open(std::string_view path, std::string_view mode, std::optional<file_stats> const& attrs, handle_callback);
	void open(std::string_view path, std::uint32_t flags, std::optional<file_stats> const& attrs, handle_callback);
	void close(file_handle const&, status_callback);

	/// reads at most length bytes (shortened to max read block), empty data means end of file
	void read(file_handle const&, std::uint64_t position, std::uint32_t length, data_callback);
	/// writes buffer[offset, offset+length) at position
	void write(file_handle const&, const_span buffer, std::size_t offset, std::size_t length, std::uint64_t position, status_callback);

	void lstat(std::string_view path, stats_callback);
	void stat(std::string_view path, stats_callback);
	void fstat(file_handle const&, stats_callback);
	void setstat(std::string_view path, std::optional<file_stats> const& attrs, status_callback);
	void fsetstat(file_handle const&, std::optional<file_stats> const& attrs, status_callback);

	void opendir(std::string_view path, handle_callback);
	/// empty list when there are no more entries
	void readdir(file_handle const&, entries_callback);

	void unlink(std::string_view path, status_callback);
	void mkdir(std::string_view path, std::optional<file_stats> const& attrs, status_callback);
	void rmdir(std::string_view path, status_callback);

	void realpath(std::string_view path, path_callback);
	void readlink(std::string_view path, path_callback);

	void rename(std::string_view old_path, std::string_view new_path, rename_flags flags, status_callback);
	void symlink(std::string_view target_path, std::string_view link_path, status_callback);
	/// hard link, requires hardlink@openssh.com
	void link(std::string_view old_path, std::string_view new_path, status_callback);

public:
	std::uint32_t session_id() const { return session_id_; }
	session_state state() const { return state_; }
	bool is_ready() const { return state_ == session_state::ready; }

	std::uint64_t bytes_sent() const { return bytes_sent_; }
	std::uint64_t bytes_received() const { return bytes_received_; }

	extension_map const& extensions() const { return extensions_; }
	bool has_feature(sftp_feature f) const { return features_.contains(f); }

	sftp_config const& config() const { return config_; }

protected: // channel_listener
	void on_message(const_span packet) override;
	void on_text(std::string_view text) override;
	void on_close(std::optional<channel_error> error) override;

private:
	/// runs the user callback after the response was decoded and the request retired
	using completion = std::function<void()>;
	using response_parser = std::function<completion(sftp_packet_reader&, command_info const&)>;
	using failure_handler = std::function<void(sftp_error)>;

	struct pending_request {
		response_parser parser;
		failure_handler fail;
		command_info info;
	};

	sftp_packet_writer create_request(sftp_packet_type);
	sftp_packet_writer create_extended_request(std::string_view name);

	void execute(sftp_packet_writer&, pending_request);
	void post_failure(failure_handler, sftp_error);

	/// sends request with string arguments, features are checked before anything is sent
	void command(sftp_packet_type, std::initializer_list<std::string_view> args, pending_request);
	void command(sftp_feature, std::initializer_list<std::string_view> args, pending_request);
	void write_args(sftp_packet_writer&, std::initializer_list<std::string_view> args);

	void send_read(const_span handle, std::uint64_t position, std::uint32_t length, std::uint32_t retries, data_callback, command_info);

	pending_request take_request(sftp_packet_reader const&);
	void detach(std::optional<close_reason> reason, std::string_view description);
	void fail_requests(status_code, std::string_view message);
	void abort_session(std::optional<pending_request>&, std::string_view reason);

	completion handle_version(sftp_packet_reader&, command_info const&, status_callback const&);
	void fail_handshake(std::string_view reason, command_info const&, status_callback const&);

	sftp_error read_status(sftp_packet_reader&, command_info const&);
	/// returns the error of a failed status response, throws protocol_violation if the response has wrong type
	sftp_error check_response(sftp_packet_reader&, sftp_packet_type expected, command_info const&);
	/// for read and readdir the EOF status is success with empty result
	std::optional<sftp_error> check_eof_response(sftp_packet_reader&, sftp_packet_type expected, command_info const&);

	completion parse_status(sftp_packet_reader&, command_info const&, status_callback const&);
	completion parse_handle(sftp_packet_reader&, command_info const&, handle_callback const&);
	completion parse_attribs(sftp_packet_reader&, command_info const&, stats_callback const&);
	completion parse_path(sftp_packet_reader&, command_info const&, path_callback const&);
	completion parse_items(sftp_packet_reader&, command_info const&, entries_callback const&);
	completion parse_data(sftp_packet_reader&, command_info const&, byte_vector const& handle, std::uint64_t position,
		std::uint32_t length, std::uint32_t retries, data_callback const&);

	template<typename Callback, typename Parser>
	pending_request make_request(Callback, Parser, command_info);

	void check_callback(bool has_callback) const;
	const_span to_handle(file_handle const&) const;
	std::string check_path(std::string_view path, std::string_view name) const;
	void check_buffer(const_span buffer, std::size_t offset, std::size_t length) const;
	void check_position(std::uint64_t position) const;

	void log_packet(std::string_view what, std::optional<std::uint32_t> id, std::string const& type, const_span data);

private:
	std::uint32_t const session_id_;
	session_logger log_;
	scheduler& scheduler_;
	sftp_config const config_;

	sftp_channel* channel_{};
	session_state state_{session_state::unbound};
	bool init_sent_{};

	// next request id, wraps around
	std::uint32_t next_id_{1};

	// the init request does not have id
	std::optional<pending_request> init_request_;
	std::map<std::uint32_t, pending_request> requests_;

	extension_map extensions_;
	std::map<sftp_feature, std::string_view> features_;

	std::uint64_t bytes_sent_{};
	std::uint64_t bytes_received_{};
};

std::string_view to_string(session_state);

}

#endif
