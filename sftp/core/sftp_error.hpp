#ifndef SP_SFTP_SFTP_ERROR_HEADER
#define SP_SFTP_SFTP_ERROR_HEADER

#include "command_info.hpp"
#include "packet_types.hpp"

#include <optional>

namespace securepath::sftp {

/// POSIX flavoured error taxonomy for sftp status codes and local failures
enum class error_kind {
	none,
	eof,
	no_such_file,
	permission_denied,
	failure,
	not_connected,
	shutdown,
	not_implemented,
	io,
	protocol,
	unknown
};

error_kind to_error_kind(status_code);

/// "ENOENT", "EACCES", ...
std::string_view error_code_name(error_kind);

int error_number(error_kind);

/** \brief Error passed to request callbacks
 *
 *  Default constructed error means success.
 *  Message is "<code>, <command> <argument>", where argument is the quoted path or the handle in hex.
 */
class sftp_error {
public:
	sftp_error() = default;

	/// kind derived from the status code
	sftp_error(status_code code, std::string_view description, command_info info);

	/// explicit kind for local failures (io, protocol) that share status code with other kinds
	sftp_error(error_kind kind, status_code code, std::string_view description, command_info info);

	error_kind kind() const { return kind_; }
	std::string_view code() const { return error_code_name(kind_); }
	int error_number() const { return sftp::error_number(kind_); }

	/// status code from the server (or the local pseudo status)
	status_code native_code() const { return native_code_; }
	/// status message from the server
	std::string_view description() const { return description_; }
	std::string const& message() const { return message_; }

	std::string_view command() const { return command_name(info_); }
	command_info const& context() const { return info_; }

	std::optional<std::string> path() const;
	std::optional<byte_vector> handle() const;
	std::optional<std::string> old_path() const;
	std::optional<std::string> new_path() const;
	std::optional<std::string> target_path() const;
	std::optional<std::string> link_path() const;
	std::optional<sftp::rename_flags> rename_flags() const;

	/// this is an error if the kind is not none
	explicit operator bool() const {
		return kind_ != error_kind::none;
	}

private:
	void make_message();

private:
	error_kind kind_{};
	status_code native_code_{};
	std::string description_;
	std::string message_;
	command_info info_;
};

}

#endif
