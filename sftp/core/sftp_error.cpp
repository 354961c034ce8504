#include "sftp_error.hpp"

#include "sftp/common/util.hpp"

namespace securepath::sftp {

std::string_view command_name(command_info const& info) {
	struct visitor {
		std::string_view operator()(init_command const&) const { return "init"; }
		std::string_view operator()(path_command const& c) const { return c.command; }
		std::string_view operator()(handle_command const& c) const { return c.command; }
		std::string_view operator()(rename_command const&) const { return "rename"; }
		std::string_view operator()(link_command const&) const { return "link"; }
		std::string_view operator()(symlink_command const&) const { return "symlink"; }
	};
	return std::visit(visitor{}, info);
}

error_kind to_error_kind(status_code code) {
	switch(code) {
		case fx_ok:                return error_kind::none;
		case fx_eof:               return error_kind::eof;
		case fx_no_such_file:      return error_kind::no_such_file;
		case fx_permission_denied: return error_kind::permission_denied;
		case fx_failure:           [[fallthrough]];
		case fx_bad_message:       return error_kind::failure;
		case fx_no_connection:     return error_kind::not_connected;
		case fx_connection_lost:   return error_kind::shutdown;
		case fx_op_unsupported:    return error_kind::not_implemented;
	};
	return error_kind::unknown;
}

std::string_view error_code_name(error_kind k) {
	switch(k) {
		case error_kind::none:              return "";
		case error_kind::eof:               return "EOF";
		case error_kind::no_such_file:      return "ENOENT";
		case error_kind::permission_denied: return "EACCES";
		case error_kind::failure:           return "EFAILURE";
		case error_kind::not_connected:     return "ENOTCONN";
		case error_kind::shutdown:          return "ESHUTDOWN";
		case error_kind::not_implemented:   return "ENOSYS";
		case error_kind::io:                return "EIO";
		case error_kind::protocol:          return "EPROTO";
		case error_kind::unknown:           return "UNKNOWN";
	};
	return "UNKNOWN";
}

int error_number(error_kind k) {
	switch(k) {
		case error_kind::none:              return 0;
		case error_kind::eof:               return 1;
		case error_kind::no_such_file:      return 34;
		case error_kind::permission_denied: return 3;
		case error_kind::failure:           return -2;
		case error_kind::not_connected:     return 31;
		case error_kind::shutdown:          return 46;
		case error_kind::not_implemented:   return 35;
		case error_kind::io:                return 55;
		case error_kind::protocol:          return -3;
		case error_kind::unknown:           return -1;
	};
	return -1;
}

sftp_error::sftp_error(status_code code, std::string_view description, command_info info)
: sftp_error(to_error_kind(code), code, description, std::move(info))
{
}

sftp_error::sftp_error(error_kind kind, status_code code, std::string_view description, command_info info)
: kind_(kind)
, native_code_(code)
, description_(description)
, info_(std::move(info))
{
	make_message();
}

void sftp_error::make_message() {
	message_ = std::string(code()) + ", " + std::string(command());

	if(auto p = path()) {
		message_ += " '" + *p + "'";
	} else if(auto h = handle()) {
		message_ += " 0x" + to_hex(*h);
	}
}

std::optional<std::string> sftp_error::path() const {
	if(auto c = std::get_if<path_command>(&info_)) {
		return c->path;
	}
	return std::nullopt;
}

std::optional<byte_vector> sftp_error::handle() const {
	if(auto c = std::get_if<handle_command>(&info_)) {
		return c->handle;
	}
	return std::nullopt;
}

std::optional<std::string> sftp_error::old_path() const {
	if(auto c = std::get_if<rename_command>(&info_)) {
		return c->old_path;
	}
	if(auto c = std::get_if<link_command>(&info_)) {
		return c->old_path;
	}
	return std::nullopt;
}

std::optional<std::string> sftp_error::new_path() const {
	if(auto c = std::get_if<rename_command>(&info_)) {
		return c->new_path;
	}
	if(auto c = std::get_if<link_command>(&info_)) {
		return c->new_path;
	}
	return std::nullopt;
}

std::optional<std::string> sftp_error::target_path() const {
	if(auto c = std::get_if<symlink_command>(&info_)) {
		return c->target_path;
	}
	return std::nullopt;
}

std::optional<std::string> sftp_error::link_path() const {
	if(auto c = std::get_if<symlink_command>(&info_)) {
		return c->link_path;
	}
	return std::nullopt;
}

std::optional<rename_flags> sftp_error::rename_flags() const {
	if(auto c = std::get_if<rename_command>(&info_)) {
		return c->flags;
	}
	return std::nullopt;
}

}
