#ifndef SP_SFTP_COMMAND_INFO_HEADER
#define SP_SFTP_COMMAND_INFO_HEADER

#include "sftp/common/types.hpp"

#include <variant>

namespace securepath::sftp {

enum class rename_flags : std::uint32_t {
	none      = 0,
	overwrite = 1
};

/*
	Context of a request used when reporting errors, each command carries just the arguments it has
*/
struct init_command {
	bool operator==(init_command const&) const = default;
};

/// open, opendir, lstat, stat, setstat, unlink, mkdir, rmdir, realpath, readlink
struct path_command {
	std::string_view command;
	std::string path;

	bool operator==(path_command const&) const = default;
};

/// close, read, write, fstat, fsetstat, readdir
struct handle_command {
	std::string_view command;
	byte_vector handle;

	bool operator==(handle_command const&) const = default;
};

struct rename_command {
	std::string old_path;
	std::string new_path;
	rename_flags flags{};

	bool operator==(rename_command const&) const = default;
};

struct link_command {
	std::string old_path;
	std::string new_path;

	bool operator==(link_command const&) const = default;
};

struct symlink_command {
	std::string target_path;
	std::string link_path;

	bool operator==(symlink_command const&) const = default;
};

using command_info = std::variant<
	init_command,
	path_command,
	handle_command,
	rename_command,
	link_command,
	symlink_command>;

std::string_view command_name(command_info const&);

}

#endif
