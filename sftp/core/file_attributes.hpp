#ifndef SP_SFTP_FILE_ATTRIBUTES_HEADER
#define SP_SFTP_FILE_ATTRIBUTES_HEADER

#include "sftp_packet.hpp"

#include <optional>

namespace securepath::sftp {

/// generic stat-like file metadata, unset fields are unknown or not to be changed
struct file_stats {
	/// file size in bytes
	std::optional<std::uint64_t> size;
	/// Unix-like user identifier
	std::optional<std::uint32_t> uid;
	/// Unix-like group identifier
	std::optional<std::uint32_t> gid;
	/// bit mask of file type and permissions as defined by posix
	std::optional<std::uint32_t> mode;
	/// access time in seconds from Jan 1, 1970 UTC
	std::optional<std::uint32_t> atime;
	/// modification time in seconds from Jan 1, 1970 UTC
	std::optional<std::uint32_t> mtime;
	/// number of hard links, never sent over the wire
	std::optional<std::uint32_t> nlink;

	bool is_directory() const;
	bool is_file() const;
	bool is_symlink() const;

	bool operator==(file_stats const&) const = default;
};

/*
	uint32   flags
	uint64   size           present only if flag SSH_FILEXFER_ATTR_SIZE
	uint32   uid            present only if flag SSH_FILEXFER_ATTR_UIDGID
	uint32   gid            present only if flag SSH_FILEXFER_ATTR_UIDGID
	uint32   permissions    present only if flag SSH_FILEXFER_ATTR_PERMISSIONS
	uint32   atime          present only if flag SSH_FILEXFER_ATTR_ACMODTIME
	uint32   mtime          present only if flag SSH_FILEXFER_ATTR_ACMODTIME
	uint32   extended_count present only if flag SSH_FILEXFER_ATTR_EXTENDED
	string   extended_type
	string   extended_data
	...      more extended data (extended_type - extended_data pairs),
			 so that number of pairs equals extended_count
*/
struct file_attributes {
	std::uint32_t flags{};

	std::optional<std::uint64_t> size;
	std::optional<std::uint32_t> uid;
	std::optional<std::uint32_t> gid;
	std::optional<std::uint32_t> permissions;
	std::optional<std::uint32_t> atime;
	std::optional<std::uint32_t> mtime;
	std::optional<std::uint32_t> nlink;

	/// builds attributes from the set fields, no stats means no attribute changes (flags = 0)
	static file_attributes from_stats(std::optional<file_stats> const&);

	/// deserialise attributes, extended pairs are skipped
	static file_attributes read(sftp_packet_reader&);

	/// serialise the fields marked in flags, extended pairs are never written
	void write(sftp_packet_writer&) const;

	/// the fields without the wire flags
	file_stats to_stats() const;

	void clear_flags() { flags = 0; }
};

}

#endif
