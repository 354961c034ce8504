#include "file_attributes.hpp"

namespace securepath::sftp {

static bool has_file_type(std::optional<std::uint32_t> const& mode, file_type t) {
	return mode && (*mode & file_type_mask) == t;
}

bool file_stats::is_directory() const {
	return has_file_type(mode, directory_file);
}

bool file_stats::is_file() const {
	return has_file_type(mode, regular_file);
}

bool file_stats::is_symlink() const {
	return has_file_type(mode, symlink_file);
}

file_attributes file_attributes::from_stats(std::optional<file_stats> const& stats) {
	file_attributes res;
	if(!stats) {
		return res;
	}

	if(stats->size) {
		res.flags |= size_attribute;
		res.size = stats->size;
	}
	if(stats->uid || stats->gid) {
		res.flags |= uidgid_attribute;
		res.uid = stats->uid.value_or(0);
		res.gid = stats->gid.value_or(0);
	}
	if(stats->mode) {
		res.flags |= permissions_attribute;
		res.permissions = stats->mode;
	}
	if(stats->atime || stats->mtime) {
		if(!stats->atime || !stats->mtime) {
			throw usage_error("Both atime and mtime are required");
		}
		res.flags |= acmodtime_attribute;
		res.atime = stats->atime;
		res.mtime = stats->mtime;
	}
	res.nlink = stats->nlink;

	return res;
}

file_attributes file_attributes::read(sftp_packet_reader& r) {
	file_attributes res;
	res.flags = r.read_uint32();

	if(res.flags & size_attribute) {
		res.size = r.read_uint64();
	}
	if(res.flags & uidgid_attribute) {
		res.uid = r.read_uint32();
		res.gid = r.read_uint32();
	}
	if(res.flags & permissions_attribute) {
		res.permissions = r.read_uint32();
	}
	if(res.flags & acmodtime_attribute) {
		res.atime = r.read_uint32();
		res.mtime = r.read_uint32();
	}
	if(res.flags & extended_attribute) {
		std::uint32_t count = r.read_uint32();
		for(std::uint32_t i = 0; i != count; ++i) {
			r.skip_string();
			r.skip_string();
		}
	}
	return res;
}

void file_attributes::write(sftp_packet_writer& w) const {
	w.write_uint32(flags);

	if(flags & size_attribute) {
		w.write_uint64(size.value_or(0));
	}
	if(flags & uidgid_attribute) {
		w.write_uint32(uid.value_or(0));
		w.write_uint32(gid.value_or(0));
	}
	if(flags & permissions_attribute) {
		w.write_uint32(permissions.value_or(0));
	}
	if(flags & acmodtime_attribute) {
		w.write_uint32(atime.value_or(0));
		w.write_uint32(mtime.value_or(0));
	}
	if(flags & extended_attribute) {
		w.write_uint32(0);
	}
}

file_stats file_attributes::to_stats() const {
	return file_stats{
		.size = size,
		.uid = uid,
		.gid = gid,
		.mode = permissions,
		.atime = atime,
		.mtime = mtime,
		.nlink = nlink
		};
}

}
