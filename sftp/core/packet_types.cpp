#include "packet_types.hpp"

namespace securepath::sftp {

std::string_view to_string(sftp_packet_type t) {
	switch(t) {
		case fxp_init:           return "INIT";
		case fxp_version:        return "VERSION";
		case fxp_open:           return "OPEN";
		case fxp_close:          return "CLOSE";
		case fxp_read:           return "READ";
		case fxp_write:          return "WRITE";
		case fxp_lstat:          return "LSTAT";
		case fxp_fstat:          return "FSTAT";
		case fxp_setstat:        return "SETSTAT";
		case fxp_fsetstat:       return "FSETSTAT";
		case fxp_opendir:        return "OPENDIR";
		case fxp_readdir:        return "READDIR";
		case fxp_remove:         return "REMOVE";
		case fxp_mkdir:          return "MKDIR";
		case fxp_rmdir:          return "RMDIR";
		case fxp_realpath:       return "REALPATH";
		case fxp_stat:           return "STAT";
		case fxp_rename:         return "RENAME";
		case fxp_readlink:       return "READLINK";
		case fxp_symlink:        return "SYMLINK";
		case fxp_status:         return "STATUS";
		case fxp_handle:         return "HANDLE";
		case fxp_data:           return "DATA";
		case fxp_name:           return "NAME";
		case fxp_attrs:          return "ATTRS";
		case fxp_extended:       return "EXTENDED";
		case fxp_extended_reply: return "EXTENDED_REPLY";
	};
	return "UNKNOWN";
}

}
