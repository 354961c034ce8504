#ifndef SP_SFTP_PACKET_TYPES_HEADER
#define SP_SFTP_PACKET_TYPES_HEADER

#include "sftp/common/types.hpp"

namespace securepath::sftp {

// https://datatracker.ietf.org/doc/html/draft-ietf-secsh-filexfer-02
std::uint32_t const sftp_version{3};

// servers must not send longer handles
std::size_t const max_handle_length{256};

enum sftp_packet_type : std::uint8_t {
	fxp_init           = 1,
	fxp_version        = 2,
	fxp_open           = 3,
	fxp_close          = 4,
	fxp_read           = 5,
	fxp_write          = 6,
	fxp_lstat          = 7,
	fxp_fstat          = 8,
	fxp_setstat        = 9,
	fxp_fsetstat       = 10,
	fxp_opendir        = 11,
	fxp_readdir        = 12,
	fxp_remove         = 13,
	fxp_mkdir          = 14,
	fxp_rmdir          = 15,
	fxp_realpath       = 16,
	fxp_stat           = 17,
	fxp_rename         = 18,
	fxp_readlink       = 19,
	fxp_symlink        = 20,
	fxp_status         = 101,
	fxp_handle         = 102,
	fxp_data           = 103,
	fxp_name           = 104,
	fxp_attrs          = 105,
	fxp_extended       = 200,
	fxp_extended_reply = 201
};

/// INIT and VERSION are the only packets without request id
inline bool has_request_id(sftp_packet_type t) {
	return t != fxp_init && t != fxp_version;
}

std::string_view to_string(sftp_packet_type);

enum attribute_flags : std::uint32_t {
	size_attribute        = 0x00000001,
	uidgid_attribute      = 0x00000002,
	permissions_attribute = 0x00000004,
	acmodtime_attribute   = 0x00000008,
	basic_attributes      = 0x0000000F,
	extended_attribute    = 0x80000000
};

enum open_mode : std::uint32_t {
	fxf_read   = 0x00000001,
	fxf_write  = 0x00000002,
	fxf_append = 0x00000004,
	fxf_creat  = 0x00000008,
	fxf_trunc  = 0x00000010,
	fxf_excl   = 0x00000020,

	fxf_all    = 0x0000003F
};
/*
   SSH_FXF_APPEND
      Force all writes to append data at the end of the file.

   SSH_FXF_CREAT
      If this flag is specified, then a new file will be created if one
      does not already exist (if O_TRUNC is specified, the new file will
      be truncated to zero length if it previously exists).

   SSH_FXF_TRUNC
      Forces an existing file with the same name to be truncated to zero
      length when creating a file by specifying SSH_FXF_CREAT.
      SSH_FXF_CREAT MUST also be specified if this flag is used.

   SSH_FXF_EXCL
      Causes the request to fail if the named file already exists.
      SSH_FXF_CREAT MUST also be specified if this flag is used.
*/

enum status_code : std::uint32_t {
	fx_ok                = 0,
	fx_eof               = 1,
	fx_no_such_file      = 2,
	fx_permission_denied = 3,
	fx_failure           = 4,
	fx_bad_message       = 5,
	fx_no_connection     = 6,
	fx_connection_lost   = 7,
	fx_op_unsupported    = 8
};
/*
   SSH_FX_NO_CONNECTION
      is a pseudo-error which indicates that the client has no
      connection to the server (it can only be generated locally by the
      client, and MUST NOT be returned by servers).

   SSH_FX_CONNECTION_LOST
      is a pseudo-error which indicates that the connection to the
      server has been lost (it can only be generated locally by the
      client, and MUST NOT be returned by servers).

   SSH_FX_OP_UNSUPPORTED
      indicates that an attempt was made to perform an operation which
      is not supported for the server (it may be generated locally by
      the client if e.g.  the version number exchange indicates that a
      required feature is not supported by the server, or it may be
      returned by the server if the server does not implement an
      operation).
*/

/// POSIX file type bits in the permissions field
enum file_type : std::uint32_t {
	fifo_file             = 0x1000,
	character_device_file = 0x2000,
	directory_file        = 0x4000,
	block_device_file     = 0x6000,
	regular_file          = 0x8000,
	symlink_file          = 0xA000,
	socket_file           = 0xC000,

	file_type_mask        = 0xF000
};

}

#endif
