#ifndef SP_SFTP_PACKET_HEADER
#define SP_SFTP_PACKET_HEADER

#include "errors.hpp"
#include "packet_types.hpp"

#include <optional>

namespace securepath::sftp {

/*
	All sftp packets have the envelope
		uint32     length (byte count following this field)
		byte       type
		uint32     id (not present for SSH_FXP_INIT and SSH_FXP_VERSION)
		string     extended-request (only for SSH_FXP_EXTENDED)
*/
std::size_t const packet_length_size = 4;
std::size_t const packet_header_size = packet_length_size + 1;

struct raw_packet_tag {} constexpr raw_packet;

/** \brief Reader for sftp binary format
 *
 *  All reads check the remaining size first and throw packet_error (unexpected_end) without
 *  moving the position if there is not enough data.
 */
class sftp_packet_reader {
public:
	/// parses the envelope, throws packet_error if the length field does not match the data
	explicit sftp_packet_reader(const_span in);

	/// raw reader without envelope (used for nested structured data)
	sftp_packet_reader(raw_packet_tag, const_span in);

	/// packet type, zero for raw readers
	sftp_packet_type type() const { return type_; }

	/// extended request name for SSH_FXP_EXTENDED packets
	std::string_view extended_type() const { return extended_type_; }

	/// request id, not set for INIT, VERSION and raw readers
	std::optional<std::uint32_t> id() const { return id_; }

	std::size_t position() const { return pos_; }
	std::size_t length() const { return in_.size(); }
	std::size_t size_left() const { return in_.size() - pos_; }

	const_span total_span() const { return in_; }
	const_span rest_of_span() const { return in_.subspan(pos_); }

	std::uint8_t read_byte();
	std::uint16_t read_uint16();
	std::int16_t read_int16();
	std::uint32_t read_uint32();
	std::int32_t read_int32();
	/// 64-bit value as high and low 32-bit words
	std::uint64_t read_uint64();

	/// UTF-8 string, copied
	std::string read_string();
	/// string pointing to the underlying buffer
	std::string_view read_string_view();
	void skip_string();

	/// length prefixed opaque data pointing to the underlying buffer
	const_span read_data_view();
	/// length prefixed opaque data, copied
	byte_vector read_data();

	/// reads opaque data and returns raw reader over it for field by field decoding
	sftp_packet_reader read_structured();

	void skip(std::size_t count);

private:
	void check(std::size_t count) const;

private:
	const_span in_;
	std::size_t pos_{};
	sftp_packet_type type_{};
	std::optional<std::uint32_t> id_;
	std::string_view extended_type_;
};

/** \brief Writer for sftp binary format with fixed capacity
 *
 *  usage:
 *		sftp_packet_writer w(1024);
 *		w.start(fxp_close, id);
 *		w.write_data(handle);
 *		send(w.finish());
 */
class sftp_packet_writer {
public:
	explicit sftp_packet_writer(std::size_t capacity);

	/// writes length placeholder and envelope, id is not written for INIT and VERSION
	void start(sftp_packet_type type, std::uint32_t id = 0);

	/// starts SSH_FXP_EXTENDED packet with given request name
	void start_extended(std::string_view name, std::uint32_t id);

	/// back-patches the length and returns the used part of the buffer
	const_span finish();

	sftp_packet_type type() const { return type_; }
	std::string_view extended_type() const { return extended_type_; }
	std::uint32_t id() const { return id_; }

	std::size_t position() const { return pos_; }
	std::size_t capacity() const { return out_.size(); }
	std::size_t size_left() const { return out_.size() - pos_; }

	void write_byte(std::uint8_t);
	void write_uint16(std::uint16_t);
	void write_int16(std::int16_t v) { write_uint16(std::uint16_t(v)); }
	void write_uint32(std::uint32_t);
	void write_int32(std::int32_t v) { write_uint32(std::uint32_t(v)); }
	void write_uint64(std::uint64_t);
	void write_string(std::string_view);
	void write_data(const_span);

private:
	void check(std::size_t count) const;

private:
	byte_vector out_;
	std::size_t pos_{};
	sftp_packet_type type_{};
	std::uint32_t id_{};
	std::string extended_type_;
};

/// returns the total size of the packet (including the length field) in front of the span if there is enough data to know it
std::optional<std::size_t> peek_packet_size(const_span);

}

#endif
