#include "sftp_packet.hpp"

#include "sftp/common/util.hpp"

#include <cstring>

namespace securepath::sftp {

sftp_packet_reader::sftp_packet_reader(const_span in)
: in_(in)
{
	std::size_t length = std::size_t(read_uint32()) + packet_length_size;
	if(length != in_.size()) {
		throw packet_error(packet_error_code::invalid_packet, "Invalid packet received");
	}

	type_ = sftp_packet_type(read_byte());
	if(has_request_id(type_)) {
		id_ = read_uint32();
		if(type_ == fxp_extended) {
			extended_type_ = read_string_view();
		}
	}
}

sftp_packet_reader::sftp_packet_reader(raw_packet_tag, const_span in)
: in_(in)
{
}

void sftp_packet_reader::check(std::size_t count) const {
	if(count > size_left()) {
		throw packet_error(packet_error_code::unexpected_end, "Unexpected end of packet");
	}
}

void sftp_packet_reader::skip(std::size_t count) {
	check(count);
	pos_ += count;
}

std::uint8_t sftp_packet_reader::read_byte() {
	check(1);
	return std::to_integer<std::uint8_t>(in_[pos_++]);
}

std::uint16_t sftp_packet_reader::read_uint16() {
	check(2);
	auto v = ntou16(in_.data() + pos_);
	pos_ += 2;
	return v;
}

std::int16_t sftp_packet_reader::read_int16() {
	return std::int16_t(read_uint16());
}

std::uint32_t sftp_packet_reader::read_uint32() {
	check(4);
	auto v = ntou32(in_.data() + pos_);
	pos_ += 4;
	return v;
}

std::int32_t sftp_packet_reader::read_int32() {
	return std::int32_t(read_uint32());
}

std::uint64_t sftp_packet_reader::read_uint64() {
	check(8);
	std::uint64_t hi = ntou32(in_.data() + pos_);
	std::uint64_t lo = ntou32(in_.data() + pos_ + 4);
	pos_ += 8;
	return (hi << 32) | lo;
}

std::string_view sftp_packet_reader::read_string_view() {
	return to_string_view(read_data_view());
}

std::string sftp_packet_reader::read_string() {
	return std::string(read_string_view());
}

void sftp_packet_reader::skip_string() {
	read_data_view();
}

const_span sftp_packet_reader::read_data_view() {
	check(4);
	std::size_t size = ntou32(in_.data() + pos_);
	// the length field is consumed only if the data is there too
	check(4 + size);
	const_span res = in_.subspan(pos_ + 4, size);
	pos_ += 4 + size;
	return res;
}

byte_vector sftp_packet_reader::read_data() {
	return to_byte_vector(read_data_view());
}

sftp_packet_reader sftp_packet_reader::read_structured() {
	return sftp_packet_reader(raw_packet, read_data_view());
}


sftp_packet_writer::sftp_packet_writer(std::size_t capacity)
: out_(capacity)
{
}

void sftp_packet_writer::check(std::size_t count) const {
	if(count > size_left()) {
		throw packet_error(packet_error_code::insufficient_space, "Not enough space in the buffer");
	}
}

void sftp_packet_writer::start(sftp_packet_type type, std::uint32_t id) {
	type_ = type;
	id_ = id;
	extended_type_.clear();

	pos_ = 0;
	write_uint32(0); // length placeholder
	write_byte(type);
	if(has_request_id(type)) {
		write_uint32(id);
	}
}

void sftp_packet_writer::start_extended(std::string_view name, std::uint32_t id) {
	start(fxp_extended, id);
	extended_type_ = name;
	write_string(name);
}

const_span sftp_packet_writer::finish() {
	SPSFTP_ASSERT(pos_ >= packet_header_size, "finish called before start");
	u32ton(std::uint32_t(pos_ - packet_length_size), out_.data());
	return const_span(out_).subspan(0, pos_);
}

void sftp_packet_writer::write_byte(std::uint8_t v) {
	check(1);
	out_[pos_++] = std::byte{v};
}

void sftp_packet_writer::write_uint16(std::uint16_t v) {
	check(2);
	u16ton(v, out_.data() + pos_);
	pos_ += 2;
}

void sftp_packet_writer::write_uint32(std::uint32_t v) {
	check(4);
	u32ton(v, out_.data() + pos_);
	pos_ += 4;
}

void sftp_packet_writer::write_uint64(std::uint64_t v) {
	check(8);
	u32ton(std::uint32_t(v >> 32), out_.data() + pos_);
	u32ton(std::uint32_t(v & 0xFFFFFFFF), out_.data() + pos_ + 4);
	pos_ += 8;
}

void sftp_packet_writer::write_string(std::string_view v) {
	write_data(to_span(v));
}

void sftp_packet_writer::write_data(const_span s) {
	check(4 + s.size());
	u32ton(std::uint32_t(s.size()), out_.data() + pos_);
	if(!s.empty()) {
		std::memcpy(out_.data() + pos_ + 4, s.data(), s.size());
	}
	pos_ += 4 + s.size();
}

std::optional<std::size_t> peek_packet_size(const_span s) {
	if(s.size() < packet_length_size) {
		return std::nullopt;
	}
	return std::size_t(ntou32(s.data())) + packet_length_size;
}

}
