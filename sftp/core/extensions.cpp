#include "extensions.hpp"

#include "sftp/common/util.hpp"

#include <algorithm>
#include <array>

namespace securepath::sftp {

static std::array const known_extensions{
	extension_names::posix_rename,
	extension_names::statvfs,
	extension_names::fstatvfs,
	extension_names::hardlink,
	extension_names::fsync,
	extension_names::newline,
	extension_names::newline2,
	extension_names::newline3,
	extension_names::charset,
	extension_names::metadata,
	extension_names::versions,
	extension_names::vendor
};

bool is_known_extension(std::string_view name) {
	return std::find(known_extensions.begin(), known_extensions.end(), name) != known_extensions.end();
}

void write_extension(sftp_packet_writer& w, std::string_view name, std::string_view value) {
	w.write_string(name);
	w.write_string(value);
}

extension_value read_extension(sftp_packet_reader& r, std::string_view name) {
	if(name == extension_names::vendor) {
		auto s = r.read_structured();
		vendor_id v;
		v.vendor_name = s.read_string();
		v.product_name = s.read_string();
		v.product_version = s.read_string();
		v.product_build = s.read_uint64();
		return v;
	}

	if(name == extension_names::newline3) {
		auto s = r.read_structured();
		return s.read_string();
	}

	if(is_known_extension(name)) {
		return r.read_string();
	}

	return r.read_data();
}

bool is_openssh_extension(std::string_view name) {
	return name.ends_with("@openssh.com");
}

bool contains_value(std::string_view values, std::string_view value) {
	std::string list;
	list.reserve(values.size() + 2);
	list.append(",").append(values).append(",");

	std::string token;
	token.reserve(value.size() + 2);
	token.append(",").append(value).append(",");

	return list.find(token) != std::string::npos;
}

std::string to_string(extension_value const& v) {
	struct visitor {
		std::string operator()(std::string const& s) const {
			return s;
		}
		std::string operator()(byte_vector const& d) const {
			return "0x" + to_hex(d);
		}
		std::string operator()(vendor_id const& id) const {
			return id.vendor_name + " " + id.product_name + " " + id.product_version + " (build " + std::to_string(id.product_build) + ")";
		}
	};
	return std::visit(visitor{}, v);
}

}
