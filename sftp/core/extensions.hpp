#ifndef SP_SFTP_EXTENSIONS_HEADER
#define SP_SFTP_EXTENSIONS_HEADER

#include "sftp_packet.hpp"

#include <map>
#include <variant>

namespace securepath::sftp {

namespace extension_names {
	std::string_view const posix_rename{"posix-rename@openssh.com"}; // "1"
	std::string_view const statvfs{"statvfs@openssh.com"};           // "2"
	std::string_view const fstatvfs{"fstatvfs@openssh.com"};         // "2"
	std::string_view const hardlink{"hardlink@openssh.com"};         // "1"
	std::string_view const fsync{"fsync@openssh.com"};               // "1"
	std::string_view const newline{"newline@sftp.ws"};               // "\n"
	std::string_view const newline2{"newline"};                      // "\n"
	std::string_view const newline3{"newline@vandyke.com"};          // "\n"
	std::string_view const charset{"charset@sftp.ws"};               // "utf-8"
	std::string_view const metadata{"meta@sftp.ws"};
	std::string_view const versions{"versions"};
	std::string_view const vendor{"vendor-id"};
}

struct vendor_id {
	std::string vendor_name;
	std::string product_name;
	std::string product_version;
	std::uint64_t product_build{};

	bool operator==(vendor_id const&) const = default;
};

/// known extensions decode to string (or vendor_id), unknown ones to raw data
using extension_value = std::variant<std::string, byte_vector, vendor_id>;
using extension_map = std::map<std::string, extension_value, std::less<>>;

bool is_known_extension(std::string_view name);

void write_extension(sftp_packet_writer&, std::string_view name, std::string_view value);
extension_value read_extension(sftp_packet_reader&, std::string_view name);

/// OpenSSH style extensions may be announced multiple times
bool is_openssh_extension(std::string_view name);

/// exact token match in comma separated list
bool contains_value(std::string_view values, std::string_view value);

std::string to_string(extension_value const&);

}

#endif
