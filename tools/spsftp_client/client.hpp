#ifndef SP_SFTP_TOOLS_SPSFTP_CLIENT_CLIENT_HEADER
#define SP_SFTP_TOOLS_SPSFTP_CLIENT_CLIENT_HEADER

#include "sftp/client/sftp_config.hpp"
#include "tools/common/command_parser.hpp"
#include "tools/common/util.hpp"

#include <memory>

namespace securepath::sftp {

struct client_tool_commands : sftp_config, securepath::command_parser {
	bool help{};
	bool verbose{};
	bool very_verbose{};
	std::string host{"localhost"};
	std::uint16_t port{2222};
	std::string config_file;

	client_tool_commands();
};

class client_tool {
public:
	client_tool(client_tool_commands const&);
	~client_tool();

	int run();

private:
	sync_cout_logger log_;

	class impl;
	std::unique_ptr<impl> impl_;
};

}

#endif
