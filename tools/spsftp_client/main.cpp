#include "client.hpp"

#include <stdexcept>
#include <iostream>

int main(int argc, char* argv[]) {
	try {
		using namespace securepath::sftp;
		client_tool_commands p;
		p.parse(argc, argv);
		if(p.help) {
			std::cout << "spsftp client\n";
			client_tool_commands().print_help(std::cout);
			return 0;
		}
		if(!p.config_file.empty()) {
			p.parse_file(p.config_file);
		}
		if(!p.positionals().empty()) {
			throw securepath::invalid_argument("unexpected argument '" + p.positionals().front() + "'");
		}

		client_tool client(p);
		return client.run();
	} catch(std::exception const& e) {
		std::cerr << "Exception: " << e.what() << "\n";
		return 1;
	}
}
