#include "util.hpp"

#include <iostream>
#include <syncstream>

namespace securepath::sftp {

std::string_view to_string(logger::type t) {
	switch(t) {
		case logger::error:         return "error";
		case logger::warning:       return "warning";
		case logger::info:          return "info";
		case logger::debug:         return "debug";
		case logger::debug_verbose: return "verbose";
		case logger::debug_trace:   return "trace";
		default: break;
	}
	return "log";
}

void sync_cout_logger::do_log_line(type t, std::string const& s, std::source_location&&) {
	std::osyncstream out(std::cout);
	out << "[" << to_string(t) << "] " << s << std::endl;
}

}
