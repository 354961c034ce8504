#ifndef SECUREPATH_TOOLS_COMMON_UTIL_HEADER
#define SECUREPATH_TOOLS_COMMON_UTIL_HEADER

#include "sftp/common/logger.hpp"

namespace securepath::sftp {

/// logger that can be used from multiple threads, lines are written to std::cout as whole
class sync_cout_logger : public logger {
public:
	using logger::logger;

protected:
	void do_log_line(type, std::string const&, std::source_location&&) override;
};

std::string_view to_string(logger::type);

}

#endif
