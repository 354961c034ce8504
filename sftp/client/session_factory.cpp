#include "session_factory.hpp"

namespace securepath::sftp {

session_factory::session_factory(logger& log, scheduler& s, sftp_config const& config)
: log_(log)
, scheduler_(s)
, config_(config)
{
	if(!config_.valid()) {
		throw usage_error("Invalid sftp configuration");
	}
}

std::unique_ptr<sftp_client> session_factory::create() {
	auto id = next_session_id_++;
	log_.log(logger::debug, "Creating sftp session [id={}]", id);
	return std::make_unique<sftp_client>(id, log_, scheduler_, config_);
}

}
