#ifndef SP_SFTP_CLIENT_SESSION_FACTORY_HEADER
#define SP_SFTP_CLIENT_SESSION_FACTORY_HEADER

#include "sftp_client.hpp"

#include <memory>

namespace securepath::sftp {

/// creates sftp client sessions with unique session ids, the logger and scheduler must outlive the sessions
class session_factory {
public:
	session_factory(logger&, scheduler&, sftp_config const& = {});

	std::unique_ptr<sftp_client> create();

	/// id that the next created session gets
	std::uint32_t next_session_id() const { return next_session_id_; }

	sftp_config const& config() const { return config_; }

private:
	logger& log_;
	scheduler& scheduler_;
	sftp_config config_;
	std::uint32_t next_session_id_{1};
};

}

#endif
