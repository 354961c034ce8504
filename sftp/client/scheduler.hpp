#ifndef SP_SFTP_CLIENT_SCHEDULER_HEADER
#define SP_SFTP_CLIENT_SCHEDULER_HEADER

#include <functional>

namespace securepath::sftp {

/// runs functions later on the same thread that drives the sftp session
class scheduler {
public:
	virtual ~scheduler() = default;

	/// the function must not be called before post returns
	virtual void post(std::function<void()>) = 0;
};

}

#endif
