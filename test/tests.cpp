
#include "log.hpp"

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

using namespace securepath;

sftp::stdout_logger& securepath::sftp::test::test_log() {
    static stdout_logger log(stdout_logger::log_none);
    return log;
}

int main(int argc, char* argv[]) {
	using namespace Catch::clara;

    Catch::Session session;
    bool show_logging = false;

    auto cli = session.cli()
        | Opt(show_logging)
             ["--show-sftp-log"]
             ("Show sftp log");

    session.cli(cli);

    auto ret = session.applyCommandLine( argc, argv );
    if (ret) {
        return ret;
    }
    if(show_logging) {
    	sftp::test::test_log().set_level(sftp::stdout_logger::log_all);
    }

    return session.run();
}
