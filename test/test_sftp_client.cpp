
#include "log.hpp"
#include "util.hpp"
#include "sftp/client/session_factory.hpp"
#include "sftp/client/sftp_client.hpp"
#include <catch2/catch.hpp>

namespace securepath::sftp::test {

using file_handle = sftp_client::file_handle;

struct client_fixture {
	client_fixture(sftp_config const& config = {})
	: client(1, test_log(), sched, config)
	{
	}

	void connect(std::vector<std::pair<std::string, std::string>> const& extensions = {}) {
		bool called = false;
		client.bind(channel, [&](sftp_error err) {
			CHECK(!err);
			called = true;
		});
		client.process(version_packet(sftp_version, extensions));
		REQUIRE(called);
		REQUIRE(client.is_ready());
	}

	file_handle open(std::string_view path, std::string_view handle) {
		file_handle res;
		client.open(path, "r", std::nullopt, [&](sftp_error err, file_handle h) {
			CHECK(!err);
			res = h;
		});
		client.process(handle_packet(channel.last_id(), handle));
		REQUIRE(res);
		return res;
	}

	manual_scheduler sched;
	test_channel channel;
	sftp_client client;
};

TEST_CASE("sftp_client handshake", "[unit]") {
	client_fixture f;
	CHECK(f.client.state() == session_state::unbound);

	bool called = false;
	f.client.bind(f.channel, [&](sftp_error err) {
		CHECK(!err);
		called = true;
	});

	CHECK(f.channel.listener == &f.client);
	CHECK(f.client.state() == session_state::initializing);
	REQUIRE(f.channel.sent.size() == 1);
	{
		auto r = f.channel.request(0);
		CHECK(r.type() == fxp_init);
		CHECK(!r.id());
		CHECK(r.read_uint32() == sftp_version);
		CHECK(r.size_left() == 0);
	}

	f.channel.listener->on_message(version_packet(3, {
		{"posix-rename@openssh.com", "1"},
		{"hardlink@openssh.com", "1"},
		{"hardlink@openssh.com", "2"},
		{"statvfs@openssh.com", "2"},
		{"newline", "\n"},
		{"other@example.com", "xy"}}));

	CHECK(called);
	CHECK(f.client.is_ready());
	CHECK(f.client.has_feature(sftp_feature::hardlink));
	CHECK(f.client.has_feature(sftp_feature::posix_rename));

	auto& ext = f.client.extensions();
	CHECK(ext.size() == 5);
	CHECK(std::get<std::string>(ext.at("hardlink@openssh.com")) == "1,2");
	CHECK(std::get<std::string>(ext.at("newline")) == "\n");
	CHECK(std::get<byte_vector>(ext.at("other@example.com")) == to_byte_vector(std::string_view("xy")));
	CHECK(f.client.bytes_sent() == 9);
	CHECK(f.client.bytes_received() > 0);
}

TEST_CASE("sftp_client handshake without features", "[unit]") {
	client_fixture f;
	f.connect({{"hardlink@openssh.com", "2"}, {"posix-rename@openssh.com", "0"}});
	CHECK(!f.client.has_feature(sftp_feature::hardlink));
	CHECK(!f.client.has_feature(sftp_feature::posix_rename));
}

TEST_CASE("sftp_client handshake failure", "[unit]") {
	client_fixture f;
	std::optional<sftp_error> result;
	f.client.bind(f.channel, [&](sftp_error err) { result = err; });

	SECTION("unexpected message") {
		f.client.process(status_packet(1, fx_ok));
		REQUIRE(result);
		CHECK(result->native_code() == fx_bad_message);
		CHECK(result->description() == "Unexpected message");
	}
	SECTION("unexpected version") {
		f.client.process(version_packet(4));
		REQUIRE(result);
		CHECK(result->native_code() == fx_bad_message);
		CHECK(result->description() == "Unexpected protocol version");
	}

	CHECK(f.client.state() == session_state::closed);
	CHECK(f.channel.closed == close_reason::sftp_protocol_error);
	CHECK(f.channel.listener == nullptr);
}

TEST_CASE("sftp_client bind usage", "[unit]") {
	client_fixture f;
	CHECK_THROWS_AS(f.client.bind(f.channel, nullptr), usage_error);
	CHECK(f.channel.sent.empty());

	f.connect();
	test_channel other;
	CHECK_THROWS_AS(f.client.bind(other, [](sftp_error) {}), usage_error);
	CHECK(other.sent.empty());
}

TEST_CASE("sftp_client not connected", "[unit]") {
	client_fixture f;
	std::optional<sftp_error> result;
	f.client.stat("/a", [&](sftp_error err, file_stats) { result = err; });

	// failure is never reported before the call returns
	CHECK(!result);
	CHECK(f.sched.run_all() == 1);
	REQUIRE(result);
	CHECK(result->code() == "ENOTCONN");
	CHECK(result->native_code() == fx_no_connection);
	CHECK(result->path() == "/a");
	CHECK(f.channel.sent.empty());
}

TEST_CASE("sftp_client responses in reverse order", "[unit]") {
	client_fixture f;
	f.connect();

	std::map<std::string, std::uint64_t> sizes;
	std::vector<std::uint32_t> ids;
	for(std::string path : {"/a", "/b", "/c"}) {
		f.client.stat(path, [&, path](sftp_error err, file_stats stats) {
			CHECK(!err);
			sizes[path] = stats.size.value();
		});
		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_stat);
		CHECK(r.read_string() == path);
		ids.push_back(*r.id());
	}

	CHECK(ids == std::vector<std::uint32_t>{1, 2, 3});

	f.client.process(attrs_packet(ids[2], file_stats{.size = 3}));
	f.client.process(attrs_packet(ids[1], file_stats{.size = 2}));
	f.client.process(attrs_packet(ids[0], file_stats{.size = 1}));

	CHECK(sizes == std::map<std::string, std::uint64_t>{{"/a", 1}, {"/b", 2}, {"/c", 3}});
}

TEST_CASE("sftp_client status errors", "[unit]") {
	client_fixture f;
	f.connect();

	std::optional<sftp_error> result;
	f.client.stat("/missing", [&](sftp_error err, file_stats) { result = err; });
	f.client.process(status_packet(f.channel.last_id(), fx_no_such_file, "No such file"));

	REQUIRE(result);
	CHECK(result->kind() == error_kind::no_such_file);
	CHECK(result->code() == "ENOENT");
	CHECK(result->error_number() == 34);
	CHECK(result->description() == "No such file");
	CHECK(result->message() == "ENOENT, stat '/missing'");
	CHECK(f.client.is_ready());
}

TEST_CASE("sftp_client read eof and empty data", "[unit]") {
	client_fixture f;
	f.connect();
	auto h = f.open("/file", "h1");

	SECTION("eof status") {
		std::optional<sftp_error> result;
		byte_vector data{std::byte{1}};
		f.client.read(h, 10, 100, [&](sftp_error err, byte_vector d) { result = err; data = d; });
		f.client.process(status_packet(f.channel.last_id(), fx_eof));

		REQUIRE(result);
		CHECK(!*result);
		CHECK(data.empty());
	}

	SECTION("data") {
		byte_vector data;
		f.client.read(h, 10, 100, [&](sftp_error err, byte_vector d) { CHECK(!err); data = d; });
		{
			auto r = f.channel.last_request();
			CHECK(r.type() == fxp_read);
			CHECK(r.read_string() == "h1");
			CHECK(r.read_uint64() == 10);
			CHECK(r.read_uint32() == 100);
		}
		f.client.process(data_packet(f.channel.last_id(), "abc"));
		CHECK(data == to_byte_vector(std::string_view("abc")));
	}

	SECTION("empty data is retried") {
		std::optional<sftp_error> result;
		f.client.read(h, 1000, 50, [&](sftp_error err, byte_vector) { result = err; });

		auto sent_before = f.channel.sent.size();
		for(int i = 0; i != 4; ++i) {
			f.client.process(data_packet(f.channel.last_id(), ""));
			CHECK(!result);
			REQUIRE(f.channel.sent.size() == sent_before + i + 1);

			auto r = f.channel.last_request();
			CHECK(r.type() == fxp_read);
			CHECK(r.read_string() == "h1");
			CHECK(r.read_uint64() == 1000);
			CHECK(r.read_uint32() == 50);
		}

		// fifth empty response fails the read
		f.client.process(data_packet(f.channel.last_id(), ""));
		REQUIRE(result);
		CHECK(result->code() == "EIO");
		CHECK(result->error_number() == 55);
		CHECK(result->handle() == to_byte_vector(std::string_view("h1")));
		CHECK(f.channel.sent.size() == sent_before + 4);
	}

	SECTION("retry succeeds") {
		byte_vector data;
		f.client.read(h, 0, 50, [&](sftp_error err, byte_vector d) { CHECK(!err); data = d; });
		f.client.process(data_packet(f.channel.last_id(), ""));
		f.client.process(data_packet(f.channel.last_id(), "x"));
		CHECK(data == to_byte_vector(std::string_view("x")));
	}
}

TEST_CASE("sftp_client read too much data", "[unit]") {
	client_fixture f;
	f.connect();
	auto h = f.open("/file", "h1");

	std::optional<sftp_error> read_result;
	std::optional<sftp_error> stat_result;
	f.client.read(h, 0, 4, [&](sftp_error err, byte_vector) { read_result = err; });
	auto read_id = f.channel.last_id();
	f.client.stat("/other", [&](sftp_error err, file_stats) { stat_result = err; });

	CHECK_THROWS_AS(f.client.process(data_packet(read_id, "12345")), protocol_violation);

	REQUIRE(read_result);
	CHECK(read_result->kind() == error_kind::protocol);
	CHECK(read_result->code() == "EPROTO");
	CHECK(read_result->description() == "Received too much data");

	REQUIRE(stat_result);
	CHECK(stat_result->code() == "ESHUTDOWN");
	CHECK(stat_result->native_code() == fx_connection_lost);

	CHECK(f.channel.closed == close_reason::sftp_protocol_error);
	CHECK(f.client.state() == session_state::closed);
}

TEST_CASE("sftp_client block limits", "[unit]") {
	sftp_config config;
	config.max_read_block_length = 1024;
	config.max_write_block_length = 16;

	client_fixture f(config);
	f.connect();
	auto h = f.open("/file", "h1");

	f.client.read(h, 0, 4096, [](sftp_error, byte_vector) {});
	{
		auto r = f.channel.last_request();
		r.skip_string();
		r.read_uint64();
		CHECK(r.read_uint32() == 1024);
	}

	auto sent = f.channel.sent.size();
	byte_vector buffer(32);
	CHECK_THROWS_AS(f.client.write(h, buffer, 0, 17, 0, [](sftp_error) {}), usage_error);
	CHECK_THROWS_AS(f.client.write(h, buffer, 20, 13, 0, [](sftp_error) {}), usage_error);
	CHECK_THROWS_AS(f.client.write(h, buffer, 33, 0, 0, [](sftp_error) {}), usage_error);
	CHECK_THROWS_AS(f.client.write(h, buffer, 0, 1, 0x8000000000000000ull, [](sftp_error) {}), usage_error);
	CHECK_THROWS_AS(f.client.read(h, 0x8000000000000000ull, 1, [](sftp_error, byte_vector) {}), usage_error);
	CHECK_THROWS_AS(f.client.read(h, 0, 0, [](sftp_error, byte_vector) {}), usage_error);
	CHECK(f.channel.sent.size() == sent);

	f.client.write(h, buffer, 16, 16, 0x7FFFFFFFFFFFFFFFull, [](sftp_error) {});
	CHECK(f.channel.sent.size() == sent + 1);

	CHECK_THROWS_AS(sftp_client(2, test_log(), f.sched, sftp_config{.max_read_block_length = 0}), usage_error);
}

TEST_CASE("sftp_config packet slack", "[unit]") {
	CHECK(sftp_config{}.valid());
	CHECK(!sftp_config{.packet_slack = 0}.valid());
	CHECK(!sftp_config{.packet_slack = sftp_config::min_packet_slack - 1}.valid());
	CHECK(sftp_config{.packet_slack = sftp_config::min_packet_slack}.valid());

	manual_scheduler sched;
	CHECK_THROWS_AS(sftp_client(2, test_log(), sched, sftp_config{.packet_slack = 0}), usage_error);

	// full write block with the longest handle fits
	sftp_config config;
	config.max_write_block_length = 64;
	config.packet_slack = sftp_config::min_packet_slack;

	client_fixture f(config);
	f.connect();
	auto h = f.open("/file", std::string(max_handle_length, 'h'));

	byte_vector buffer(64);
	f.client.write(h, buffer, 0, 64, 0, [](sftp_error) {});
	auto r = f.channel.last_request();
	CHECK(r.type() == fxp_write);
	CHECK(r.read_string().size() == max_handle_length);
	r.read_uint64();
	CHECK(r.read_data().size() == 64);
}

TEST_CASE("sftp_client invalid handle length", "[unit]") {
	std::string handle = GENERATE(std::string(), std::string(max_handle_length + 1, 'h'));

	client_fixture f;
	f.connect();

	std::optional<sftp_error> result;
	f.client.open("/file", "r", std::nullopt, [&](sftp_error err, file_handle) { result = err; });
	CHECK_THROWS_AS(f.client.process(handle_packet(f.channel.last_id(), handle)), protocol_violation);

	REQUIRE(result);
	CHECK(result->code() == "EPROTO");
	CHECK(f.client.state() == session_state::closed);
}

TEST_CASE("sftp_client callback throwing", "[unit]") {
	client_fixture f;
	f.connect();

	int calls = 0;
	f.client.open("/file", "r", std::nullopt, [&](sftp_error err, file_handle) {
		++calls;
		CHECK(!err);
		// the path does not fit in the request buffer
		f.client.stat(std::string(40000, 'a'), [](sftp_error, file_stats) {});
	});
	CHECK_THROWS_AS(f.client.process(handle_packet(f.channel.last_id(), "h1")), packet_error);

	// completed once and the session is still usable
	CHECK(calls == 1);
	CHECK(f.client.is_ready());
	CHECK(!f.channel.closed);

	std::optional<sftp_error> result;
	f.client.rmdir("/dir", [&](sftp_error err) { result = err; });
	f.client.process(status_packet(f.channel.last_id(), fx_ok));
	REQUIRE(result);
	CHECK(!*result);
}

TEST_CASE("sftp_client link requires hardlink", "[unit]") {
	client_fixture f;
	f.connect();

	std::optional<sftp_error> result;
	f.client.link("/a", "/b", [&](sftp_error err) { result = err; });

	auto sent = f.channel.sent.size();
	CHECK(!result);
	f.sched.run_all();

	REQUIRE(result);
	CHECK(result->code() == "ENOSYS");
	CHECK(result->native_code() == fx_op_unsupported);
	CHECK(result->old_path() == "/a");
	CHECK(result->new_path() == "/b");
	CHECK(f.channel.sent.size() == sent);
}

TEST_CASE("sftp_client link", "[unit]") {
	client_fixture f;
	f.connect({{"hardlink@openssh.com", "1"}});

	bool called = false;
	f.client.link("/a", "/b", [&](sftp_error err) { CHECK(!err); called = true; });

	auto r = f.channel.last_request();
	CHECK(r.type() == fxp_extended);
	CHECK(r.extended_type() == "hardlink@openssh.com");
	CHECK(r.read_string() == "/a");
	CHECK(r.read_string() == "/b");

	f.client.process(status_packet(*r.id(), fx_ok));
	CHECK(called);
}

TEST_CASE("sftp_client rename", "[unit]") {
	std::optional<sftp_error> result;
	auto cb = [&](sftp_error err) { result = err; };

	SECTION("without overwrite") {
		client_fixture f;
		f.connect();
		f.client.rename("/a", "/b", rename_flags::none, cb);

		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_rename);
		CHECK(r.read_string() == "/a");
		CHECK(r.read_string() == "/b");

		f.client.process(status_packet(*r.id(), fx_failure, "exists"));
		REQUIRE(result);
		CHECK(result->code() == "EFAILURE");
		CHECK(result->rename_flags() == rename_flags::none);
	}

	SECTION("overwrite") {
		client_fixture f;
		f.connect({{"posix-rename@openssh.com", "1"}});
		f.client.rename("/a", "/b", rename_flags::overwrite, cb);

		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_extended);
		CHECK(r.extended_type() == "posix-rename@openssh.com");
		CHECK(r.read_string() == "/a");
		CHECK(r.read_string() == "/b");

		f.client.process(status_packet(*r.id(), fx_ok));
		REQUIRE(result);
		CHECK(!*result);
	}

	SECTION("overwrite not supported") {
		client_fixture f;
		f.connect();
		auto sent = f.channel.sent.size();
		f.client.rename("/a", "/b", rename_flags::overwrite, cb);
		CHECK(f.channel.sent.size() == sent);

		f.sched.run_all();
		REQUIRE(result);
		CHECK(result->code() == "ENOSYS");
	}

	SECTION("unknown flags") {
		client_fixture f;
		f.connect({{"posix-rename@openssh.com", "1"}});
		auto sent = f.channel.sent.size();
		f.client.rename("/a", "/b", rename_flags(2), cb);
		CHECK(f.channel.sent.size() == sent);

		CHECK(f.sched.run_all() == 1);
		REQUIRE(result);
		CHECK(result->native_code() == fx_op_unsupported);
		CHECK(result->description() == "Unsupported rename flags");
		CHECK(result->rename_flags() == rename_flags(2));
	}
}

TEST_CASE("sftp_client realpath", "[unit]") {
	client_fixture f;
	f.connect();

	std::optional<sftp_error> result;
	std::string path;
	auto cb = [&](sftp_error err, std::string p) { result = err; path = p; };

	f.client.realpath("/a/../b", cb);
	f.client.process(name_packet(f.channel.last_id(), {{"/b", "/b"}}));
	REQUIRE(result);
	CHECK(!*result);
	CHECK(path == "/b");

	result.reset();
	f.client.realpath("/a/../b", cb);
	CHECK_THROWS_AS(f.client.process(name_packet(f.channel.last_id(), {{"/b", ""}, {"/c", ""}})), protocol_violation);
	REQUIRE(result);
	CHECK(result->code() == "EPROTO");
	CHECK(result->path() == "/a/../b");
	CHECK(f.client.state() == session_state::closed);
}

TEST_CASE("sftp_client readdir", "[unit]") {
	client_fixture f;
	f.connect();

	file_handle h;
	f.client.opendir("/dir", [&](sftp_error err, file_handle d) { CHECK(!err); h = d; });
	CHECK(f.channel.last_request().type() == fxp_opendir);
	f.client.process(handle_packet(f.channel.last_id(), "d1"));
	REQUIRE(h);

	std::vector<directory_entry> entries;
	f.client.readdir(h, [&](sftp_error err, std::vector<directory_entry> e) { CHECK(!err); entries = e; });
	f.client.process(name_packet(f.channel.last_id(), {{"a", "-rw-r--r-- a"}, {"b", "drwxr-xr-x b"}}));

	REQUIRE(entries.size() == 2);
	CHECK(entries[0].filename == "a");
	CHECK(entries[1].longname == "drwxr-xr-x b");

	bool called = false;
	f.client.readdir(h, [&](sftp_error err, std::vector<directory_entry> e) {
		CHECK(!err);
		CHECK(e.empty());
		called = true;
	});
	f.client.process(status_packet(f.channel.last_id(), fx_eof));
	CHECK(called);
}

TEST_CASE("sftp_client open write close", "[unit]") {
	client_fixture f;
	f.connect();

	std::string const content = "hello sftp";
	std::vector<std::string> completed;

	file_handle h;
	f.client.open("/tmp/a", "w", std::nullopt, [&](sftp_error err, file_handle fh) {
		CHECK(!err);
		h = fh;
		completed.push_back("open");
	});
	{
		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_open);
		CHECK(r.read_string() == "/tmp/a");
		CHECK(r.read_uint32() == (fxf_write | fxf_creat | fxf_trunc));
		CHECK(r.read_uint32() == 0);
		CHECK(r.size_left() == 0);
	}
	f.client.process(handle_packet(f.channel.last_id(), "\x01\x02"));
	REQUIRE(h);
	CHECK(h.to_string() == "0x0102");

	f.client.write(h, to_span(content), 0, content.size(), 0, [&](sftp_error err) {
		CHECK(!err);
		completed.push_back("write");
	});
	{
		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_write);
		CHECK(r.read_string() == "\x01\x02");
		CHECK(r.read_uint64() == 0);
		CHECK(r.read_string() == content);
		CHECK(r.size_left() == 0);
	}
	f.client.process(status_packet(f.channel.last_id(), fx_ok));

	f.client.close(h, [&](sftp_error err) {
		CHECK(!err);
		completed.push_back("close");
	});
	{
		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_close);
		CHECK(r.read_string() == "\x01\x02");
	}
	f.client.process(status_packet(f.channel.last_id(), fx_ok));

	CHECK(completed == std::vector<std::string>{"open", "write", "close"});
	// init, open, write, close
	CHECK(f.channel.sent.size() == 4);
}

TEST_CASE("sftp_client attribute requests", "[unit]") {
	client_fixture f;
	f.connect();
	auto h = f.open("/file", "h1");

	f.client.setstat("/file", file_stats{.mode = 0600}, [](sftp_error) {});
	{
		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_setstat);
		CHECK(r.read_string() == "/file");
		CHECK(r.read_uint32() == permissions_attribute);
		CHECK(r.read_uint32() == 0600);
	}

	f.client.fsetstat(h, file_stats{.atime = 1, .mtime = 2}, [](sftp_error) {});
	CHECK(f.channel.last_request().type() == fxp_fsetstat);

	f.client.mkdir("/dir", std::nullopt, [](sftp_error) {});
	{
		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_mkdir);
		CHECK(r.read_string() == "/dir");
		CHECK(r.read_uint32() == 0);
	}

	file_stats stats;
	f.client.fstat(h, [&](sftp_error err, file_stats s) { CHECK(!err); stats = s; });
	f.client.process(attrs_packet(f.channel.last_id(), file_stats{.size = 7, .uid = 1, .gid = 2}));
	CHECK(stats == file_stats{.size = 7, .uid = 1, .gid = 2});

	CHECK_THROWS_AS(f.client.setstat("/file", file_stats{.mtime = 2}, [](sftp_error) {}), usage_error);
}

TEST_CASE("sftp_client path commands", "[unit]") {
	client_fixture f;
	f.connect();

	auto check_sent = [&](sftp_packet_type type, std::string_view arg) {
		auto r = f.channel.last_request();
		CHECK(r.type() == type);
		CHECK(r.read_string() == arg);
	};

	f.client.lstat("~/x", [](sftp_error, file_stats) {});
	check_sent(fxp_lstat, "./x");
	f.client.stat("~", [](sftp_error, file_stats) {});
	check_sent(fxp_stat, ".");
	f.client.unlink("/f", [](sftp_error) {});
	check_sent(fxp_remove, "/f");
	f.client.rmdir("/d", [](sftp_error) {});
	check_sent(fxp_rmdir, "/d");
	f.client.readlink("/l", [](sftp_error, std::string) {});
	check_sent(fxp_readlink, "/l");

	f.client.symlink("/target", "/link", [](sftp_error) {});
	{
		auto r = f.channel.last_request();
		CHECK(r.type() == fxp_symlink);
		CHECK(r.read_string() == "/target");
		CHECK(r.read_string() == "/link");
	}

	auto sent = f.channel.sent.size();
	CHECK_THROWS_AS(f.client.stat("", [](sftp_error, file_stats) {}), usage_error);
	CHECK_THROWS_AS(f.client.rename("/a", "", rename_flags::none, [](sftp_error) {}), usage_error);
	CHECK_THROWS_AS(f.client.unlink("/f", nullptr), usage_error);
	CHECK_THROWS_AS(f.client.open("/f", "rw", std::nullopt, [](sftp_error, file_handle) {}), usage_error);
	CHECK(f.channel.sent.size() == sent);
}

TEST_CASE("sftp_client handle validation", "[unit]") {
	client_fixture f;
	f.connect();

	client_fixture other;
	other.connect();
	auto foreign = other.open("/file", "h1");

	try {
		f.client.close(file_handle{}, [](sftp_error) {});
		FAIL("expected usage_error");
	} catch(usage_error const& e) {
		CHECK(std::string_view(e.what()) == "Missing handle");
	}

	try {
		f.client.fstat(foreign, [](sftp_error, file_stats) {});
		FAIL("expected usage_error");
	} catch(usage_error const& e) {
		CHECK(std::string_view(e.what()) == "Invalid handle");
	}
}

TEST_CASE("sftp_client end", "[unit]") {
	client_fixture f;
	f.connect();

	std::vector<std::string> messages;
	f.client.stat("/a", [&](sftp_error err, file_stats) {
		messages.push_back(err.message());
		// new requests from the failure callback are not connected
		f.client.stat("/b", [&](sftp_error e, file_stats) { messages.push_back(e.message()); });
	});
	f.client.opendir("/d", [&](sftp_error err, file_handle) { messages.push_back(err.message()); });

	f.client.end();
	CHECK(f.client.state() == session_state::closed);
	CHECK(f.channel.closed == close_reason::normal);
	CHECK(f.channel.listener == nullptr);
	CHECK(messages == std::vector<std::string>{"ESHUTDOWN, stat '/a'", "ESHUTDOWN, opendir '/d'"});

	f.sched.run_all();
	REQUIRE(messages.size() == 3);
	CHECK(messages[2] == "ENOTCONN, stat '/b'");

	// second end does nothing
	f.client.end();
	CHECK(messages.size() == 3);
}

TEST_CASE("sftp_client channel close", "[unit]") {
	client_fixture f;
	f.connect();

	std::optional<sftp_error> result;
	f.client.stat("/a", [&](sftp_error err, file_stats) { result = err; });

	f.channel.closed.reset();
	f.channel.listener->on_text("hello");
	f.channel.listener->on_close(channel_error{"ECONNRESET", "Connection reset"});

	REQUIRE(result);
	CHECK(result->code() == "ESHUTDOWN");
	CHECK(f.client.state() == session_state::closed);
	// the channel is already gone, it is not closed again
	CHECK(!f.channel.closed);
}

TEST_CASE("sftp_client unknown response", "[unit]") {
	client_fixture f;
	f.connect();

	std::optional<sftp_error> result;
	f.client.stat("/a", [&](sftp_error err, file_stats) { result = err; });

	auto listener = f.channel.listener;
	// errors are not propagated to the channel
	listener->on_message(status_packet(1234, fx_ok));

	CHECK(f.client.state() == session_state::closed);
	CHECK(f.channel.closed == close_reason::sftp_protocol_error);
	REQUIRE(result);
	CHECK(result->code() == "ESHUTDOWN");

	client_fixture g;
	g.connect();
	CHECK_THROWS_AS(g.client.process(status_packet(99, fx_ok)), protocol_violation);

	client_fixture h;
	h.connect();
	CHECK_THROWS_AS(h.client.process(byte_vector{std::byte{0}, std::byte{0}, std::byte{0}, std::byte{9}}), packet_error);
	CHECK(h.client.state() == session_state::closed);
}

TEST_CASE("sftp_client unexpected response type", "[unit]") {
	client_fixture f;
	f.connect();

	std::optional<sftp_error> result;
	f.client.stat("/a", [&](sftp_error err, file_stats) { result = err; });
	CHECK_THROWS_AS(f.client.process(handle_packet(f.channel.last_id(), "h")), protocol_violation);
	REQUIRE(result);
	CHECK(result->code() == "EPROTO");
	CHECK(result->description() == "Unexpected packet received");
}

TEST_CASE("session_factory", "[unit]") {
	manual_scheduler sched;
	session_factory factory(test_log(), sched);

	auto s1 = factory.create();
	auto s2 = factory.create();
	CHECK(s1->session_id() == 1);
	CHECK(s2->session_id() == 2);
	CHECK(factory.next_session_id() == 3);
	CHECK(s1->config().max_write_block_length == sftp_config{}.max_write_block_length);

	CHECK_THROWS_AS(session_factory(test_log(), sched, sftp_config{.protocol_version = 4}), usage_error);
}

}
