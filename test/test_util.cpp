
#include "log.hpp"
#include "sftp/common/logger.hpp"
#include "sftp/common/util.hpp"
#include <catch2/catch.hpp>

#include <sstream>

namespace securepath::sftp::test {

static byte_vector to_vec(std::string_view s) {
	return byte_vector((std::byte const*)s.data(), (std::byte const*)s.data()+s.size());
}

static byte_vector to_vec(const_span s) {
	return byte_vector(s.begin(), s.end());
}

TEST_CASE("safe_subspan", "[unit]") {

	{
		auto vec = to_vec("test");
		span s = vec;
		CHECK(to_vec(safe_subspan(s, 0)) == to_vec("test"));
		CHECK(to_vec(safe_subspan(s, 1)) == to_vec("est"));
		CHECK(safe_subspan(s, 4).empty());
		CHECK(to_vec(safe_subspan(s, 1, 2)) == to_vec("es"));
		CHECK(to_vec(safe_subspan(s, 2, 6)) == to_vec("st"));
	}

	{
		const_span s = to_span("test");
		CHECK(to_vec(safe_subspan(s, 0)) == to_vec("test"));
		CHECK(safe_subspan(s, 5).empty());
		CHECK(to_vec(safe_subspan(s, 3, 1)) == to_vec("t"));
	}

}

TEST_CASE("byte order", "[unit]") {
	std::byte buf[4];
	u32ton(0x01020304, buf);
	CHECK(buf[0] == std::byte{1});
	CHECK(buf[3] == std::byte{4});
	CHECK(ntou32(buf) == 0x01020304);

	u16ton(0xABCD, buf);
	CHECK(buf[0] == std::byte{0xAB});
	CHECK(ntou16(buf) == 0xABCD);
}

TEST_CASE("hex output", "[unit]") {
	CHECK(to_hex(to_span("")) == "");
	CHECK(to_hex(to_vec("\x01\xff\x10")) == "01ff10");

	std::ostringstream out;
	out << const_span(to_vec("\x0a\xb0")) << " " << 10;
	CHECK(out.str() == "0a b0 10");
}

namespace {
struct recording_logger : logger {
	using logger::logger;

	void do_log_line(type t, std::string const& s, std::source_location&&) override {
		lines.emplace_back(t, s);
	}

	std::vector<std::pair<type, std::string>> lines;
};
}

TEST_CASE("session_logger", "[unit]") {
	recording_logger log(logger::type(logger::error | logger::info));
	session_logger slog(log, "[session 3] ");

	slog.log(logger::info, "hello {} {}", 1, "world");
	slog.log(logger::debug, "not shown");
	CHECK(!slog.would_log(logger::debug_trace));
	CHECK(slog.would_log(logger::error));

	REQUIRE(log.lines.size() == 1);
	CHECK(log.lines[0].first == logger::info);
	CHECK(log.lines[0].second == "[session 3] hello 1 world");

	CHECK(my_simple_format("a{}b{}", 1) == "a1b{}");
	CHECK(my_simple_format("x", 1, 2) == "x");
}

}
