#include "client.hpp"
#include "tcp_channel.hpp"
#include "sftp/client/session_factory.hpp"

#include <coroutine>
#include <asio.hpp>

#include <atomic>
#include <fstream>
#include <future>
#include <iostream>
#include <iomanip>
#include <map>
#include <string>
#include <stdexcept>
#include <syncstream>
#include <thread>

namespace securepath::sftp {

client_tool_commands::client_tool_commands()
: command_parser(false)
{
	add(help, "help", "", "show help");
	add(verbose, "verbose", "v", "verbose logging");
	add(very_verbose, "very-verbose", "vv", "very verbose logging");
	add(host, "host", "h", "host to connect");
	add(port, "port", "p", "port to connect");
	add(max_read_block_length, "max-read-block", "", "maximum data length of single read request");
	add(max_write_block_length, "max-write-block", "", "maximum data length of single write request");
	add(config_file, "config", "c", "config file");
}

using tcp = asio::ip::tcp;
using namespace std::literals;

namespace {

class asio_scheduler : public scheduler {
public:
	asio_scheduler(asio::io_context& io_context)
	: io_context_(io_context)
	{}

	void post(std::function<void()> func) override {
		asio::post(io_context_, std::move(func));
	}

private:
	asio::io_context& io_context_;
};

using done_handler = std::function<void()>;

void print_error(sftp_error const& e) {
	std::osyncstream out(std::cout);
	out << "error: " << e.message();
	if(!e.description().empty()) {
		out << " (" << e.description() << ")";
	}
	out << std::endl;
}

template<typename... Args>
void print_line(Args const&... args) {
	std::osyncstream out(std::cout);
	(out << ... << args) << std::endl;
}

void print_stats(file_stats const& s) {
	std::osyncstream out(std::cout);
	if(s.mode) {
		char const* type = s.is_directory() ? "directory" : s.is_symlink() ? "symbolic link" : s.is_file() ? "regular file" : "other";
		out << "type: " << type << "\n";
		out << "mode: " << std::oct << std::setw(4) << std::setfill('0') << (*s.mode & 07777) << std::dec << "\n";
	}
	if(s.size) {
		out << "size: " << *s.size << "\n";
	}
	if(s.uid && s.gid) {
		out << "uid/gid: " << *s.uid << "/" << *s.gid << "\n";
	}
	if(s.atime && s.mtime) {
		out << "atime: " << *s.atime << "\nmtime: " << *s.mtime << "\n";
	}
	out << std::flush;
}

sftp_client::status_callback report_status(done_handler done) {
	return [done = std::move(done)](sftp_error e)
		{
			if(e) {
				print_error(e);
			}
			done();
		};
}

sftp_client::path_callback report_path(done_handler done) {
	return [done = std::move(done)](sftp_error e, std::string path)
		{
			if(e) {
				print_error(e);
			} else {
				print_line(path);
			}
			done();
		};
}

sftp_client::stats_callback report_stats(done_handler done) {
	return [done = std::move(done)](sftp_error e, file_stats stats)
		{
			if(e) {
				print_error(e);
			} else {
				print_stats(stats);
			}
			done();
		};
}

/// operation on open file or directory, the handle is closed at the end also when the operation fails
class handle_operation : public std::enable_shared_from_this<handle_operation> {
public:
	handle_operation(sftp_client& client, done_handler done)
	: client_(client)
	, done_(std::move(done))
	{}

	virtual ~handle_operation() = default;

protected:
	template<typename T>
	std::shared_ptr<T> shared_this() {
		return std::static_pointer_cast<T>(shared_from_this());
	}

	/// start the operation once the handle is received
	virtual void next() = 0;
	virtual void report_success() {}

	sftp_client::handle_callback on_handle() {
		return [self = shared_from_this()](sftp_error e, sftp_client::file_handle h)
			{
				if(e) {
					print_error(e);
					self->done_();
				} else {
					self->handle_ = std::move(h);
					self->next();
				}
			};
	}

	void finish(sftp_error error) {
		client_.close(handle_,
			[self = shared_from_this(), error = std::move(error)](sftp_error e)
			{
				if(error) {
					print_error(error);
				} else if(e) {
					print_error(e);
				} else {
					self->report_success();
				}
				self->done_();
			});
	}

protected:
	sftp_client& client_;
	sftp_client::file_handle handle_;
	done_handler done_;
};

class directory_listing : public handle_operation {
public:
	using handle_operation::handle_operation;

	void start(std::string const& path) {
		client_.opendir(path, on_handle());
	}

private:
	void next() override {
		client_.readdir(handle_,
			[self = shared_this<directory_listing>()](sftp_error e, std::vector<directory_entry> entries)
			{
				if(e || entries.empty()) {
					self->finish(std::move(e));
				} else {
					for(auto&& v : entries) {
						print_line(v.longname.empty() ? v.filename : v.longname);
					}
					self->next();
				}
			});
	}
};

class file_upload : public handle_operation {
public:
	file_upload(sftp_client& client, done_handler done, std::ifstream in)
	: handle_operation(client, std::move(done))
	, in_(std::move(in))
	, block_(client.config().max_write_block_length)
	{}

	void start(std::string const& path) {
		client_.open(path, "w", std::nullopt, on_handle());
	}

private:
	void next() override {
		in_.read(reinterpret_cast<char*>(block_.data()), block_.size());
		std::size_t n = in_.gcount();
		if(!n) {
			if(in_.bad()) {
				print_line("error: failed to read local file");
			}
			finish({});
			return;
		}

		client_.write(handle_, block_, 0, n, position_,
			[self = shared_this<file_upload>(), n](sftp_error e)
			{
				if(e) {
					self->finish(std::move(e));
				} else {
					self->position_ += n;
					self->next();
				}
			});
	}

	void report_success() override {
		print_line("uploaded ", position_, " bytes");
	}

private:
	std::ifstream in_;
	byte_vector block_;
	std::uint64_t position_{};
};

class file_download : public handle_operation {
public:
	file_download(sftp_client& client, done_handler done, std::ofstream out)
	: handle_operation(client, std::move(done))
	, out_(std::move(out))
	{}

	void start(std::string const& path) {
		client_.open(path, "r", std::nullopt, on_handle());
	}

private:
	void next() override {
		client_.read(handle_, position_, client_.config().max_read_block_length,
			[self = shared_this<file_download>()](sftp_error e, byte_vector data)
			{
				if(e || data.empty()) {
					self->finish(std::move(e));
				} else {
					self->out_.write(reinterpret_cast<char const*>(data.data()), data.size());
					self->position_ += data.size();
					self->next();
				}
			});
	}

	void report_success() override {
		out_.flush();
		if(!out_) {
			print_line("error: failed to write local file");
		} else {
			print_line("downloaded ", position_, " bytes");
		}
	}

private:
	std::ofstream out_;
	std::uint64_t position_{};
};

/// flags used by the interactive commands
struct command_line : securepath::command_parser {
	bool force{};
	bool symbolic{};

	command_line() {
		add(force, "force", "f", "overwrite existing target");
		add(symbolic, "symbolic", "s", "create symbolic link");
	}
};

struct command_args {
	std::vector<std::string> args;
	bool force{};
	bool symbolic{};
};

struct interactive_command {
	std::size_t arguments{};
	std::string usage;
	std::function<void(command_args const&, done_handler)> run;
};

}

struct client_tool::impl {
	impl(client_tool_commands const& c, logger& log)
	: log_(log)
	, config_(c)
	, scheduler_(io_context_)
	, factory_(log_, scheduler_, config_)
	, signals_(io_context_, SIGINT, SIGTERM)
	{
		signals_.async_wait(
			[&](auto, auto){
				io_context_.stop();
			});

		add_commands();
	}

	~impl() {
		io_context_.stop();
		if(thread_.joinable()) {
			thread_.join();
		}
	}

	void add_commands() {
		commands_["ls"] = {1, "ls <path>",
			[&](command_args const& a, done_handler done) {
				std::make_shared<directory_listing>(*client_, std::move(done))->start(a.args[0]);
			}};

		commands_["put"] = {2, "put <local> <remote>",
			[&](command_args const& a, done_handler done) {
				std::ifstream in(a.args[0], std::ios_base::binary);
				if(!in) {
					print_line("error: failed to open '", a.args[0], "'");
					done();
					return;
				}
				std::make_shared<file_upload>(*client_, std::move(done), std::move(in))->start(a.args[1]);
			}};

		commands_["get"] = {2, "get <remote> <local>",
			[&](command_args const& a, done_handler done) {
				std::ofstream out(a.args[1], std::ios_base::binary | std::ios_base::trunc);
				if(!out) {
					print_line("error: failed to open '", a.args[1], "'");
					done();
					return;
				}
				std::make_shared<file_download>(*client_, std::move(done), std::move(out))->start(a.args[0]);
			}};

		commands_["stat"] = {1, "stat <path>",
			[&](command_args const& a, done_handler done) {
				client_->stat(a.args[0], report_stats(std::move(done)));
			}};

		commands_["lstat"] = {1, "lstat <path>",
			[&](command_args const& a, done_handler done) {
				client_->lstat(a.args[0], report_stats(std::move(done)));
			}};

		commands_["realpath"] = {1, "realpath <path>",
			[&](command_args const& a, done_handler done) {
				client_->realpath(a.args[0], report_path(std::move(done)));
			}};

		commands_["readlink"] = {1, "readlink <path>",
			[&](command_args const& a, done_handler done) {
				client_->readlink(a.args[0], report_path(std::move(done)));
			}};

		commands_["mkdir"] = {1, "mkdir <path>",
			[&](command_args const& a, done_handler done) {
				client_->mkdir(a.args[0], std::nullopt, report_status(std::move(done)));
			}};

		commands_["rmdir"] = {1, "rmdir <path>",
			[&](command_args const& a, done_handler done) {
				client_->rmdir(a.args[0], report_status(std::move(done)));
			}};

		commands_["rm"] = {1, "rm <path>",
			[&](command_args const& a, done_handler done) {
				client_->unlink(a.args[0], report_status(std::move(done)));
			}};

		commands_["mv"] = {2, "mv [-f] <old> <new>",
			[&](command_args const& a, done_handler done) {
				client_->rename(a.args[0], a.args[1], a.force ? rename_flags::overwrite : rename_flags::none,
					report_status(std::move(done)));
			}};

		commands_["ln"] = {2, "ln [-s] <target> <link>",
			[&](command_args const& a, done_handler done) {
				if(a.symbolic) {
					client_->symlink(a.args[0], a.args[1], report_status(std::move(done)));
				} else {
					client_->link(a.args[0], a.args[1], report_status(std::move(done)));
				}
			}};
	}

	int run() {
		auto result = tcp::resolver(io_context_).resolve(config_.host, std::to_string(config_.port));
		if(result.begin() == result.end()) {
			std::cerr << "Failed to resolve address\n";
			return 1;
		}

		channel_ = std::make_shared<tcp_channel>(io_context_, log_, config_.max_in_packet_size());
		client_ = factory_.create();

		auto ready = std::make_shared<std::promise<bool>>();
		auto connected = ready->get_future();

		asio::co_spawn(io_context_, channel_->connect(result.begin()->endpoint(),
			[this, ready](std::optional<channel_error> error)
			{
				if(error) {
					print_line("error: ", error->code, ", ", error->message);
					ready->set_value(false);
				} else {
					client_->bind(*channel_,
						[ready](sftp_error e)
						{
							if(e) {
								print_error(e);
							}
							ready->set_value(!e);
						});
				}
			}), asio::detached);

		thread_ = std::thread{
			[&]{
				io_context_.run();
				stopped_ = true;
			}};

		if(!wait(connected) || !connected.get()) {
			return 1;
		}

		while(!stopped_ && get_input()) {
		}

		asio::post(io_context_,
			[&]{
				client_->end();
				signals_.cancel();
			});

		return 0;
	}

	template<typename Future>
	bool wait(Future& f) {
		while(f.wait_for(100ms) != std::future_status::ready) {
			if(stopped_) {
				return false;
			}
		}
		return true;
	}

	bool get_input() {
		std::string line;
		{
			std::osyncstream out(std::cout);
			out << "sftp> " << std::flush;
		}
		if(!std::getline(std::cin, line)) {
			return false;
		}
		return handle_command_line(line);
	}

	bool handle_command_line(std::string const& line) {
		command_line cl;
		try {
			cl.parse(line);
		} catch(securepath::invalid_argument const& e) {
			print_line("error: ", e.what());
			return true;
		}

		auto const& words = cl.positionals();
		if(words.empty()) {
			return true;
		}
		if(words[0] == "exit") {
			return false;
		}

		auto it = commands_.find(words[0]);
		if(it == commands_.end()) {
			print_line("Unknown command");
			return true;
		}

		command_args args{std::vector<std::string>(words.begin()+1, words.end()), cl.force, cl.symbolic};
		if(args.args.size() != it->second.arguments) {
			print_line("usage: ", it->second.usage);
			return true;
		}

		auto done = std::make_shared<std::promise<void>>();
		auto finished = done->get_future();

		// the sftp client is only used from the io thread
		asio::post(io_context_,
			[&command = it->second, args = std::move(args), done]
			{
				try {
					command.run(args, [done]{ done->set_value(); });
				} catch(std::exception const& e) {
					print_line("error: ", e.what());
					done->set_value();
				}
			});

		return wait(finished);
	}

private:
	logger& log_;
	asio::io_context io_context_;
	client_tool_commands config_;
	asio_scheduler scheduler_;
	session_factory factory_;
	asio::signal_set signals_;
	std::map<std::string, interactive_command> commands_;
	std::thread thread_;
	std::atomic<bool> stopped_{};
	std::shared_ptr<tcp_channel> channel_;
	std::unique_ptr<sftp_client> client_;
};

static logger::type make_log_level(client_tool_commands const& c) {
	if(c.very_verbose) {
		return logger::log_all;
	}
	if(c.verbose) {
		return logger::type(logger::error | logger::info | logger::debug);
	}
	return logger::error;
}

client_tool::client_tool(client_tool_commands const& c)
: log_(make_log_level(c))
, impl_(std::make_unique<impl>(c, log_))
{
}

client_tool::~client_tool()
{
}

int client_tool::run() {
	return impl_->run();
}

}
