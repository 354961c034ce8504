#include "sftp_client.hpp"

#include "sftp/core/open_flags.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace securepath::sftp {

namespace {

template<typename... Results>
std::function<void(sftp_error)> to_failure(std::function<void(sftp_error, Results...)> cb) {
	return [cb = std::move(cb)](sftp_error err) {
		cb(std::move(err), Results{}...);
	};
}

std::string type_name(sftp_packet_type type, std::string_view extended) {
	std::string res(to_string(type));
	if(!extended.empty()) {
		res += ":";
		res += extended;
	}
	return res;
}

std::string id_string(std::optional<std::uint32_t> id) {
	return id ? std::to_string(*id) : std::string("-");
}

}

std::string_view to_string(session_state s) {
	switch(s) {
		case session_state::unbound:      return "unbound";
		case session_state::initializing: return "initializing";
		case session_state::ready:        return "ready";
		case session_state::closed:       return "closed";
	}
	return "unknown";
}

std::string sftp_client::file_handle::to_string() const {
	return "0x" + to_hex(handle_);
}

sftp_client::sftp_client(std::uint32_t session_id, logger& log, scheduler& s, sftp_config const& config)
: session_id_(session_id)
, log_(log, "[session " + std::to_string(session_id) + "] ")
, scheduler_(s)
, config_(config)
{
	if(!config_.valid()) {
		throw usage_error("Invalid sftp configuration");
	}
}

sftp_client::~sftp_client() {
	end();
}

template<typename Callback, typename Parser>
sftp_client::pending_request sftp_client::make_request(Callback cb, Parser parser, command_info info) {
	auto fail = to_failure(cb);
	return pending_request{
		[this, cb = std::move(cb), parser](sftp_packet_reader& r, command_info const& i) {
			return (this->*parser)(r, i, cb);
		},
		std::move(fail),
		std::move(info)};
}

void sftp_client::bind(sftp_channel& channel, status_callback cb) {
	check_callback(bool(cb));
	if(state_ != session_state::unbound) {
		throw usage_error("Already bound");
	}
	if(init_sent_) {
		throw usage_error("Already initialized");
	}

	channel_ = &channel;
	channel_->set_listener(this);
	state_ = session_state::initializing;

	sftp_packet_writer w(config_.request_buffer_size());
	w.start(fxp_init);
	w.write_uint32(config_.protocol_version);

	init_request_ = make_request(std::move(cb), &sftp_client::handle_version, init_command{});
	init_sent_ = true;

	auto data = w.finish();
	log_packet("Sending initialization request", std::nullopt, type_name(fxp_init, {}), data);
	bytes_sent_ += data.size();
	channel_->send(data);
}

void sftp_client::end() {
	if(state_ != session_state::closed) {
		log_.log(logger::info, "Ending session [pending requests={}]", requests_.size() + (init_request_ ? 1 : 0));
	}
	detach(close_reason::normal, {});
	fail_requests(fx_connection_lost, "Connection closed");
}

void sftp_client::detach(std::optional<close_reason> reason, std::string_view description) {
	state_ = session_state::closed;
	if(channel_) {
		auto ch = std::exchange(channel_, nullptr);
		ch->set_listener(nullptr);
		if(reason) {
			ch->close(*reason, description);
		}
	}
}

void sftp_client::fail_requests(status_code code, std::string_view message) {
	// callbacks may issue new requests, so take the table out first
	auto init = std::exchange(init_request_, std::nullopt);
	auto requests = std::exchange(requests_, {});

	if(init) {
		init->fail(sftp_error(code, message, init->info));
	}
	for(auto& [id, req] : requests) {
		log_.log(logger::debug_verbose, "#{} - Failing pending request [{}]", id, message);
		req.fail(sftp_error(code, message, req.info));
	}
}

void sftp_client::abort_session(std::optional<pending_request>& req, std::string_view reason) {
	log_.log(logger::error, "Protocol violation, aborting session [{}]", reason);
	if(req) {
		auto r = std::exchange(req, std::nullopt);
		r->fail(sftp_error(error_kind::protocol, fx_bad_message, reason, r->info));
	}
	detach(close_reason::sftp_protocol_error, reason);
	fail_requests(fx_connection_lost, "Connection closed");
}

void sftp_client::process(const_span packet) {
	bytes_received_ += packet.size();

	std::optional<pending_request> req;
	completion done;
	try {
		sftp_packet_reader reader(packet);
		log_packet("Received response", reader.id(), type_name(reader.type(), reader.extended_type()), packet);

		req = take_request(reader);
		done = req->parser(reader, req->info);
	} catch(packet_error const& e) {
		abort_session(req, e.what());
		throw;
	} catch(protocol_violation const& e) {
		abort_session(req, e.what());
		throw;
	}

	// the request is retired before its callback runs, anything the callback throws is not a protocol error
	req.reset();
	done();
}

sftp_client::pending_request sftp_client::take_request(sftp_packet_reader const& reader) {
	if(init_request_) {
		// anything arriving before the version response is handled by the handshake
		return *std::exchange(init_request_, std::nullopt);
	}

	auto id = reader.id();
	if(!id) {
		throw protocol_violation("Unexpected packet received");
	}

	auto it = requests_.find(*id);
	if(it == requests_.end()) {
		throw protocol_violation("Unknown response ID");
	}

	auto req = std::move(it->second);
	requests_.erase(it);
	return req;
}

void sftp_client::on_message(const_span packet) {
	try {
		process(packet);
	} catch(packet_error const& e) {
		log_.log(logger::error, "process sftp error {}", e.what());
	} catch(protocol_violation const& e) {
		log_.log(logger::error, "process sftp error {}", e.what());
	}
}

void sftp_client::on_text(std::string_view text) {
	log_.log(logger::debug, "Received text message [{}]", text);
}

void sftp_client::on_close(std::optional<channel_error> error) {
	if(error) {
		log_.log(logger::error, "Channel closed with error [code={}, msg={}]", error->code, error->message);
	} else {
		log_.log(logger::info, "Channel closed");
	}
	detach(std::nullopt, {});
	fail_requests(fx_connection_lost, "Connection closed");
}

sftp_client::completion sftp_client::handle_version(sftp_packet_reader& r, command_info const& info, status_callback const& cb) {
	if(r.type() != fxp_version) {
		return [this, info, cb] { fail_handshake("Unexpected message", info, cb); };
	}

	auto version = r.read_uint32();
	if(version != config_.protocol_version) {
		log_.log(logger::error, "Server protocol version {} is not supported", version);
		return [this, info, cb] { fail_handshake("Unexpected protocol version", info, cb); };
	}

	extension_map extensions;
	while(r.size_left()) {
		auto name = r.read_string();
		auto value = read_extension(r, name);

		auto it = extensions.find(name);
		if(it != extensions.end() && is_openssh_extension(name)
			&& std::holds_alternative<std::string>(it->second) && std::holds_alternative<std::string>(value))
		{
			std::get<std::string>(it->second) += "," + std::get<std::string>(value);
		} else {
			extensions.insert_or_assign(std::move(name), std::move(value));
		}
	}

	for(auto&& [name, value] : extensions) {
		log_.log(logger::debug, "Server extension [{}={}]", name, to_string(value));
	}

	auto add_feature = [&](sftp_feature f, std::string_view name) {
		auto it = extensions.find(name);
		if(it != extensions.end()) {
			if(auto v = std::get_if<std::string>(&it->second); v && contains_value(*v, "1")) {
				features_[f] = name;
			}
		}
	};
	add_feature(sftp_feature::hardlink, extension_names::hardlink);
	add_feature(sftp_feature::posix_rename, extension_names::posix_rename);

	extensions_ = std::move(extensions);
	state_ = session_state::ready;

	log_.log(logger::info, "SFTP session established [version={}, extensions={}]", version, extensions_.size());
	return [cb] { cb(sftp_error{}); };
}

void sftp_client::fail_handshake(std::string_view reason, command_info const& info, status_callback const& cb) {
	log_.log(logger::error, "SFTP handshake failed [{}]", reason);
	detach(close_reason::sftp_protocol_error, reason);
	fail_requests(fx_connection_lost, "Connection closed");
	cb(sftp_error(fx_bad_message, reason, info));
}

sftp_packet_writer sftp_client::create_request(sftp_packet_type type) {
	sftp_packet_writer w(config_.request_buffer_size());
	w.start(type, next_id_++);
	return w;
}

sftp_packet_writer sftp_client::create_extended_request(std::string_view name) {
	sftp_packet_writer w(config_.request_buffer_size());
	w.start_extended(name, next_id_++);
	return w;
}

void sftp_client::execute(sftp_packet_writer& w, pending_request req) {
	if(!channel_) {
		post_failure(std::move(req.fail), sftp_error(fx_no_connection, "Not connected", std::move(req.info)));
		return;
	}

	auto id = w.id();
	if(!requests_.try_emplace(id, std::move(req)).second) {
		throw sftp_defect("Duplicate request");
	}

	auto data = w.finish();
	log_packet("Sending request", id, type_name(w.type(), w.extended_type()), data);
	bytes_sent_ += data.size();
	channel_->send(data);
}

void sftp_client::post_failure(failure_handler fail, sftp_error err) {
	log_.log(logger::debug, "Request failed before sending [{}]", err.message());
	scheduler_.post([fail = std::move(fail), err = std::move(err)] {
		fail(err);
	});
}

void sftp_client::write_args(sftp_packet_writer& w, std::initializer_list<std::string_view> args) {
	for(auto&& a : args) {
		w.write_string(a);
	}
}

void sftp_client::command(sftp_packet_type type, std::initializer_list<std::string_view> args, pending_request req) {
	auto w = create_request(type);
	write_args(w, args);
	execute(w, std::move(req));
}

void sftp_client::command(sftp_feature f, std::initializer_list<std::string_view> args, pending_request req) {
	auto it = features_.find(f);
	if(it == features_.end()) {
		post_failure(std::move(req.fail), sftp_error(fx_op_unsupported, "Operation not supported", std::move(req.info)));
		return;
	}

	auto w = create_extended_request(it->second);
	write_args(w, args);
	execute(w, std::move(req));
}

void sftp_client::check_callback(bool has_callback) const {
	if(!has_callback) {
		throw usage_error("Callback must be a function");
	}
}

const_span sftp_client::to_handle(file_handle const& h) const {
	if(!h.owner_) {
		throw usage_error("Missing handle");
	}
	if(h.owner_ != this) {
		throw usage_error("Invalid handle");
	}
	return h.handle_;
}

std::string sftp_client::check_path(std::string_view path, std::string_view name) const {
	if(path.empty()) {
		throw usage_error("Empty " + std::string(name));
	}
	if(path == "~") {
		return ".";
	}
	if(path.starts_with("~/")) {
		return "./" + std::string(path.substr(2));
	}
	return std::string(path);
}

void sftp_client::check_buffer(const_span buffer, std::size_t offset, std::size_t length) const {
	if(offset > buffer.size() || length > buffer.size() - offset) {
		throw usage_error("Offset or length is out of bounds");
	}
}

void sftp_client::check_position(std::uint64_t position) const {
	if(position > std::uint64_t(std::numeric_limits<std::int64_t>::max())) {
		throw usage_error("Invalid position");
	}
}

void sftp_client::log_packet(std::string_view what, std::optional<std::uint32_t> id, std::string const& type, const_span data) {
	log_.log(logger::debug, "#{} - {} [type={}, length={}]", id_string(id), what, type, data.size());
	if(log_.would_log(logger::debug_trace)) {
		log_.log(logger::debug_trace, "#{} - data: {}", id_string(id), data);
	}
}

void sftp_client::open(std::string_view path, std::string_view mode, std::optional<file_stats> const& attrs, handle_callback cb) {
	open(path, to_open_flags(mode), attrs, std::move(cb));
}

void sftp_client::open(std::string_view path, std::uint32_t flags, std::optional<file_stats> const& attrs, handle_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	auto attributes = file_attributes::from_stats(attrs);

	auto w = create_request(fxp_open);
	w.write_string(p);
	w.write_uint32(to_open_flags(flags));
	attributes.write(w);

	execute(w, make_request(std::move(cb), &sftp_client::parse_handle, path_command{"open", p}));
}

void sftp_client::close(file_handle const& handle, status_callback cb) {
	check_callback(bool(cb));
	auto h = to_handle(handle);

	auto w = create_request(fxp_close);
	w.write_data(h);

	execute(w, make_request(std::move(cb), &sftp_client::parse_status, handle_command{"close", to_byte_vector(h)}));
}

void sftp_client::read(file_handle const& handle, std::uint64_t position, std::uint32_t length, data_callback cb) {
	check_callback(bool(cb));
	auto h = to_handle(handle);
	check_position(position);
	if(!length) {
		throw usage_error("Invalid length");
	}

	length = std::min(length, config_.max_read_block_length);
	send_read(h, position, length, 0, std::move(cb), handle_command{"read", to_byte_vector(h)});
}

void sftp_client::send_read(const_span handle, std::uint64_t position, std::uint32_t length, std::uint32_t retries, data_callback cb, command_info info) {
	auto w = create_request(fxp_read);
	w.write_data(handle);
	w.write_uint64(position);
	w.write_uint32(length);

	auto fail = to_failure(cb);
	pending_request req{
		[this, h = to_byte_vector(handle), position, length, retries, cb = std::move(cb)](sftp_packet_reader& r, command_info const& i) {
			return parse_data(r, i, h, position, length, retries, cb);
		},
		std::move(fail),
		std::move(info)};

	execute(w, std::move(req));
}

void sftp_client::write(file_handle const& handle, const_span buffer, std::size_t offset, std::size_t length, std::uint64_t position, status_callback cb) {
	check_callback(bool(cb));
	auto h = to_handle(handle);
	check_buffer(buffer, offset, length);
	check_position(position);
	if(length > config_.max_write_block_length) {
		throw usage_error("Length exceeds maximum allowed data block length");
	}

	auto w = create_request(fxp_write);
	w.write_data(h);
	w.write_uint64(position);
	w.write_data(buffer.subspan(offset, length));

	execute(w, make_request(std::move(cb), &sftp_client::parse_status, handle_command{"write", to_byte_vector(h)}));
}

void sftp_client::lstat(std::string_view path, stats_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	command(fxp_lstat, {p}, make_request(std::move(cb), &sftp_client::parse_attribs, path_command{"lstat", p}));
}

void sftp_client::stat(std::string_view path, stats_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	command(fxp_stat, {p}, make_request(std::move(cb), &sftp_client::parse_attribs, path_command{"stat", p}));
}

void sftp_client::fstat(file_handle const& handle, stats_callback cb) {
	check_callback(bool(cb));
	auto h = to_handle(handle);

	auto w = create_request(fxp_fstat);
	w.write_data(h);

	execute(w, make_request(std::move(cb), &sftp_client::parse_attribs, handle_command{"fstat", to_byte_vector(h)}));
}

void sftp_client::setstat(std::string_view path, std::optional<file_stats> const& attrs, status_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	auto attributes = file_attributes::from_stats(attrs);

	auto w = create_request(fxp_setstat);
	w.write_string(p);
	attributes.write(w);

	execute(w, make_request(std::move(cb), &sftp_client::parse_status, path_command{"setstat", p}));
}

void sftp_client::fsetstat(file_handle const& handle, std::optional<file_stats> const& attrs, status_callback cb) {
	check_callback(bool(cb));
	auto h = to_handle(handle);
	auto attributes = file_attributes::from_stats(attrs);

	auto w = create_request(fxp_fsetstat);
	w.write_data(h);
	attributes.write(w);

	execute(w, make_request(std::move(cb), &sftp_client::parse_status, handle_command{"fsetstat", to_byte_vector(h)}));
}

void sftp_client::opendir(std::string_view path, handle_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	command(fxp_opendir, {p}, make_request(std::move(cb), &sftp_client::parse_handle, path_command{"opendir", p}));
}

void sftp_client::readdir(file_handle const& handle, entries_callback cb) {
	check_callback(bool(cb));
	auto h = to_handle(handle);

	auto w = create_request(fxp_readdir);
	w.write_data(h);

	execute(w, make_request(std::move(cb), &sftp_client::parse_items, handle_command{"readdir", to_byte_vector(h)}));
}

void sftp_client::unlink(std::string_view path, status_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	command(fxp_remove, {p}, make_request(std::move(cb), &sftp_client::parse_status, path_command{"unlink", p}));
}

void sftp_client::mkdir(std::string_view path, std::optional<file_stats> const& attrs, status_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	auto attributes = file_attributes::from_stats(attrs);

	auto w = create_request(fxp_mkdir);
	w.write_string(p);
	attributes.write(w);

	execute(w, make_request(std::move(cb), &sftp_client::parse_status, path_command{"mkdir", p}));
}

void sftp_client::rmdir(std::string_view path, status_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	command(fxp_rmdir, {p}, make_request(std::move(cb), &sftp_client::parse_status, path_command{"rmdir", p}));
}

void sftp_client::realpath(std::string_view path, path_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	command(fxp_realpath, {p}, make_request(std::move(cb), &sftp_client::parse_path, path_command{"realpath", p}));
}

void sftp_client::readlink(std::string_view path, path_callback cb) {
	check_callback(bool(cb));
	auto p = check_path(path, "path");
	command(fxp_readlink, {p}, make_request(std::move(cb), &sftp_client::parse_path, path_command{"readlink", p}));
}

void sftp_client::rename(std::string_view old_path, std::string_view new_path, rename_flags flags, status_callback cb) {
	check_callback(bool(cb));
	auto o = check_path(old_path, "old path");
	auto n = check_path(new_path, "new path");
	rename_command info{o, n, flags};

	switch(flags) {
		case rename_flags::none:
			command(fxp_rename, {o, n}, make_request(std::move(cb), &sftp_client::parse_status, std::move(info)));
			break;
		case rename_flags::overwrite:
			command(sftp_feature::posix_rename, {o, n}, make_request(std::move(cb), &sftp_client::parse_status, std::move(info)));
			break;
		default:
			post_failure(to_failure(std::move(cb)), sftp_error(fx_op_unsupported, "Unsupported rename flags", std::move(info)));
			break;
	}
}

void sftp_client::symlink(std::string_view target_path, std::string_view link_path, status_callback cb) {
	check_callback(bool(cb));
	auto t = check_path(target_path, "target path");
	auto l = check_path(link_path, "link path");
	command(fxp_symlink, {t, l}, make_request(std::move(cb), &sftp_client::parse_status, symlink_command{t, l}));
}

void sftp_client::link(std::string_view old_path, std::string_view new_path, status_callback cb) {
	check_callback(bool(cb));
	auto o = check_path(old_path, "old path");
	auto n = check_path(new_path, "new path");
	command(sftp_feature::hardlink, {o, n}, make_request(std::move(cb), &sftp_client::parse_status, link_command{o, n}));
}

sftp_error sftp_client::read_status(sftp_packet_reader& r, command_info const& info) {
	auto code = status_code(r.read_uint32());
	auto message = r.read_string_view();
	// language tag is not always sent
	if(r.size_left()) {
		r.skip_string();
	}
	return sftp_error(code, message, info);
}

sftp_error sftp_client::check_response(sftp_packet_reader& r, sftp_packet_type expected, command_info const& info) {
	if(r.type() == fxp_status) {
		auto err = read_status(r, info);
		if(err) {
			return err;
		}
	}
	if(r.type() != expected) {
		throw protocol_violation("Unexpected packet received");
	}
	return {};
}

std::optional<sftp_error> sftp_client::check_eof_response(sftp_packet_reader& r, sftp_packet_type expected, command_info const& info) {
	if(r.type() == fxp_status) {
		auto err = read_status(r, info);
		if(err.kind() == error_kind::eof) {
			return sftp_error{};
		}
		if(err) {
			return err;
		}
	}
	if(r.type() != expected) {
		throw protocol_violation("Unexpected packet received");
	}
	return std::nullopt;
}

sftp_client::completion sftp_client::parse_status(sftp_packet_reader& r, command_info const& info, status_callback const& cb) {
	return [cb, err = check_response(r, fxp_status, info)] { cb(err); };
}

sftp_client::completion sftp_client::parse_handle(sftp_packet_reader& r, command_info const& info, handle_callback const& cb) {
	if(auto err = check_response(r, fxp_handle, info)) {
		return [cb, err] { cb(err, file_handle{}); };
	}

	auto handle = r.read_data();
	if(handle.empty() || handle.size() > max_handle_length) {
		throw protocol_violation("Invalid handle length");
	}
	return [this, cb, handle = std::move(handle)] { cb(sftp_error{}, file_handle(handle, this)); };
}

sftp_client::completion sftp_client::parse_attribs(sftp_packet_reader& r, command_info const& info, stats_callback const& cb) {
	if(auto err = check_response(r, fxp_attrs, info)) {
		return [cb, err] { cb(err, file_stats{}); };
	}
	return [cb, stats = file_attributes::read(r).to_stats()] { cb(sftp_error{}, stats); };
}

sftp_client::completion sftp_client::parse_path(sftp_packet_reader& r, command_info const& info, path_callback const& cb) {
	if(auto err = check_response(r, fxp_name, info)) {
		return [cb, err] { cb(err, std::string{}); };
	}

	auto count = r.read_uint32();
	if(count != 1) {
		throw protocol_violation("Invalid response");
	}
	return [cb, path = r.read_string()] { cb(sftp_error{}, path); };
}

sftp_client::completion sftp_client::parse_items(sftp_packet_reader& r, command_info const& info, entries_callback const& cb) {
	if(auto err = check_eof_response(r, fxp_name, info)) {
		return [cb, err = std::move(*err)] { cb(err, std::vector<directory_entry>{}); };
	}

	auto count = r.read_uint32();
	std::vector<directory_entry> entries;
	// each entry takes at least 12 bytes
	entries.reserve(std::min<std::size_t>(count, r.size_left() / 12));
	for(std::uint32_t i = 0; i != count; ++i) {
		directory_entry e;
		e.filename = r.read_string();
		e.longname = r.read_string();
		e.stats = file_attributes::read(r).to_stats();
		entries.push_back(std::move(e));
	}
	return [cb, entries = std::move(entries)] { cb(sftp_error{}, entries); };
}

sftp_client::completion sftp_client::parse_data(sftp_packet_reader& r, command_info const& info, byte_vector const& handle, std::uint64_t position,
	std::uint32_t length, std::uint32_t retries, data_callback const& cb)
{
	if(auto err = check_eof_response(r, fxp_data, info)) {
		return [cb, err = std::move(*err)] { cb(err, byte_vector{}); };
	}

	auto data = r.read_data_view();
	if(data.size() > length) {
		throw protocol_violation("Received too much data");
	}

	if(data.empty()) {
		// some servers occasionally send empty data instead of EOF, try again before giving up
		if(retries >= config_.empty_read_retries) {
			return [cb, err = sftp_error(error_kind::io, fx_failure, "Unable to read data", info)] { cb(err, byte_vector{}); };
		}
		log_.log(logger::debug, "Empty data received, retrying read [position={}, retries={}]", position, retries + 1);
		return [this, handle, position, length, retries, cb, info] {
			send_read(handle, position, length, retries + 1, cb, info);
		};
	}

	return [cb, data = to_byte_vector(data)] { cb(sftp_error{}, data); };
}

}
