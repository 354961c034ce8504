#include "open_flags.hpp"
#include "errors.hpp"

namespace securepath::sftp {

std::uint32_t to_open_flags(std::string_view mode) {
	if(mode == "r") {
		return fxf_read;
	}
	if(mode == "r+") {
		return fxf_read | fxf_write;
	}
	if(mode == "w") {
		return fxf_write | fxf_creat | fxf_trunc;
	}
	if(mode == "w+") {
		return fxf_write | fxf_creat | fxf_trunc | fxf_read;
	}
	if(mode == "wx" || mode == "xw") {
		return fxf_write | fxf_creat | fxf_excl;
	}
	if(mode == "wx+" || mode == "xw+") {
		return fxf_write | fxf_creat | fxf_excl | fxf_read;
	}
	if(mode == "a") {
		return fxf_write | fxf_creat | fxf_append;
	}
	if(mode == "a+") {
		return fxf_write | fxf_creat | fxf_append | fxf_read;
	}
	if(mode == "ax" || mode == "xa") {
		return fxf_write | fxf_creat | fxf_append | fxf_excl;
	}
	if(mode == "ax+" || mode == "xa+") {
		return fxf_write | fxf_creat | fxf_append | fxf_excl | fxf_read;
	}
	throw usage_error("Invalid flags '" + std::string(mode) + "'");
}

std::uint32_t to_open_flags(std::uint32_t flags) {
	return flags & fxf_all;
}

std::uint32_t normalise_open_flags(std::uint32_t flags) {
	flags &= fxf_all;

	if(flags & fxf_excl) {
		flags &= ~std::uint32_t(fxf_trunc);
	}

	if(flags & fxf_trunc) {
		flags &= ~std::uint32_t(fxf_append);
	}

	if(!(flags & (fxf_read | fxf_write))) {
		flags |= fxf_read;
	}

	if(flags & fxf_creat) {
		flags |= fxf_write;
	} else {
		flags &= fxf_read | fxf_write;
	}

	return flags;
}

std::vector<std::string_view> from_open_flags(std::uint32_t flags) {
	switch(normalise_open_flags(flags)) {
		case fxf_read:                                           return {"r"};
		case fxf_write:                                          return {"r+"};
		case fxf_read | fxf_write:                               return {"r+"};
		case fxf_write | fxf_creat:                              return {"wx", "r+"};
		case fxf_read | fxf_write | fxf_creat:                   return {"wx+", "r+"};
		case fxf_write | fxf_creat | fxf_append:                 return {"a"};
		case fxf_read | fxf_write | fxf_creat | fxf_append:      return {"a+"};
		case fxf_write | fxf_creat | fxf_trunc:                  return {"w"};
		case fxf_read | fxf_write | fxf_creat | fxf_trunc:       return {"w+"};
		case fxf_write | fxf_creat | fxf_excl:                   return {"wx"};
		case fxf_read | fxf_write | fxf_creat | fxf_excl:        return {"wx+"};
		case fxf_write | fxf_creat | fxf_append | fxf_excl:      return {"ax"};
		case fxf_read | fxf_write | fxf_creat | fxf_append | fxf_excl: return {"ax+"};
		default: break;
	}

	throw sftp_defect("Unsupported flags");
}

}
