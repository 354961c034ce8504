#ifndef SP_SFTP_OPEN_FLAGS_HEADER
#define SP_SFTP_OPEN_FLAGS_HEADER

#include "packet_types.hpp"

#include <vector>

namespace securepath::sftp {

/// converts posix fopen style mode ("r", "w+", "ax", ...) to open flags, throws usage_error for unknown modes
std::uint32_t to_open_flags(std::string_view mode);

/// numeric flags are taken as they are but limited to the known bits
std::uint32_t to_open_flags(std::uint32_t flags);

/** \brief Removes the overlapping flag combinations
 *
 *  - excl cancels trunc (truncate does not apply when creating a new file)
 *  - trunc cancels append
 *  - read is implied if neither read or write is set
 *  - without creat only read and write apply, with creat write is required
 */
std::uint32_t normalise_open_flags(std::uint32_t flags);

/** \brief Converts open flags to mode strings
 *
 *  The first mode is the idiomatic one, the second (if any) is always valid read/write equivalent.
 *  Every normalised value has a mode, so failing here is sftp_defect.
 */
std::vector<std::string_view> from_open_flags(std::uint32_t flags);

}

#endif
