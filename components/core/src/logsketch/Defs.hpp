#ifndef LOGSKETCH_DEFS_HPP
#define LOGSKETCH_DEFS_HPP

#include <cstddef>
#include <cstdint>

// The build passes the length of the source root so exception traces carry a relative path
#ifndef SOURCE_PATH_SIZE
#define SOURCE_PATH_SIZE 0
#endif
#define __FILENAME__ ((__FILE__) + SOURCE_PATH_SIZE)

namespace logsketch {
// Width in bits of every hash family in this library
constexpr uint32_t cHashWidth = 64;
}  // namespace logsketch

#endif  // LOGSKETCH_DEFS_HPP
