#ifndef LOGSKETCH_ERRORCODE_HPP
#define LOGSKETCH_ERRORCODE_HPP

namespace logsketch {
typedef enum {
    ErrorCodeSuccess = 0,
    ErrorCodeBadParam,
    ErrorCodeOutOfBounds,
    ErrorCodeFileNotFound,
    ErrorCodeCorrupt,
    ErrorCodeFailure,
    ErrorCodeUnsupported
} ErrorCode;
}  // namespace logsketch

#endif  // LOGSKETCH_ERRORCODE_HPP
