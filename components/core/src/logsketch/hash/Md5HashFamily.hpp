#ifndef LOGSKETCH_HASH_MD5HASHFAMILY_HPP
#define LOGSKETCH_HASH_MD5HASHFAMILY_HPP

#include <cstdint>
#include <memory>
#include <string_view>

#include "../Defs.hpp"
#include "../TraceableException.hpp"
#include "HashFamily.hpp"

namespace logsketch::hash {

/**
 * Digest-based family. Member 0 hashes the plain value, member i > 0 hashes the value prefixed
 * with the four little-endian bytes of i. The first eight digest bytes, read little-endian, are
 * the hash value.
 */
class Md5HashFamily : public IHashFamily {
public:
    // Types
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(ErrorCode error_code, char const* const filename, int line_number)
                : TraceableException(error_code, filename, line_number) {}

        [[nodiscard]] auto what() const noexcept -> char const* override {
            return "Md5HashFamily operation failed";
        }
    };

    Md5HashFamily() = default;

    [[nodiscard]] auto hash(std::string_view value, uint32_t index) const -> uint64_t override;

    [[nodiscard]] auto get_hash_width() const -> uint32_t override { return cHashWidth; }

    [[nodiscard]] auto get_type() const -> HashFamilyType override { return HashFamilyType::Md5; }

    [[nodiscard]] auto clone() const -> std::unique_ptr<IHashFamily> override {
        return std::make_unique<Md5HashFamily>();
    }
};

}  // namespace logsketch::hash

#endif  // LOGSKETCH_HASH_MD5HASHFAMILY_HPP
