#pragma once

#include <cstddef>
#include <string>

namespace pastebin {
namespace paste {

// Interface for identifier generation to enable deterministic tests
class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    // Returns a new identifier. Throws std::runtime_error if no identifier can be produced.
    virtual std::string generate() = 0;
};

/**
 * @brief Random paste identifiers
 *
 * Draws kIdBytes bytes from the OpenSSL CSPRNG and renders them as
 * lowercase hex (8 characters). No uniqueness guarantee: callers handle
 * collisions at insertion time.
 */
class RandomIdGenerator : public IdGenerator {
public:
    std::string generate() override;
};

// Lowercase hex rendering of a byte buffer
std::string to_hex(const unsigned char *data, std::size_t size);

}  // namespace paste
}  // namespace pastebin
