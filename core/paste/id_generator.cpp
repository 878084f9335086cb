#include "id_generator.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <stdexcept>

#include "paste_types.hpp"

namespace pastebin {
namespace paste {

std::string RandomIdGenerator::generate() {
    std::array<unsigned char, kIdBytes> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        throw std::runtime_error(std::string("RAND_bytes failed: ") + buf);
    }
    return to_hex(bytes.data(), bytes.size());
}

std::string to_hex(const unsigned char *data, std::size_t size) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace paste
}  // namespace pastebin
