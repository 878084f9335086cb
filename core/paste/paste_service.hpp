#ifndef PASTEBIN_PASTE_PASTE_SERVICE_HPP
#define PASTEBIN_PASTE_PASTE_SERVICE_HPP

#include <cstddef>
#include <optional>
#include <string>

#include "id_generator.hpp"
#include "paste_types.hpp"
#include "store/i_paste_store.hpp"

namespace pastebin {
namespace paste {

enum class PasteError {
    NONE,
    INVALID_INPUT,  // missing, non-string or empty content
    TOO_LONG,       // content over the configured maximum
    NOT_FOUND,      // unknown identifier
    STORAGE_ERROR   // store failure, details only in the log
};

const char *paste_error_to_string(PasteError error);

// Client-facing messages
constexpr const char *kInvalidContentMessage = "Invalid content.";
constexpr const char *kNotFoundMessage = "Paste not found.";
constexpr const char *kStorageErrorMessage = "Database error.";

struct PasteServiceOptions {
    std::size_t max_content_length = kDefaultMaxContentLength;
    int max_id_attempts = 5;  // identifier draws per create before giving up on collisions
};

// Create result - identifier and shareable URL on success
struct CreateResult {
    bool success = false;
    PasteError error = PasteError::NONE;
    std::string error_message;
    std::string id;
    std::string url;
};

// Get result - the stored row on success
struct GetResult {
    bool success = false;
    PasteError error = PasteError::NONE;
    std::string error_message;
    PasteRecord paste;
};

// PasteService - validation and record lifecycle for pastes
class PasteService {
public:
    PasteService(store::IPasteStore &store, IdGenerator &id_generator, PasteServiceOptions options = {});

    /**
     * Create a paste.
     *
     * `content` is empty (std::nullopt) when the request carried no string
     * content at all. `base_url` is the scheme and host the URL is built on,
     * without a trailing slash.
     */
    CreateResult create_paste(const std::optional<std::string> &content, const std::string &base_url);

    GetResult get_paste(const std::string &id);

private:
    store::IPasteStore &store_;
    IdGenerator &id_generator_;
    PasteServiceOptions options_;
};

// "Content too long. Maximum 10,000 characters allowed." for the given limit
std::string too_long_message(std::size_t max_content_length);

// Length of a UTF-8 string in UTF-16 code units (characters above U+FFFF count twice)
std::size_t utf16_length(const std::string &text);

}  // namespace paste
}  // namespace pastebin

#endif  // PASTEBIN_PASTE_PASTE_SERVICE_HPP
