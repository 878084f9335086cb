#include "paste_service.hpp"

#include <cstddef>
#include <exception>

#include "logging/logger.hpp"

namespace pastebin {
namespace paste {

namespace {

CreateResult create_failure(PasteError error, const std::string &message) {
    CreateResult result;
    result.error = error;
    result.error_message = message;
    return result;
}

GetResult get_failure(PasteError error, const char *message) {
    GetResult result;
    result.error = error;
    result.error_message = message;
    return result;
}

}  // namespace

const char *paste_error_to_string(PasteError error) {
    switch (error) {
        case PasteError::NONE:
            return "NONE";
        case PasteError::INVALID_INPUT:
            return "INVALID_INPUT";
        case PasteError::TOO_LONG:
            return "TOO_LONG";
        case PasteError::NOT_FOUND:
            return "NOT_FOUND";
        case PasteError::STORAGE_ERROR:
            return "STORAGE_ERROR";
        default:
            return "UNKNOWN";
    }
}

std::string too_long_message(std::size_t max_content_length) {
    std::string digits = std::to_string(max_content_length);
    for (std::ptrdiff_t pos = static_cast<std::ptrdiff_t>(digits.size()) - 3; pos > 0; pos -= 3) {
        digits.insert(static_cast<std::size_t>(pos), 1, ',');
    }
    return "Content too long. Maximum " + digits + " characters allowed.";
}

std::size_t utf16_length(const std::string &text) {
    std::size_t count = 0;
    for (unsigned char c : text) {
        // Continuation bytes are 10xxxxxx
        if ((c & 0xC0) == 0x80) {
            continue;
        }
        // 4-byte sequences lie outside the BMP and take a surrogate pair
        count += (c & 0xF8) == 0xF0 ? 2 : 1;
    }
    return count;
}

PasteService::PasteService(store::IPasteStore &store, IdGenerator &id_generator, PasteServiceOptions options)
    : store_(store), id_generator_(id_generator), options_(options) {
    if (options_.max_id_attempts < 1) {
        options_.max_id_attempts = 1;
    }
}

CreateResult PasteService::create_paste(const std::optional<std::string> &content, const std::string &base_url) {
    if (!content || content->empty()) {
        LOG_DEBUG("[Service] Rejected create: missing or empty content");
        return create_failure(PasteError::INVALID_INPUT, kInvalidContentMessage);
    }

    const std::size_t length = utf16_length(*content);
    if (length > options_.max_content_length) {
        LOG_DEBUG("[Service] Rejected create: content length " << length << " over " << options_.max_content_length);
        return create_failure(PasteError::TOO_LONG, too_long_message(options_.max_content_length));
    }

    for (int attempt = 1; attempt <= options_.max_id_attempts; ++attempt) {
        std::string id;
        try {
            id = id_generator_.generate();
        } catch (const std::exception &e) {
            LOG_ERROR("[Service] Identifier generation failed: " << e.what());
            return create_failure(PasteError::STORAGE_ERROR, kStorageErrorMessage);
        }

        std::string error;
        const store::StoreStatus status = store_.insert(id, *content, error);

        if (status == store::StoreStatus::OK) {
            CreateResult result;
            result.success = true;
            result.id = id;
            result.url = base_url + "/" + id;
            LOG_INFO("[Service] Created paste " << id);
            return result;
        }

        if (status == store::StoreStatus::CONSTRAINT_VIOLATION) {
            LOG_WARN("[Service] Identifier collision on " << id << " (attempt " << attempt << "/"
                                                          << options_.max_id_attempts << ")");
            continue;
        }

        LOG_ERROR("[Service] Error inserting paste (" << store::store_status_to_string(status) << "): " << error);
        return create_failure(PasteError::STORAGE_ERROR, kStorageErrorMessage);
    }

    LOG_ERROR("[Service] Error inserting paste: no free identifier after " << options_.max_id_attempts
                                                                           << " attempts");
    return create_failure(PasteError::STORAGE_ERROR, kStorageErrorMessage);
}

GetResult PasteService::get_paste(const std::string &id) {
    GetResult result;
    std::string error;
    const store::StoreStatus status = store_.get_by_id(id, result.paste, error);

    switch (status) {
        case store::StoreStatus::OK:
            result.success = true;
            return result;
        case store::StoreStatus::NOT_FOUND:
            return get_failure(PasteError::NOT_FOUND, kNotFoundMessage);
        default:
            LOG_ERROR("[Service] Error retrieving paste " << id << " (" << store::store_status_to_string(status)
                                                          << "): " << error);
            return get_failure(PasteError::STORAGE_ERROR, kStorageErrorMessage);
    }
}

}  // namespace paste
}  // namespace pastebin
