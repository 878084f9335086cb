#pragma once

#include <string>

#include "paste/paste_types.hpp"

namespace pastebin {
namespace store {

enum class StoreStatus {
    OK,
    NOT_FOUND,
    CONSTRAINT_VIOLATION,  // primary key already taken
    ERROR
};

const char *store_status_to_string(StoreStatus status);

// Interface for the paste table to enable mocking.
// On any status other than OK, `error` carries the underlying message.
class IPasteStore {
public:
    virtual ~IPasteStore() = default;

    virtual StoreStatus insert(const std::string &id, const std::string &content, std::string &error) = 0;
    virtual StoreStatus get_by_id(const std::string &id, paste::PasteRecord &record, std::string &error) = 0;
};

}  // namespace store
}  // namespace pastebin
