#pragma once

#include <cstddef>
#include <string>

namespace pastebin {
namespace paste {

// Length limits and identifier shape
constexpr std::size_t kDefaultMaxContentLength = 10000;
constexpr std::size_t kIdBytes = 4;
constexpr std::size_t kIdLength = kIdBytes * 2;

// A stored paste row
struct PasteRecord {
    std::string id;
    std::string content;
    std::string created_at;  // "YYYY-MM-DD HH:MM:SS", UTC, assigned by the store
};

}  // namespace paste
}  // namespace pastebin
