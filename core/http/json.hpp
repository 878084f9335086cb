#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "paste/paste_service.hpp"
#include "paste/paste_types.hpp"

namespace pastebin {
namespace http {

/**
 * @brief JSON encoding utilities for paste API bodies
 *
 * Response shapes:
 * - created:  {"id", "url"}
 * - paste:    {"id", "content", "created_at"}
 */

nlohmann::json encode_created(const paste::CreateResult &result);
nlohmann::json encode_paste(const paste::PasteRecord &record);

/**
 * @brief Decode a create request body
 *
 * Returns false with `error` set if the body is not a JSON object.
 * Otherwise returns true; `content` holds the "content" member when it
 * is present and a string, std::nullopt otherwise.
 */
bool decode_create_request(const std::string &body, std::optional<std::string> &content, std::string &error);

}  // namespace http
}  // namespace pastebin
