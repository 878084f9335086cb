#include "json.hpp"

namespace pastebin {
namespace http {

nlohmann::json encode_created(const paste::CreateResult &result) {
    return {{"id", result.id}, {"url", result.url}};
}

nlohmann::json encode_paste(const paste::PasteRecord &record) {
    return {{"id", record.id}, {"content", record.content}, {"created_at", record.created_at}};
}

bool decode_create_request(const std::string &body, std::optional<std::string> &content, std::string &error) {
    content.reset();

    nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        error = "Request body is not valid JSON";
        return false;
    }
    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    auto it = json.find("content");
    if (it != json.end() && it->is_string()) {
        content = it->get<std::string>();
    }
    return true;
}

}  // namespace http
}  // namespace pastebin
