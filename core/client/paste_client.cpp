#include "paste_client.hpp"

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <utility>

#include "logging/logger.hpp"

namespace pastebin {
namespace client {

namespace {

SubmitResult unexpected() {
    SubmitResult result;
    result.outcome = SubmitOutcome::UNEXPECTED;
    result.message = kUnexpectedErrorMessage;
    return result;
}

}  // namespace

std::string trim(const std::string &text) {
    const char *whitespace = " \t\n\r\f\v";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

PasteClient::PasteClient(std::string server_url, int timeout_seconds)
    : server_url_(std::move(server_url)), timeout_seconds_(timeout_seconds) {}

SubmitResult PasteClient::submit(const std::string &content) const {
    const std::string trimmed = trim(content);
    if (trimmed.empty()) {
        SubmitResult result;
        result.outcome = SubmitOutcome::EMPTY_INPUT;
        result.message = kEmptyContentMessage;
        return result;
    }

    httplib::Client http_client(server_url_);
    http_client.set_connection_timeout(timeout_seconds_, 0);
    http_client.set_read_timeout(timeout_seconds_, 0);

    const nlohmann::json request_body = {{"content", trimmed}};
    // Invalid UTF-8 in the input is sent as U+FFFD instead of failing the request
    const std::string payload = request_body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto res = http_client.Post("/api/paste", payload, "application/json");
    if (!res) {
        LOG_WARN("[Client] Request to " << server_url_ << " failed: " << httplib::to_string(res.error()));
        return unexpected();
    }

    const nlohmann::json body = nlohmann::json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        LOG_WARN("[Client] Unreadable response (HTTP " << res->status << ")");
        return unexpected();
    }

    auto error_it = body.find("error");
    if (error_it != body.end()) {
        SubmitResult result;
        result.outcome = SubmitOutcome::SERVER_ERROR;
        result.message = "Error: " + (error_it->is_string() ? error_it->get<std::string>() : error_it->dump());
        return result;
    }

    auto url_it = body.find("url");
    if (url_it == body.end() || !url_it->is_string()) {
        LOG_WARN("[Client] Response without url (HTTP " << res->status << ")");
        return unexpected();
    }

    SubmitResult result;
    result.outcome = SubmitOutcome::CREATED;
    result.url = url_it->get<std::string>();
    result.message = "Paste created! " + result.url;
    return result;
}

}  // namespace client
}  // namespace pastebin
