#include <optional>
#include <string>

#include "../../logging/logger.hpp"
#include "../../paste/paste_service.hpp"
#include "../html.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace pastebin {
namespace http {

//=============================================================================
// POST /api/paste
//=============================================================================
void HttpServer::handle_post_paste(const httplib::Request &req, httplib::Response &res) {
    // Bodies not declared as JSON are not parsed and count as missing content
    if (!is_json_request(req)) {
        LOG_DEBUG("[HTTP] Rejected create request: Content-Type '" << req.get_header_value("Content-Type")
                                                                    << "' is not application/json");
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(paste::kInvalidContentMessage));
        return;
    }

    std::optional<std::string> content;
    std::string decode_error;
    if (!decode_create_request(req.body, content, decode_error)) {
        LOG_DEBUG("[HTTP] Rejected create request: " << decode_error);
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(paste::kInvalidContentMessage));
        return;
    }

    auto result = service_.create_paste(content, base_url_for(req));
    if (!result.success) {
        const StatusCode status = paste_error_to_status(result.error);
        LOG_DEBUG("[HTTP] Create failed: " << paste::paste_error_to_string(result.error));
        send_json(res, status, make_error_response(result.error_message));
        return;
    }

    send_json(res, StatusCode::CREATED, encode_created(result));
}

//=============================================================================
// GET /api/paste/{id}
//=============================================================================
void HttpServer::handle_get_paste(const httplib::Request &req, httplib::Response &res) {
    std::string id;
    if (!parse_id_param(req, id)) {
        send_json(res, StatusCode::NOT_FOUND, make_error_response(paste::kNotFoundMessage));
        return;
    }

    auto result = service_.get_paste(id);
    if (!result.success) {
        send_json(res, paste_error_to_status(result.error), make_error_response(result.error_message));
        return;
    }

    send_json(res, StatusCode::OK, encode_paste(result.paste));
}

//=============================================================================
// GET /{id}
//=============================================================================
void HttpServer::handle_get_paste_page(const httplib::Request &req, httplib::Response &res) {
    std::string id;
    if (!parse_id_param(req, id)) {
        send_text(res, StatusCode::NOT_FOUND, paste::kNotFoundMessage);
        return;
    }

    auto result = service_.get_paste(id);
    if (!result.success) {
        send_text(res, paste_error_to_status(result.error), result.error_message);
        return;
    }

    send_html(res, StatusCode::OK, render_paste_page(result.paste));
}

}  // namespace http
}  // namespace pastebin
