#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace pastebin
{
    namespace http
    {

        // Helper: Parse the paste id from regex matches
        inline bool parse_id_param(const httplib::Request &req, std::string &id)
        {
            if (req.matches.size() >= 2)
            {
                id = req.matches[1].str();
                return !id.empty();
            }
            return false;
        }

        // Helper: True if the request declares a JSON body (media type application/json, any parameters)
        inline bool is_json_request(const httplib::Request &req)
        {
            std::string media_type = req.get_header_value("Content-Type");
            media_type = media_type.substr(0, media_type.find(';'));
            media_type.erase(std::remove_if(media_type.begin(), media_type.end(),
                                            [](unsigned char c) { return std::isspace(c) != 0; }),
                             media_type.end());
            std::transform(media_type.begin(), media_type.end(), media_type.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return media_type == "application/json";
        }

        // Helper: Send JSON response with a raw HTTP status
        inline void send_json(httplib::Response &res, int http_status, const nlohmann::json &body)
        {
            res.status = http_status;
            // Stored content is valid UTF-8 (it arrived as JSON); replace rather than throw on anything else
            res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            send_json(res, status_code_to_http(code), body);
        }

        // Helper: Send plain text response
        inline void send_text(httplib::Response &res, StatusCode code, const std::string &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body, "text/plain; charset=utf-8");
        }

        // Helper: Send HTML response
        inline void send_html(httplib::Response &res, StatusCode code, const std::string &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body, "text/html; charset=utf-8");
        }

    } // namespace http
} // namespace pastebin
