#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "paste/paste_service.hpp"

namespace pastebin
{
    namespace http
    {

        /**
         * @brief Response status codes mapped to HTTP status codes
         *
         * - OK -> HTTP 200
         * - CREATED -> HTTP 201
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            CREATED,
            INVALID_ARGUMENT,
            NOT_FOUND,
            INTERNAL
        };

        /**
         * @brief Convert StatusCode to HTTP status integer
         */
        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::CREATED:
                return 201;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        /**
         * @brief Map a paste service failure to a response status
         */
        inline StatusCode paste_error_to_status(paste::PasteError error)
        {
            switch (error)
            {
            case paste::PasteError::NONE:
                return StatusCode::OK;
            case paste::PasteError::INVALID_INPUT:
            case paste::PasteError::TOO_LONG:
                return StatusCode::INVALID_ARGUMENT;
            case paste::PasteError::NOT_FOUND:
                return StatusCode::NOT_FOUND;
            case paste::PasteError::STORAGE_ERROR:
                return StatusCode::INTERNAL;
            default:
                return StatusCode::INTERNAL;
            }
        }

        /**
         * @brief Build a complete JSON error response
         *
         * Error bodies carry a single "error" field with a client-facing message.
         * Internal details never appear here; they go to the server log.
         */
        inline nlohmann::json make_error_response(const std::string &message)
        {
            return {{"error", message}};
        }

    } // namespace http
} // namespace pastebin
