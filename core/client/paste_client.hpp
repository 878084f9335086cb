#pragma once

#include <string>

namespace pastebin {
namespace client {

enum class SubmitOutcome {
    CREATED,       // paste stored, url set
    EMPTY_INPUT,   // rejected locally, no request sent
    SERVER_ERROR,  // server answered with {"error": ...}
    UNEXPECTED     // network failure or unreadable response
};

struct SubmitResult {
    SubmitOutcome outcome = SubmitOutcome::UNEXPECTED;
    std::string message;  // line to show the user
    std::string url;      // shareable URL when CREATED
};

constexpr const char *kEmptyContentMessage = "Content cannot be empty.";
constexpr const char *kUnexpectedErrorMessage = "Unexpected error. Please try again.";

/**
 * @brief Submits pastes to a running server
 *
 * Trims the input, refuses empty content without contacting the server,
 * otherwise POSTs {"content": ...} to /api/paste and turns the answer into
 * a user-facing line.
 */
class PasteClient {
public:
    // server_url is scheme://host[:port], e.g. http://127.0.0.1:3000
    explicit PasteClient(std::string server_url, int timeout_seconds = 5);

    SubmitResult submit(const std::string &content) const;

private:
    std::string server_url_;
    int timeout_seconds_;
};

// Strips leading and trailing whitespace
std::string trim(const std::string &text);

}  // namespace client
}  // namespace pastebin
