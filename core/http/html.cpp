#include "html.hpp"

#include <sstream>

namespace pastebin {
namespace http {

std::string escape_html(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#39;";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    return out;
}

std::string render_paste_page(const paste::PasteRecord &record) {
    const std::string id = escape_html(record.id);

    std::ostringstream page;
    page << "<!DOCTYPE html>\n"
         << "<html lang=\"en\">\n"
         << "<head>\n"
         << "  <meta charset=\"UTF-8\">\n"
         << "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
         << "  <title>Paste " << id << "</title>\n"
         << "  <style>\n"
         << "    body { font-family: Arial, sans-serif; margin: 20px; padding: 0; }\n"
         << "    pre { background-color: #f4f4f4; padding: 15px; border: 1px solid #ddd; }\n"
         << "  </style>\n"
         << "</head>\n"
         << "<body>\n"
         << "  <h1>Paste " << id << "</h1>\n"
         << "  <pre>" << escape_html(record.content) << "</pre>\n"
         << "  <p>Created at: " << escape_html(record.created_at) << " UTC</p>\n"
         << "</body>\n"
         << "</html>\n";
    return page.str();
}

}  // namespace http
}  // namespace pastebin
