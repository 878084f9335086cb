#pragma once

#include <string>

#include "paste/paste_types.hpp"

namespace pastebin {
namespace http {

// Escapes &, <, >, " and ' for use in HTML text and attribute values
std::string escape_html(const std::string &text);

// Full HTML document showing one paste inside a <pre> block
std::string render_paste_page(const paste::PasteRecord &record);

}  // namespace http
}  // namespace pastebin
