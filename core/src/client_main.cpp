// Pastebin Client
// Submits content from --content or stdin and prints the paste URL

#include <iostream>
#include <iterator>
#include <string>

#include "client/paste_client.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    std::string server_url = "http://127.0.0.1:3000"; // Default
    std::string content;
    bool has_content = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg.substr(0, 9) == "--server=")
        {
            server_url = arg.substr(9);
        }
        else if (arg.substr(0, 10) == "--content=")
        {
            content = arg.substr(10);
            has_content = true;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            pastebin::logging::Logger::set_level(pastebin::logging::Level::LVL_DEBUG);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: pastebin-client [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --server=URL     Server base URL (default: http://127.0.0.1:3000)\n";
            std::cerr << "  --content=TEXT   Paste content (default: read from stdin)\n";
            std::cerr << "  --verbose, -v    Log request details\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!has_content)
    {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    // Client diagnostics stay quiet unless asked for
    if (pastebin::logging::Logger::level() != pastebin::logging::Level::LVL_DEBUG)
    {
        pastebin::logging::Logger::set_level(pastebin::logging::Level::LVL_ERROR);
    }

    pastebin::client::PasteClient client(server_url);
    auto result = client.submit(content);

    if (result.outcome == pastebin::client::SubmitOutcome::CREATED)
    {
        std::cout << result.message << "\n";
        return 0;
    }

    std::cerr << result.message << "\n";
    return 1;
}
