#pragma once

#include <atomic>

namespace pastebin
{
    namespace runtime
    {

        // Records SIGINT/SIGTERM so the main loop can shut down cleanly
        class SignalHandler
        {
        public:
            static void install();
            static bool is_shutdown_requested();

            // Clears the flag (tests)
            static void reset();

        private:
            static void handle_signal(int signal);
            static std::atomic<bool> shutdown_requested_;
        };

    } // namespace runtime
} // namespace pastebin
