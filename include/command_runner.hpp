// include/command_runner.hpp
#pragma once

#include <string>

namespace PageStitch
{
    namespace Process
    {

        struct CommandOutput
        {
            std::string output;  // everything the command wrote to stdout
            int exit_code;       // -1 if the command was killed or did not exit normally
        };

        // Run a shell command and capture its stdout.
        // Throws std::runtime_error if the pipe cannot be opened.
        CommandOutput runCommand(const std::string &command);

        // True if `command -v name` succeeds.
        bool commandExists(const std::string &name);

        // Quote a single argument for /bin/sh.
        std::string shellQuote(const std::string &arg);

    } // namespace Process
} // namespace PageStitch
