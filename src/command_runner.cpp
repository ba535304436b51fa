// src/command_runner.cpp
#include "command_runner.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <sys/wait.h> // For WIFEXITED, WEXITSTATUS

namespace PageStitch
{
    namespace Process
    {

        CommandOutput runCommand(const std::string &command)
        {
            FILE *pipe = popen(command.c_str(), "r");
            if (!pipe)
            {
                throw std::runtime_error("Failed to open pipe to command: " + command);
            }

            std::string output;
            char buffer[4096];
            while (true)
            {
                size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
                if (n > 0) output.append(buffer, n);
                if (n < sizeof(buffer)) break;
            }

            int status = pclose(pipe);
            int exit_code = -1;
            if (status != -1 && WIFEXITED(status))
            {
                exit_code = WEXITSTATUS(status);
            }
            return CommandOutput{std::move(output), exit_code};
        }

        bool commandExists(const std::string &name)
        {
            std::string test = "command -v " + shellQuote(name) + " >/dev/null 2>&1";
            int rc = std::system(test.c_str());
            return rc == 0;
        }

        std::string shellQuote(const std::string &arg)
        {
            std::string quoted = "'";
            for (char c : arg)
            {
                if (c == '\'')
                {
                    quoted += "'\\''";
                }
                else
                {
                    quoted += c;
                }
            }
            quoted += "'";
            return quoted;
        }

    } // namespace Process
} // namespace PageStitch
