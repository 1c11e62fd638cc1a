#pragma once

#include <string>
#include <utility>
#include <vector>

namespace txgate::native
{
    /**
     * Spawns a new process and waits for it to finish.
     * Standard output and standard error are captured together.
     *
     * @param command The executable to run, resolved through PATH
     * @param args The arguments to pass to the command
     * @return exit code (or -1 when the process could not be started) and captured output
     */
    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args = {});
}
