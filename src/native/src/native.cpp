#include "native.h"

#if !defined(__unix__) && !defined(__APPLE__)
#   error "Error, unsupported platform"
#endif

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace txgate::native
{
    namespace
    {
        // both ends close on exec so concurrent spawns never inherit each other's pipes
        bool _openPipe(int (&pipe_fds)[2])
        {
#if defined(__linux__)
            return pipe2(pipe_fds, O_CLOEXEC) == 0;
#else
            if(pipe(pipe_fds) != 0)
            {
                return false;
            }
            for(const int fd : pipe_fds)
            {
                if(fcntl(fd, F_SETFD, FD_CLOEXEC) != 0)
                {
                    close(pipe_fds[0]);
                    close(pipe_fds[1]);
                    return false;
                }
            }
            return true;
#endif
        }
    }

    std::pair<int, std::string> runProcess(const std::string & command, std::vector<std::string> args)
    {
        int pipe_fds[2];
        if(!_openPipe(pipe_fds))
        {
            spdlog::error("Failed to create pipe for '{}'", command);
            return {-1, ""};
        }

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(command.c_str()));
        for(std::string & arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        const pid_t pid = fork();
        if(pid < 0)
        {
            close(pipe_fds[0]);
            close(pipe_fds[1]);
            spdlog::error("Failed to fork for '{}'", command);
            return {-1, ""};
        }

        if(pid == 0)
        {
            dup2(pipe_fds[1], STDOUT_FILENO);
            dup2(pipe_fds[1], STDERR_FILENO);
            close(pipe_fds[0]);
            close(pipe_fds[1]);
            execvp(command.c_str(), argv.data());
            _exit(127);
        }

        close(pipe_fds[1]);

        std::string output;
        std::array<char, 4096> buffer{};
        while(true)
        {
            const ssize_t n = read(pipe_fds[0], buffer.data(), buffer.size());
            if(n > 0)
            {
                output.append(buffer.data(), static_cast<std::size_t>(n));
                continue;
            }
            if(n < 0 && errno == EINTR)
            {
                continue;
            }
            break;
        }
        close(pipe_fds[0]);

        int status = 0;
        while(waitpid(pid, &status, 0) < 0)
        {
            if(errno != EINTR)
            {
                return {-1, output};
            }
        }

        if(WIFEXITED(status))
        {
            return {WEXITSTATUS(status), output};
        }
        return {-1, output};
    }
}
