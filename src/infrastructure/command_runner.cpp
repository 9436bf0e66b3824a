/**
 * Bounded-time external tool execution
 */

#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <thread>

extern char **environ;

namespace apguard
{
    namespace infrastructure
    {

        namespace
        {
            constexpr int EXEC_FAILED = 127;

            int remaining_ms(std::chrono::steady_clock::time_point deadline)
            {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                return left.count() > 0 ? static_cast<int>(left.count()) : 0;
            }

            // Reaps the child, killing its process group once the deadline passes
            int wait_for_child(pid_t pid, std::chrono::steady_clock::time_point deadline, bool &timed_out)
            {
                int status = 0;
                while (true)
                {
                    pid_t result = waitpid(pid, &status, WNOHANG);
                    if (result == pid)
                    {
                        return status;
                    }
                    if (result < 0 && errno != EINTR)
                    {
                        return -1;
                    }
                    if (remaining_ms(deadline) == 0)
                    {
                        timed_out = true;
                        kill(-pid, SIGKILL);
                        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
                        {
                        }
                        return status;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            }
        } // namespace

        std::string describe_command(const std::vector<std::string> &argv)
        {
            std::ostringstream cmd;
            for (size_t i = 0; i < argv.size(); ++i)
            {
                if (i > 0)
                    cmd << " ";
                // Never echo a pre-shared key
                if (i > 0 && argv[i - 1] == "wifi-sec.psk")
                    cmd << "<redacted>";
                else
                    cmd << argv[i];
            }
            return cmd.str();
        }

        CommandResult ProcessCommandRunner::run(const std::vector<std::string> &argv,
                                                std::chrono::milliseconds timeout)
        {
            auto logger = core::get_logger("CommandRunner");
            CommandResult result;

            if (argv.empty())
            {
                result.spawn_failed = true;
                return result;
            }

            // Everything the child needs is prepared before fork
            std::vector<char *> args;
            for (const auto &arg : argv)
            {
                args.push_back(const_cast<char *>(arg.c_str()));
            }
            args.push_back(nullptr);

            std::vector<std::string> env_storage;
            for (char **env = environ; env && *env; ++env)
            {
                if (std::strncmp(*env, "LC_ALL=", 7) != 0 && std::strncmp(*env, "LANG=", 5) != 0)
                {
                    env_storage.emplace_back(*env);
                }
            }
            env_storage.emplace_back("LC_ALL=C");
            std::vector<char *> envp;
            for (auto &entry : env_storage)
            {
                envp.push_back(entry.data());
            }
            envp.push_back(nullptr);

            int pipe_fds[2];
            if (pipe2(pipe_fds, O_CLOEXEC) != 0)
            {
                logger->error("Failed to create pipe", core::LogContext().add("error", std::strerror(errno)));
                result.spawn_failed = true;
                return result;
            }

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                setpgid(0, 0);

                sigset_t empty;
                sigemptyset(&empty);
                sigprocmask(SIG_SETMASK, &empty, nullptr);

                int devnull = open("/dev/null", O_RDONLY);
                if (devnull >= 0)
                {
                    dup2(devnull, STDIN_FILENO);
                }
                dup2(pipe_fds[1], STDOUT_FILENO);
                dup2(pipe_fds[1], STDERR_FILENO);

                execvpe(args[0], args.data(), envp.data());
                _exit(EXEC_FAILED);
            }
            else if (pid < 0)
            {
                logger->error("Failed to fork", core::LogContext().add("command", argv[0]).add("error", std::strerror(errno)));
                close(pipe_fds[0]);
                close(pipe_fds[1]);
                result.spawn_failed = true;
                return result;
            }

            // Parent process
            close(pipe_fds[1]);
            const auto deadline = std::chrono::steady_clock::now() + timeout;

            char buffer[4096];
            bool eof = false;
            while (!eof)
            {
                int wait_ms = remaining_ms(deadline);
                if (wait_ms == 0)
                {
                    break;
                }

                struct pollfd pfd = {pipe_fds[0], POLLIN, 0};
                int ready = poll(&pfd, 1, wait_ms);
                if (ready < 0)
                {
                    if (errno == EINTR)
                        continue;
                    break;
                }
                if (ready == 0)
                {
                    continue;
                }

                ssize_t n = read(pipe_fds[0], buffer, sizeof(buffer));
                if (n > 0)
                {
                    result.output.append(buffer, static_cast<size_t>(n));
                }
                else if (n == 0 || errno != EINTR)
                {
                    eof = true;
                }
            }
            close(pipe_fds[0]);

            int status = wait_for_child(pid, deadline, result.timed_out);
            if (result.timed_out)
            {
                logger->warning("Command timed out",
                                core::LogContext()
                                    .add("command", describe_command(argv))
                                    .add("timeout_ms", timeout.count()));
                return result;
            }

            if (status >= 0 && WIFEXITED(status))
            {
                result.exit_code = WEXITSTATUS(status);
                if (result.exit_code == EXEC_FAILED && result.output.empty())
                {
                    result.spawn_failed = true;
                }
            }
            else
            {
                result.exit_code = -1;
            }

            logger->debug("Command finished",
                          core::LogContext()
                              .add("command", argv[0])
                              .add("exit_code", result.exit_code));
            return result;
        }

    } // namespace infrastructure
} // namespace apguard
