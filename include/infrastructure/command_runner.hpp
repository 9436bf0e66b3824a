#ifndef APGUARD_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define APGUARD_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <string>
#include <vector>
#include <chrono>

namespace apguard
{
    namespace infrastructure
    {

        struct CommandResult
        {
            int exit_code = -1;
            std::string output; // stdout and stderr, interleaved
            bool timed_out = false;
            bool spawn_failed = false;

            bool ok() const { return !timed_out && !spawn_failed && exit_code == 0; }
        };

        std::string describe_command(const std::vector<std::string> &argv);

        /**
         * Runs an external tool. Implementations must never block longer than
         * the given timeout.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            virtual CommandResult run(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout) = 0;
        };

        /**
         * fork/execvp runner. The child gets its own process group so a hung
         * tool and anything it spawned can be killed as a whole on timeout.
         */
        class ProcessCommandRunner : public CommandRunner
        {
        public:
            CommandResult run(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout) override;
        };

    } // namespace infrastructure
} // namespace apguard

#endif // APGUARD_INFRASTRUCTURE_COMMAND_RUNNER_HPP
