#ifndef APGUARD_INFRASTRUCTURE_PROCESS_CONTROL_HPP
#define APGUARD_INFRASTRUCTURE_PROCESS_CONTROL_HPP

#include <string>
#include <sys/types.h>

namespace apguard
{
    namespace infrastructure
    {

        /**
         * Process identity and signalling
         */
        class ProcessControl
        {
        public:
            virtual ~ProcessControl() = default;

            virtual pid_t self_pid() const = 0;
            virtual bool is_root() const = 0;

            // Liveness check by signalling the process (signal 0)
            virtual bool is_alive(pid_t pid) const = 0;

            // Stable while the process lives and different for a later process
            // reusing the pid; empty if the process does not exist
            virtual std::string identity(pid_t pid) const = 0;

            // SIGTERM / SIGKILL; false if the signal could not be delivered
            virtual bool terminate(pid_t pid) = 0;
            virtual bool kill(pid_t pid) = 0;
        };

        class PosixProcessControl : public ProcessControl
        {
        public:
            pid_t self_pid() const override;
            bool is_root() const override;
            bool is_alive(pid_t pid) const override;
            std::string identity(pid_t pid) const override;
            bool terminate(pid_t pid) override;
            bool kill(pid_t pid) override;
        };

    } // namespace infrastructure
} // namespace apguard

#endif // APGUARD_INFRASTRUCTURE_PROCESS_CONTROL_HPP
