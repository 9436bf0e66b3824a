#include "infrastructure/process_control.hpp"

#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <fstream>
#include <sstream>

namespace apguard
{
    namespace infrastructure
    {

        pid_t PosixProcessControl::self_pid() const
        {
            return getpid();
        }

        bool PosixProcessControl::is_root() const
        {
            return geteuid() == 0;
        }

        bool PosixProcessControl::is_alive(pid_t pid) const
        {
            if (pid <= 0)
                return false;
            // EPERM still means the process exists
            return ::kill(pid, 0) == 0 || errno == EPERM;
        }

        std::string PosixProcessControl::identity(pid_t pid) const
        {
            if (pid <= 0)
                return "";

            std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
            std::string line;
            if (!stat || !std::getline(stat, line))
                return "";

            // The command name may contain spaces and parentheses; fields resume after the last ')'
            const auto close = line.rfind(')');
            if (close == std::string::npos)
                return "";

            // Field 3 (state) is the first after the name; field 22 is starttime
            std::istringstream fields(line.substr(close + 1));
            std::string field;
            for (int index = 3; index <= 22; ++index)
            {
                if (!(fields >> field))
                    return "";
            }
            return field;
        }

        bool PosixProcessControl::terminate(pid_t pid)
        {
            return pid > 0 && ::kill(pid, SIGTERM) == 0;
        }

        bool PosixProcessControl::kill(pid_t pid)
        {
            return pid > 0 && ::kill(pid, SIGKILL) == 0;
        }

    } // namespace infrastructure
} // namespace apguard
