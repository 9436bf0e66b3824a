#include "infrastructure/session_lock.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "core/logger.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <cerrno>
#include <cstring>
#include <thread>

namespace apguard
{
    namespace infrastructure
    {

        namespace
        {
            constexpr auto RETRY_INTERVAL = std::chrono::milliseconds(50);
        }

        SessionLock::SessionLock(const std::string &path, std::chrono::milliseconds timeout)
            : path_(path)
        {
            auto logger = core::get_logger("SessionLock");
            core::files::ensure_private_parent_directory(path_, geteuid());

            fd_ = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC | O_NOFOLLOW, 0600);
            if (fd_ < 0)
            {
                throw core::ConfigurationError("Cannot open lock file " + path_ + ": " + std::strerror(errno));
            }

            const auto deadline = std::chrono::steady_clock::now() + timeout;
            while (flock(fd_, LOCK_EX | LOCK_NB) != 0)
            {
                if (errno != EWOULDBLOCK && errno != EINTR)
                {
                    const std::string error = std::strerror(errno);
                    close(fd_);
                    fd_ = -1;
                    throw core::ConfigurationError("Cannot lock " + path_ + ": " + error);
                }
                if (std::chrono::steady_clock::now() >= deadline)
                {
                    close(fd_);
                    fd_ = -1;
                    throw core::ConfigurationError("Another backend instance holds " + path_ +
                                                   "; gave up after " + std::to_string(timeout.count()) + " ms");
                }
                std::this_thread::sleep_for(RETRY_INTERVAL);
            }

            logger->debug("Session lock acquired", core::LogContext().add("path", path_));
        }

        SessionLock::~SessionLock()
        {
            release();
        }

        void SessionLock::release()
        {
            if (fd_ < 0)
                return;
            flock(fd_, LOCK_UN);
            close(fd_);
            fd_ = -1;
        }

    } // namespace infrastructure
} // namespace apguard
