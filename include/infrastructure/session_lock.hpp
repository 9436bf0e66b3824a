#ifndef APGUARD_INFRASTRUCTURE_SESSION_LOCK_HPP
#define APGUARD_INFRASTRUCTURE_SESSION_LOCK_HPP

#include <string>
#include <chrono>

namespace apguard
{
    namespace infrastructure
    {

        /**
         * Exclusive advisory lock (flock) serializing every state mutation
         * across backend processes. Released on destruction.
         */
        class SessionLock
        {
        public:
            // Throws ConfigurationError if the lock is not acquired within timeout
            SessionLock(const std::string &path, std::chrono::milliseconds timeout);
            ~SessionLock();

            SessionLock(const SessionLock &) = delete;
            SessionLock &operator=(const SessionLock &) = delete;

            void release();
            bool held() const { return fd_ >= 0; }

        private:
            std::string path_;
            int fd_ = -1;
        };

    } // namespace infrastructure
} // namespace apguard

#endif // APGUARD_INFRASTRUCTURE_SESSION_LOCK_HPP
