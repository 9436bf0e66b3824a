#ifndef APGUARD_SERVICES_AUTO_OFF_TIMER_HPP
#define APGUARD_SERVICES_AUTO_OFF_TIMER_HPP

#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>

namespace apguard
{
    namespace services
    {

        /**
         * Background thread that fires once at a deadline unless cancelled first.
         * The callback receives the session id the timer was armed for; it must
         * check that session against persisted state before acting.
         */
        class AutoOffTimer
        {
        public:
            using Callback = std::function<void(const std::string &session_id)>;

            AutoOffTimer() = default;
            ~AutoOffTimer();

            AutoOffTimer(const AutoOffTimer &) = delete;
            AutoOffTimer &operator=(const AutoOffTimer &) = delete;

            // Re-arming cancels the previous deadline. Not callable from the callback.
            void arm(std::chrono::system_clock::time_point deadline, const std::string &session_id, Callback callback);

            // Waits for a running callback to return, unless called from that
            // callback. The worker thread is always joined, never detached.
            void cancel();

            bool armed() const;

        private:
            void run(std::chrono::system_clock::time_point deadline, std::string session_id, Callback callback);

            mutable std::mutex mutex_;
            std::condition_variable cv_;
            std::thread worker_;
            std::thread::id worker_id_;
            bool cancelled_ = false;
            bool armed_ = false;
        };

    } // namespace services
} // namespace apguard

#endif // APGUARD_SERVICES_AUTO_OFF_TIMER_HPP
