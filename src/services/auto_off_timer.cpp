#include "services/auto_off_timer.hpp"
#include "core/logger.hpp"

namespace apguard
{
    namespace services
    {

        AutoOffTimer::~AutoOffTimer()
        {
            cancel();
        }

        void AutoOffTimer::arm(std::chrono::system_clock::time_point deadline, const std::string &session_id,
                               Callback callback)
        {
            cancel();

            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = false;
            armed_ = true;
            worker_ = std::thread(&AutoOffTimer::run, this, deadline, session_id, std::move(callback));
            worker_id_ = worker_.get_id();

            core::get_logger("AutoOffTimer")->info("Auto-off timer armed", core::LogContext().add("session", session_id));
        }

        void AutoOffTimer::cancel()
        {
            std::thread finished;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancelled_ = true;
                armed_ = false;

                // From the callback: the worker is joined by the next cancel() or the destructor
                if (std::this_thread::get_id() == worker_id_)
                    return;

                finished = std::move(worker_);
                worker_id_ = std::thread::id();
            }
            cv_.notify_all();

            if (finished.joinable())
                finished.join();
        }

        bool AutoOffTimer::armed() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return armed_;
        }

        void AutoOffTimer::run(std::chrono::system_clock::time_point deadline, std::string session_id, Callback callback)
        {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (cv_.wait_until(lock, deadline, [this]
                                   { return cancelled_; }))
                {
                    return;
                }
                armed_ = false;
            }

            core::get_logger("AutoOffTimer")->info("Auto-off deadline reached", core::LogContext().add("session", session_id));
            callback(session_id);
        }

    } // namespace services
} // namespace apguard
