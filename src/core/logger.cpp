#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace apguard
{
    namespace core
    {

        namespace
        {
            // 2024-05-01T14:03:07.123+0200
            std::string timestamp_now()
            {
                const auto now = std::chrono::system_clock::now();
                const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
                const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

                std::tm local{};
                localtime_r(&seconds, &local);

                char date[32];
                char zone[8];
                std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
                std::strftime(zone, sizeof(zone), "%z", &local);

                std::ostringstream out;
                out << date << '.' << std::setfill('0') << std::setw(3) << millis << zone;
                return out.str();
            }

            bool needs_quotes(const std::string &value)
            {
                return value.empty() || std::any_of(value.begin(), value.end(), [](unsigned char c)
                                                    { return std::isspace(c) || c == '"' || c == '='; });
            }
        } // namespace

        // LogContext

        LogContext &LogContext::add_secret(const std::string &key, const std::string &secret)
        {
            fields_[key] = secret.empty() ? "<unset>" : "<set:" + std::to_string(secret.size()) + ">";
            return *this;
        }

        std::string LogContext::format() const
        {
            std::string line;
            for (const auto &[key, value] : fields_)
            {
                if (!line.empty())
                    line += ' ';
                line += key;
                line += '=';
                if (needs_quotes(value))
                {
                    line += '"';
                    for (char c : value)
                    {
                        if (c == '"')
                            line += '\\';
                        line += c;
                    }
                    line += '"';
                }
                else
                {
                    line += value;
                }
            }
            return line;
        }

        // LogSink

        LogSink::LogSink(bool console, const std::string &path)
            : console_(console), path_(path)
        {
            if (!path_.empty())
            {
                file_.open(path_, std::ios::out | std::ios::app);
                if (!file_.is_open())
                {
                    // Nowhere else to report it; keep the console so nothing is lost
                    std::cerr << "apguard: cannot open log file " << path_ << ", logging to stderr" << std::endl;
                    console_ = true;
                }
            }
        }

        void LogSink::write(const std::string &line)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (console_)
            {
                std::cerr << line << '\n';
                std::cerr.flush();
            }
            if (file_.is_open())
            {
                file_ << line << '\n';
                file_.flush();
            }
        }

        // Logger

        Logger::Logger(const std::string &name, LogLevel level, std::shared_ptr<LogSink> sink)
            : name_(name), level_(level), sink_(sink ? std::move(sink) : std::make_shared<LogSink>(true, ""))
        {
        }

        void Logger::set_level(LogLevel level)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            level_ = level;
        }

        void Logger::set_sink(std::shared_ptr<LogSink> sink)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = std::move(sink);
        }

        void Logger::set_output_file(const std::string &filename)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = std::make_shared<LogSink>(sink_->console(), filename);
        }

        void Logger::set_console_output(bool enabled)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = std::make_shared<LogSink>(enabled, sink_->path());
        }

        bool Logger::is_enabled(LogLevel level) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= level_;
        }

        void Logger::log(LogLevel level, const std::string &message, const LogContext &context)
        {
            std::shared_ptr<LogSink> sink;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (level < level_)
                    return;
                sink = sink_;
            }

            std::ostringstream line;
            line << timestamp_now() << ' ' << getpid() << " [" << LoggerManager::level_to_string(level) << "] "
                 << name_ << ": " << message;
            if (!context.empty())
                line << ' ' << context.format();

            sink->write(line.str());
        }

        // LoggerManager

        LoggerManager::LoggerManager()
            : sink_(std::make_shared<LogSink>(true, ""))
        {
        }

        LoggerManager &LoggerManager::instance()
        {
            static LoggerManager manager;
            return manager;
        }

        void LoggerManager::setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            level_ = level;
            sink_ = std::make_shared<LogSink>(console_output, log_file);
            for (auto &entry : loggers_)
            {
                entry.second->set_level(level_);
                entry.second->set_sink(sink_);
            }
        }

        std::shared_ptr<Logger> LoggerManager::get_logger(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto &slot = loggers_[name];
            if (!slot)
                slot = std::make_shared<Logger>(name, level_, sink_);
            return slot;
        }

        LogLevel LoggerManager::string_to_level(const std::string &level_str)
        {
            std::string name;
            for (unsigned char c : level_str)
                name += static_cast<char>(std::toupper(c));

            static const std::map<std::string, LogLevel> levels = {
                {"DEBUG", LogLevel::DEBUG},
                {"INFO", LogLevel::INFO},
                {"WARN", LogLevel::WARNING},
                {"WARNING", LogLevel::WARNING},
                {"ERROR", LogLevel::ERROR},
                {"CRIT", LogLevel::CRITICAL},
                {"CRITICAL", LogLevel::CRITICAL}};

            auto it = levels.find(name);
            return it == levels.end() ? LogLevel::WARNING : it->second;
        }

        std::string LoggerManager::level_to_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRIT";
            }
            return "UNKNOWN";
        }

        std::shared_ptr<Logger> get_logger(const std::string &name)
        {
            return LoggerManager::instance().get_logger(name);
        }

        void setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            LoggerManager::instance().setup_logging(level, log_file, console_output);
        }

    } // namespace core
} // namespace apguard
