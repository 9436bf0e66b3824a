#ifndef APGUARD_CORE_LOGGER_HPP
#define APGUARD_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <sstream>
#include <map>

namespace apguard
{
    namespace core
    {

        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3,
            CRITICAL = 4
        };

        /**
         * Structured key=value context appended to a log line
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::ostringstream ss;
                ss << std::boolalpha << value;
                fields_[key] = ss.str();
                return *this;
            }

            // Secrets are only ever logged as "<set:N>" / "<unset>"
            LogContext &add_secret(const std::string &key, const std::string &secret);

            std::string format() const;
            bool empty() const { return fields_.empty(); }

        private:
            std::map<std::string, std::string> fields_;
        };

        /**
         * Destination shared by every logger of the process. The backend
         * that supervises a session and a later `--stop` invocation may
         * append to the same file, so each line is written whole.
         */
        class LogSink
        {
        public:
            LogSink(bool console, const std::string &path);

            void write(const std::string &line);
            bool console() const { return console_; }
            const std::string &path() const { return path_; }

        private:
            bool console_;
            std::string path_;
            std::ofstream file_;
            std::mutex mutex_;
        };

        /**
         * Named logger (thread-safe). Console output goes to stderr so that
         * stdout stays available for machine-readable command output.
         */
        class Logger
        {
        public:
            Logger(const std::string &name, LogLevel level = LogLevel::WARNING,
                   std::shared_ptr<LogSink> sink = nullptr);

            void set_level(LogLevel level);
            void set_sink(std::shared_ptr<LogSink> sink);

            // Private sink for this logger only
            void set_output_file(const std::string &filename);
            void set_console_output(bool enabled);

            void debug(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::DEBUG, message, context); }
            void info(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::INFO, message, context); }
            void warning(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::WARNING, message, context); }
            void error(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::ERROR, message, context); }
            void critical(const std::string &message, const LogContext &context = LogContext{}) { log(LogLevel::CRITICAL, message, context); }

            void log(LogLevel level, const std::string &message, const LogContext &context);
            bool is_enabled(LogLevel level) const;

            const std::string &name() const { return name_; }

        private:
            std::string name_;
            LogLevel level_;
            std::shared_ptr<LogSink> sink_;
            mutable std::mutex mutex_;
        };

        /**
         * Process-wide registry of named loggers
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            // Re-targets every logger created so far, and all later ones
            void setup_logging(LogLevel level = LogLevel::WARNING,
                               const std::string &log_file = "",
                               bool console_output = true);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static LogLevel string_to_level(const std::string &level_str);
            static std::string level_to_string(LogLevel level);

        private:
            LoggerManager();

            LogLevel level_ = LogLevel::WARNING;
            std::shared_ptr<LogSink> sink_;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::WARNING,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace core
} // namespace apguard

#endif // APGUARD_CORE_LOGGER_HPP
