#ifndef APGUARD_CORE_ERRORS_HPP
#define APGUARD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <optional>

namespace apguard
{
    namespace core
    {

        /**
         * Error taxonomy shared by the status record and the process exit code.
         * The front end tells the kinds apart by code alone.
         */
        enum class ErrorKind
        {
            HardwareError,      // rfkill, missing AP capability, monitor mode
            SafetyBlock,        // single-adapter lockout and similar
            ConfigurationError, // external tool failed or timed out
            InvalidArgument     // malformed input, rejected before any mutation
        };

        // Process exit codes
        constexpr int EXIT_OK = 0;
        constexpr int EXIT_BLOCKED = 1;
        constexpr int EXIT_CONFIGURATION = 2;
        constexpr int EXIT_INVALID_ARGUMENT = 3;

        std::string error_code(ErrorKind kind);
        std::optional<ErrorKind> error_kind_from_code(const std::string &code);
        int exit_code_for(ErrorKind kind);

        /**
         * Base class for errors that carry a taxonomy kind
         */
        class ApguardError : public std::runtime_error
        {
        public:
            ApguardError(ErrorKind kind, const std::string &message)
                : std::runtime_error(message), kind_(kind) {}

            ErrorKind kind() const { return kind_; }

        private:
            ErrorKind kind_;
        };

        class ConfigurationError : public ApguardError
        {
        public:
            explicit ConfigurationError(const std::string &message)
                : ApguardError(ErrorKind::ConfigurationError, message) {}
        };

        class InvalidArgumentError : public ApguardError
        {
        public:
            explicit InvalidArgumentError(const std::string &message)
                : ApguardError(ErrorKind::InvalidArgument, message) {}
        };

    } // namespace core
} // namespace apguard

#endif // APGUARD_CORE_ERRORS_HPP
