#include "core/errors.hpp"

namespace apguard
{
    namespace core
    {

        std::string error_code(ErrorKind kind)
        {
            switch (kind)
            {
            case ErrorKind::HardwareError:
                return "hardware";
            case ErrorKind::SafetyBlock:
                return "safety_block";
            case ErrorKind::ConfigurationError:
                return "configuration";
            case ErrorKind::InvalidArgument:
                return "invalid_argument";
            }
            return "configuration";
        }

        std::optional<ErrorKind> error_kind_from_code(const std::string &code)
        {
            if (code == "hardware")
                return ErrorKind::HardwareError;
            if (code == "safety_block")
                return ErrorKind::SafetyBlock;
            if (code == "configuration")
                return ErrorKind::ConfigurationError;
            if (code == "invalid_argument")
                return ErrorKind::InvalidArgument;
            return std::nullopt;
        }

        int exit_code_for(ErrorKind kind)
        {
            switch (kind)
            {
            case ErrorKind::HardwareError:
            case ErrorKind::SafetyBlock:
                return EXIT_BLOCKED;
            case ErrorKind::ConfigurationError:
                return EXIT_CONFIGURATION;
            case ErrorKind::InvalidArgument:
                return EXIT_INVALID_ARGUMENT;
            }
            return EXIT_CONFIGURATION;
        }

    } // namespace core
} // namespace apguard
