#ifndef APGUARD_SERVICES_SAFETY_VALIDATOR_HPP
#define APGUARD_SERVICES_SAFETY_VALIDATOR_HPP

#include <string>
#include <vector>
#include <memory>

#include "core/types.hpp"
#include "core/errors.hpp"
#include "core/session_request.hpp"

namespace apguard
{
    namespace core
    {
        class Logger;
    }

    namespace services
    {

        struct Violation
        {
            core::ErrorKind kind;
            std::string check; // stable identifier, e.g. "rfkill"
            std::string message;
        };

        struct Warning
        {
            std::string check;
            std::string message;
        };

        /**
         * Hotspot and upstream interfaces after resolving the request against
         * one inventory. Empty names mean "none found".
         */
        struct ResolvedInterfaces
        {
            std::string hotspot;
            std::string upstream;
        };

        struct OverrideFlags
        {
            bool force_single_interface = false;
        };

        struct ValidationResult
        {
            ResolvedInterfaces interfaces;
            std::vector<Violation> blocking;
            std::vector<Warning> warnings;

            bool ok() const { return blocking.empty(); }

            // Summary of all blocking violations, "; "-separated
            std::string blocking_summary() const;
            std::vector<std::string> warning_messages() const;
        };

        ResolvedInterfaces resolve_interfaces(const core::SessionRequest &request,
                                              const core::Inventory &inventory);

        /**
         * Pre-flight safety checks. Pure: no side effects, no probing.
         */
        class SafetyValidator
        {
        public:
            SafetyValidator();

            ValidationResult validate(const core::SessionRequest &request,
                                      const core::Inventory &inventory,
                                      const OverrideFlags &overrides) const;

        private:
            void check_hotspot_hardware(const core::SessionRequest &request,
                                        const core::NetworkInterface &hotspot,
                                        ValidationResult &result) const;
            void check_connectivity(const core::SessionRequest &request,
                                    const core::Inventory &inventory,
                                    const core::NetworkInterface &hotspot,
                                    const OverrideFlags &overrides,
                                    ValidationResult &result) const;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace apguard

#endif // APGUARD_SERVICES_SAFETY_VALIDATOR_HPP
