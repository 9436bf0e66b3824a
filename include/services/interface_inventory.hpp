#ifndef APGUARD_SERVICES_INTERFACE_INVENTORY_HPP
#define APGUARD_SERVICES_INTERFACE_INVENTORY_HPP

#include <memory>

#include "core/types.hpp"
#include "infrastructure/interface_probe.hpp"

namespace apguard
{
    namespace core
    {
        class Logger;
    }

    namespace services
    {

        /**
         * Map raw attributes to exactly one interface type.
         *
         * Precedence: tunnel/bridge signature, then mobile broadband and phone
         * tethering, then wireless (USB vs built-in by bus), then wired
         * Ethernet, then Unknown. Depends on nothing but its argument.
         */
        core::InterfaceType classify(const infrastructure::InterfaceAttributes &attrs);

        /**
         * Builds a fresh, ordered inventory on every call
         */
        class InterfaceInventory
        {
        public:
            explicit InterfaceInventory(infrastructure::InterfaceProbe &probe);
            ~InterfaceInventory() = default;

            // Stable-sorted by type priority, then by name
            core::Inventory list_interfaces();

        private:
            infrastructure::InterfaceProbe &probe_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace apguard

#endif // APGUARD_SERVICES_INTERFACE_INVENTORY_HPP
