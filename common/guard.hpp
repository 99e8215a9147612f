#pragma once

#include <eosiolib/eosio.hpp>
#include "./constants.hpp"
#include "contracts.hpp"

namespace luckpool {

    /**
     * Holds the contract-wide lock for the lifetime of an action that moves funds or escrow.
     * A failed assert reverts the lock together with the rest of the transaction.
     */
    template<typename Globals>
    class reentrancy_guard {
    public:
        explicit reentrancy_guard(Globals& globals): _globals(globals) {
            eosio_assert(get_global(_globals, G_ID_LOCKED) == 0, ERR_REENTRANCY);
            set_global(_globals, G_ID_LOCKED, 1);
        }

        ~reentrancy_guard() {
            set_global(_globals, G_ID_LOCKED, 0);
        }

        reentrancy_guard(const reentrancy_guard&) = delete;
        reentrancy_guard& operator=(const reentrancy_guard&) = delete;

    private:
        Globals& _globals;
    };
}
