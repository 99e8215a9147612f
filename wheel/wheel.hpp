#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <string>

#include "../common/constants.hpp"
#include "../common/contracts.hpp"
#include "../common/random.hpp"
#include "../common/bankroll.hpp"
#include "../common/param_reader.hpp"

namespace luckpool {
    using namespace eosio;
    using namespace std;

    CONTRACT wheel: public contract {
    public:
        DEFINE_GLOBAL_TABLE
        DEFINE_PENDING_TABLE
        DEFINE_STATS_TABLE
        DEFINE_ENTROPY_TABLES

        // result of the player's latest spin, nonce moves by one on every spin
        TABLE lastspin {
            name player;
            uint8_t outcome;
            uint16_t multiplier;
            bool won;
            uint64_t amount;
            uint64_t nonce;

            uint64_t primary_key() const { return player.value; }
        };
        typedef multi_index<name("lastspin"), lastspin> lastspin_index;
        lastspin_index _lastspins;

        wheel(name receiver, name code, datastream<const char *> ds);

        DECLARE_BANKROLL_ACTIONS
        ACTION receipt(name player, asset bet, uint8_t outcome, uint16_t multiplier, asset payout, uint64_t nonce);

    private:
        void place_bet(name from, asset quantity, const string& command, param_reader& reader);
    };

    EOSIO_ABI_EX(wheel, BANKROLL_ACTIONS(receipt))
}
