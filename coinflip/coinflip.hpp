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

    CONTRACT coinflip: public contract {
    public:
        DEFINE_GLOBAL_TABLE
        DEFINE_PENDING_TABLE
        DEFINE_STATS_TABLE
        DEFINE_ENTROPY_TABLES

        coinflip(name receiver, name code, datastream<const char *> ds);

        DECLARE_BANKROLL_ACTIONS
        ACTION receipt(name player, asset bet, uint8_t guess, uint8_t result, asset payout);

    private:
        void place_bet(name from, asset quantity, const string& command, param_reader& reader);
    };

    EOSIO_ABI_EX(coinflip, BANKROLL_ACTIONS(receipt))
}
