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

    CONTRACT crash: public contract {
    public:
        DEFINE_GLOBAL_TABLE
        DEFINE_PENDING_TABLE
        DEFINE_STATS_TABLE
        DEFINE_ENTROPY_TABLES

        /**
         * One shared betting round. The crash multiplier is drawn when the round opens and the row
         * is never changed afterwards, except forceclose moving betting_ends_at to now.
         */
        TABLE gameround {
            uint64_t id;
            uint64_t start_time;
            uint64_t betting_ends_at;
            uint64_t crash_multiplier;

            uint64_t primary_key() const { return id; }
        };
        typedef multi_index<name("rounds"), gameround> round_index;
        round_index _rounds;

        crash(name receiver, name code, datastream<const char *> ds);

        DECLARE_BANKROLL_ACTIONS
        ACTION openround(name caller);
        ACTION forceclose();
        ACTION receipt(uint64_t round_id, name player, asset bet, uint64_t cashout, uint64_t crash_multiplier,
                       asset payout);

    private:
        void open_round(name caller);
        void place_bet(name from, asset quantity, const string& command, param_reader& reader);
    };

    EOSIO_ABI_EX(crash, BANKROLL_ACTIONS(openround)(forceclose)(receipt))
}
