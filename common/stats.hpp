#pragma once

#include <eosiolib/eosio.hpp>
#include "tables.hpp"
#include "contracts.hpp"

namespace luckpool {

    #define DEFINE_STATS_TABLE \
        TABLE userstat { \
            name player; \
            uint64_t total_bet; \
            uint64_t total_won; \
            uint64_t total_lost; \
            uint64_t primary_key() const { return player.value; } \
        }; \
        typedef multi_index<name("userstats"), userstat> userstat_index; \
        userstat_index _userstats;

    /**
     * Book a resolved bet. A win adds the payout to total_won, a loss adds the stake to total_lost.
     */
    template<typename Contract>
    void record_bet(Contract& contract, name player, int64_t bet, int64_t payout) {
        name self = contract.get_self();
        auto iter = contract._userstats.find(player.value);
        if (iter == contract._userstats.end()) {
            contract._userstats.emplace(self, [&](auto& a) {
                a.player = player;
                a.total_bet = bet;
                a.total_won = payout > 0 ? payout : 0;
                a.total_lost = payout > 0 ? 0 : bet;
            });
        } else {
            contract._userstats.modify(iter, self, [&](auto& a) {
                a.total_bet += bet;
                if (payout > 0) {
                    a.total_won += payout;
                } else {
                    a.total_lost += bet;
                }
            });
        }
        adjust_global(contract._globals, G_ID_TOTAL_BET, bet);
    }
}
