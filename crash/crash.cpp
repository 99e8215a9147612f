#include <string>
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/system.h>

#include "crash.hpp"
#include "../common/odds.hpp"
#include "../common/tables.hpp"

#define DEFAULT_ROUND_WINDOW        60
#define ROUND_HISTORY_SIZE          40

using namespace std;
using namespace eosio;

namespace luckpool {
    crash::crash(name receiver, name code, datastream<const char *> ds) :
        contract(receiver, code, ds),
        _globals(_self, _self.value),
        _pending(_self, _self.value),
        _userstats(_self, _self.value),
        _rounds(_self, _self.value) {
    }

    void crash::init(name owner) {
        require_auth(_self);
        init_bankroll(_globals, owner);
        set_global(_globals, G_ID_ROUND_WINDOW, DEFAULT_ROUND_WINDOW);
        open_round(_self);
    }

    DEFINE_BANKROLL_FUNCTIONS(crash, Crash)

    /**
     * Start the next round once betting on the current one has closed. Anyone may call this.
     * @param caller Account paying for the action, also salts the entropy
     */
    void crash::openround(name caller) {
        require_auth(caller);

        const auto& current = _rounds.get(get_global(_globals, G_ID_ROUND_ID), "round does not exist");
        eosio_assert(now() >= current.betting_ends_at, ERR_ROUND_OPEN);

        open_round(caller);
    }

    void crash::forceclose() {
        require_owner(_globals);

        const auto& current = _rounds.get(get_global(_globals, G_ID_ROUND_ID), "round does not exist");

        uint32_t timestamp = now();
        if (timestamp < current.betting_ends_at) {
            table_modify(_rounds, _self, current.id, [&](auto& a) {
                a.betting_ends_at = timestamp;
            });
        }
    }

    void crash::open_round(name caller) {
        random<crash> random_gen(*this, caller);
        uint64_t crash_multiplier = crash_odds::multiplier_from_draw(random_gen.generator(CRASH_DRAW_RANGE));

        uint64_t round_id = increment_global(_globals, G_ID_ROUND_ID);
        uint32_t timestamp = now();
        uint64_t window = get_global(_globals, G_ID_ROUND_WINDOW, DEFAULT_ROUND_WINDOW);

        _rounds.emplace(_self, [&](auto& a) {
            a.id = round_id;
            a.start_time = timestamp;
            a.betting_ends_at = timestamp + window;
            a.crash_multiplier = crash_multiplier;
        });

        if (round_id > ROUND_HISTORY_SIZE) {
            auto expired = _rounds.find(round_id - ROUND_HISTORY_SIZE);
            if (expired != _rounds.end()) {
                _rounds.erase(expired);
            }
        }
    }

    /**
     * Memo "play,<amount>,<cashout>", cashout in tenths. Caps are checked against the bankroll at
     * settlement, so a late bet in a round can be refused where an earlier one was accepted.
     */
    void crash::place_bet(name from, asset quantity, const string& command, param_reader& reader) {
        eosio_assert(command == "play", ERR_INVALID_MEMO);
        int64_t bet = read_stake(_globals, reader, quantity);
        uint64_t cashout = reader.next_param_i64(ERR_INVALID_BET);
        reader.expect_end();
        eosio_assert(crash_odds::valid_cashout(cashout), ERR_INVALID_BET);

        const auto& current = _rounds.get(get_global(_globals, G_ID_ROUND_ID), "round does not exist");
        eosio_assert(now() < current.betting_ends_at, ERR_BETTING_CLOSED);

        bankroll<crash> ledger(*this);
        ledger.require_solvent(crash_odds::max_payout(bet));

        int64_t payout = 0;
        if (crash_odds::won(cashout, current.crash_multiplier)) {
            payout = crash_odds::payout(bet, cashout);
            int64_t available = ledger.available();
            eosio_assert(!crash_odds::exceeds_cap(payout, available), ERR_PAYOUT_CAP);
            eosio_assert(payout <= available, ERR_INSUFFICIENT_BANKROLL);
        }

        ledger.settle(from, bet, payout);

        SEND_INLINE_ACTION(*this, receipt, {_self, name("active")},
            {current.id, from, quantity, cashout, current.crash_multiplier, asset(payout, EOS_SYMBOL)});
    }

    void crash::receipt(uint64_t round_id, name player, asset bet, uint64_t cashout, uint64_t crash_multiplier,
                        asset payout) {
        require_auth(_self);
        require_recipient(player);
    }
}
