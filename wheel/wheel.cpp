#include <string>
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>

#include "wheel.hpp"
#include "../common/odds.hpp"
#include "../common/tables.hpp"

using namespace std;
using namespace eosio;

namespace luckpool {
    wheel::wheel(name receiver, name code, datastream<const char *> ds) :
        contract(receiver, code, ds),
        _globals(_self, _self.value),
        _pending(_self, _self.value),
        _userstats(_self, _self.value),
        _lastspins(_self, _self.value) {
    }

    void wheel::init(name owner) {
        require_auth(_self);
        init_bankroll(_globals, owner);
    }

    DEFINE_BANKROLL_FUNCTIONS(wheel, Wheel)

    /**
     * Memo "spin,<amount>". Every spin, winning or not, overwrites the player's lastspin row.
     */
    void wheel::place_bet(name from, asset quantity, const string& command, param_reader& reader) {
        eosio_assert(command == "spin", ERR_INVALID_MEMO);
        int64_t bet = read_stake(_globals, reader, quantity);
        reader.expect_end();

        bankroll<wheel> ledger(*this);
        ledger.require_solvent(wheel_odds::max_payout(bet));

        random<wheel> random_gen(*this, from);
        uint8_t outcome = wheel_odds::select(random_gen.generator(BASIS_POINTS));
        uint16_t multiplier = wheel_odds::multiplier(outcome);
        int64_t payout = wheel_odds::payout(bet, outcome);
        uint64_t nonce = random_gen.nonce();

        ledger.settle(from, bet, payout);

        table_upsert(_lastspins, _self, from.value, [&](auto& a) {
            a.player = from;
            a.outcome = outcome;
            a.multiplier = multiplier;
            a.won = multiplier > 0;
            a.amount = (uint64_t) payout;
            a.nonce = nonce;
        });

        SEND_INLINE_ACTION(*this, receipt, {_self, name("active")},
            {from, quantity, outcome, multiplier, asset(payout, EOS_SYMBOL), nonce});
    }

    void wheel::receipt(name player, asset bet, uint8_t outcome, uint16_t multiplier, asset payout, uint64_t nonce) {
        require_auth(_self);
        require_recipient(player);
    }
}
