#include <string>
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>

#include "coinflip.hpp"
#include "../common/odds.hpp"

using namespace std;
using namespace eosio;

namespace luckpool {
    coinflip::coinflip(name receiver, name code, datastream<const char *> ds) :
        contract(receiver, code, ds),
        _globals(_self, _self.value),
        _pending(_self, _self.value),
        _userstats(_self, _self.value) {
    }

    void coinflip::init(name owner) {
        require_auth(_self);
        init_bankroll(_globals, owner);
    }

    DEFINE_BANKROLL_FUNCTIONS(coinflip, Coinflip)

    // memo "flip,<guess>,<amount>", guess 1 is heads
    void coinflip::place_bet(name from, asset quantity, const string& command, param_reader& reader) {
        eosio_assert(command == "flip", ERR_INVALID_MEMO);
        uint64_t guess = reader.next_param_i64(ERR_INVALID_BET);
        eosio_assert(guess < COINFLIP_SIDES, ERR_INVALID_BET);
        int64_t bet = read_stake(_globals, reader, quantity);
        reader.expect_end();

        bankroll<coinflip> ledger(*this);
        ledger.require_solvent(coinflip_odds::max_payout(bet));

        random<coinflip> random_gen(*this, from);
        uint64_t result = random_gen.generator(COINFLIP_SIDES);
        int64_t payout = coinflip_odds::payout(bet, coinflip_odds::won(result, (uint8_t) guess));

        ledger.settle(from, bet, payout);

        SEND_INLINE_ACTION(*this, receipt, {_self, name("active")},
            {from, quantity, (uint8_t) guess, (uint8_t) result, asset(payout, EOS_SYMBOL)});
    }

    void coinflip::receipt(name player, asset bet, uint8_t guess, uint8_t result, asset payout) {
        require_auth(_self);
        require_recipient(player);
    }
}
