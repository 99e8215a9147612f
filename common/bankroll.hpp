#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <string>

#include "./constants.hpp"
#include "contracts.hpp"
#include "tables.hpp"
#include "param_reader.hpp"
#include "guard.hpp"
#include "stats.hpp"

/**
 * Shared bankroll for the games: funds are held by the token contract, prizes are escrowed in the
 * pending table until the winner claims them.
 *
 *   held      = token balance of the game account
 *   pending   = sum of all pending rows, kept in G_ID_TOTAL_PENDING
 *   available = held - pending, never negative
 */
namespace luckpool {
    using namespace std;
    using namespace eosio;

    #define DEFINE_PENDING_TABLE \
        TABLE prize { \
            name player; \
            uint64_t amount; \
            uint64_t primary_key() const { return player.value; } \
        }; \
        typedef multi_index<name("pending"), prize> prize_index; \
        prize_index _pending;

    template<typename Contract>
    class bankroll {
    public:
        explicit bankroll(Contract& contract): _contract(contract), _self(contract.get_self()) {
        }

        int64_t held() const {
            return token_balance(_self, EOS_SYMBOL);
        }

        int64_t total_pending() const {
            return (int64_t) get_global(_contract._globals, G_ID_TOTAL_PENDING);
        }

        int64_t available() const {
            int64_t held_amount = held();
            int64_t pending_amount = total_pending();
            eosio_assert(held_amount >= pending_amount, ERR_LEDGER_CORRUPT);
            return held_amount - pending_amount;
        }

        int64_t pending_of(name player) const {
            return (int64_t) table_field(_contract._pending, player.value, [](const auto& a) { return a.amount; }, (uint64_t) 0);
        }

        /**
         * Worst-case solvency check, run before any entropy is consumed
         */
        void require_solvent(int64_t max_payout) const {
            eosio_assert(max_payout <= available(), ERR_INSUFFICIENT_BANKROLL);
        }

        /**
         * Escrow a prize for player. The amount must already fit into the available bankroll.
         */
        void reserve(name player, int64_t amount) {
            eosio_assert(amount > 0, "reserve amount must be positive");
            eosio_assert(amount <= available(), ERR_INSUFFICIENT_BANKROLL);

            uint64_t escrowed = (uint64_t) (pending_of(player) + amount);
            table_upsert(_contract._pending, _self, player.value, [&](auto& a) {
                a.player = player;
                a.amount = escrowed;
            });
            adjust_global(_contract._globals, G_ID_TOTAL_PENDING, amount);
        }

        /**
         * Zero the player's escrow before any transfer is sent
         * @return The amount released
         */
        int64_t release(name player) {
            auto iter = _contract._pending.find(player.value);
            eosio_assert(iter != _contract._pending.end() && iter->amount > 0, ERR_NOTHING_TO_CLAIM);

            int64_t amount = (int64_t) iter->amount;
            _contract._pending.modify(iter, _self, [&](auto& a) {
                a.amount = 0;
            });
            adjust_global(_contract._globals, G_ID_TOTAL_PENDING, -amount);
            return amount;
        }

        /**
         * Escrow the payout, if any, and book the bet in the stats
         */
        void settle(name player, int64_t bet, int64_t payout) {
            if (payout > 0) {
                reserve(player, payout);
            }
            record_bet(_contract, player, bet, payout);
        }

    private:
        Contract& _contract;
        name _self;
    };

    /**
     * The memo states the bet; it must match the transfer and sit within the configured limits
     */
    void validate_stake(int64_t bet, int64_t transferred, int64_t min_bet, int64_t max_bet) {
        eosio_assert(bet == transferred, ERR_INVALID_BET);
        eosio_assert(bet >= min_bet && bet <= max_bet, ERR_INVALID_BET);
    }

    template<typename T>
    int64_t read_stake(T& globals, param_reader& reader, const asset& quantity) {
        auto bet = (int64_t) reader.next_param_i64(ERR_INVALID_BET);
        validate_stake(bet, quantity.amount,
                       (int64_t) get_global(globals, G_ID_MIN_BET, DEFAULT_MIN_BET),
                       (int64_t) get_global(globals, G_ID_MAX_BET, DEFAULT_MAX_BET));
        return bet;
    }

    template<typename T>
    void init_bankroll(T& globals, name owner) {
        eosio_assert(get_global(globals, G_ID_OWNER) == 0, ERR_ALREADY_INITIALIZED);
        eosio_assert(is_account(owner), "owner must be an eos account");

        set_global(globals, G_ID_OWNER, owner.value);
        set_global(globals, G_ID_TOTAL_PENDING, 0);
        set_global(globals, G_ID_TOTAL_BET, 0);
        set_global(globals, G_ID_LOCKED, 0);
        set_global(globals, G_ID_MIN_BET, DEFAULT_MIN_BET);
        set_global(globals, G_ID_MAX_BET, DEFAULT_MAX_BET);
    }

    #define DECLARE_BANKROLL_ACTIONS \
        ACTION init(name owner); \
        ACTION setconfig(uint64_t key, uint64_t value); \
        ACTION claim(name player); \
        ACTION withdraw(); \
        ACTION transfer(name from, name to, asset quantity, string memo);

    #define BANKROLL_ACTIONS (init)(setconfig)(claim)(withdraw)(transfer)

    #define DEFINE_CLAIM_FUNCTION(NAME, DISPLAYNAME) \
    void NAME::claim(name player) { \
        require_auth(player); \
        reentrancy_guard<global_index> guard(_globals); \
        bankroll<NAME> ledger(*this); \
        int64_t amount = ledger.release(player); \
        send_token(_self, player, asset(amount, EOS_SYMBOL), RECEIPT_PREFIX #DISPLAYNAME " prize"); \
    }

    #define DEFINE_WITHDRAW_FUNCTION(NAME, DISPLAYNAME) \
    void NAME::withdraw() { \
        require_owner(_globals); \
        reentrancy_guard<global_index> guard(_globals); \
        bankroll<NAME> ledger(*this); \
        int64_t amount = ledger.available(); \
        eosio_assert(amount > 0, ERR_INSUFFICIENT_BANKROLL); \
        send_token(_self, get_owner(_globals), asset(amount, EOS_SYMBOL), RECEIPT_PREFIX #DISPLAYNAME " withdrawal"); \
    }

    /**
     * Entry point for token transfers: "deposit" funds the bankroll, anything else is handed to
     * the game's place_bet with the memo command already read.
     */
    #define DEFINE_TRANSFER_FUNCTION(NAME) \
    void NAME::transfer(name from, name to, asset quantity, string memo) { \
        if (!check_transfer(this, from, to, quantity, memo)) { \
            return; \
        } \
        eosio_assert(get_global(_globals, G_ID_OWNER) != 0, ERR_NOT_INITIALIZED); \
        reentrancy_guard<global_index> guard(_globals); \
        param_reader reader(memo); \
        string command = reader.next_param(); \
        if (command == "deposit") { \
            reader.expect_end(); \
            return; \
        } \
        place_bet(from, quantity, command, reader); \
    }

    #define DEFINE_BANKROLL_FUNCTIONS(NAME, DISPLAYNAME) \
        DEFINE_SET_CONFIG(NAME) \
        DEFINE_CLAIM_FUNCTION(NAME, DISPLAYNAME) \
        DEFINE_WITHDRAW_FUNCTION(NAME, DISPLAYNAME) \
        DEFINE_TRANSFER_FUNCTION(NAME)
}
