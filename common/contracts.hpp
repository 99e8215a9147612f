#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/action.hpp>
#include "./constants.hpp"
#include "tables.hpp"

#include <string>

namespace luckpool {
    using namespace std;
    using namespace eosio;

    //###############    Globals  ######################
    #define G_ID_OWNER                  101
    #define G_ID_TOTAL_PENDING          102
    #define G_ID_TOTAL_BET              103
    #define G_ID_LOCKED                 104
    #define G_ID_ROUND_ID               105

    // keys at or above G_ID_CONFIG_START may be changed by the owner
    #define G_ID_CONFIG_START           201
    #define G_ID_MIN_BET                201
    #define G_ID_MAX_BET                202
    #define G_ID_ROUND_WINDOW           203
    #define G_ID_CONFIG_END             203

    #define DEFINE_GLOBAL_TABLE \
    TABLE globalvar { \
        uint64_t id; \
        uint64_t val; \
        uint64_t primary_key() const { return id; }; \
    }; \
    typedef multi_index<name("globals"), globalvar> global_index; \
    global_index _globals;

    template<typename T>
    void set_global(T& globals, uint64_t key, uint64_t value) {
        table_upsert(globals, globals.get_code(), key, [&](auto& a) {
            a.id = key;
            a.val = value;
        });
    }

    template<typename T>
    uint64_t get_global(const T& globals, uint64_t key, uint64_t default_value = 0) {
        auto iter = globals.find(key);
        if (iter == globals.end()) {
            return default_value;
        } else {
            return iter->val;
        }
    }

    template<typename T>
    uint64_t increment_global(T& globals, uint64_t key) {
        uint64_t result = get_global(globals, key) + 1;
        set_global(globals, key, result);
        return result;
    }

    /**
     * Add a signed delta to a counter, refusing to wrap below zero
     */
    template<typename T>
    uint64_t adjust_global(T& globals, uint64_t key, int64_t delta) {
        uint64_t current = get_global(globals, key);
        if (delta < 0) {
            eosio_assert(current >= (uint64_t) -delta, "global counter underflow");
        }
        uint64_t result = current + delta;
        set_global(globals, key, result);
        return result;
    }

    template<typename T>
    name get_owner(const T& globals) {
        uint64_t owner = get_global(globals, G_ID_OWNER);
        eosio_assert(owner != 0, ERR_NOT_INITIALIZED);
        return name(owner);
    }

    template<typename T>
    void require_owner(const T& globals) {
        eosio_assert(has_auth(get_owner(globals)), ERR_NOT_OWNER);
    }

    #define DEFINE_SET_CONFIG(NAME) \
    void NAME::setconfig(uint64_t key, uint64_t value) { \
        require_owner(_globals); \
        eosio_assert(key >= G_ID_CONFIG_START && key <= G_ID_CONFIG_END, ERR_INVALID_CONFIG_KEY); \
        set_global(_globals, key, value); \
    }

    //###############    Transactions  ######################
    #define EOSIO_ABI_EX( TYPE, MEMBERS ) \
    extern "C" { \
       void apply( uint64_t receiver, uint64_t code, uint64_t action ) { \
          auto self = receiver; \
          if( (code == self && action != name("transfer").value) || \
                (code == EOS_TOKEN_CONTRACT.value && action == name("transfer").value) || \
                (code == name("eosio").value && action == name("onerror").value) ) { \
             switch( action ) { \
                EOSIO_DISPATCH_HELPER( TYPE, MEMBERS ) \
             } \
          } \
       } \
    }

    /**
     * Check a transfer notification against normal issues
     * @param self A pointer for the calling contract
     * @param from The sender
     * @param to The receiver
     * @param quantity The amount to be transfered
     * @param memo Memo used for transfer
     * @return True if the transaction should be further processed, false otherwise
     */
    bool check_transfer(const contract* self, name from, name to, asset quantity, const string& memo) {
        if (from == self->get_self() || to != self->get_self()) {
            return false;
        }
        if (from == name("eosio.stake")) {
            return false;
        }
        require_auth(from);

        eosio_assert(quantity.is_valid(), "Invalid transfer amount.");
        eosio_assert(quantity.symbol == EOS_SYMBOL, "token is not supported");
        eosio_assert(quantity.amount > 0, "Transfer amount not positive");
        eosio_assert(!memo.empty(), "Memo is required");

        // only plain transfers signed by the sender may place bets, never a contract's inline action
        eosio::action act = eosio::get_action( 1, 0 );
        eosio_assert(act.name == name("transfer") && act.authorization[0].actor == from, "Contract not allowed");

        return true;
    }

    //###############    Token ledger  ######################
    struct token_account {
        asset balance;

        uint64_t primary_key() const { return balance.symbol.code().raw(); }
    };
    typedef multi_index<name("accounts"), token_account> token_accounts;

    /**
     * Balance of the owner account as recorded by the token contract
     */
    int64_t token_balance(name owner, symbol sym) {
        token_accounts accounts(EOS_TOKEN_CONTRACT, owner.value);
        auto iter = accounts.find(sym.code().raw());
        return iter == accounts.end() ? 0 : iter->balance.amount;
    }

    void send_token(name self, name to, asset quantity, const string& memo) {
        action(permission_level{self, name("active")}, EOS_TOKEN_CONTRACT, name("transfer"),
               make_tuple(self, to, quantity, memo)).send();
    }
}
