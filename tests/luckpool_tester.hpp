#pragma once

#include <boost/test/unit_test.hpp>
#include <eosio/testing/tester.hpp>
#include <eosio/chain/abi_serializer.hpp>
#include <fc/variant_object.hpp>

#include <contracts.hpp>

using namespace eosio::chain;
using namespace eosio::testing;
using namespace fc;

using mvo = fc::mutable_variant_object;

// ids of the globals table rows
#define G_ID_OWNER                  101
#define G_ID_TOTAL_PENDING          102
#define G_ID_TOTAL_BET              103
#define G_ID_LOCKED                 104
#define G_ID_ROUND_ID               105
#define G_ID_MIN_BET                201

/**
 * Chain with eosio.token and one game contract deployed, funded players and an initialized bankroll
 */
class luckpool_tester : public tester {
public:
   luckpool_tester(account_name game, const std::vector<uint8_t>& wasm, const std::vector<char>& abi)
      : game(game) {
      produce_blocks(2);

      create_accounts({ N(eosio.token), N(owner), N(alice), N(bob), N(carol), game });
      produce_blocks(2);

      set_code(N(eosio.token), contracts::token_wasm());
      set_abi(N(eosio.token), contracts::token_abi().data());
      set_code(game, wasm);
      set_abi(game, abi.data());

      // the game sends prizes and receipts as inline actions
      set_authority(game, config::active_name,
                    authority(1, { key_weight{ get_public_key(game, "active"), 1 } },
                              { permission_level_weight{ { game, config::eosio_code_name }, 1 } }),
                    config::owner_name);
      produce_blocks();

      token_abi_ser = load_abi(N(eosio.token));
      game_abi_ser = load_abi(game);

      BOOST_REQUIRE_EQUAL(success(), push_action_to(N(eosio.token), token_abi_ser, N(eosio.token), N(create), mvo()
         ("issuer", "eosio.token")
         ("maximum_supply", "1000000000.0000 EOS")));
      BOOST_REQUIRE_EQUAL(success(), push_action_to(N(eosio.token), token_abi_ser, N(eosio.token), N(issue), mvo()
         ("to", "eosio.token")
         ("quantity", "1000000000.0000 EOS")
         ("memo", "")));
      for (const account_name& player : players()) {
         BOOST_REQUIRE_EQUAL(success(), transfer(N(eosio.token), player, "100000.0000 EOS", ""));
      }

      BOOST_REQUIRE_EQUAL(success(), push_game_action(game, N(init), mvo()("owner", "owner")));
      produce_blocks();
   }

   static std::vector<account_name> players() {
      return { N(owner), N(alice), N(bob), N(carol) };
   }

   abi_serializer load_abi(account_name account) {
      const auto& accnt = control->db().get<account_object, by_name>(account);
      abi_def abi;
      BOOST_REQUIRE_EQUAL(abi_serializer::to_abi(accnt.abi, abi), true);
      return abi_serializer(abi, abi_serializer_max_time);
   }

   action_result push_action_to(account_name code, const abi_serializer& ser, account_name signer,
                                const action_name& name, const variant_object& data) {
      string action_type_name = ser.get_action_type(name);

      action act;
      act.account = code;
      act.name = name;
      act.data = ser.variant_to_binary(action_type_name, data, abi_serializer_max_time);

      return base_tester::push_action(std::move(act), uint64_t(signer));
   }

   action_result push_game_action(account_name signer, const action_name& name, const variant_object& data) {
      return push_action_to(game, game_abi_ser, signer, name, data);
   }

   action_result transfer(account_name from, account_name to, const string& quantity, const string& memo) {
      return push_action_to(N(eosio.token), token_abi_ser, from, N(transfer), mvo()
         ("from", from)
         ("to", to)
         ("quantity", quantity)
         ("memo", memo));
   }

   action_result deposit(const string& quantity) {
      return transfer(N(owner), game, quantity, "deposit");
   }

   action_result claim(account_name player) {
      return push_game_action(player, N(claim), mvo()("player", player));
   }

   fc::variant get_row(const name& table, uint64_t key, const string& type) {
      vector<char> data = get_row_by_account(game, game, table, account_name(key));
      return data.empty() ? fc::variant() : game_abi_ser.binary_to_variant(type, data, abi_serializer_max_time);
   }

   uint64_t get_global(uint64_t key) {
      fc::variant row = get_row(N(globals), key, "globalvar");
      return row.is_null() ? 0 : row["val"].as_uint64();
   }

   int64_t pending_of(account_name player) {
      fc::variant row = get_row(N(pending), player.value, "prize");
      return row.is_null() ? 0 : row["amount"].as_int64();
   }

   int64_t balance_of(account_name account) {
      return get_currency_balance(N(eosio.token), symbol(4, "EOS"), account).get_amount();
   }

   int64_t held() {
      return balance_of(game);
   }

   int64_t available() {
      return held() - (int64_t) get_global(G_ID_TOTAL_PENDING);
   }

   /**
    * Ledger invariants after every action: the pending total matches the rows, the held balance
    * covers it and the lock is released
    */
   void check_ledger() {
      int64_t sum = 0;
      for (const account_name& player : players()) {
         sum += pending_of(player);
      }
      BOOST_REQUIRE_EQUAL(sum, (int64_t) get_global(G_ID_TOTAL_PENDING));
      BOOST_REQUIRE_GE(held(), sum);
      BOOST_REQUIRE_EQUAL(0u, get_global(G_ID_LOCKED));
   }

   account_name game;
   abi_serializer token_abi_ser;
   abi_serializer game_abi_ser;
};
