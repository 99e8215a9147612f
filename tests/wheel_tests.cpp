#include <boost/test/unit_test.hpp>

#include "luckpool_tester.hpp"

namespace {
   // multipliers in tenths, by segment
   const uint64_t segment_multipliers[] = {0, 0, 15, 20, 30, 50, 100};
}

class wheel_tester : public luckpool_tester {
public:
   wheel_tester() : luckpool_tester(N(wheel), contracts::wheel_wasm(), contracts::wheel_abi()) {}

   action_result spin(account_name player, const string& quantity, const string& memo) {
      action_result result = transfer(player, game, quantity, memo);
      produce_blocks();
      return result;
   }
};

BOOST_AUTO_TEST_SUITE(wheel_tests)

BOOST_FIXTURE_TEST_CASE(spins_record_last_result, wheel_tester) try {
   BOOST_REQUIRE_EQUAL(success(), deposit("1000.0000 EOS"));

   int64_t won = 0;
   for (uint64_t i = 1; i <= 25; i++) {
      int64_t before = pending_of(N(bob));
      BOOST_REQUIRE_EQUAL(success(), spin(N(bob), "1.0100 EOS", "spin,10100"));

      fc::variant last = get_row(N(lastspin), N(bob), "lastspin");
      BOOST_REQUIRE(!last.is_null());

      uint64_t outcome = last["outcome"].as_uint64();
      uint64_t multiplier = last["multiplier"].as_uint64();
      uint64_t amount = last["amount"].as_uint64();

      BOOST_REQUIRE_LT(outcome, 7u);
      BOOST_REQUIRE_EQUAL(segment_multipliers[outcome], multiplier);
      BOOST_REQUIRE_EQUAL(10100 * multiplier / 10, amount);
      BOOST_REQUIRE_EQUAL(multiplier > 0, last["won"].as_bool());
      BOOST_REQUIRE_EQUAL(i, last["nonce"].as_uint64());

      BOOST_REQUIRE_EQUAL(before + (int64_t) amount, pending_of(N(bob)));
      won += amount;
      check_ledger();
   }

   fc::variant stats = get_row(N(userstats), N(bob), "userstat");
   BOOST_REQUIRE_EQUAL(25 * 10100u, stats["total_bet"].as_uint64());
   BOOST_REQUIRE_EQUAL((uint64_t) won, stats["total_won"].as_uint64());

   fc::variant nonce = get_row(N(nonces), N(bob), "playernonce");
   BOOST_REQUIRE_EQUAL(25u, nonce["value"].as_uint64());
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(nonces_are_per_player, wheel_tester) try {
   BOOST_REQUIRE_EQUAL(success(), deposit("1000.0000 EOS"));

   BOOST_REQUIRE_EQUAL(success(), spin(N(alice), "1.0000 EOS", "spin,10000"));
   BOOST_REQUIRE_EQUAL(success(), spin(N(alice), "1.0000 EOS", "spin,10000"));
   BOOST_REQUIRE_EQUAL(success(), spin(N(carol), "1.0000 EOS", "spin,10000"));

   BOOST_REQUIRE_EQUAL(2u, get_row(N(lastspin), N(alice), "lastspin")["nonce"].as_uint64());
   BOOST_REQUIRE_EQUAL(1u, get_row(N(lastspin), N(carol), "lastspin")["nonce"].as_uint64());
   BOOST_REQUIRE(!get_row_by_account(game, game, N(seedpool), account_name(0)).empty());
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(rejected_spin_leaves_no_trace, wheel_tester) try {
   // 10x the stake is needed up front
   BOOST_REQUIRE_EQUAL(success(), deposit("8.0000 EOS"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("insufficient bankroll"), spin(N(bob), "1.0000 EOS", "spin,10000"));

   BOOST_REQUIRE(get_row(N(nonces), N(bob), "playernonce").is_null());
   BOOST_REQUIRE(get_row(N(lastspin), N(bob), "lastspin").is_null());
   BOOST_REQUIRE(get_row(N(userstats), N(bob), "userstat").is_null());
   BOOST_REQUIRE_EQUAL(80000, held());

   BOOST_REQUIRE_EQUAL(success(), deposit("1.0000 EOS"));
   BOOST_REQUIRE_EQUAL(success(), spin(N(bob), "1.0000 EOS", "spin,10000"));
   BOOST_REQUIRE_EQUAL(1u, get_row(N(lastspin), N(bob), "lastspin")["nonce"].as_uint64());
   check_ledger();
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(invalid_spins_are_rejected, wheel_tester) try {
   BOOST_REQUIRE_EQUAL(success(), deposit("1000.0000 EOS"));

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("invalid bet"), spin(N(bob), "1.0000 EOS", "spin,10001"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("invalid bet"), spin(N(bob), "1.0000 EOS", "spin,"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("invalid memo"), spin(N(bob), "1.0000 EOS", "spin,10000,1"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("invalid memo"), spin(N(bob), "1.0000 EOS", "flip,1,10000"));
   BOOST_REQUIRE_EQUAL(wasm_assert_msg("Memo is required"), spin(N(bob), "1.0000 EOS", ""));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(bet_before_init_is_rejected, tester) try {
   create_accounts({ N(eosio.token), N(wheel), N(alice) });
   produce_blocks(2);
   set_code(N(eosio.token), contracts::token_wasm());
   set_abi(N(eosio.token), contracts::token_abi().data());
   set_code(N(wheel), contracts::wheel_wasm());
   set_abi(N(wheel), contracts::wheel_abi().data());
   produce_blocks();

   push_action(N(eosio.token), N(create), N(eosio.token), mvo()
      ("issuer", "eosio.token")
      ("maximum_supply", "1000.0000 EOS"));
   push_action(N(eosio.token), N(issue), N(eosio.token), mvo()
      ("to", "eosio.token")
      ("quantity", "1000.0000 EOS")
      ("memo", ""));
   push_action(N(eosio.token), N(transfer), N(eosio.token), mvo()
      ("from", "eosio.token")
      ("to", "alice")
      ("quantity", "10.0000 EOS")
      ("memo", ""));

   BOOST_REQUIRE_EXCEPTION(push_action(N(eosio.token), N(transfer), N(alice), mvo()
                              ("from", "alice")
                              ("to", "wheel")
                              ("quantity", "1.0000 EOS")
                              ("memo", "spin,10000")),
                           eosio_assert_message_exception, eosio_assert_message_is("contract not initialized"));
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
