#pragma once

#define EOS_TOKEN_CONTRACT name("eosio.token")
#define EOS_SYMBOL symbol("EOS", 4)

#define RECEIPT_PREFIX "[luckpool] "

// betting limits in token units, tunable through setconfig
#define DEFAULT_MIN_BET             1000
#define DEFAULT_MAX_BET             10000000

#define ERR_INVALID_BET             "invalid bet"
#define ERR_INSUFFICIENT_BANKROLL   "insufficient bankroll"
#define ERR_PAYOUT_CAP              "payout exceeds bankroll cap"
#define ERR_NOTHING_TO_CLAIM        "nothing to claim"
#define ERR_NOT_OWNER               "not owner"
#define ERR_REENTRANCY              "reentrant call"
#define ERR_BETTING_CLOSED          "betting closed"
#define ERR_ROUND_OPEN              "round still open"
#define ERR_INVALID_MEMO            "invalid memo"
#define ERR_INVALID_CONFIG_KEY      "invalid config key"
#define ERR_NOT_INITIALIZED         "contract not initialized"
#define ERR_ALREADY_INITIALIZED     "already initialized"
#define ERR_LEDGER_CORRUPT          "pending prizes exceed held balance"
