#pragma once

#include <cstdint>
#include <cstddef>

// multipliers are expressed in tenths: 15 == 1.5x
#define MULTIPLIER_SCALE            10
#define BASIS_POINTS                10000

#define COINFLIP_SIDES              2
#define COINFLIP_MULTIPLIER         20

#define WHEEL_SEGMENT_COUNT         7
#define WHEEL_MAX_MULTIPLIER        100

#define CRASH_DRAW_RANGE            1000000000ULL
#define CRASH_MIN_MULTIPLIER        10
#define CRASH_MAX_MULTIPLIER        300
#define CRASH_MIN_CASHOUT           11
#define CRASH_MAX_CASHOUT           300
#define CRASH_HOUSE_EDGE_BP         200
#define CRASH_PAYOUT_CAP_BP         2500

namespace luckpool {

    /**
     * bet * multiplier / MULTIPLIER_SCALE, truncating. Widened so max bets cannot overflow.
     */
    inline int64_t scale_payout(int64_t bet, uint64_t multiplier) {
        return (int64_t) (((__int128) bet * multiplier) / MULTIPLIER_SCALE);
    }

    class coinflip_odds {
    public:
        static int64_t max_payout(int64_t bet) {
            return scale_payout(bet, COINFLIP_MULTIPLIER);
        }

        static bool won(uint64_t result, uint8_t guess) {
            return result == guess;
        }

        // even money, the edge is structural so nothing is deducted
        static int64_t payout(int64_t bet, bool won) {
            return won ? scale_payout(bet, COINFLIP_MULTIPLIER) : 0;
        }
    };

    struct wheel_segment {
        uint16_t weight;
        uint16_t multiplier;
    };

    // weights in basis points, summing to BASIS_POINTS
    const wheel_segment WHEEL_SEGMENTS[WHEEL_SEGMENT_COUNT] = {
        {1900, 0},
        {1900, 0},
        {2200, 15},
        {2100, 20},
        {1000, 30},
        {600, 50},
        {300, 100},
    };

    // Alternative table published alongside the wheel. Not used for draws.
    const uint16_t WHEEL_DOC_WEIGHTS[WHEEL_SEGMENT_COUNT] = {2250, 2250, 1800, 1800, 1000, 600, 300};

    class wheel_odds {
    public:
        static int64_t max_payout(int64_t bet) {
            return scale_payout(bet, WHEEL_MAX_MULTIPLIER);
        }

        /**
         * First segment whose cumulative weight exceeds roll. A roll equal to a cumulative
         * boundary therefore lands in the following segment.
         * @param roll Value in [0, BASIS_POINTS)
         */
        static uint8_t select(uint64_t roll) {
            uint64_t cumulative = 0;
            for (uint8_t i = 0; i < WHEEL_SEGMENT_COUNT; i++) {
                cumulative += WHEEL_SEGMENTS[i].weight;
                if (roll < cumulative) {
                    return i;
                }
            }
            return WHEEL_SEGMENT_COUNT - 1;
        }

        static uint16_t multiplier(uint8_t segment) {
            return WHEEL_SEGMENTS[segment].multiplier;
        }

        static int64_t payout(int64_t bet, uint8_t segment) {
            return scale_payout(bet, multiplier(segment));
        }

        static uint64_t total_weight() {
            uint64_t total = 0;
            for (const wheel_segment& segment: WHEEL_SEGMENTS) {
                total += segment.weight;
            }
            return total;
        }
    };

    class crash_odds {
    public:
        // worst case for any bet in a round is the multiplier cap
        static int64_t max_payout(int64_t bet) {
            return scale_payout(bet, CRASH_MAX_MULTIPLIER);
        }

        static bool valid_cashout(uint64_t cashout) {
            return cashout >= CRASH_MIN_CASHOUT && cashout <= CRASH_MAX_CASHOUT;
        }

        /**
         * Heavy-tailed multiplier from a uniform draw in [0, CRASH_DRAW_RANGE)
         * @return Multiplier in tenths, within [CRASH_MIN_MULTIPLIER, CRASH_MAX_MULTIPLIER]
         */
        static uint64_t multiplier_from_draw(uint64_t draw) {
            if (draw < 1) {
                draw = 1;
            }
            uint64_t multiplier = (CRASH_DRAW_RANGE * MULTIPLIER_SCALE) / (CRASH_DRAW_RANGE - draw);
            if (multiplier < CRASH_MIN_MULTIPLIER) {
                multiplier = CRASH_MIN_MULTIPLIER;
            }
            if (multiplier > CRASH_MAX_MULTIPLIER) {
                multiplier = CRASH_MAX_MULTIPLIER;
            }
            return multiplier;
        }

        static bool won(uint64_t cashout, uint64_t crash_multiplier) {
            return cashout <= crash_multiplier;
        }

        static int64_t payout(int64_t bet, uint64_t cashout) {
            int64_t gross = scale_payout(bet, cashout);
            return (int64_t) (((__int128) gross * (BASIS_POINTS - CRASH_HOUSE_EDGE_BP)) / BASIS_POINTS);
        }

        /**
         * A single payout may take at most CRASH_PAYOUT_CAP_BP of the available bankroll
         */
        static bool exceeds_cap(int64_t payout, int64_t available) {
            return (__int128) payout * BASIS_POINTS > (__int128) available * CRASH_PAYOUT_CAP_BP;
        }
    };
}
