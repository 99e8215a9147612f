#pragma once
#include <eosiolib/eosio.hpp>
#include <eosiolib/crypto.h>
#include <eosiolib/system.h>
#include <eosiolib/transaction.h>
#include <cstring>

#include "tables.hpp"
#include "uint256.hpp"

/**
 * Entropy source mixing chain state into a persistent accumulator.
 * Best-effort unpredictability only: a block producer can bias the tapos inputs.
 */
namespace luckpool {

    #define DEFINE_ENTROPY_TABLES \
        TABLE seedpool { \
            uint64_t id; \
            capi_checksum256 accumulator; \
            uint64_t primary_key() const { return id; } \
        }; \
        typedef multi_index<name("seedpool"), seedpool> seedpool_index; \
        \
        TABLE playernonce { \
            name player; \
            uint64_t value; \
            uint64_t primary_key() const { return player.value; } \
        }; \
        typedef multi_index<name("nonces"), playernonce> nonce_index;

    // both inputs are zeroed before use so padding bytes hash deterministically
    struct entropy_input {
        capi_checksum256 accumulator;
        uint64_t caller;
        uint64_t self;
        uint64_t nonce;
        uint64_t time;
        uint64_t trx_size;
        int32_t block_num;
        int32_t block_prefix;
    };

    struct rehash_input {
        capi_checksum256 draw;
        uint64_t caller;
        uint64_t time;
        int32_t block_prefix;
    };

    template<typename Contract>
    class random {
    public:
        random(const Contract& contract, name caller):
            _self(contract.get_self()),
            _caller(caller),
            _pool(_self, _self.value),
            _nonces(_self, _self.value) {
        }

        /**
         * Fresh 256-bit draw. Advances the caller's nonce and folds the draw back into the accumulator.
         */
        capi_checksum256 draw_raw() {
            _nonce = next_nonce();

            entropy_input input;
            memset(&input, 0, sizeof(input));
            input.accumulator = accumulator();
            input.caller = _caller.value;
            input.self = _self.value;
            input.nonce = _nonce;
            input.time = current_time();
            input.trx_size = transaction_size();
            input.block_num = tapos_block_num();
            input.block_prefix = tapos_block_prefix();

            capi_checksum256 result;
            sha256((char *) &input, sizeof(input), &result);

            capi_checksum256 mixed = input.accumulator;
            for (size_t i = 0; i < sizeof(mixed.hash); i++) {
                mixed.hash[i] ^= result.hash[i];
            }
            table_upsert(_pool, _self, 0, [&](auto& a) {
                a.id = 0;
                a.accumulator = mixed;
            });
            return result;
        }

        /**
         * Uniform number in [0, max-1], rejection sampled so no residue is favoured
         */
        uint64_t generator(uint64_t max) {
            eosio_assert(max > 0, "random range must be positive");

            capi_checksum256 draw = draw_raw();
            return uint256_math::reduce(uint256_math::from_bytes(draw.hash), max,
                [&](const uint256_words& rejected) {
                    rehash_input input;
                    memset(&input, 0, sizeof(input));
                    uint256_math::to_bytes(rejected, input.draw.hash);
                    input.caller = _caller.value;
                    input.time = current_time();
                    input.block_prefix = tapos_block_prefix();

                    capi_checksum256 next;
                    sha256((char *) &input, sizeof(input), &next);
                    return uint256_math::from_bytes(next.hash);
                });
        }

        // nonce consumed by the latest draw_raw
        uint64_t nonce() const {
            return _nonce;
        }

    private:
        capi_checksum256 accumulator() const {
            auto iter = _pool.find(0);
            if (iter == _pool.end()) {
                capi_checksum256 empty{};
                return empty;
            }
            return iter->accumulator;
        }

        uint64_t next_nonce() {
            uint64_t value = table_field(_nonces, _caller.value, [](const auto& a) { return a.value; }, (uint64_t) 0) + 1;
            table_upsert(_nonces, _self, _caller.value, [&](auto& a) {
                a.player = _caller;
                a.value = value;
            });
            return value;
        }

        name _self;
        name _caller;
        typename Contract::seedpool_index _pool;
        typename Contract::nonce_index _nonces;
        uint64_t _nonce = 0;
    };
}
