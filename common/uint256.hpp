#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

namespace luckpool {

    /**
     * 256-bit unsigned value as four 64-bit words, most significant word first.
     * Only the operations needed to reduce a hash into a bounded range without bias.
     */
    typedef std::array<uint64_t, 4> uint256_words;

    class uint256_math {
    public:
        /**
         * Interpret 32 bytes (e.g. a sha256 digest) as a big-endian number
         */
        static uint256_words from_bytes(const uint8_t* bytes) {
            uint256_words result{};
            for (size_t word = 0; word < 4; word++) {
                uint64_t value = 0;
                for (size_t i = 0; i < 8; i++) {
                    value = (value << 8) | bytes[word * 8 + i];
                }
                result[word] = value;
            }
            return result;
        }

        static void to_bytes(const uint256_words& value, uint8_t* bytes) {
            for (size_t word = 0; word < 4; word++) {
                for (size_t i = 0; i < 8; i++) {
                    bytes[word * 8 + i] = (uint8_t) (value[word] >> (56 - 8 * i));
                }
            }
        }

        static uint64_t mod(const uint256_words& value, uint64_t modulus) {
            unsigned __int128 remainder = 0;
            for (uint64_t word: value) {
                remainder = ((remainder << 64) | word) % modulus;
            }
            return (uint64_t) remainder;
        }

        /**
         * MAX_UINT256 mod modulus, the size of the biased tail at the top of the range
         */
        static uint64_t max_residue(uint64_t modulus) {
            return mod(max_value(), modulus);
        }

        static uint256_words max_value() {
            return uint256_words{{~0ULL, ~0ULL, ~0ULL, ~0ULL}};
        }

        /**
         * limit = MAX_UINT256 - (MAX_UINT256 mod modulus). [0, limit) holds an exact multiple of
         * modulus values; a draw at or above limit would favour the low residues.
         */
        static uint256_words rejection_limit(uint64_t modulus) {
            uint256_words limit = max_value();
            limit[3] -= max_residue(modulus);
            return limit;
        }

        static bool less_than(const uint256_words& a, const uint256_words& b) {
            for (size_t i = 0; i < 4; i++) {
                if (a[i] != b[i]) {
                    return a[i] < b[i];
                }
            }
            return false;
        }

        /**
         * Reduce draw into [0, modulus), drawing again through rehash while it lies in the biased tail
         * @param draw Initial 256-bit draw
         * @param modulus Upper bound, must be positive
         * @param rehash Callable producing the next draw from the rejected one
         */
        template<typename Rehash>
        static uint64_t reduce(uint256_words draw, uint64_t modulus, Rehash&& rehash) {
            const uint256_words limit = rejection_limit(modulus);
            while (!less_than(draw, limit)) {
                draw = rehash(draw);
            }
            return mod(draw, modulus);
        }
    };
}
