#pragma once

#include <string>
#include <eosiolib/eosio.hpp>
#include "./constants.hpp"

namespace luckpool {
    using namespace std;
    using namespace eosio;

    /**
     * Reads comma separated transfer memo fields, e.g. "play,10000,120"
     */
    class param_reader {
    public:
        param_reader(const string& params, char separator = ','):_params(params), _separator(separator), _last_pos(0) {
        }

        string next_param(const char* error_msg = ERR_INVALID_MEMO) {
            eosio_assert(has_next(), error_msg);

            size_t new_pos = _params.find(_separator, _last_pos);
            if (new_pos == string::npos) {
                new_pos = _params.length();
            }

            string result = _params.substr(_last_pos, new_pos - _last_pos);
            _last_pos = new_pos + 1;
            return result;
        }

        uint64_t next_param_i64(const char* error_msg = ERR_INVALID_MEMO) {
            string param = next_param(error_msg);
            eosio_assert(!param.empty() && param.length() <= 19, error_msg);

            uint64_t result = 0;
            for (char c: param) {
                eosio_assert(c >= '0' && c <= '9', error_msg);
                result = result * 10 + (c - '0');
            }
            return result;
        }

        bool has_next() const {
            return _last_pos < _params.length();
        }

        void expect_end(const char* error_msg = ERR_INVALID_MEMO) const {
            eosio_assert(!has_next(), error_msg);
        }

    private:
        const string& _params;
        char _separator;
        size_t _last_pos;
    };
}
