#pragma once

#include <eosiolib/eosio.hpp>

namespace luckpool {
    using namespace eosio;

    /**
     * Insert the row under key, or update it in place when it already exists
     */
    template<typename T, typename Lambda>
    void table_upsert(T& table, const name& payer, uint64_t key, Lambda&& updater){
        auto iter = table.find(key);

        if (iter == table.end()) {
            table.emplace(payer, updater);
        } else {
            table.modify(iter, payer, updater);
        }
    }

    template<typename T, typename Lambda>
    void table_modify(T& table, const name& payer, uint64_t key, Lambda&& updater){
        auto iter = table.find(key);

        eosio_assert(iter != table.end(), "item does not exist");
        table.modify(iter, payer, updater);
    }

    /**
     * Read a single field of a row, falling back to default_value for a missing row
     * @param getter Extracts the field from the row
     */
    template<typename T, typename Getter>
    auto table_field(const T& table, uint64_t key, Getter&& getter, decltype(getter(*table.begin())) default_value) {
        auto iter = table.find(key);
        return iter == table.end() ? default_value : getter(*iter);
    }
}
