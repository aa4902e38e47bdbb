#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "raptor/types.hpp"

namespace raptor::engine {

    /**
     * @brief Keeps the K highest-valued (key, value) pairs seen in one pass.
     *
     * Insertion is O(K) once full (linear scan for the minimum).
     */
    class CandidateSet {
    public:
        struct Entry {
            std::string key;
            float value;
        };

        explicit CandidateSet(size_t capacity = 5);

        /**
         * @brief Offers a pair. Replaces the current minimum only if `value` is strictly larger.
         * @throws Error InvalidArgument for an empty key or a NaN value.
         */
        void add(const std::string& key, float value);

        /**
         * @brief Held pairs, highest value first.
         */
        std::vector<Entry> entries() const;
        std::vector<std::string> keys() const;

        size_t count() const { return m_entries.size(); }
        size_t capacity() const { return m_capacity; }

    private:
        size_t m_capacity;
        std::vector<Entry> m_entries;
    };

}
