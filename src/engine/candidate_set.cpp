#include "candidate_set.hpp"
#include "raptor/error.hpp"
#include <algorithm>
#include <cmath>

namespace raptor::engine {

    CandidateSet::CandidateSet(size_t capacity) : m_capacity(capacity) {
        if (capacity == 0) {
            throw Error(ErrorCode::InvalidArgument, "Size must be a positive integer.");
        }
        m_entries.reserve(capacity);
    }

    void CandidateSet::add(const std::string& key, float value) {
        if (key.empty()) throw Error(ErrorCode::InvalidArgument, "Key must be provided.");
        if (std::isnan(value)) throw Error(ErrorCode::InvalidArgument, "Value must be provided.");

        if (m_entries.size() < m_capacity) {
            m_entries.push_back({key, value});
            return;
        }

        size_t min_index = 0;
        for (size_t i = 1; i < m_entries.size(); ++i) {
            if (m_entries[i].value < m_entries[min_index].value) min_index = i;
        }

        if (value > m_entries[min_index].value) {
            m_entries[min_index] = {key, value};
        }
    }

    std::vector<CandidateSet::Entry> CandidateSet::entries() const {
        std::vector<Entry> sorted = m_entries;
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const Entry& a, const Entry& b) { return a.value > b.value; });
        return sorted;
    }

    std::vector<std::string> CandidateSet::keys() const {
        std::vector<std::string> result;
        for (auto& entry : entries()) {
            result.push_back(std::move(entry.key));
        }
        return result;
    }

}
