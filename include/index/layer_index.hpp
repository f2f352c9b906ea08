#pragma once

#include "time/timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace tempo {

/**
 * @brief Coarse time-bucketed index over document ids
 *
 * Each document lives in exactly one bucket, derived from its canonical
 * timestamp when it is inserted. Buckets are never rewritten in place; the
 * index is only an accelerator for range queries.
 */
struct LayerIndex {
    int layer_days = 7;

    // Bucket number (layer_days-wide periods since the epoch) -> document ids
    std::map<int64_t, std::set<std::string>> buckets;

    explicit LayerIndex(int days = 7) : layer_days(days) {
        if (days <= 0) {
            throw std::invalid_argument("Layer width must be positive");
        }
    }

    int64_t bucket_of(const Timestamp& ts) const {
        return ts.week_bucket(layer_days);
    }

    void insert(const std::string& doc_id, const Timestamp& ts) {
        buckets[bucket_of(ts)].insert(doc_id);
    }

    // Buckets that can hold timestamps in [start, end]
    std::vector<int64_t> buckets_in_range(const Timestamp& start, const Timestamp& end) const {
        std::vector<int64_t> result;
        if (end < start) {
            return result;
        }

        auto first = buckets.lower_bound(bucket_of(start));
        auto last = buckets.upper_bound(bucket_of(end));
        for (auto it = first; it != last; ++it) {
            result.push_back(it->first);
        }
        return result;
    }

    const std::set<std::string>* bucket(int64_t number) const {
        auto it = buckets.find(number);
        return it != buckets.end() ? &it->second : nullptr;
    }

    // Neighbouring buckets that actually hold documents
    std::vector<int64_t> adjacent(int64_t number) const {
        std::vector<int64_t> result;
        if (buckets.count(number - 1)) {
            result.push_back(number - 1);
        }
        if (buckets.count(number + 1)) {
            result.push_back(number + 1);
        }
        return result;
    }

    size_t num_layers() const { return buckets.size(); }

    size_t num_entries() const {
        size_t total = 0;
        for (const auto& [number, ids] : buckets) {
            total += ids.size();
        }
        return total;
    }

    void clear() { buckets.clear(); }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["layer_days"] = layer_days;

        nlohmann::json layers = nlohmann::json::object();
        for (const auto& [number, ids] : buckets) {
            layers["layer_" + std::to_string(number)] =
                std::vector<std::string>(ids.begin(), ids.end());
        }
        j["layers"] = layers;
        return j;
    }
};

} // namespace tempo
