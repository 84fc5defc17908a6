#pragma once

#include <algorithm>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "common/models.hpp"

namespace sheltercontrol {

// Keyed buckets, iterated in ascending key order.
using BucketMap = std::map<std::string, AggregationBucket>;

inline double quantityOf(const ShelteredPerson &)
{
    return 0.0;
}

inline double quantityOf(const FoodDonation &donation)
{
    return donation.quantityKg;
}

inline double quantityOf(const FoodDelivery &delivery)
{
    return delivery.quantityKg;
}

// Sum that does not depend on the order of the inputs.
double stableSum(std::vector<double> values);

/**
 * Groups records under keyFn(record), counting them and summing their
 * quantity. An empty key lands in the sentinel bucket, so no record is ever
 * dropped here; callers filter beforehand when a view needs a date.
 *
 * Each bucket's total is summed over its members in sorted order, which keeps
 * totals bit-identical however the input collection happens to be ordered.
 */
template <typename Record, typename KeyFn>
BucketMap groupBy(const std::vector<Record> &records, KeyFn keyFn,
                  const std::string &sentinel = kUnspecifiedLabel)
{
    std::map<std::string, std::vector<double>> quantities;
    for (const auto &record : records) {
        std::string key = keyFn(record);
        if (key.empty()) {
            key = sentinel;
        }
        quantities[key].push_back(quantityOf(record));
    }

    BucketMap buckets;
    for (auto &entry : quantities) {
        AggregationBucket bucket;
        bucket.key = entry.first;
        bucket.count = static_cast<int>(entry.second.size());
        bucket.totalKg = stableSum(std::move(entry.second));
        buckets.emplace(entry.first, std::move(bucket));
    }
    return buckets;
}

template <typename Record>
double totalKg(const std::vector<Record> &records)
{
    std::vector<double> values;
    values.reserve(records.size());
    for (const auto &record : records) {
        values.push_back(quantityOf(record));
    }
    return stableSum(std::move(values));
}

std::vector<AggregationBucket> sortedByKey(const BucketMap &buckets);

/**
 * Leaderboard: the first n buckets by total kg, descending. Ties are broken
 * by key ascending, then by count descending, so the ordering is total and
 * re-ranking a ranked list returns it unchanged.
 */
std::vector<AggregationBucket> topN(std::vector<AggregationBucket> buckets, std::size_t n);

std::vector<AggregationBucket> topN(const BucketMap &buckets, std::size_t n);

/**
 * numerator / max(denominator, 1).
 *
 * This is an approximation, not a true quotient: denominators between 0 and 1
 * count as 1, and an empty (zero or negative) denominator yields 0 instead of
 * an undefined value. The result is always finite.
 */
double ratio(double numerator, double denominator);

// Arithmetic mean; 0.0 for an empty input.
double average(const std::vector<double> &values);

/**
 * Fixed key set over the given collections. Persons, donations and
 * deliveries are counted whether or not their date parsed. Donor identity is
 * the exact donor string (case-sensitive, no fuzzy matching).
 */
SummaryStats summaryStats(const std::vector<ShelteredPerson> &persons,
                          const std::vector<FoodDonation> &donations,
                          const std::vector<FoodDelivery> &deliveries);

} // namespace sheltercontrol
