#include "engine/aggregator.hpp"

#include <cmath>
#include <set>

namespace sheltercontrol {

double stableSum(std::vector<double> values)
{
    std::sort(values.begin(), values.end());
    double sum = 0.0;
    for (const double value : values) {
        sum += value;
    }
    return sum;
}

std::vector<AggregationBucket> sortedByKey(const BucketMap &buckets)
{
    std::vector<AggregationBucket> sorted;
    sorted.reserve(buckets.size());
    for (const auto &entry : buckets) {
        sorted.push_back(entry.second);
    }
    return sorted;
}

std::vector<AggregationBucket> topN(std::vector<AggregationBucket> buckets, std::size_t n)
{
    std::stable_sort(buckets.begin(), buckets.end(),
                     [](const AggregationBucket &a, const AggregationBucket &b) {
                         if (a.totalKg != b.totalKg) {
                             return a.totalKg > b.totalKg;
                         }
                         if (a.key != b.key) {
                             return a.key < b.key;
                         }
                         return a.count > b.count;
                     });
    if (buckets.size() > n) {
        buckets.resize(n);
    }
    return buckets;
}

std::vector<AggregationBucket> topN(const BucketMap &buckets, std::size_t n)
{
    return topN(sortedByKey(buckets), n);
}

double ratio(double numerator, double denominator)
{
    if (!std::isfinite(numerator) || !std::isfinite(denominator)
        || denominator <= 0.0) {
        return 0.0;
    }
    return numerator / std::max(denominator, 1.0);
}

double average(const std::vector<double> &values)
{
    if (values.empty()) {
        return 0.0;
    }
    return ratio(stableSum(values), static_cast<double>(values.size()));
}

SummaryStats summaryStats(const std::vector<ShelteredPerson> &persons,
                          const std::vector<FoodDonation> &donations,
                          const std::vector<FoodDelivery> &deliveries)
{
    SummaryStats stats;
    stats.totalPersons = static_cast<int>(persons.size());
    stats.activePersons = static_cast<int>(std::count_if(
        persons.begin(), persons.end(),
        [](const ShelteredPerson &person) { return person.isActive; }));

    stats.totalDonations = static_cast<int>(donations.size());
    stats.availableDonations = static_cast<int>(std::count_if(
        donations.begin(), donations.end(),
        [](const FoodDonation &donation) { return !donation.isDelivered; }));
    stats.totalKgDonated = totalKg(donations);

    std::set<std::string> donors;
    for (const auto &donation : donations) {
        donors.insert(donation.donorName);
    }
    stats.uniqueDonors = static_cast<int>(donors.size());

    stats.totalDeliveries = static_cast<int>(deliveries.size());
    stats.totalKgDelivered = totalKg(deliveries);
    return stats;
}

} // namespace sheltercontrol
