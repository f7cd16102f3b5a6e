#ifndef PIISHIELD_CORE_OCCUPATION_MAP_HPP
#define PIISHIELD_CORE_OCCUPATION_MAP_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file occupation_map.hpp
 * @brief Tracks which byte ranges of one input string are already claimed.
 *
 * DESIGN GOALS:
 *   - One map per resolution pass; it is created for a single string, used by
 *     a single thread and discarded afterwards.
 *   - Two operations: isFree([start,end)) and claim([start,end)).
 *   - claim() is a union: claiming a range that is already claimed, wholly or
 *     partly, leaves the map consistent.
 *   - IntervalOccupationMap keeps a sorted, merged interval list and suits
 *     sentence-scale inputs. BitmapOccupationMap trades memory for O(length)
 *     checks without searching. Both are interchangeable behind OccupationMap.
 */

namespace piishield {
namespace core {

class OccupationMap
{
public:
    virtual ~OccupationMap() = default;

    /// True if no byte of [start, end) is claimed.
    virtual bool isFree(std::size_t start, std::size_t end) const = 0;

    /// Mark every byte of [start, end) as claimed.
    virtual void claim(std::size_t start, std::size_t end) = 0;

    /// Number of claimed bytes.
    virtual std::size_t claimedBytes() const = 0;
};

/**
 * @brief Builds a fresh map for a text of the given byte length.
 */
using OccupationMapFactory = std::function<std::unique_ptr<OccupationMap>(std::size_t textLength)>;

/**
 * @class IntervalOccupationMap
 * @brief Sorted list of disjoint, non-adjacent half-open intervals.
 */
class IntervalOccupationMap : public OccupationMap
{
public:
    bool isFree(std::size_t start, std::size_t end) const override
    {
        if (end <= start) {
            return true;
        }
        // First interval whose start is >= end cannot overlap; check its predecessor chain.
        auto it = std::lower_bound(intervals_.begin(), intervals_.end(), end,
            [](const Interval &iv, std::size_t value) { return iv.first < value; });
        if (it == intervals_.begin()) {
            return true;
        }
        --it;
        return it->second <= start;
    }

    void claim(std::size_t start, std::size_t end) override
    {
        if (end <= start) {
            throw std::invalid_argument("IntervalOccupationMap: empty claim");
        }

        // Intervals touching or overlapping [start, end) are merged into it.
        auto first = std::lower_bound(intervals_.begin(), intervals_.end(), start,
            [](const Interval &iv, std::size_t value) { return iv.second < value; });
        auto last = first;
        while (last != intervals_.end() && last->first <= end) {
            start = std::min(start, last->first);
            end = std::max(end, last->second);
            ++last;
        }
        first = intervals_.erase(first, last);
        intervals_.insert(first, Interval(start, end));
    }

    std::size_t claimedBytes() const override
    {
        std::size_t total = 0;
        for (const auto &iv : intervals_) {
            total += iv.second - iv.first;
        }
        return total;
    }

    std::size_t intervalCount() const { return intervals_.size(); }

private:
    using Interval = std::pair<std::size_t, std::size_t>;
    std::vector<Interval> intervals_;
};

/**
 * @class BitmapOccupationMap
 * @brief One flag per byte of the text.
 */
class BitmapOccupationMap : public OccupationMap
{
public:
    explicit BitmapOccupationMap(std::size_t textLength)
        : claimed_(textLength, false)
        , count_(0)
    {
    }

    bool isFree(std::size_t start, std::size_t end) const override
    {
        checkRange(start, end);
        for (std::size_t i = start; i < end; ++i) {
            if (claimed_[i]) {
                return false;
            }
        }
        return true;
    }

    void claim(std::size_t start, std::size_t end) override
    {
        checkRange(start, end);
        if (end <= start) {
            throw std::invalid_argument("BitmapOccupationMap: empty claim");
        }
        for (std::size_t i = start; i < end; ++i) {
            if (!claimed_[i]) {
                claimed_[i] = true;
                ++count_;
            }
        }
    }

    std::size_t claimedBytes() const override { return count_; }

private:
    void checkRange(std::size_t start, std::size_t end) const
    {
        if (start > end || end > claimed_.size()) {
            throw std::out_of_range("BitmapOccupationMap: range [" + std::to_string(start) + ","
                + std::to_string(end) + ") outside text of length " + std::to_string(claimed_.size()));
        }
    }

    std::vector<bool> claimed_;
    std::size_t count_;
};

inline std::unique_ptr<OccupationMap> makeIntervalOccupationMap(std::size_t /*textLength*/)
{
    return std::make_unique<IntervalOccupationMap>();
}

inline std::unique_ptr<OccupationMap> makeBitmapOccupationMap(std::size_t textLength)
{
    return std::make_unique<BitmapOccupationMap>(textLength);
}

} // namespace core
} // namespace piishield

#endif // PIISHIELD_CORE_OCCUPATION_MAP_HPP
