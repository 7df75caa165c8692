/**
 * @file rollingstats.h
 * @brief Rolling window and smoothed-average statistics for network estimates.
 *
 * Used by the adaptive controller (latency, throughput and loss windows) and
 * by the metrics store (smoothed transfer speed).
 */

#ifndef ROLLINGSTATS_H
#define ROLLINGSTATS_H

#include <algorithm>
#include <cstddef>
#include <limits>
#include <vector>

/**
 * @brief Mean, min, max and most recent value over a fixed window of samples.
 *
 * Samples are kept in a circular buffer. The running sum is updated in O(1);
 * min and max are rescanned only when the evicted sample was an extreme.
 *
 * @par Example usage:
 * @code
 * RollingStats latency(20);
 * latency.addSample(42.0);
 * latency.addSample(58.0);
 * double avg = latency.mean();   // 50.0
 * @endcode
 */
class RollingStats
{
public:
    /**
     * @brief Constructs a window holding at most @p windowSize samples.
     * @param windowSize Maximum number of samples kept (at least 1).
     */
    explicit RollingStats(size_t windowSize = 20)
        : windowSize_(std::max<size_t>(windowSize, 1))
    {
        samples_.reserve(windowSize_);
    }

    /**
     * @brief Adds a sample, evicting the oldest one when the window is full.
     * @param value The sample value.
     */
    void addSample(double value)
    {
        double evicted = 0.0;
        bool didEvict = false;

        if (samples_.size() < windowSize_) {
            samples_.push_back(value);
        } else {
            evicted = samples_[next_];
            samples_[next_] = value;
            sum_ -= evicted;
            didEvict = true;
        }
        next_ = (next_ + 1) % windowSize_;
        sum_ += value;
        last_ = value;

        if (didEvict && (evicted <= min_ || evicted >= max_)) {
            rescanExtremes();
        } else {
            min_ = std::min(min_, value);
            max_ = std::max(max_, value);
        }
    }

    /// @brief Mean of the samples in the window, or 0.0 when empty.
    [[nodiscard]] double mean() const
    {
        return samples_.empty() ? 0.0 : sum_ / static_cast<double>(samples_.size());
    }

    /// @brief Smallest sample in the window (+infinity when empty).
    [[nodiscard]] double min() const { return min_; }

    /// @brief Largest sample in the window (-infinity when empty).
    [[nodiscard]] double max() const { return max_; }

    /// @brief Most recently added sample, or 0.0 when none was added.
    [[nodiscard]] double last() const { return last_; }

    [[nodiscard]] size_t count() const { return samples_.size(); }
    [[nodiscard]] bool isEmpty() const { return samples_.empty(); }
    [[nodiscard]] bool isFull() const { return samples_.size() >= windowSize_; }
    [[nodiscard]] size_t windowSize() const { return windowSize_; }

    /// @brief Drops every sample.
    void clear()
    {
        samples_.clear();
        next_ = 0;
        sum_ = 0.0;
        last_ = 0.0;
        min_ = std::numeric_limits<double>::infinity();
        max_ = -std::numeric_limits<double>::infinity();
    }

private:
    void rescanExtremes()
    {
        min_ = std::numeric_limits<double>::infinity();
        max_ = -std::numeric_limits<double>::infinity();
        for (double sample : samples_) {
            min_ = std::min(min_, sample);
            max_ = std::max(max_, sample);
        }
    }

    size_t windowSize_;
    std::vector<double> samples_;
    size_t next_ = 0;
    double sum_ = 0.0;
    double last_ = 0.0;
    double min_ = std::numeric_limits<double>::infinity();
    double max_ = -std::numeric_limits<double>::infinity();
};

/**
 * @brief Exponentially weighted moving average.
 *
 * value = value * (1 - alpha) + sample * alpha. The first sample is blended
 * against an initial value of 0, so early estimates start low and converge.
 */
class SmoothedAverage
{
public:
    explicit SmoothedAverage(double alpha = 0.1)
        : alpha_(std::clamp(alpha, 0.0, 1.0))
    {
    }

    void addSample(double sample)
    {
        value_ = value_ * (1.0 - alpha_) + sample * alpha_;
        ++count_;
    }

    [[nodiscard]] double value() const { return value_; }
    [[nodiscard]] double alpha() const { return alpha_; }
    [[nodiscard]] size_t count() const { return count_; }

    void clear()
    {
        value_ = 0.0;
        count_ = 0;
    }

private:
    double alpha_;
    double value_ = 0.0;
    size_t count_ = 0;
};

#endif // ROLLINGSTATS_H
