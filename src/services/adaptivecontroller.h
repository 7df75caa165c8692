/**
 * @file adaptivecontroller.h
 * @brief Derives concurrency, compression, timeout and batch size from
 *        observed network quality.
 */

#ifndef ADAPTIVECONTROLLER_H
#define ADAPTIVECONTROLLER_H

#include <QMetaType>
#include <QObject>

#include "retrypolicy.h"
#include "utils/rollingstats.h"

/**
 * @brief Rolling network quality estimates.
 */
struct NetworkStats {
    double latencyMs = 0.0;   ///< Mean probe round trip, valid when latencySamples > 0
    double bandwidth = 0.0;   ///< Mean observed throughput in bytes per second
    double packetLoss = 0.0;  ///< Fraction (0..1) of recent probes/transfers lost
    int latencySamples = 0;
    int lossSamples = 0;

    [[nodiscard]] bool hasLatency() const { return latencySamples > 0; }
};

/**
 * @brief Operating parameters read at admission and batch-formation time.
 */
struct AdaptiveParams {
    int maxConcurrency = 5;
    bool compressionEnabled = false;
    int timeoutMs = 30000;
    int batchSize = 50;

    bool operator==(const AdaptiveParams &other) const
    {
        return maxConcurrency == other.maxConcurrency
            && compressionEnabled == other.compressionEnabled
            && timeoutMs == other.timeoutMs
            && batchSize == other.batchSize;
    }
    bool operator!=(const AdaptiveParams &other) const { return !(*this == other); }
};

/**
 * @brief Configured starting point the derived parameters are adjusted from.
 */
struct AdaptiveBaseline {
    int concurrencyCeiling = 10;  ///< Configured max_connections, clamped to [1, 10]
    int batchSize = 50;
    int timeoutMs = 30000;
};

/**
 * @brief Owns NetworkStats and AdaptiveParams; everything else reads them.
 *
 * Rules, applied on every new sample:
 * - packet loss above 5%: concurrency 1, timeout raised to 90 s
 * - latency above 300 ms: compression on, timeout 60 s, batch size at most 20
 * - latency below 50 ms: concurrency at the upper bound
 * - otherwise: concurrency 5
 *
 * Concurrency is always clamped to [1, 10] and to the configured ceiling.
 * New parameters only affect later admissions; running tasks keep theirs.
 */
class AdaptiveController : public QObject
{
    Q_OBJECT

public:
    static constexpr int MinConcurrency = 1;
    static constexpr int MaxConcurrency = 10;
    static constexpr int DefaultConcurrency = 5;
    static constexpr double LowLatencyMs = 50.0;
    static constexpr double HighLatencyMs = 300.0;
    static constexpr double LossThreshold = 0.05;
    static constexpr int HighLatencyTimeoutMs = 60000;
    static constexpr int LossyTimeoutMs = 90000;
    static constexpr int HighLatencyBatchSize = 20;
    static constexpr size_t SampleWindow = 20;

    explicit AdaptiveController(QObject *parent = nullptr);
    ~AdaptiveController() override;

    /// @brief Replaces the configured baseline and recomputes.
    void setBaseline(const AdaptiveBaseline &baseline);
    [[nodiscard]] AdaptiveBaseline baseline() const { return baseline_; }

    [[nodiscard]] NetworkStats networkStats() const;
    [[nodiscard]] AdaptiveParams params() const { return params_; }

    /**
     * @brief Pure derivation of parameters from stats and a baseline.
     */
    [[nodiscard]] static AdaptiveParams deriveParams(const NetworkStats &stats,
                                                     const AdaptiveBaseline &baseline);

    /// @brief Drops all samples and returns to baseline parameters.
    void reset();

public slots:
    /**
     * @brief Records the outcome of a connectivity probe.
     * @param success False counts as a lost sample.
     * @param latencyMs Round-trip time; ignored when @p success is false.
     */
    void recordProbe(bool success, double latencyMs);

    /**
     * @brief Records a finished transfer invocation.
     * @param bytes Bytes moved.
     * @param durationMs Wall time of the invocation.
     * @param success True when the executor reported success.
     * @param errorClass Failure class; Timeout and Connection count as loss.
     */
    void recordTransfer(qint64 bytes, qint64 durationMs, bool success, ErrorClass errorClass);

signals:
    void paramsChanged(const AdaptiveParams &params);

private:
    void recompute();

    AdaptiveBaseline baseline_;
    AdaptiveParams params_;
    RollingStats latency_{SampleWindow};
    RollingStats throughput_{SampleWindow};
    RollingStats loss_{SampleWindow};
};

Q_DECLARE_METATYPE(AdaptiveParams)

#endif // ADAPTIVECONTROLLER_H
