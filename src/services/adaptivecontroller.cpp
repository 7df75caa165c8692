#include "adaptivecontroller.h"

#include <QDebug>
#include <algorithm>

AdaptiveController::AdaptiveController(QObject *parent)
    : QObject(parent)
{
    params_ = deriveParams(NetworkStats(), baseline_);
}

AdaptiveController::~AdaptiveController() = default;

void AdaptiveController::setBaseline(const AdaptiveBaseline &baseline)
{
    baseline_ = baseline;
    baseline_.concurrencyCeiling = std::clamp(baseline.concurrencyCeiling, MinConcurrency, MaxConcurrency);
    baseline_.batchSize = std::max(baseline.batchSize, 1);
    baseline_.timeoutMs = std::max(baseline.timeoutMs, 1000);
    recompute();
}

NetworkStats AdaptiveController::networkStats() const
{
    NetworkStats stats;
    stats.latencyMs = latency_.mean();
    stats.latencySamples = static_cast<int>(latency_.count());
    stats.bandwidth = throughput_.mean();
    stats.packetLoss = loss_.mean();
    stats.lossSamples = static_cast<int>(loss_.count());
    return stats;
}

AdaptiveParams AdaptiveController::deriveParams(const NetworkStats &stats,
                                                const AdaptiveBaseline &baseline)
{
    const int ceiling = std::clamp(baseline.concurrencyCeiling, MinConcurrency, MaxConcurrency);

    AdaptiveParams p;
    p.maxConcurrency = DefaultConcurrency;
    p.compressionEnabled = false;
    p.timeoutMs = baseline.timeoutMs;
    p.batchSize = std::max(baseline.batchSize, 1);

    if (stats.hasLatency()) {
        if (stats.latencyMs < LowLatencyMs) {
            p.maxConcurrency = MaxConcurrency;
        } else if (stats.latencyMs > HighLatencyMs) {
            p.compressionEnabled = true;
            p.timeoutMs = std::max(p.timeoutMs, HighLatencyTimeoutMs);
            p.batchSize = std::min(p.batchSize, HighLatencyBatchSize);
        }
    }

    if (stats.packetLoss > LossThreshold) {
        p.maxConcurrency = MinConcurrency;
        p.timeoutMs = std::max(p.timeoutMs, LossyTimeoutMs);
    }

    p.maxConcurrency = std::clamp(p.maxConcurrency, MinConcurrency, ceiling);
    return p;
}

void AdaptiveController::reset()
{
    latency_.clear();
    throughput_.clear();
    loss_.clear();
    recompute();
}

void AdaptiveController::recordProbe(bool success, double latencyMs)
{
    if (success) {
        latency_.addSample(std::max(latencyMs, 0.0));
        loss_.addSample(0.0);
    } else {
        loss_.addSample(1.0);
    }
    recompute();
}

void AdaptiveController::recordTransfer(qint64 bytes, qint64 durationMs, bool success, ErrorClass errorClass)
{
    if (success) {
        if (durationMs > 0) {
            throughput_.addSample(static_cast<double>(bytes) * 1000.0 / static_cast<double>(durationMs));
        }
        loss_.addSample(0.0);
    } else if (errorClass == ErrorClass::Timeout || errorClass == ErrorClass::Connection) {
        loss_.addSample(1.0);
    }
    recompute();
}

void AdaptiveController::recompute()
{
    const NetworkStats stats = networkStats();
    const AdaptiveParams next = deriveParams(stats, baseline_);
    if (next == params_) {
        return;
    }

    params_ = next;
    qInfo().nospace() << "AdaptiveController: latency=" << qRound(stats.latencyMs) << "ms"
                      << " loss=" << qRound(stats.packetLoss * 100.0) << "%"
                      << " -> concurrency=" << params_.maxConcurrency
                      << " compression=" << (params_.compressionEnabled ? "on" : "off")
                      << " timeout=" << params_.timeoutMs << "ms"
                      << " batch=" << params_.batchSize;
    emit paramsChanged(params_);
}
