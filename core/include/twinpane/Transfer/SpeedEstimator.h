// SpeedEstimator.h — Сглаженная оценка скорости передачи

#pragma once

#include "../export.h"
#include <chrono>
#include <cstdint>

namespace TwinPane {

/// Сглаженная скорость передачи (экспоненциальное скользящее среднее)
class TP_API SpeedEstimator {
public:
    using Clock = std::chrono::steady_clock;

    /// @param smoothing Вес нового замера (0..1]
    /// @param sampleIntervalMs Минимальный интервал между замерами
    SpeedEstimator(double smoothing, int32_t sampleIntervalMs);

    void reset(Clock::time_point now);

    /// Учесть переданные байты; замер делается не чаще sampleIntervalMs
    /// @return Текущая сглаженная скорость (bytes/sec)
    double addBytes(int64_t bytes, Clock::time_point now);

    double bytesPerSecond() const { return m_rate; }

private:
    double m_smoothing;
    std::chrono::milliseconds m_sampleInterval;
    double m_rate = 0.0;
    bool m_hasSample = false;
    int64_t m_pendingBytes = 0;
    Clock::time_point m_lastSample;
};

} // namespace TwinPane
