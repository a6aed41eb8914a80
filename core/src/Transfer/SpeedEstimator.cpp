// SpeedEstimator.cpp — Сглаженная оценка скорости передачи

#include "twinpane/Transfer/SpeedEstimator.h"

namespace TwinPane {

SpeedEstimator::SpeedEstimator(double smoothing, int32_t sampleIntervalMs)
    : m_smoothing(smoothing), m_sampleInterval(sampleIntervalMs), m_lastSample(Clock::now()) {}

void SpeedEstimator::reset(Clock::time_point now) {
    m_rate = 0.0;
    m_hasSample = false;
    m_pendingBytes = 0;
    m_lastSample = now;
}

double SpeedEstimator::addBytes(int64_t bytes, Clock::time_point now) {
    m_pendingBytes += bytes;

    auto elapsed = now - m_lastSample;
    if (elapsed < m_sampleInterval || elapsed <= Clock::duration::zero()) {
        return m_rate;
    }

    double seconds = std::chrono::duration<double>(elapsed).count();
    double instant = static_cast<double>(m_pendingBytes) / seconds;

    m_rate = m_hasSample ? m_smoothing * instant + (1.0 - m_smoothing) * m_rate : instant;
    m_hasSample = true;
    m_pendingBytes = 0;
    m_lastSample = now;
    return m_rate;
}

} // namespace TwinPane
