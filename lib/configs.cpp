#include "spikecorr/pipelines/configs.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>
#include <omp.h>
#include <spdlog/spdlog.h>

#include "spikecorr/detection/spikes.hpp"

namespace spikecorr::pipelines {

DetrendType parse_detrend(std::string_view name) {
    if (name == "none") {
        return DetrendType::kNone;
    }
    if (name == "mean") {
        return DetrendType::kMean;
    }
    if (name == "linear") {
        return DetrendType::kLinear;
    }
    throw std::invalid_argument(fmt::format(
        "Unknown detrend type '{}' (expected none, mean or linear)", name));
}

ScaleType parse_scale(std::string_view name) {
    if (name == "none") {
        return ScaleType::kNone;
    }
    if (name == "normalize") {
        return ScaleType::kNormalize;
    }
    if (name == "unbiased") {
        return ScaleType::kUnbiased;
    }
    throw std::invalid_argument(fmt::format(
        "Unknown scale type '{}' (expected none, normalize or unbiased)",
        name));
}

std::string_view to_string(DetrendType detrend) noexcept {
    switch (detrend) {
    case DetrendType::kMean:
        return "mean";
    case DetrendType::kLinear:
        return "linear";
    default:
        return "none";
    }
}

std::string_view to_string(ScaleType scale) noexcept {
    switch (scale) {
    case ScaleType::kNormalize:
        return "normalize";
    case ScaleType::kUnbiased:
        return "unbiased";
    default:
        return "none";
    }
}

XcorrConfig::XcorrConfig(std::optional<SizeType> maxlags,
                         DetrendType detrend,
                         ScaleType scale,
                         bool nan_auto,
                         int nthreads)
    : m_maxlags(maxlags),
      m_detrend(detrend),
      m_scale(scale),
      m_nan_auto(nan_auto),
      m_nthreads(nthreads) {
    validate();
}

void XcorrConfig::validate() const {
    if (m_maxlags.has_value() && *m_maxlags == 0) {
        throw std::invalid_argument("maxlags must be at least 1 (got 0)");
    }
}

SpikeXcorrConfig::SpikeXcorrConfig(double fs,
                                   SizeType bin_size,
                                   double refractory_ms,
                                   double firing_rate_threshold,
                                   SizeType maxlags,
                                   IndexType which_lag,
                                   DetrendType detrend,
                                   ScaleType scale,
                                   bool nan_auto,
                                   int nthreads)
    : m_fs(fs),
      m_bin_size(bin_size),
      m_refractory_ms(refractory_ms),
      m_firing_rate_threshold(firing_rate_threshold),
      m_maxlags(maxlags),
      m_which_lag(which_lag),
      m_detrend(detrend),
      m_scale(scale),
      m_nan_auto(nan_auto),
      m_nthreads(nthreads) {
    m_nthreads = std::clamp(m_nthreads, 1, omp_get_max_threads());
    validate();
    m_refractory_samples = detection::samples_per_ms(m_fs, m_refractory_ms);

    spdlog::info("SpikeXcorrConfig: fs={}, bin_size={}, refractory_ms={} "
                 "({} samples), firing_rate_threshold={}, maxlags={}, "
                 "which_lag={}, detrend={}, scale={}, nan_auto={}, "
                 "nthreads={}",
                 m_fs, m_bin_size, m_refractory_ms, m_refractory_samples,
                 m_firing_rate_threshold, m_maxlags, m_which_lag,
                 to_string(m_detrend), to_string(m_scale), m_nan_auto,
                 m_nthreads);
}

XcorrConfig SpikeXcorrConfig::get_xcorr_config() const {
    return XcorrConfig(m_maxlags, m_detrend, m_scale, m_nan_auto, m_nthreads);
}

void SpikeXcorrConfig::validate() const {
    if (!(m_fs > 0)) {
        throw std::invalid_argument(
            fmt::format("fs must be positive (got {})", m_fs));
    }
    if (m_bin_size == 0) {
        throw std::invalid_argument("bin_size must be positive (got 0)");
    }
    if (!(m_refractory_ms >= 0)) {
        throw std::invalid_argument(fmt::format(
            "refractory_ms must be non-negative (got {})", m_refractory_ms));
    }
    if (!(m_firing_rate_threshold >= 0)) {
        throw std::invalid_argument(
            fmt::format("firing_rate_threshold must be non-negative (got {})",
                        m_firing_rate_threshold));
    }
    if (m_maxlags == 0) {
        throw std::invalid_argument("maxlags must be at least 1 (got 0)");
    }
    if (static_cast<SizeType>(std::abs(m_which_lag)) >= m_maxlags) {
        throw std::invalid_argument(
            fmt::format("which_lag must lie in ({}, {}) (got {})",
                        -static_cast<IndexType>(m_maxlags),
                        m_maxlags, m_which_lag));
    }
}

} // namespace spikecorr::pipelines
