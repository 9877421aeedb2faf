#pragma once

#include <optional>
#include <string_view>

#include "spikecorr/common/types.hpp"

namespace spikecorr::pipelines {

enum class DetrendType { kNone, kMean, kLinear };

enum class ScaleType { kNone, kNormalize, kUnbiased };

// Parse "none", "mean" or "linear".
[[nodiscard]] DetrendType parse_detrend(std::string_view name);

// Parse "none", "normalize" or "unbiased".
[[nodiscard]] ScaleType parse_scale(std::string_view name);

[[nodiscard]] std::string_view to_string(DetrendType detrend) noexcept;
[[nodiscard]] std::string_view to_string(ScaleType scale) noexcept;

class XcorrConfig {
public:
    explicit XcorrConfig(std::optional<SizeType> maxlags = std::nullopt,
                         DetrendType detrend             = DetrendType::kNone,
                         ScaleType scale                 = ScaleType::kNone,
                         bool nan_auto                   = false,
                         int nthreads                    = 0);

    [[nodiscard]] std::optional<SizeType> get_maxlags() const {
        return m_maxlags;
    }
    [[nodiscard]] DetrendType get_detrend() const { return m_detrend; }
    [[nodiscard]] ScaleType get_scale() const { return m_scale; }
    [[nodiscard]] bool get_nan_auto() const { return m_nan_auto; }
    [[nodiscard]] int get_nthreads() const { return m_nthreads; }

private:
    void validate() const;

    std::optional<SizeType> m_maxlags;
    DetrendType m_detrend;
    ScaleType m_scale;
    bool m_nan_auto;
    int m_nthreads;
};

class SpikeXcorrConfig {
public:
    SpikeXcorrConfig() = delete;
    SpikeXcorrConfig(double fs,
                     SizeType bin_size,
                     double refractory_ms         = 2.0,
                     double firing_rate_threshold = 1.0,
                     SizeType maxlags             = 1,
                     IndexType which_lag          = 0,
                     DetrendType detrend          = DetrendType::kMean,
                     ScaleType scale              = ScaleType::kNormalize,
                     bool nan_auto                = true,
                     int nthreads                 = 1);

    // Getters
    [[nodiscard]] double get_fs() const { return m_fs; }
    [[nodiscard]] SizeType get_bin_size() const { return m_bin_size; }
    [[nodiscard]] double get_refractory_ms() const { return m_refractory_ms; }
    [[nodiscard]] double get_firing_rate_threshold() const {
        return m_firing_rate_threshold;
    }
    [[nodiscard]] SizeType get_maxlags() const { return m_maxlags; }
    [[nodiscard]] IndexType get_which_lag() const { return m_which_lag; }
    [[nodiscard]] DetrendType get_detrend() const { return m_detrend; }
    [[nodiscard]] ScaleType get_scale() const { return m_scale; }
    [[nodiscard]] bool get_nan_auto() const { return m_nan_auto; }
    [[nodiscard]] int get_nthreads() const { return m_nthreads; }
    [[nodiscard]] SizeType get_refractory_samples() const {
        return m_refractory_samples;
    }

    // Cross-correlation settings for the binned spike counts
    [[nodiscard]] XcorrConfig get_xcorr_config() const;

private:
    void validate() const;

    double m_fs;
    SizeType m_bin_size;
    double m_refractory_ms;
    double m_firing_rate_threshold;
    SizeType m_maxlags;
    IndexType m_which_lag;
    DetrendType m_detrend;
    ScaleType m_scale;
    bool m_nan_auto;
    int m_nthreads;
    SizeType m_refractory_samples{};
};

} // namespace spikecorr::pipelines
