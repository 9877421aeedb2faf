#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace spikecorr::timing {

// Logs the wall time of a pipeline stage at debug level on scope exit.
class ScopeTimer {
public:
    explicit ScopeTimer(std::string_view label)
        : m_label(label),
          m_start(std::chrono::steady_clock::now()) {}

    ~ScopeTimer() {
        const auto elapsed =
            std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - m_start)
                .count();
        spdlog::debug("{} took {:.3f} ms", m_label, elapsed);
    }

    ScopeTimer(const ScopeTimer&)            = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&)                 = delete;
    ScopeTimer& operator=(ScopeTimer&&)      = delete;

private:
    std::string m_label;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace spikecorr::timing
