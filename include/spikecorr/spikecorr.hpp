#pragma once

#include "spikecorr/common/types.hpp" // IWYU pragma: export

#include "spikecorr/algorithms/binning.hpp"        // IWYU pragma: export
#include "spikecorr/algorithms/xcorr.hpp"          // IWYU pragma: export
#include "spikecorr/detection/spikes.hpp"          // IWYU pragma: export
#include "spikecorr/pipelines/configs.hpp"         // IWYU pragma: export
#include "spikecorr/pipelines/xcorr_pipeline.hpp"  // IWYU pragma: export
#include "spikecorr/utils/fft.hpp"                 // IWYU pragma: export
