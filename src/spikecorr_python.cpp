#include "pybind_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/complex.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "spikecorr/spikecorr.hpp"

namespace spikecorr {
using pipelines::SpikeXcorrConfig;
using pipelines::XcorrConfig;

namespace py = pybind11;

namespace {

template <SupportedCorrType T>
using StrictArrayT = py::array_t<T, py::array::c_style>;

template <SupportedCorrType T>
void bind_cross_correlate(py::module_& m) {
    m.def(
        "cross_correlate",
        [](const StrictArrayT<T>& x, const StrictArrayT<T>& xc,
           StrictArrayT<T> c, SizeType n, SizeType nx, int nthreads) {
            if (x.ndim() != 2 || xc.ndim() != 2 || c.ndim() != 2) {
                throw py::value_error("X, Xc and c must be 2-dimensional");
            }
            algorithms::cross_correlate<T>(
                std::span<const T>(x.data(), static_cast<SizeType>(x.size())),
                std::span<const T>(xc.data(),
                                   static_cast<SizeType>(xc.size())),
                std::span<T>(c.mutable_data(), static_cast<SizeType>(c.size())),
                n, nx, nthreads);
        },
        py::arg("X"), py::arg("Xc"), py::arg("c").noconvert(), py::arg("n"),
        py::arg("nx"), py::arg("nthreads") = 0);
    m.def(
        "pair_conjugates",
        [](const StrictArrayT<T>& x) {
            if (x.ndim() != 2) {
                throw py::value_error("X must be 2-dimensional");
            }
            const auto n  = static_cast<SizeType>(x.shape(0));
            const auto nx = static_cast<SizeType>(x.shape(1));
            auto xc       = algorithms::pair_conjugates<T>(
                std::span<const T>(x.data(), static_cast<SizeType>(x.size())),
                n, nx);
            return as_pyarray(std::move(xc), {static_cast<py::ssize_t>(n * n),
                                              static_cast<py::ssize_t>(nx)});
        },
        py::arg("X"));
}

} // namespace

PYBIND11_MODULE(libspikecorr, m) {
    m.doc() = "Python bindings for the spikecorr library";

    m.def(
        "bin_data",
        [](const PyArrayT<SampleType>& samples,
           const PyArrayT<IndexType>& bin_edges, int nthreads) {
            require_ndim(samples, 2, "samples");
            require_ndim(bin_edges, 1, "bin_edges");
            const auto nsamples  = static_cast<SizeType>(samples.shape(0));
            const auto nchannels = static_cast<SizeType>(samples.shape(1));
            auto out = algorithms::bin_data(to_span(samples), nsamples,
                                            nchannels, to_span(bin_edges),
                                            nthreads);
            const auto nbins =
                static_cast<py::ssize_t>(bin_edges.size()) - 1;
            return as_pyarray(std::move(out),
                              {nbins, static_cast<py::ssize_t>(nchannels)});
        },
        py::arg("samples"), py::arg("bin_edges"), py::arg("nthreads") = 1);
    m.def(
        "uniform_bin_edges",
        [](SizeType nsamples, SizeType bin_size) {
            return as_pyarray(algorithms::uniform_bin_edges(nsamples, bin_size));
        },
        py::arg("nsamples"), py::arg("bin_size"));

    bind_cross_correlate<float>(m);
    bind_cross_correlate<double>(m);
    bind_cross_correlate<ComplexTypeF>(m);
    bind_cross_correlate<ComplexType>(m);

    m.def(
        "threshold",
        [](const PyArrayT<float>& raw, const PyArrayT<float>& thresholds,
           int nthreads) {
            require_ndim(raw, 2, "raw");
            const auto nsamples  = static_cast<SizeType>(raw.shape(0));
            const auto nchannels = static_cast<SizeType>(raw.shape(1));
            auto spikes = detection::threshold(to_span(raw), nsamples,
                                               nchannels, to_span(thresholds),
                                               nthreads);
            return as_pyarray(std::move(spikes),
                              {static_cast<py::ssize_t>(nsamples),
                               static_cast<py::ssize_t>(nchannels)});
        },
        py::arg("raw"), py::arg("thresholds"), py::arg("nthreads") = 1);
    m.def("samples_per_ms", &detection::samples_per_ms, py::arg("fs"),
          py::arg("ms"));
    m.def(
        "clear_refractory",
        [](py::array_t<SampleType, py::array::c_style> spikes,
           SizeType window, int nthreads) {
            if (spikes.ndim() != 2) {
                throw py::value_error("spikes must be 2-dimensional");
            }
            detection::clear_refractory(
                std::span<SampleType>(spikes.mutable_data(),
                                      static_cast<SizeType>(spikes.size())),
                static_cast<SizeType>(spikes.shape(0)),
                static_cast<SizeType>(spikes.shape(1)), window, nthreads);
        },
        py::arg("spikes").noconvert(), py::arg("window"),
        py::arg("nthreads") = 1);
    m.def(
        "interval_jitter",
        [](py::array_t<SampleType, py::array::c_style> spikes,
           SizeType window, std::uint32_t seed, int nthreads) {
            if (spikes.ndim() != 2) {
                throw py::value_error("spikes must be 2-dimensional");
            }
            detection::interval_jitter(
                std::span<SampleType>(spikes.mutable_data(),
                                      static_cast<SizeType>(spikes.size())),
                static_cast<SizeType>(spikes.shape(0)),
                static_cast<SizeType>(spikes.shape(1)), window, seed,
                nthreads);
        },
        py::arg("spikes").noconvert(), py::arg("window"), py::arg("seed"),
        py::arg("nthreads") = 1);

    py::class_<XcorrConfig>(m, "XcorrConfig")
        .def(py::init([](std::optional<SizeType> maxlags,
                         const std::string& detrend, const std::string& scale,
                         bool nan_auto, int nthreads) {
                 return XcorrConfig(maxlags, pipelines::parse_detrend(detrend),
                                    pipelines::parse_scale(scale), nan_auto,
                                    nthreads);
             }),
             py::arg("maxlags") = std::nullopt, py::arg("detrend") = "none",
             py::arg("scale") = "none", py::arg("nan_auto") = false,
             py::arg("nthreads") = 0)
        .def_property_readonly("maxlags", &XcorrConfig::get_maxlags)
        .def_property_readonly("detrend",
                               [](const XcorrConfig& cfg) {
                                   return std::string(
                                       pipelines::to_string(cfg.get_detrend()));
                               })
        .def_property_readonly("scale",
                               [](const XcorrConfig& cfg) {
                                   return std::string(
                                       pipelines::to_string(cfg.get_scale()));
                               })
        .def_property_readonly("nan_auto", &XcorrConfig::get_nan_auto)
        .def_property_readonly("nthreads", &XcorrConfig::get_nthreads);

    py::class_<SpikeXcorrConfig>(m, "SpikeXcorrConfig")
        .def(py::init([](double fs, SizeType bin_size, double refractory_ms,
                         double firing_rate_threshold, SizeType maxlags,
                         IndexType which_lag, const std::string& detrend,
                         const std::string& scale, bool nan_auto,
                         int nthreads) {
                 return SpikeXcorrConfig(
                     fs, bin_size, refractory_ms, firing_rate_threshold,
                     maxlags, which_lag, pipelines::parse_detrend(detrend),
                     pipelines::parse_scale(scale), nan_auto, nthreads);
             }),
             py::arg("fs"), py::arg("bin_size"), py::arg("refractory_ms") = 2.0,
             py::arg("firing_rate_threshold") = 1.0, py::arg("maxlags") = 1,
             py::arg("which_lag") = 0, py::arg("detrend") = "mean",
             py::arg("scale") = "normalize", py::arg("nan_auto") = true,
             py::arg("nthreads") = 1)
        .def_property_readonly("fs", &SpikeXcorrConfig::get_fs)
        .def_property_readonly("bin_size", &SpikeXcorrConfig::get_bin_size)
        .def_property_readonly("refractory_ms",
                               &SpikeXcorrConfig::get_refractory_ms)
        .def_property_readonly("refractory_samples",
                               &SpikeXcorrConfig::get_refractory_samples)
        .def_property_readonly("firing_rate_threshold",
                               &SpikeXcorrConfig::get_firing_rate_threshold)
        .def_property_readonly("maxlags", &SpikeXcorrConfig::get_maxlags)
        .def_property_readonly("which_lag", &SpikeXcorrConfig::get_which_lag)
        .def_property_readonly("nan_auto", &SpikeXcorrConfig::get_nan_auto)
        .def_property_readonly("nthreads", &SpikeXcorrConfig::get_nthreads);

    m.def(
        "matrix_xcorr",
        [](const PyArrayT<double>& data, const XcorrConfig& config) {
            require_ndim(data, 2, "data");
            const auto nsamples  = static_cast<SizeType>(data.shape(0));
            const auto nchannels = static_cast<SizeType>(data.shape(1));
            auto result = pipelines::matrix_xcorr(to_span(data), nsamples,
                                                  nchannels, config);
            const auto nlags  = static_cast<py::ssize_t>(result.nlags());
            const auto npairs = static_cast<py::ssize_t>(result.npairs());
            return py::make_tuple(
                as_pyarray(std::move(result.lags)),
                as_pyarray(std::move(result.values), {nlags, npairs}));
        },
        py::arg("data"), py::arg("config"));
    m.def(
        "spike_xcorr",
        [](const PyArrayT<float>& raw, const PyArrayT<float>& thresholds,
           const SpikeXcorrConfig& config) {
            require_ndim(raw, 2, "raw");
            const auto nsamples  = static_cast<SizeType>(raw.shape(0));
            const auto nchannels = static_cast<SizeType>(raw.shape(1));
            auto result = pipelines::spike_xcorr(
                to_span(raw), nsamples, nchannels, to_span(thresholds), config);
            const auto n = static_cast<py::ssize_t>(nchannels);
            const auto nbins = static_cast<py::ssize_t>(result.nbins);
            py::dict out;
            out["xcorr"]  = as_pyarray(std::move(result.xcorr), {n, n});
            out["active"] = as_pyarray(std::move(result.active));
            out["binned"] = as_pyarray(std::move(result.binned), {nbins, n});
            return out;
        },
        py::arg("raw"), py::arg("thresholds"), py::arg("config"));
    m.def(
        "spike_xcorr_sweep",
        [](const PyArrayT<float>& raw, const PyArrayT<float>& threshold_levels,
           const SpikeXcorrConfig& config) {
            require_ndim(raw, 2, "raw");
            const auto nsamples  = static_cast<SizeType>(raw.shape(0));
            const auto nchannels = static_cast<SizeType>(raw.shape(1));
            auto sweep = pipelines::spike_xcorr_sweep(
                to_span(raw), nsamples, nchannels, to_span(threshold_levels),
                config);
            const auto nlevels = static_cast<py::ssize_t>(sweep.levels.size());
            const auto npairs  = static_cast<py::ssize_t>(sweep.pairs.size());
            py::dict out;
            out["levels"] = as_pyarray(std::move(sweep.levels));
            out["pairs"]  = as_pyarray(std::move(sweep.pairs));
            out["values"] =
                as_pyarray(std::move(sweep.values), {nlevels, npairs});
            return out;
        },
        py::arg("raw"), py::arg("threshold_levels"), py::arg("config"));
}

} // namespace spikecorr
