#pragma once

#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

namespace py = pybind11;

template <typename T>
using PyArrayT = py::array_t<T, py::array::c_style | py::array::forcecast>;

// Hand a std::vector over to numpy without copying, reshaped to `shape`.
// source: https://github.com/pybind/pybind11/issues/1042#issuecomment-642215028
template <typename Sequence>
inline py::array_t<typename Sequence::value_type>
as_pyarray(Sequence&& seq, std::vector<py::ssize_t> shape) {
    auto* data = seq.data();
    std::unique_ptr<Sequence> seq_ptr =
        std::make_unique<Sequence>(std::forward<Sequence>(seq));
    auto capsule = py::capsule(seq_ptr.get(), [](void* p) {
        std::unique_ptr<Sequence>(reinterpret_cast<Sequence*>(p)); // NOLINT
    });
    seq_ptr.release();
    return py::array_t<typename Sequence::value_type>(std::move(shape), data,
                                                      capsule);
}

template <typename Sequence>
inline py::array_t<typename Sequence::value_type> as_pyarray(Sequence&& seq) {
    const auto size = static_cast<py::ssize_t>(seq.size());
    return as_pyarray(std::forward<Sequence>(seq), {size});
}

template <typename T>
inline std::span<const T> to_span(const PyArrayT<T>& arr) {
    static_assert(!std::is_pointer_v<T>, "T must not be a pointer type");
    static_assert(!std::is_reference_v<T>, "T must not be a reference type");
    return std::span<const T>(arr.data(), static_cast<std::size_t>(arr.size()));
}

// Throw if a numpy array does not have the expected number of dimensions.
template <typename T>
inline void require_ndim(const PyArrayT<T>& arr, py::ssize_t ndim,
                         const char* name) {
    if (arr.ndim() != ndim) {
        throw py::value_error(std::string(name) + " must be " +
                              std::to_string(ndim) + "-dimensional");
    }
}
