#pragma once
// Python wrapper types for syncmap bindings

#include <nanobind/nanobind.h>

#include <syncmap.hpp>

#include <string_view>

#include <cstdint>

namespace nb = nanobind;

namespace syncmap_python {

// Exception type pointers (set during module init)
extern PyObject* overlap_error_type;
extern PyObject* not_sorted_error_type;

/// Fragments carry an arbitrary Python object as payload
using PyFragment = syncmap::SyncMapFragment<nb::object>;
using PyFragmentList = syncmap::SyncMapFragmentList<nb::object>;

/**
 * @brief Raise the Python exception matching a list error
 *
 * overlap and not_sorted get their own ValueError subclasses; out_of_bounds
 * is a plain ValueError.
 */
[[noreturn]] inline void raise_list_error(syncmap::FragmentListError err) {
    PyObject* type = PyExc_ValueError;
    switch (err) {
        case syncmap::FragmentListError::overlap:
            type = overlap_error_type;
            break;
        case syncmap::FragmentListError::not_sorted:
            type = not_sorted_error_type;
            break;
        default:
            break;
    }
    PyErr_SetString(type, syncmap::fragment_list_error_string(err));
    throw nb::python_error();
}

inline void check(const syncmap::expected<void, syncmap::FragmentListError>& result) {
    if (!result) {
        raise_list_error(result.error());
    }
}

inline syncmap::TimeValue parse_time(std::string_view text) {
    auto parsed = syncmap::TimeValue::parse(text);
    if (!parsed) {
        PyErr_SetString(PyExc_ValueError, syncmap::time_parse_error_string(parsed.error()));
        throw nb::python_error();
    }
    return *parsed;
}

/**
 * @brief Resolve a Python index (negative counts from the end)
 *
 * Raises IndexError if the index is outside the list.
 */
inline PyFragmentList::size_type resolve_index(const PyFragmentList& list, std::int64_t index) {
    const auto size = static_cast<std::int64_t>(list.size());
    if (index < 0) {
        index += size;
    }
    if (index < 0 || index >= size) {
        throw nb::index_error("Fragment index out of range");
    }
    return static_cast<PyFragmentList::size_type>(index);
}

inline nb::object payload_or_none(const PyFragment& f) {
    return f.payload().is_valid() ? f.payload() : nb::none();
}

} // namespace syncmap_python
