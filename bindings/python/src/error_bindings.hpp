#pragma once
// Error bindings: TimeParseError, IntervalError, FragmentListError, custom exceptions

#include <nanobind/nanobind.h>

#include <syncmap.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;

namespace syncmap_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // Error code enums
    // =========================================================================

    nb::enum_<syncmap::TimeParseError>(m, "TimeParseError", "Errors from TimeValue parsing")
        .value("no_digits", syncmap::TimeParseError::no_digits)
        .value("invalid_character", syncmap::TimeParseError::invalid_character)
        .value("too_many_fraction_digits", syncmap::TimeParseError::too_many_fraction_digits)
        .value("out_of_range", syncmap::TimeParseError::out_of_range)
        .def("__str__", [](syncmap::TimeParseError e) {
            return std::string(syncmap::time_parse_error_string(e));
        });

    nb::enum_<syncmap::IntervalError>(m, "IntervalError", "Errors from TimeInterval creation")
        .value("negative_begin", syncmap::IntervalError::negative_begin)
        .value("begin_after_end", syncmap::IntervalError::begin_after_end)
        .def("__str__", [](syncmap::IntervalError e) {
            return std::string(syncmap::interval_error_string(e));
        });

    nb::enum_<syncmap::FragmentListError>(m, "FragmentListError",
                                          "Errors from SyncMapFragmentList operations")
        .value("out_of_bounds", syncmap::FragmentListError::out_of_bounds,
               "Fragment interval outside list boundaries")
        .value("overlap", syncmap::FragmentListError::overlap,
               "Fragment interval overlaps another fragment")
        .value("not_sorted", syncmap::FragmentListError::not_sorted,
               "Sorted insertion into a list not guaranteed sorted")
        .def("__str__", [](syncmap::FragmentListError e) {
            return std::string(syncmap::fragment_list_error_string(e));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // Both derive from ValueError so callers can catch either broadly
    auto overlap_error = nb::exception<std::runtime_error>(m, "OverlapError", PyExc_ValueError);
    overlap_error_type = overlap_error.ptr();

    auto not_sorted_error =
        nb::exception<std::runtime_error>(m, "NotSortedError", PyExc_ValueError);
    not_sorted_error_type = not_sorted_error.ptr();
}

} // namespace syncmap_python
