#pragma once
// Fragment bindings: FragmentType, SyncMapFragment, SyncMapFragmentList, ZeroLengthRepair

#include <nanobind/make_iterator.h>
#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <syncmap.hpp>

#include "py_types.hpp"

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace syncmap_python {

inline void bind_fragment_list(nb::module_& m) {
    using syncmap::FragmentType;
    using syncmap::TimeInterval;
    using syncmap::TimeValue;
    using size_type = PyFragmentList::size_type;

    // =========================================================================
    // FragmentType
    // =========================================================================

    nb::enum_<FragmentType>(m, "FragmentType", "Role of a fragment in the timeline")
        .value("regular", FragmentType::regular, "Aligned text")
        .value("head", FragmentType::head, "Leading audio before the first text")
        .value("tail", FragmentType::tail, "Trailing audio after the last text")
        .value("nonspeech", FragmentType::nonspeech, "Silence or other non-speech audio")
        .def("__str__",
             [](FragmentType t) { return std::string(syncmap::fragment_type_string(t)); });

    // =========================================================================
    // SyncMapFragment
    // =========================================================================

    nb::class_<PyFragment>(m, "SyncMapFragment", "Time interval with an attached payload")
        .def(
            "__init__",
            [](PyFragment* self, const TimeInterval& interval, nb::object payload,
               FragmentType type) { new (self) PyFragment(interval, std::move(payload), type); },
            "interval"_a, "payload"_a = nb::none(), "fragment_type"_a = FragmentType::regular)
        .def_prop_ro("interval", [](const PyFragment& f) { return f.interval(); })
        .def_prop_ro("payload", &payload_or_none)
        .def_prop_rw("fragment_type", &PyFragment::fragment_type, &PyFragment::set_fragment_type)
        .def_prop_ro("begin", &PyFragment::begin)
        .def_prop_ro("end", &PyFragment::end)
        .def_prop_ro("length", &PyFragment::length)
        .def("has_zero_length", &PyFragment::has_zero_length)
        .def("__eq__", [](const PyFragment& a, const PyFragment& b) { return a == b; })
        .def("__lt__", [](const PyFragment& a, const PyFragment& b) { return a < b; })
        .def("__repr__", [](const PyFragment& f) {
            std::ostringstream oss;
            oss << "SyncMapFragment(" << f.begin().to_string() << ", " << f.end().to_string()
                << ", " << syncmap::fragment_type_string(f.fragment_type()) << ")";
            return oss.str();
        });

    // =========================================================================
    // ZeroLengthRepair
    // =========================================================================

    nb::class_<syncmap::ZeroLengthRepair>(m, "ZeroLengthRepair",
                                          "Result of fix_zero_length_intervals()")
        .def_ro("fixed", &syncmap::ZeroLengthRepair::fixed,
                "Zero-length fragments given a positive length")
        .def_ro("unfixable", &syncmap::ZeroLengthRepair::unfixable,
                "Zero-length fragments left as they were")
        .def("complete", &syncmap::ZeroLengthRepair::complete)
        .def("__bool__", &syncmap::ZeroLengthRepair::complete)
        .def("__repr__", [](const syncmap::ZeroLengthRepair& r) {
            std::ostringstream oss;
            oss << "ZeroLengthRepair(fixed=" << r.fixed << ", unfixable=" << r.unfixable << ")";
            return oss.str();
        });

    // =========================================================================
    // SyncMapFragmentList
    // =========================================================================

    nb::class_<PyFragmentList>(m, "SyncMapFragmentList",
                               "Timeline of fragments that may touch but never overlap")
        .def(nb::init<std::optional<TimeValue>, std::optional<TimeValue>>(),
             "Raises ValueError if begin < 0 or begin > end", "begin"_a = TimeValue::zero(),
             "end"_a = nb::none())
        .def_prop_ro("begin", &PyFragmentList::begin_time)
        .def_prop_ro("end", &PyFragmentList::end_time)
        .def_prop_ro("is_guaranteed_sorted", &PyFragmentList::is_guaranteed_sorted)
        .def_prop_ro("fragments",
                     [](const PyFragmentList& l) {
                         return std::vector<PyFragment>(l.begin(), l.end());
                     })
        .def("__len__", &PyFragmentList::size)
        .def(
            "__getitem__",
            [](const PyFragmentList& l, std::int64_t index) { return l.at(resolve_index(l, index)); },
            "index"_a)
        .def(
            "__iter__",
            [](const PyFragmentList& l) {
                return nb::make_iterator<nb::rv_policy::copy>(
                    nb::type<PyFragmentList>(), "FragmentIterator", l.begin(), l.end());
            },
            nb::keep_alive<0, 1>())
        .def(
            "add", [](PyFragmentList& l, PyFragment f, bool sort) { check(l.add(std::move(f), sort)); },
            "Raises ValueError, OverlapError or NotSortedError; the list is unchanged then",
            "fragment"_a, "sort"_a = true)
        .def("sort", [](PyFragmentList& l) { check(l.sort()); }, "Raises OverlapError")
        .def(
            "replace",
            [](PyFragmentList& l, std::int64_t index, PyFragment f) {
                check(l.replace(resolve_index(l, index), std::move(f)));
            },
            "index"_a, "fragment"_a)
        .def("remove", &PyFragmentList::remove, "indices"_a)
        .def(
            "move_end",
            [](PyFragmentList& l, std::int64_t index, TimeValue value) {
                // Negative indices are refused, not counted from the end
                return index >= 0 && l.move_end(static_cast<size_type>(index), value);
            },
            "Move the boundary between fragments index and index + 1; False if refused",
            "index"_a, "value"_a)
        .def("offset", &PyFragmentList::offset, "delta"_a)
        .def("fix_zero_length_intervals", &PyFragmentList::fix_zero_length_intervals,
             "offset"_a = PyFragmentList::default_zero_length_offset(), "min_index"_a = 0,
             "max_index"_a = nb::none())
        .def("has_zero_length_fragments", &PyFragmentList::has_zero_length_fragments,
             "min_index"_a = 0, "max_index"_a = nb::none())
        .def("has_adjacent_fragments_only", &PyFragmentList::has_adjacent_fragments_only,
             "min_index"_a = 0, "max_index"_a = nb::none())
        .def("indices_of", &PyFragmentList::indices_of, "fragment_type"_a);
}

} // namespace syncmap_python
