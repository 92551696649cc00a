#pragma once
// Time bindings: TimeValue, TimeInterval, RelativePosition

#include <nanobind/nanobind.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>

#include <syncmap.hpp>

#include "py_types.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace syncmap_python {

inline void bind_time(nb::module_& m) {
    using syncmap::TimeInterval;
    using syncmap::TimeValue;

    // =========================================================================
    // TimeValue
    // =========================================================================

    nb::class_<TimeValue>(m, "TimeValue", "Signed time with exact picosecond resolution")
        .def(nb::init<>())
        .def("__init__",
             [](TimeValue* self, std::string_view text) { new (self) TimeValue(parse_time(text)); },
             "Parse a decimal seconds string such as '12.345'", "text"_a)
        .def_static("zero", &TimeValue::zero)
        .def_static("from_milliseconds", &TimeValue::from_milliseconds, "ms"_a)
        .def_static("from_picoseconds", &TimeValue::from_picoseconds, "ps"_a)
        .def_static(
            "from_seconds",
            [](double s) {
                auto t = TimeValue::from_seconds(s);
                if (!t) {
                    throw std::invalid_argument("Seconds value not finite or out of range");
                }
                return *t;
            },
            "s"_a)
        .def_prop_ro("seconds", &TimeValue::seconds, "Whole seconds (floor)")
        .def_prop_ro("picoseconds", &TimeValue::picoseconds,
                     "Fractional part in picoseconds, always non-negative")
        .def("to_seconds", &TimeValue::to_seconds)
        .def("is_zero", &TimeValue::is_zero)
        .def("is_negative", &TimeValue::is_negative)
        .def("__abs__", &TimeValue::abs)
        .def("__neg__", [](const TimeValue& t) { return -t; })
        .def("__add__", [](const TimeValue& a, const TimeValue& b) { return a + b; })
        .def("__sub__", [](const TimeValue& a, const TimeValue& b) { return a - b; })
        .def("__eq__", [](const TimeValue& a, const TimeValue& b) { return a == b; })
        .def("__lt__", [](const TimeValue& a, const TimeValue& b) { return a < b; })
        .def("__le__", [](const TimeValue& a, const TimeValue& b) { return a <= b; })
        .def("__gt__", [](const TimeValue& a, const TimeValue& b) { return a > b; })
        .def("__ge__", [](const TimeValue& a, const TimeValue& b) { return a >= b; })
        .def("__hash__",
             [](const TimeValue& t) {
                 return nb::hash(nb::make_tuple(t.seconds(), t.picoseconds()));
             })
        .def("__float__", &TimeValue::to_seconds)
        .def("__str__", &TimeValue::to_string)
        .def("__repr__",
             [](const TimeValue& t) { return "TimeValue('" + t.to_string() + "')"; });

    // =========================================================================
    // TimeInterval
    // =========================================================================

    nb::class_<TimeInterval>(m, "TimeInterval", "Closed interval [begin, end] with 0 <= begin <= end")
        .def(nb::init<>())
        .def(nb::init<TimeValue, TimeValue>(), "Raises ValueError if begin < 0 or begin > end",
             "begin"_a, "end"_a)
        .def_prop_ro("begin", &TimeInterval::begin)
        .def_prop_ro("end", &TimeInterval::end)
        .def_prop_ro("length", &TimeInterval::length)
        .def("has_zero_length", &TimeInterval::has_zero_length)
        .def("contains", &TimeInterval::contains, "point"_a)
        .def("is_adjacent_before", &TimeInterval::is_adjacent_before, "other"_a)
        .def("is_adjacent_after", &TimeInterval::is_adjacent_after, "other"_a)
        .def("offset", &TimeInterval::offset, "Shift both ends, clamping into optional bounds",
             "delta"_a, "allow_negative"_a = false, "min_begin"_a = nb::none(),
             "max_end"_a = nb::none())
        .def("shrink", &TimeInterval::shrink, "amount"_a)
        .def("enlarge", &TimeInterval::enlarge, "amount"_a)
        .def("move_end_to", &TimeInterval::move_end_to, "point"_a)
        .def("__eq__", [](const TimeInterval& a, const TimeInterval& b) { return a == b; })
        .def("__lt__", [](const TimeInterval& a, const TimeInterval& b) { return a < b; })
        .def("__repr__", [](const TimeInterval& t) {
            return "TimeInterval(" + t.begin().to_string() + ", " + t.end().to_string() + ")";
        });

    // =========================================================================
    // RelativePosition
    // =========================================================================

    nb::enum_<syncmap::RelativePosition> position(
        m, "RelativePosition", "Position of one interval relative to another");
    for (uint8_t i = 0; i <= static_cast<uint8_t>(syncmap::RelativePosition::ii_gg); ++i) {
        auto pos = static_cast<syncmap::RelativePosition>(i);
        position.value(syncmap::relative_position_string(pos), pos);
    }

    m.def("relative_position", &syncmap::relative_position,
          "Classify other relative to self", "self"_a, "other"_a);
    m.def("is_allowed_position", &syncmap::is_allowed_position,
          "True if the two intervals may both be in one fragment list", "position"_a);
    m.def("may_share_timeline", &syncmap::may_share_timeline, "self"_a, "other"_a);
}

} // namespace syncmap_python
