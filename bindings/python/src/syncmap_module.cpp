// syncmap Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "error_bindings.hpp"
#include "fragment_list_bindings.hpp"
#include "time_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace syncmap_python {
PyObject* overlap_error_type = nullptr;
PyObject* not_sorted_error_type = nullptr;
} // namespace syncmap_python

NB_MODULE(syncmap, m) {
    m.doc() = "syncmap - non-overlapping timeline of text fragments";

    // 1. Time types (TimeValue, TimeInterval, RelativePosition) - no dependencies
    syncmap_python::bind_time(m);

    // 2. Error enums and exceptions (sets overlap_error_type, not_sorted_error_type)
    syncmap_python::bind_errors(m);

    // 3. Fragments and lists - needs time types and exception types
    syncmap_python::bind_fragment_list(m);
}
