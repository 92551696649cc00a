#pragma once

// SYNCMAP - ordered, non-overlapping timelines of time-bounded fragments
//
// Single include for the whole library:
//   TimeValue           exact picosecond time
//   TimeInterval        [begin, end] with geometry mutators
//   RelativePosition    qualitative position of one interval against another
//   SyncMapFragment     interval + opaque payload
//   SyncMapFragmentList the partitioned timeline

#include "syncmap/expected.hpp"
#include "syncmap/fragment.hpp"
#include "syncmap/fragment_list.hpp"
#include "syncmap/log.hpp"
#include "syncmap/relative_position.hpp"
#include "syncmap/time_interval.hpp"
#include "syncmap/time_value.hpp"
