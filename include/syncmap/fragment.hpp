#pragma once

#include "syncmap/time_interval.hpp"

#include <compare>
#include <utility>

#include <cstdint>

namespace syncmap {

/**
 * Role of a fragment on the timeline.
 */
enum class FragmentType : uint8_t {
    regular,  ///< Aligned to a piece of the payload (e.g. a transcript sentence)
    head,     ///< Leading span before the first regular fragment
    tail,     ///< Trailing span after the last regular fragment
    nonspeech ///< Span with no aligned payload
};

constexpr const char* fragment_type_string(FragmentType type) noexcept {
    switch (type) {
        case FragmentType::regular:
            return "regular";
        case FragmentType::head:
            return "head";
        case FragmentType::tail:
            return "tail";
        case FragmentType::nonspeech:
            return "nonspeech";
        default:
            return "unknown";
    }
}

/**
 * A time interval paired with an opaque payload.
 *
 * Fragments compare by interval only; payload and type take no part in
 * ordering or equality.
 *
 * @tparam Payload Value stored alongside the interval (text, speaker id, ...)
 */
template <typename Payload>
class SyncMapFragment {
public:
    using payload_type = Payload;

    SyncMapFragment() = default;

    explicit SyncMapFragment(TimeInterval interval, Payload payload = Payload{},
                             FragmentType type = FragmentType::regular)
        : interval_(interval),
          payload_(std::move(payload)),
          type_(type) {}

    const TimeInterval& interval() const noexcept { return interval_; }
    TimeInterval& interval() noexcept { return interval_; }

    const Payload& payload() const noexcept { return payload_; }
    Payload& payload() noexcept { return payload_; }

    FragmentType fragment_type() const noexcept { return type_; }
    void set_fragment_type(FragmentType type) noexcept { type_ = type; }

    TimeValue begin() const noexcept { return interval_.begin(); }
    TimeValue end() const noexcept { return interval_.end(); }
    TimeValue length() const noexcept { return interval_.length(); }
    bool has_zero_length() const noexcept { return interval_.has_zero_length(); }

    friend auto operator<=>(const SyncMapFragment& lhs, const SyncMapFragment& rhs) noexcept {
        return lhs.interval_ <=> rhs.interval_;
    }

    friend bool operator==(const SyncMapFragment& lhs, const SyncMapFragment& rhs) noexcept {
        return lhs.interval_ == rhs.interval_;
    }

private:
    TimeInterval interval_{};
    Payload payload_{};
    FragmentType type_{FragmentType::regular};
};

} // namespace syncmap
