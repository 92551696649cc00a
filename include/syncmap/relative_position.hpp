#pragma once

#include "syncmap/time_interval.hpp"

#include <cstdint>

namespace syncmap {

/**
 * Qualitative position of an interval `other` relative to an interval `self`.
 *
 * The two-letter prefix gives the shape of (self, other): P for a point
 * (zero length), I for a proper interval. The suffix tells where other's
 * endpoints fall on self:
 *
 *   L  before self.begin          B  at self.begin (interval self)
 *   C  at the point (point self)  I  strictly inside self
 *   E  at self.end                G  after self.end (or after the point)
 *
 * Point/interval suffixes read (other.begin, other.end); interval/point
 * suffixes read the single point; interval/interval read (other.begin, other.end).
 */
enum class RelativePosition : uint8_t {
    // point / point
    pp_l, ///< other point before self point
    pp_c, ///< points coincide
    pp_g, ///< other point after self point

    // point / interval
    pi_ll, ///< other interval ends before the point
    pi_lc, ///< other interval ends at the point
    pi_lg, ///< point strictly inside other interval
    pi_cg, ///< other interval begins at the point
    pi_gg, ///< other interval begins after the point

    // interval / point
    ip_l, ///< point before self.begin
    ip_b, ///< point at self.begin
    ip_i, ///< point strictly inside self
    ip_e, ///< point at self.end
    ip_g, ///< point after self.end

    // interval / interval
    ii_ll, ///< other entirely before self
    ii_lb, ///< other ends at self.begin
    ii_li, ///< other begins before self, ends inside
    ii_le, ///< other begins before self, ends at self.end
    ii_lg, ///< other strictly contains self
    ii_bi, ///< same begin, other ends inside self
    ii_be, ///< coincident
    ii_bg, ///< same begin, other ends after self
    ii_ii, ///< other strictly inside self
    ii_ie, ///< other begins inside self, same end
    ii_ig, ///< other begins inside self, ends after
    ii_eg, ///< other begins at self.end
    ii_gg  ///< other entirely after self
};

/**
 * Classify where `other` lies relative to `self`.
 */
constexpr RelativePosition relative_position(const TimeInterval& self,
                                             const TimeInterval& other) noexcept {
    using enum RelativePosition;

    if (self.has_zero_length()) {
        const TimeValue p = self.begin();
        if (other.has_zero_length()) {
            if (other.begin() < p) {
                return pp_l;
            }
            return other.begin() == p ? pp_c : pp_g;
        }
        if (other.end() < p) {
            return pi_ll;
        }
        if (other.end() == p) {
            return pi_lc;
        }
        if (other.begin() < p) {
            return pi_lg;
        }
        return other.begin() == p ? pi_cg : pi_gg;
    }

    if (other.has_zero_length()) {
        const TimeValue q = other.begin();
        if (q < self.begin()) {
            return ip_l;
        }
        if (q == self.begin()) {
            return ip_b;
        }
        if (q < self.end()) {
            return ip_i;
        }
        return q == self.end() ? ip_e : ip_g;
    }

    if (other.begin() < self.begin()) {
        if (other.end() < self.begin()) {
            return ii_ll;
        }
        if (other.end() == self.begin()) {
            return ii_lb;
        }
        if (other.end() < self.end()) {
            return ii_li;
        }
        return other.end() == self.end() ? ii_le : ii_lg;
    }
    if (other.begin() == self.begin()) {
        if (other.end() < self.end()) {
            return ii_bi;
        }
        return other.end() == self.end() ? ii_be : ii_bg;
    }
    if (other.begin() < self.end()) {
        if (other.end() < self.end()) {
            return ii_ii;
        }
        return other.end() == self.end() ? ii_ie : ii_ig;
    }
    return other.begin() == self.end() ? ii_eg : ii_gg;
}

/**
 * True for the 15 positions in which the two intervals share at most one
 * boundary point.
 */
constexpr bool is_allowed_position(RelativePosition pos) noexcept {
    using enum RelativePosition;
    switch (pos) {
        case pp_l:
        case pp_c:
        case pp_g:
        case pi_ll:
        case pi_lc:
        case pi_cg:
        case pi_gg:
        case ip_l:
        case ip_b:
        case ip_e:
        case ip_g:
        case ii_ll:
        case ii_lb:
        case ii_eg:
        case ii_gg:
            return true;
        default:
            return false;
    }
}

/// Shorthand for is_allowed_position(relative_position(self, other))
constexpr bool may_share_timeline(const TimeInterval& self, const TimeInterval& other) noexcept {
    return is_allowed_position(relative_position(self, other));
}

constexpr const char* relative_position_string(RelativePosition pos) noexcept {
    using enum RelativePosition;
    switch (pos) {
        case pp_l: return "pp_l";
        case pp_c: return "pp_c";
        case pp_g: return "pp_g";
        case pi_ll: return "pi_ll";
        case pi_lc: return "pi_lc";
        case pi_lg: return "pi_lg";
        case pi_cg: return "pi_cg";
        case pi_gg: return "pi_gg";
        case ip_l: return "ip_l";
        case ip_b: return "ip_b";
        case ip_i: return "ip_i";
        case ip_e: return "ip_e";
        case ip_g: return "ip_g";
        case ii_ll: return "ii_ll";
        case ii_lb: return "ii_lb";
        case ii_li: return "ii_li";
        case ii_le: return "ii_le";
        case ii_lg: return "ii_lg";
        case ii_bi: return "ii_bi";
        case ii_be: return "ii_be";
        case ii_bg: return "ii_bg";
        case ii_ii: return "ii_ii";
        case ii_ie: return "ii_ie";
        case ii_ig: return "ii_ig";
        case ii_eg: return "ii_eg";
        case ii_gg: return "ii_gg";
        default: return "unknown";
    }
}

} // namespace syncmap
