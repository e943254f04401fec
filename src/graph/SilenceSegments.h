#pragma once

#include <optional>
#include <vector>

namespace AutoScrub {

/**
 * @brief A detected silence, in seconds from the start of the media
 *
 * An empty end marks a silence that was still running when the media ended
 * (ffmpeg printed silence_start without a matching silence_end).
 */
struct SilenceInterval {
    double start = 0.0;
    std::optional<double> end;

    bool isOpenEnded() const { return !end.has_value(); }

    bool operator==(const SilenceInterval& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const SilenceInterval& other) const { return !(*this == other); }
};

// Half-open time range [from, to) of one trimmed segment
struct TimeSpan {
    double from = 0.0;
    double to = 0.0;

    double length() const { return to - from; }
};

// Trim ranges for the normal-speed segment leading into a silence and for the
// fast-forwarded part of the silence itself.
struct SegmentBoundaries {
    TimeSpan before;
    TimeSpan during;

    // Where the next normal-speed segment starts
    double nextCursor() const { return during.to; }
};

/**
 * @brief Drop silences touching the very start or end of the media
 *
 * The first interval is dropped when it starts at (or before) 0 and the last
 * one when it is open-ended; those belong to the leading and trailing
 * normal-speed segments. A single interval matching both rules is dropped
 * once. The result is a subsequence of the input, so applying this twice is
 * the same as applying it once.
 */
std::vector<SilenceInterval> truncateSilences(const std::vector<SilenceInterval>& silences);

/**
 * @brief Trim boundaries for one internal silence
 * @param cursorTime End of the previous normal-speed segment
 * @param silence Internal (closed) silence interval
 * @param margin Guard band kept at normal speed on each side of the silence
 *
 * before = [cursorTime, start + margin), during = [start + margin, end - margin).
 * A non-positive "during" length is returned as is.
 */
SegmentBoundaries computeBoundaries(double cursorTime, const SilenceInterval& silence, double margin);

} // namespace AutoScrub
