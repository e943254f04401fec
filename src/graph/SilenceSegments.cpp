#include "SilenceSegments.h"

#include <iterator>

namespace AutoScrub {

std::vector<SilenceInterval> truncateSilences(const std::vector<SilenceInterval>& silences) {
    auto first = silences.begin();
    auto last = silences.end();

    if (first == last) {
        return {};
    }
    if (first->start <= 0.0) {
        ++first;
    }
    if (first != last && std::prev(last)->isOpenEnded()) {
        --last;
    }
    return std::vector<SilenceInterval>(first, last);
}

SegmentBoundaries computeBoundaries(double cursorTime, const SilenceInterval& silence, double margin) {
    // Truncated silences are always closed; an open one collapses to zero length
    const double silenceEnd = silence.end.value_or(silence.start);

    SegmentBoundaries b;
    b.before.from = cursorTime;
    b.before.to = silence.start + margin;
    b.during.from = b.before.to;
    b.during.to = silenceEnd - margin;
    return b;
}

} // namespace AutoScrub
