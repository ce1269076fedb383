#include "core.h"
#include <QMap>

namespace mmv {

// Gap slots borrow the fill of the nearest real block: next sibling first,
// then previous, then the level default (-1)
static int markerBgIndex(const QVector<MarkerSlot>& slots, int idx) {
    if (idx < 0 || idx >= slots.size()) return -1;
    if (!slots[idx].isGap) return idx;
    for (int j = idx + 1; j < slots.size(); j++)
        if (!slots[j].isGap) return j;
    for (int j = idx - 1; j >= 0; j--)
        if (!slots[j].isGap) return j;
    return -1;
}

QVector<BoundaryMarker> boundaryMarkers(const QVector<MarkerSlot>& slots) {
    if (slots.isEmpty()) return {};

    QVector<BoundaryMarker> boundaries;
    boundaries.reserve(slots.size() + 1);
    for (int i = 0; i < slots.size(); i++)
        boundaries.append({slots[i].top, slots[i].start, markerBgIndex(slots, i)});
    const int last = slots.size() - 1;
    boundaries.append({slots[last].bottom, slots[last].end, markerBgIndex(slots, last)});

    // First boundary to claim a rounded position wins; QMap keeps y order
    QMap<int, BoundaryMarker> byY;
    for (const auto& b : boundaries) {
        int key = qRound(b.y);
        if (!byY.contains(key)) byY.insert(key, b);
    }
    return QVector<BoundaryMarker>(byY.cbegin(), byY.cend());
}

} // namespace mmv
