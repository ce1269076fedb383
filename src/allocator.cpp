#include "core.h"
#include <cmath>

namespace mmv {

// ── Fit-to-budget (top level) ──
//
// Gaps take a fixed extent. The rest of the budget is split in proportion to
// byte size, clamped to [minExtent, maxExtent], then nudged one pass at a time
// until the total meets the budget or nothing can move. Earlier items take the
// leftover unit on each pass.

HeightResult computeHeightsToFit(const QVector<DisplayItem>& items,
                                 int minExtent, int maxExtent,
                                 int budget, int gapExtent,
                                 int maxPasses) {
    HeightResult r;
    if (items.isEmpty()) return r;

    const int n = items.size();
    int gapCount = 0;
    double sumSize = 0;
    for (const auto& it : items) {
        if (it.isGap) gapCount++;
        else sumSize += (double)qMax<uint64_t>(it.size, 1);
    }
    if (sumSize <= 0) sumSize = 1;
    const int nonGapBudget = qMax(0, budget - gapCount * gapExtent);

    r.heights.resize(n);
    for (int i = 0; i < n; i++) {
        const auto& it = items[i];
        if (it.isGap) {
            r.heights[i] = gapExtent;
            continue;
        }
        double share = (double)qMax<uint64_t>(it.size, 1) / sumSize;
        int h = (int)std::floor(share * nonGapBudget);
        r.heights[i] = qBound(minExtent, h, maxExtent);
    }

    auto total = [&r]() {
        int t = 0;
        for (int h : r.heights) t += h;
        return t;
    };

    int delta = budget - total();
    QVector<int> movable;
    movable.reserve(n);

    for (int pass = 0; delta != 0 && pass < maxPasses; pass++) {
        movable.clear();
        if (delta > 0) {
            for (int i = 0; i < n; i++)
                if (!items[i].isGap && r.heights[i] < maxExtent) movable.append(i);
            if (movable.isEmpty()) break;
            const int step = qMax(1, delta / (int)movable.size());
            for (int i : movable) {
                int add = qMin(qMin(step, maxExtent - r.heights[i]), delta);
                r.heights[i] += add;
                delta -= add;
                if (delta == 0) break;
            }
        } else {
            for (int i = 0; i < n; i++)
                if (!items[i].isGap && r.heights[i] > minExtent) movable.append(i);
            if (movable.isEmpty()) break;
            const int need = -delta;
            const int step = qMax(1, need / (int)movable.size());
            int taken = 0;
            for (int i : movable) {
                int sub = qMin(qMin(step, r.heights[i] - minExtent), need - taken);
                r.heights[i] -= sub;
                taken += sub;
                if (taken == need) break;
            }
            delta += taken;
        }
    }

    r.total = total();
    return r;
}

// ── Compact (nested levels) ──

HeightResult computeCompactHeights(const QVector<DisplayItem>& items,
                                   int minExtent, int gapExtent) {
    HeightResult r;
    r.heights.reserve(items.size());
    for (const auto& it : items) {
        int h = it.isGap ? gapExtent : minExtent;
        r.heights.append(h);
        r.total += h;
    }
    return r;
}

// Top stack budget: the visible viewport, never less than every item at its floor
int topLevelBudget(const QVector<DisplayItem>& items, const LayoutConfig& cfg,
                   int viewportHeight) {
    int minRequired = 0;
    for (const auto& it : items)
        minRequired += it.isGap ? cfg.outerGap : cfg.outerMin;
    int visible = qMax(cfg.minVisible, viewportHeight);
    return qMax(minRequired, visible);
}

} // namespace mmv
