#include "core.h"
#include <algorithm>

namespace mmv {

static DisplayItem makeGap(const FlatNode& parent, uint64_t from, uint64_t to) {
    DisplayItem g;
    g.id    = parent.id + QStringLiteral("/gap@") + QString::number(from);
    g.name  = QString::fromLatin1(kGapName);
    g.start = from;
    g.size  = to - from;
    g.isGap = true;
    return g;
}

// Complement of the children inside [parent.start, parent.end)
QVector<DisplayItem> gapsFor(const FlatNode& parent,
                             const QVector<const FlatNode*>& children) {
    QVector<DisplayItem> gaps;
    uint64_t cur = parent.start;
    for (const FlatNode* k : children) {
        if (k->start > cur)
            gaps.append(makeGap(parent, cur, k->start));
        cur = qMax(cur, k->end);
    }
    if (cur < parent.end)
        gaps.append(makeGap(parent, cur, parent.end));
    return gaps;
}

QVector<DisplayItem> itemsFor(const FlatTree& tree, const QString& parentId) {
    const FlatNode* parent = tree.byId(parentId);
    if (!parent) return {};

    const auto kids = tree.childrenOf(parentId);
    QVector<DisplayItem> items;
    items.reserve(kids.size() * 2 + 1);
    for (const FlatNode* k : kids)
        items.append(DisplayItem::child(*k));
    items += gapsFor(*parent, kids);

    // Children were appended first, so a stable sort keeps them ahead of
    // a gap that happens to share their start
    std::stable_sort(items.begin(), items.end(),
                     [](const DisplayItem& a, const DisplayItem& b) { return a.start < b.start; });
    return items;
}

} // namespace mmv
