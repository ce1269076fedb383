#pragma once
#include <QString>
#include <QStringList>
#include <QVector>
#include <QHash>
#include <QJsonObject>
#include <cstdint>
#include <vector>

namespace mmv {

// ── Layout constants (defaults mirror the desktop viewer) ──

struct LayoutConfig {
    int outerGap        = 52;   // gap extent, top level
    int outerMin        = 52;   // min block extent, top level
    int outerMax        = 140;  // max block extent, top level
    int innerGap        = 44;   // gap extent, nested levels
    int innerMin        = 44;   // block extent, nested levels
    int innerPadTop     = 10;
    int innerPadBottom  = 10;
    int innerPadLeft    = 10;
    int innerPadRight   = 22;
    int innerLaneWidth  = 120;  // marker lane left of every nested stack
    int markerColumn    = 280;  // marker column left of the top stack
    int minVisible      = 320;  // floor for the top-level budget
    int relayoutPasses  = 60;
    int allocatorPasses = 2000;
    int settleTicks     = 3;

    int innerPadY() const { return innerPadTop + innerPadBottom; }
};

// ── Range tree (input) ──

struct RangeNode {
    QString  name;
    uint64_t start = 0;
    uint64_t size  = 0;
    std::vector<RangeNode> children;   // sorted by start once built

    uint64_t end() const { return start + size; }

    // Stable sort by start; called once per node when the tree is built
    void sortChildren();
};

// ── Flat node (interchange record) ──

struct FlatNode {
    QString  id;
    QString  name;
    uint64_t start    = 0;
    uint64_t size     = 0;
    uint64_t end      = 0;
    int      depth    = 0;
    QString  parentId;   // empty = root

    bool isRoot() const { return parentId.isEmpty(); }
    QJsonObject toJson() const;
};

// ── FlatTree: flat sequence + lookup indices built once ──

struct FlatTree {
    QVector<FlatNode> nodes;

    static FlatTree build(const QVector<FlatNode>& flat);

    const FlatNode* root() const { return nodes.isEmpty() ? nullptr : &nodes.first(); }
    const FlatNode* byId(const QString& id) const {
        int idx = m_index.value(id, -1);
        return idx < 0 ? nullptr : &nodes[idx];
    }
    // Ordered by start (pre-order already keeps siblings in start order)
    QVector<const FlatNode*> childrenOf(const QString& parentId) const;
    bool hasChildren(const QString& id) const { return !m_children.value(id).isEmpty(); }

private:
    QHash<QString, int>          m_index;
    QHash<QString, QVector<int>> m_children;
};

// ── Display items (one level's layout pass) ──

struct DisplayItem {
    QString  id;
    QString  name;
    uint64_t start = 0;
    uint64_t size  = 0;
    bool     isGap = false;

    uint64_t end() const { return start + size; }

    static DisplayItem child(const FlatNode& n) {
        return {n.id, n.name, n.start, n.size, false};
    }
};

inline constexpr const char* kGapName = "Unmapped / Reserved";

// ── Space allocation result ──

struct HeightResult {
    QVector<int> heights;
    int          total = 0;
};

// ── Boundary markers ──

struct MarkerSlot {
    double   top    = 0;
    double   bottom = 0;
    uint64_t start  = 0;
    uint64_t end    = 0;
    bool     isGap  = false;
};

struct BoundaryMarker {
    double   y       = 0;
    uint64_t address = 0;
    int      bgIndex = -1;   // slot whose fill the pill borrows, -1 = level default
};

// ── Core passes ──

QStringList validate(const RangeNode& root);
QVector<FlatNode> flatten(const RangeNode& root);
QJsonObject payloadToJson(const RangeNode& root, const QVector<FlatNode>& flat);

QVector<DisplayItem> gapsFor(const FlatNode& parent,
                             const QVector<const FlatNode*>& children);
QVector<DisplayItem> itemsFor(const FlatTree& tree, const QString& parentId);

HeightResult computeHeightsToFit(const QVector<DisplayItem>& items,
                                 int minExtent, int maxExtent,
                                 int budget, int gapExtent,
                                 int maxPasses = 2000);
HeightResult computeCompactHeights(const QVector<DisplayItem>& items,
                                   int minExtent, int gapExtent);
int topLevelBudget(const QVector<DisplayItem>& items, const LayoutConfig& cfg,
                   int viewportHeight);

QVector<BoundaryMarker> boundaryMarkers(const QVector<MarkerSlot>& slots);

// ── Format ──

namespace fmt {
    QString address(uint64_t v);
    QString size(uint64_t bytes);
    QString hexRange(uint64_t start, uint64_t end);
    QString idToken(const QString& name, uint64_t start);
} // namespace fmt

} // namespace mmv
