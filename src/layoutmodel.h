#pragma once
#include "core.h"
#include <QHash>
#include <QVector>

namespace mmv {

// ── Block record (arena entry, one per visible non-gap item) ──

struct Block {
    QString  id;
    QString  name;
    uint64_t start     = 0;
    uint64_t size      = 0;
    int      depth     = 0;      // palette depth: top stack = 0
    bool     drillable = false;
    bool     expanded  = false;
    int      height    = 0;
    QString  levelOwner;         // owner id of the level this block sits in
};

// ── Level: one stack of items (the top stack or an expanded block's) ──

struct Level {
    QString              ownerId;     // root id for the top stack
    int                  depth = 0;   // depth of the blocks in this stack
    QVector<DisplayItem> items;
    QVector<int>         gapHeights;  // per item; only read for gaps
    QVector<BoundaryMarker> markers;  // valid after refreshMarkers()
};

struct RelayoutStats {
    int  passes    = 0;
    int  changed   = 0;   // blocks resized across all passes
    bool converged = false;
};

// Non-visual layout tree. Owns every block's LayoutState and the nested
// levels; measurements come from the tree itself, not from a widget.
class LayoutModel {
public:
    explicit LayoutModel(const FlatTree* tree, const LayoutConfig& cfg = {});

    const FlatTree&     tree()   const { return *m_tree; }
    const LayoutConfig& config() const { return m_cfg; }

    // Fresh session: drops every block, level and remembered base height
    void renderTop(int viewportHeight);

    // ── State machine ──
    bool toggle(const QString& id);
    bool expand(const QString& id);
    bool collapse(const QString& id);
    void expandRecursively(const QString& id);
    void expandAll();
    void collapseAll();

    // ── Relayout / markers ──
    RelayoutStats relayout();
    void refreshMarkers();

    // ── Queries ──
    const Block* block(const QString& id) const;
    const Level* level(const QString& ownerId) const;
    const Level& topLevel() const;
    QString rootId() const { return m_rootId; }

    int  heightAt(const Level& lv, int idx) const;
    int  itemTop(const Level& lv, int idx) const;
    int  contentHeight(const Level& lv) const;
    int  totalHeight() const { return contentHeight(topLevel()); }
    int  baseHeight(const QString& id) const { return m_baseHeights.value(id, 0); }
    int  requiredHeight(const QString& id) const;
    bool isExpanded(const QString& id) const;
    int  blockCount() const { return m_blocks.size(); }
    int  levelCount() const { return m_levels.size(); }

    // Expanded blocks, deepest first (ties in visual order)
    QVector<QString> expandedBlocks() const;
    // Owners of every visible level, top stack first, in visual order
    QVector<QString> visibleLevels() const;

private:
    const FlatTree*        m_tree;
    LayoutConfig           m_cfg;
    QString                m_rootId;
    QHash<QString, Block>  m_blocks;
    QHash<QString, Level>  m_levels;
    QHash<QString, int>    m_baseHeights;   // written once per id

    void materialize(const QString& ownerId, int depth, const HeightResult& hr,
                     const QVector<DisplayItem>& items);
    void discardLevel(const QString& ownerId);
    void rememberBaseHeight(const QString& id, int h);
    void collectLevels(const QString& ownerId, QVector<QString>& out) const;
};

} // namespace mmv
