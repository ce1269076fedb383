#include "layoutmodel.h"
#include <QDebug>
#include <algorithm>

namespace mmv {

LayoutModel::LayoutModel(const FlatTree* tree, const LayoutConfig& cfg)
    : m_tree(tree)
    , m_cfg(cfg)
{
}

// ── Top level ──

void LayoutModel::renderTop(int viewportHeight) {
    m_blocks.clear();
    m_levels.clear();
    m_baseHeights.clear();
    m_rootId.clear();

    const FlatNode* root = m_tree ? m_tree->root() : nullptr;
    if (!root) return;
    m_rootId = root->id;

    const QVector<DisplayItem> items = itemsFor(*m_tree, m_rootId);
    const int budget = topLevelBudget(items, m_cfg, viewportHeight);
    const HeightResult hr = computeHeightsToFit(items, m_cfg.outerMin, m_cfg.outerMax,
                                                budget, m_cfg.outerGap,
                                                m_cfg.allocatorPasses);
    materialize(m_rootId, 0, hr, items);

    qDebug() << "LayoutModel: Top level" << items.size() << "item(s), budget"
             << budget << "allocated" << hr.total;
}

void LayoutModel::materialize(const QString& ownerId, int depth, const HeightResult& hr,
                              const QVector<DisplayItem>& items) {
    Level lv;
    lv.ownerId = ownerId;
    lv.depth   = depth;
    lv.items   = items;
    lv.gapHeights.fill(0, items.size());

    for (int i = 0; i < items.size(); i++) {
        const DisplayItem& it = items[i];
        if (it.isGap) {
            lv.gapHeights[i] = hr.heights[i];
            continue;
        }
        Block b;
        b.id         = it.id;
        b.name       = it.name;
        b.start      = it.start;
        b.size       = it.size;
        b.depth      = depth;
        b.drillable  = m_tree->hasChildren(it.id);
        b.height     = hr.heights[i];
        b.levelOwner = ownerId;
        m_blocks.insert(b.id, b);
        rememberBaseHeight(b.id, hr.heights[i]);
    }
    m_levels.insert(ownerId, lv);
}

void LayoutModel::rememberBaseHeight(const QString& id, int h) {
    if (!m_baseHeights.contains(id))
        m_baseHeights.insert(id, h);
}

// Drops a nested level and every block, level and expansion beneath it.
// Remembered base heights survive.
void LayoutModel::discardLevel(const QString& ownerId) {
    auto it = m_levels.find(ownerId);
    if (it == m_levels.end()) return;
    const Level lv = it.value();
    m_levels.erase(it);

    for (const DisplayItem& item : lv.items) {
        if (item.isGap) continue;
        discardLevel(item.id);
        m_blocks.remove(item.id);
    }
}

// ── State machine ──

bool LayoutModel::toggle(const QString& id) {
    const Block* b = block(id);
    if (!b || !b->drillable) return false;   // gaps and leaves absorb the click
    return b->expanded ? collapse(id) : expand(id);
}

bool LayoutModel::expand(const QString& id) {
    auto it = m_blocks.find(id);
    if (it == m_blocks.end() || !it->drillable || it->expanded) return false;

    it->expanded = true;
    const int depth = it->depth + 1;
    const QVector<DisplayItem> items = itemsFor(*m_tree, id);
    materialize(id, depth, computeCompactHeights(items, m_cfg.innerMin, m_cfg.innerGap), items);

    qDebug() << "LayoutModel: Expanded" << id << "->" << items.size() << "item(s)";
    return true;
}

bool LayoutModel::collapse(const QString& id) {
    auto it = m_blocks.find(id);
    if (it == m_blocks.end() || !it->expanded) return false;

    discardLevel(id);
    it = m_blocks.find(id);
    it->expanded = false;
    if (int base = baseHeight(id); base > 0)
        it->height = base;

    qDebug() << "LayoutModel: Collapsed" << id;
    return true;
}

void LayoutModel::expandRecursively(const QString& id) {
    auto it = m_blocks.find(id);
    if (it == m_blocks.end() || !it->drillable) return;

    // An already open block is rebuilt from scratch
    if (it->expanded) {
        discardLevel(id);
        m_blocks[id].expanded = false;
    }
    expand(id);

    const QVector<DisplayItem> items = m_levels.value(id).items;
    for (const DisplayItem& item : items) {
        if (!item.isGap && m_tree->hasChildren(item.id))
            expandRecursively(item.id);
    }
}

void LayoutModel::expandAll() {
    const QVector<DisplayItem> items = topLevel().items;
    for (const DisplayItem& item : items) {
        if (!item.isGap && m_tree->hasChildren(item.id))
            expandRecursively(item.id);
    }
}

void LayoutModel::collapseAll() {
    const QVector<DisplayItem> items = topLevel().items;
    for (const DisplayItem& item : items) {
        if (item.isGap) continue;
        if (!collapse(item.id)) {
            auto it = m_blocks.find(item.id);
            if (it != m_blocks.end() && baseHeight(item.id) > 0)
                it->height = baseHeight(item.id);
        }
    }
}

// ── Relayout ──
//
// A parent's need depends on its children's settled heights, so every pass
// walks expanded blocks deepest first. Passes repeat until nothing moves or
// the ceiling is hit; the last layout reached stands either way.

RelayoutStats LayoutModel::relayout() {
    RelayoutStats stats;
    for (int pass = 0; pass < m_cfg.relayoutPasses; pass++) {
        stats.passes++;
        bool changed = false;
        for (const QString& id : expandedBlocks()) {
            const int need = requiredHeight(id);
            Block& b = m_blocks[id];
            if (qAbs(b.height - need) >= 1) {
                b.height = need;
                stats.changed++;
                changed = true;
            }
        }
        if (!changed) {
            stats.converged = true;
            break;
        }
    }
    if (!stats.converged)
        qDebug() << "LayoutModel: Relayout stopped after" << stats.passes << "pass(es)";
    return stats;
}

int LayoutModel::requiredHeight(const QString& id) const {
    const Block* b = block(id);
    if (!b) return 0;
    const int base = baseHeight(id) > 0 ? baseHeight(id) : b->height;
    const Level* lv = level(id);
    if (!b->expanded || !lv) return base;
    return qMax(base, contentHeight(*lv) + m_cfg.innerPadY());
}

// ── Markers ──

void LayoutModel::refreshMarkers() {
    for (const QString& owner : visibleLevels()) {
        Level& lv = m_levels[owner];
        QVector<MarkerSlot> slots;
        slots.reserve(lv.items.size());
        int y = 0;
        for (int i = 0; i < lv.items.size(); i++) {
            const DisplayItem& it = lv.items[i];
            const int h = heightAt(lv, i);
            slots.append({(double)y, (double)(y + h), it.start, it.end(), it.isGap});
            y += h;
        }
        lv.markers = boundaryMarkers(slots);
    }
}

// ── Queries ──

const Block* LayoutModel::block(const QString& id) const {
    auto it = m_blocks.constFind(id);
    return it == m_blocks.cend() ? nullptr : &it.value();
}

const Level* LayoutModel::level(const QString& ownerId) const {
    auto it = m_levels.constFind(ownerId);
    return it == m_levels.cend() ? nullptr : &it.value();
}

const Level& LayoutModel::topLevel() const {
    static const Level kEmpty;
    const Level* lv = level(m_rootId);
    return lv ? *lv : kEmpty;
}

bool LayoutModel::isExpanded(const QString& id) const {
    const Block* b = block(id);
    return b && b->expanded;
}

int LayoutModel::heightAt(const Level& lv, int idx) const {
    if (idx < 0 || idx >= lv.items.size()) return 0;
    if (lv.items[idx].isGap) return lv.gapHeights.value(idx);
    const Block* b = block(lv.items[idx].id);
    return b ? b->height : 0;
}

int LayoutModel::itemTop(const Level& lv, int idx) const {
    int y = 0;
    for (int i = 0; i < idx && i < lv.items.size(); i++)
        y += heightAt(lv, i);
    return y;
}

// Bottom edge of the last item
int LayoutModel::contentHeight(const Level& lv) const {
    return itemTop(lv, lv.items.size());
}

void LayoutModel::collectLevels(const QString& ownerId, QVector<QString>& out) const {
    const Level* lv = level(ownerId);
    if (!lv) return;
    out.append(ownerId);
    for (const DisplayItem& it : lv->items) {
        if (!it.isGap && isExpanded(it.id))
            collectLevels(it.id, out);
    }
}

QVector<QString> LayoutModel::visibleLevels() const {
    QVector<QString> out;
    if (!m_rootId.isEmpty())
        collectLevels(m_rootId, out);
    return out;
}

QVector<QString> LayoutModel::expandedBlocks() const {
    QVector<QString> out;
    for (const QString& owner : visibleLevels()) {
        if (owner != m_rootId) out.append(owner);
    }
    std::stable_sort(out.begin(), out.end(), [this](const QString& a, const QString& b) {
        return block(a)->depth > block(b)->depth;
    });
    return out;
}

} // namespace mmv
