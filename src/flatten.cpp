#include "core.h"
#include <QJsonArray>
#include <algorithm>

namespace mmv {

void RangeNode::sortChildren() {
    std::stable_sort(children.begin(), children.end(),
                     [](const RangeNode& a, const RangeNode& b) { return a.start < b.start; });
}

// ── Flatten (pre-order, parent before children) ──

static void flattenInto(const RangeNode& n, int depth, const QString& parentId,
                        QVector<FlatNode>& out) {
    FlatNode f;
    f.id = parentId.isEmpty()
        ? fmt::idToken(n.name, n.start)
        : parentId + QLatin1Char('/') + fmt::idToken(n.name, n.start);
    f.name     = n.name;
    f.start    = n.start;
    f.size     = n.size;
    f.end      = n.end();
    f.depth    = depth;
    f.parentId = parentId;
    out.append(f);

    const QString id = f.id;
    for (const RangeNode& c : n.children)
        flattenInto(c, depth + 1, id, out);
}

QVector<FlatNode> flatten(const RangeNode& root) {
    QVector<FlatNode> out;
    flattenInto(root, 0, QString(), out);
    return out;
}

// ── FlatTree ──

FlatTree FlatTree::build(const QVector<FlatNode>& flat) {
    FlatTree t;
    t.nodes = flat;
    for (int i = 0; i < t.nodes.size(); i++) {
        const FlatNode& n = t.nodes[i];
        t.m_index.insert(n.id, i);
        if (!n.isRoot())
            t.m_children[n.parentId].append(i);
    }
    return t;
}

QVector<const FlatNode*> FlatTree::childrenOf(const QString& parentId) const {
    QVector<const FlatNode*> out;
    const QVector<int> kids = m_children.value(parentId);
    out.reserve(kids.size());
    for (int ci : kids)
        out.append(&nodes[ci]);
    std::stable_sort(out.begin(), out.end(),
                     [](const FlatNode* a, const FlatNode* b) { return a->start < b->start; });
    return out;
}

// ── Payload (interchange record) ──

// JSON numbers are doubles; addresses past 2^53 go out as hex strings
static QJsonValue jsonAddr(uint64_t v) {
    constexpr uint64_t kMaxExact = 1ULL << 53;
    if (v <= kMaxExact) return QJsonValue((double)v);
    return QJsonValue(QStringLiteral("0x") + QString::number(v, 16));
}

QJsonObject FlatNode::toJson() const {
    QJsonObject o;
    o["id"]     = id;
    o["name"]   = name;
    o["start"]  = jsonAddr(start);
    o["size"]   = jsonAddr(size);
    o["end"]    = jsonAddr(end);
    o["depth"]  = depth;
    o["parent"] = parentId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(parentId);
    return o;
}

QJsonObject payloadToJson(const RangeNode& root, const QVector<FlatNode>& flat) {
    QJsonObject r;
    r["id"]    = flat.isEmpty() ? QString() : flat.first().id;
    r["name"]  = root.name;
    r["start"] = jsonAddr(root.start);
    r["size"]  = jsonAddr(root.size);
    r["end"]   = jsonAddr(root.end());

    QJsonArray arr;
    for (const auto& n : flat) arr.append(n.toJson());

    QJsonObject o;
    o["root"]  = r;
    o["nodes"] = arr;
    return o;
}

} // namespace mmv
