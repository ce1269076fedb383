#include "mapview.h"
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>

namespace mmv {

namespace {
constexpr int kMargin        = 18;   // room for the first/last marker pill
constexpr int kSizeColumn    = 160;  // size tags right of the top stack
constexpr int kMinStackWidth = 320;
constexpr int kMinInnerWidth = 80;
constexpr int kTickW         = 34;
constexpr int kRadius        = 10;
}

MapView::MapView(QWidget* parent)
    : QWidget(parent)
    , m_theme(Theme::memmapLight())
{
    setMouseTracking(false);
    setAutoFillBackground(false);
}

void MapView::setModel(const LayoutModel* model) {
    m_model = model;
    refresh();
}

void MapView::applyTheme(const Theme& theme) {
    m_theme = theme;
    update();
}

void MapView::refresh() {
    place();
    updateGeometry();
    update();
}

QSize MapView::sizeHint() const {
    int h = 2 * kMargin + (m_model ? m_model->totalHeight() : 0);
    int w = (m_model ? m_model->config().markerColumn : 0) + kMinStackWidth + kSizeColumn;
    return QSize(w, h);
}

// ── Geometry ──

void MapView::place() {
    m_items.clear();
    m_levels.clear();
    if (!m_model || m_model->rootId().isEmpty()) return;

    const LayoutConfig& cfg = m_model->config();
    const int stackW = qMax(kMinStackWidth, width() - cfg.markerColumn - kSizeColumn);
    QRect stack(cfg.markerColumn, kMargin, stackW, m_model->totalHeight());
    QRect lane(0, kMargin, cfg.markerColumn, stack.height());
    placeLevel(m_model->rootId(), stack, lane);
}

void MapView::placeLevel(const QString& ownerId, const QRect& stackRect, const QRect& laneRect) {
    const Level* lv = m_model->level(ownerId);
    if (!lv) return;
    m_levels.append({ownerId, stackRect, laneRect, lv->depth});

    const LayoutConfig& cfg = m_model->config();
    int y = stackRect.top();
    for (int i = 0; i < lv->items.size(); i++) {
        const DisplayItem& it = lv->items[i];
        const int h = m_model->heightAt(*lv, i);

        PlacedItem pi;
        pi.id       = it.id;
        pi.ownerId  = ownerId;
        pi.rect     = QRect(stackRect.left(), y, stackRect.width(), h);
        pi.index    = i;
        pi.depth    = lv->depth;
        pi.isGap    = it.isGap;
        pi.expanded = !it.isGap && m_model->isExpanded(it.id);
        m_items.append(pi);

        if (pi.expanded) {
            const Level* inner = m_model->level(it.id);
            QRect content = pi.rect.adjusted(cfg.innerPadLeft, cfg.innerPadTop,
                                             -cfg.innerPadRight, -cfg.innerPadBottom);
            const int innerW = qMax(kMinInnerWidth, content.width() - cfg.innerLaneWidth);
            const int innerH = inner ? m_model->contentHeight(*inner) : 0;
            QRect innerLane(content.left(), content.top(), cfg.innerLaneWidth, innerH);
            QRect innerStack(content.left() + cfg.innerLaneWidth, content.top(), innerW, innerH);
            placeLevel(it.id, innerStack, innerLane);
        }
        y += h;
    }
}

QString MapView::blockAt(const QPoint& pos) const {
    // Nested items are placed after their owner, so scan backwards
    for (int i = m_items.size() - 1; i >= 0; i--) {
        if (m_items[i].rect.contains(pos))
            return m_items[i].id;
    }
    return {};
}

QRect MapView::itemRect(const QString& id) const {
    for (const auto& pi : m_items)
        if (pi.id == id) return pi.rect;
    return {};
}

// ── Painting ──

QColor MapView::markerFill(const Level& lv, const BoundaryMarker& m) const {
    if (m.bgIndex >= 0 && m.bgIndex < lv.items.size())
        return lv.items[m.bgIndex].isGap ? m_theme.gapFill : m_theme.depthColor(lv.depth);
    // Level default: the enclosing block, or the top stack itself
    return lv.depth > 0 ? m_theme.depthColor(lv.depth - 1) : m_theme.stackFill;
}

void MapView::paintEvent(QPaintEvent*) {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing, true);
    p.fillRect(rect(), m_theme.background);
    if (!m_model) return;

    // Levels are in visual pre-order: a nested stack paints over its owner
    for (const PlacedLevel& pl : m_levels) {
        paintLevel(p, pl);
        for (const PlacedItem& pi : m_items)
            if (pi.ownerId == pl.ownerId) paintItem(p, pi);
        paintMarkers(p, pl);
    }
}

void MapView::paintLevel(QPainter& p, const PlacedLevel& pl) const {
    QPainterPath path;
    path.addRoundedRect(QRectF(pl.stackRect), kRadius, kRadius);
    p.fillPath(path, pl.depth == 0 ? m_theme.stackFill : m_theme.innerStackFill);
    p.setPen(QPen(m_theme.border, pl.depth == 0 ? 2 : 1));
    p.drawPath(path);
}

void MapView::paintItem(QPainter& p, const PlacedItem& pi) const {
    const Level* lv = m_model->level(pi.ownerId);
    const bool last = lv && pi.index == lv->items.size() - 1;

    p.fillRect(pi.rect, pi.isGap ? m_theme.gapFill : m_theme.depthColor(pi.depth));
    if (!last) {
        p.setPen(QPen(m_theme.separator, 2));
        p.drawLine(pi.rect.left(), pi.rect.bottom(), pi.rect.right(), pi.rect.bottom());
    }
    if (pi.expanded) return;   // label and size make way for the nested stack

    const DisplayItem& it = lv->items[pi.index];
    QFont f = font();
    f.setBold(true);
    p.setFont(f);
    p.setPen(pi.isGap ? m_theme.gapText : m_theme.text);
    p.drawText(pi.rect.adjusted(10, 0, -10, 0), Qt::AlignCenter | Qt::TextSingleLine, it.name);

    f.setBold(false);
    p.setFont(f);
    p.setPen(m_theme.text);
    const QString sz = fmt::size(it.size);
    if (pi.depth == 0) {
        QRect tag(pi.rect.right() + 16, pi.rect.top(), kSizeColumn - 16, pi.rect.height());
        p.drawText(tag, Qt::AlignLeft | Qt::AlignVCenter, sz);
    } else {
        p.drawText(pi.rect.adjusted(0, 0, -8, 0), Qt::AlignRight | Qt::AlignVCenter, sz);
    }
}

void MapView::paintMarkers(QPainter& p, const PlacedLevel& pl) const {
    const Level* lv = m_model->level(pl.ownerId);
    if (!lv) return;

    QFont mono(QStringLiteral("monospace"));
    mono.setStyleHint(QFont::Monospace);
    mono.setPointSizeF(qMax(7.0, font().pointSizeF() - 1));
    p.setFont(mono);
    const QFontMetrics fm(mono);

    for (const BoundaryMarker& m : lv->markers) {
        const int y = pl.stackRect.top() + qRound(m.y);
        const int tickRight = pl.stackRect.left();
        p.fillRect(QRect(tickRight - kTickW, y - 1, kTickW, 2), m_theme.markerLine);

        const QString text = fmt::address(m.address);
        const int pillW = fm.horizontalAdvance(text) + 20;
        const int pillH = fm.height() + 4;
        QRectF pill(tickRight - kTickW - pillW, y - pillH / 2.0, pillW, pillH);
        QPainterPath path;
        path.addRoundedRect(pill, pillH / 2.0, pillH / 2.0);
        p.fillPath(path, markerFill(*lv, m));
        p.setPen(QPen(m_theme.markerLine, 1));
        p.drawPath(path);
        p.setPen(m_theme.markerText);
        p.drawText(pill, Qt::AlignCenter, text);
    }
}

// ── Input ──

void MapView::mousePressEvent(QMouseEvent* event) {
    if (event->button() != Qt::LeftButton) {
        QWidget::mousePressEvent(event);
        return;
    }
    const QString id = blockAt(event->pos());
    if (!id.isEmpty())
        emit blockClicked(id);
    event->accept();
}

void MapView::resizeEvent(QResizeEvent* event) {
    QWidget::resizeEvent(event);
    place();
}

} // namespace mmv
