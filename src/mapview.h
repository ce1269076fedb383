#pragma once
#include "layoutmodel.h"
#include "themes/theme.h"
#include <QWidget>
#include <QRect>

namespace mmv {

// One painted block (or gap) in widget coordinates
struct PlacedItem {
    QString id;
    QString ownerId;
    QRect   rect;
    int     index    = 0;
    int     depth    = 0;
    bool    isGap    = false;
    bool    expanded = false;
};

// One visible stack: the block column plus the marker lane to its left
struct PlacedLevel {
    QString ownerId;
    QRect   stackRect;
    QRect   laneRect;
    int     depth = 0;
};

class MapView : public QWidget {
    Q_OBJECT
public:
    explicit MapView(QWidget* parent = nullptr);

    void setModel(const LayoutModel* model);
    void applyTheme(const Theme& theme);
    const Theme& theme() const { return m_theme; }

    // Deepest item under `pos`, empty when none
    QString blockAt(const QPoint& pos) const;
    const QVector<PlacedItem>&  placedItems()  const { return m_items; }
    const QVector<PlacedLevel>& placedLevels() const { return m_levels; }
    QRect itemRect(const QString& id) const;

    QSize sizeHint() const override;
    QSize minimumSizeHint() const override { return sizeHint(); }

public slots:
    // Recompute geometry from the model and repaint
    void refresh();

signals:
    void blockClicked(const QString& id);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private:
    const LayoutModel*   m_model = nullptr;
    Theme                m_theme;
    QVector<PlacedItem>  m_items;
    QVector<PlacedLevel> m_levels;

    void place();
    void placeLevel(const QString& ownerId, const QRect& stackRect, const QRect& laneRect);
    QColor markerFill(const Level& lv, const BoundaryMarker& m) const;
    void paintLevel(QPainter& p, const PlacedLevel& pl) const;
    void paintItem(QPainter& p, const PlacedItem& pi) const;
    void paintMarkers(QPainter& p, const PlacedLevel& pl) const;
};

} // namespace mmv
