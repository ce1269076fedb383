#pragma once
#include "layoutmodel.h"
#include <QObject>
#include <QPointer>
#include <functional>

namespace mmv {

class MapView;

// ── Controller ──
//
// Applies interactions to the LayoutModel synchronously, then lets the view
// apply the new geometry for a few event-loop ticks before running relayout
// and marker placement against it.

class MapController : public QObject {
    Q_OBJECT
public:
    explicit MapController(const FlatTree* tree, const LayoutConfig& cfg = {},
                           QObject* parent = nullptr);
    ~MapController() override;

    LayoutModel&       model()       { return m_model; }
    const LayoutModel& model() const { return m_model; }

    void attachView(MapView* view);
    MapView* view() const { return m_view; }

    // Rebuilds the top stack for a new viewport (fresh session)
    void setViewportHeight(int h);
    int  viewportHeight() const { return m_viewportHeight; }

    void toggleBlock(const QString& id);
    void expandAll();
    void collapseAll();

    bool isSettling() const { return m_pendingTicks > 0; }
    RelayoutStats lastRelayout() const { return m_lastStats; }

signals:
    void layoutChanged();    // synchronous state mutation applied
    void layoutSettled();    // relayout + markers done

private:
    LayoutModel       m_model;
    QPointer<MapView> m_view;
    int               m_viewportHeight = 0;
    int               m_pendingTicks   = 0;
    uint64_t          m_settleGen      = 0;
    RelayoutStats     m_lastStats;

    void scheduleSettle();
    void afterTicks(int ticks, uint64_t gen, std::function<void()> fn);
    void settle();
};

} // namespace mmv
