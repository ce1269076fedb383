#include "controller.h"
#include "mapview.h"
#include <QTimer>
#include <QDebug>

namespace mmv {

MapController::MapController(const FlatTree* tree, const LayoutConfig& cfg, QObject* parent)
    : QObject(parent)
    , m_model(tree, cfg)
{
}

MapController::~MapController() = default;

void MapController::attachView(MapView* view) {
    if (m_view)
        disconnect(m_view, nullptr, this, nullptr);
    m_view = view;
    if (!m_view) return;

    m_view->setModel(&m_model);
    connect(m_view, &MapView::blockClicked, this, &MapController::toggleBlock);
}

void MapController::setViewportHeight(int h) {
    m_viewportHeight = h;
    m_model.renderTop(h);
    emit layoutChanged();
    if (m_view) m_view->refresh();
    scheduleSettle();
}

void MapController::toggleBlock(const QString& id) {
    if (!m_model.toggle(id)) return;   // gap or leaf: nothing to do
    emit layoutChanged();
    if (m_view) m_view->refresh();
    scheduleSettle();
}

void MapController::expandAll() {
    m_model.expandAll();
    emit layoutChanged();
    if (m_view) m_view->refresh();
    scheduleSettle();
}

void MapController::collapseAll() {
    m_model.collapseAll();
    emit layoutChanged();
    if (m_view) m_view->refresh();
    scheduleSettle();
}

// ── Deferred settle chain ──
//
// Each mutation restarts the chain; a stale chain sees an old generation and
// stops, so overlapping interactions settle once.

void MapController::scheduleSettle() {
    const uint64_t gen = ++m_settleGen;
    m_pendingTicks = qMax(1, m_model.config().settleTicks);
    afterTicks(m_pendingTicks, gen, [this]() { settle(); });
}

void MapController::afterTicks(int ticks, uint64_t gen, std::function<void()> fn) {
    QTimer::singleShot(0, this, [this, ticks, gen, fn = std::move(fn)]() {
        if (gen != m_settleGen) return;
        m_pendingTicks = ticks - 1;
        if (ticks <= 1) {
            fn();
            return;
        }
        afterTicks(ticks - 1, gen, fn);
    });
}

void MapController::settle() {
    m_lastStats = m_model.relayout();
    m_model.refreshMarkers();
    if (m_view) m_view->refresh();

    qDebug() << "MapController: Settled in" << m_lastStats.passes << "pass(es),"
             << m_lastStats.changed << "resize(s)";
    if (!m_lastStats.converged)
        qWarning() << "MapController: Relayout hit its pass ceiling; keeping best layout";
    emit layoutSettled();
}

} // namespace mmv
