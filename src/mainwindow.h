#pragma once
#include "controller.h"
#include <QMainWindow>
#include <QLabel>
#include <QScrollArea>

namespace mmv {

class MapView;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    MainWindow(const FlatTree* tree, const LayoutConfig& cfg, QWidget* parent = nullptr);

    MapController* controller() const { return m_ctrl; }
    MapView*       mapView()    const { return m_view; }

    // Builds the top stack against the current viewport; call once shown
    void startSession();

private slots:
    void expandAll();
    void collapseAll();
    void updateStatus();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    MapController* m_ctrl   = nullptr;
    MapView*       m_view   = nullptr;
    QScrollArea*   m_scroll = nullptr;
    QLabel*        m_statusLabel = nullptr;
    const FlatTree* m_tree;
};

} // namespace mmv
