#include "mainwindow.h"
#include "mapview.h"
#include "loader.h"
#include "config.h"
#include "themes/theme.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QCloseEvent>
#include <QFile>
#include <QJsonDocument>
#include <QSettings>
#include <QStatusBar>
#include <QTextStream>
#include <QTimer>
#include <QToolBar>
#include <QDebug>
#include <cstring>
#include <memory>

namespace mmv {

// ── MainWindow ──

MainWindow::MainWindow(const FlatTree* tree, const LayoutConfig& cfg, QWidget* parent)
    : QMainWindow(parent)
    , m_tree(tree)
{
    const FlatNode* root = tree->root();
    setWindowTitle(root && !root->name.isEmpty() ? root->name : QStringLiteral("Memory Map"));

    m_ctrl = new MapController(tree, cfg, this);
    m_view = new MapView;
    m_ctrl->attachView(m_view);

    m_scroll = new QScrollArea(this);
    m_scroll->setWidgetResizable(true);
    m_scroll->setFrameShape(QFrame::NoFrame);
    m_scroll->setWidget(m_view);
    setCentralWidget(m_scroll);

    auto* bar = addToolBar(QStringLiteral("View"));
    bar->setMovable(false);
    bar->addAction(QStringLiteral("Expand All"), this, &MainWindow::expandAll);
    bar->addAction(QStringLiteral("Collapse All"), this, &MainWindow::collapseAll);

    m_statusLabel = new QLabel(this);
    statusBar()->addWidget(m_statusLabel, 1);
    connect(m_ctrl, &MapController::layoutSettled, this, &MainWindow::updateStatus);

    QSettings settings("MemMap", "MemMap");
    if (!restoreGeometry(settings.value("windowGeometry").toByteArray()))
        resize(1100, 900);
}

void MainWindow::startSession() {
    m_ctrl->setViewportHeight(m_scroll->viewport()->height());
}

void MainWindow::expandAll()   { m_ctrl->expandAll(); }
void MainWindow::collapseAll() { m_ctrl->collapseAll(); }

void MainWindow::updateStatus() {
    const FlatNode* root = m_tree->root();
    if (!root) return;
    const LayoutModel& model = m_ctrl->model();
    m_statusLabel->setText(QStringLiteral("%1 - %2  |  %3  |  %4 node(s), %5 expanded")
                               .arg(fmt::address(root->start), fmt::address(root->end),
                                    fmt::size(root->size))
                               .arg(m_tree->nodes.size())
                               .arg(model.expandedBlocks().size()));
}

void MainWindow::closeEvent(QCloseEvent* event) {
    QSettings settings("MemMap", "MemMap");
    settings.setValue("windowGeometry", saveGeometry());
    QMainWindow::closeEvent(event);
}

} // namespace mmv

// ── Entry point ──

static bool wantsHeadless(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--dump") == 0 || std::strcmp(argv[i], "--help") == 0
            || std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--version") == 0)
            return true;
    }
    return false;
}

int main(int argc, char* argv[]) {
    // Payload export needs no display
    std::unique_ptr<QCoreApplication> app(wantsHeadless(argc, argv)
        ? new QCoreApplication(argc, argv)
        : new QApplication(argc, argv));
    QCoreApplication::setApplicationName("MemMap");
    QCoreApplication::setOrganizationName("MemMap");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Interactive memory map viewer for nested address ranges");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("json_file", "Input JSON file");
    QCommandLineOption dumpOpt("dump", "Write the flattened node payload as JSON and exit");
    QCommandLineOption outOpt({"o", "out"}, "Payload output file (default: stdout)", "file");
    QCommandLineOption themeOpt("theme", "Theme JSON file", "file");
    QCommandLineOption expandOpt("expand-all", "Open with every range expanded");
    parser.addOptions({dumpOpt, outOpt, themeOpt, expandOpt});
    parser.process(*app);

    QTextStream err(stderr);
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        err << "Expected exactly one input file\n";
        return 1;
    }

    mmv::LoadResult loaded = mmv::loadRangeFile(args.first());
    if (!loaded.ok) {
        err << "Load failed: " << loaded.error << "\n";
        return 1;
    }

    const QStringList errs = mmv::validate(loaded.root);
    if (!errs.isEmpty()) {
        qWarning() << "main: Validation failed with" << errs.size() << "violation(s)";
        err << "Validation failed:\n- " << errs.join("\n- ") << "\n";
        return 2;
    }

    const QVector<mmv::FlatNode> flat = mmv::flatten(loaded.root);

    if (parser.isSet(dumpOpt)) {
        const QByteArray json = QJsonDocument(mmv::payloadToJson(loaded.root, flat))
                                    .toJson(QJsonDocument::Indented);
        if (parser.isSet(outOpt)) {
            QFile out(parser.value(outOpt));
            if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
                err << "Cannot write " << out.fileName() << ": " << out.errorString() << "\n";
                return 1;
            }
            out.write(json);
            QTextStream(stdout) << "Wrote: " << out.fileName() << "\n";
        } else {
            QTextStream(stdout) << json;
        }
        return 0;
    }

    const mmv::FlatTree tree = mmv::FlatTree::build(flat);
    QSettings settings("MemMap", "MemMap");
    const mmv::LayoutConfig cfg = mmv::loadLayoutConfig(settings);

    mmv::MainWindow window(&tree, cfg);
    if (parser.isSet(themeOpt)) {
        QFile tf(parser.value(themeOpt));
        if (tf.open(QIODevice::ReadOnly)) {
            window.mapView()->applyTheme(
                mmv::Theme::fromJson(QJsonDocument::fromJson(tf.readAll()).object()));
        } else {
            qWarning() << "main: Cannot open theme" << tf.fileName() << "-" << tf.errorString();
        }
    }
    window.show();

    // The viewport has its real height once the window is laid out
    const bool expandAll = parser.isSet(expandOpt);
    QTimer::singleShot(0, &window, [&window, expandAll]() {
        window.startSession();
        if (expandAll) window.controller()->expandAll();
    });

    return app->exec();
}
