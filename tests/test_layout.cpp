#include <QtTest/QTest>
#include "layoutmodel.h"

using namespace mmv;

static RangeNode range(const QString& name, uint64_t start, uint64_t size,
                       std::vector<RangeNode> kids = {}) {
    RangeNode n;
    n.name = name;
    n.start = start;
    n.size = size;
    n.children = std::move(kids);
    n.sortChildren();
    return n;
}

static const QString kRoot  = "SoC@0x0";
static const QString kFlash = "SoC@0x0/Flash@0x0";
static const QString kBoot  = "SoC@0x0/Flash@0x0/Boot@0x0";
static const QString kApp   = "SoC@0x0/Flash@0x0/App@0x8000";
static const QString kSram  = "SoC@0x0/SRAM@0x80000";

class TestLayout : public QObject {
    Q_OBJECT
private:
    FlatTree m_tree;

private slots:
    void initTestCase() {
        RangeNode soc = range("SoC", 0x0, 0x10000000, {
            range("Flash", 0x0, 0x40000, {
                range("Boot", 0x0, 0x8000),
                range("App", 0x8000, 0x30000, { range("AppHeader", 0x8000, 0x100) }),
            }),
            range("SRAM", 0x80000, 0x40000),
        });
        QVERIFY(validate(soc).isEmpty());
        m_tree = FlatTree::build(flatten(soc));
    }

    void testRenderTop() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        const Level& top = m.topLevel();
        QCOMPARE(top.items.size(), 4);
        QCOMPARE(m.heightAt(top, 0), 140);
        QCOMPARE(m.heightAt(top, 1), 52);
        QCOMPARE(m.heightAt(top, 2), 140);
        QCOMPARE(m.heightAt(top, 3), 52);
        QCOMPARE(m.totalHeight(), 384);
        QCOMPARE(m.blockCount(), 2);
        QCOMPARE(m.levelCount(), 1);
        QCOMPARE(m.baseHeight(kFlash), 140);
        QVERIFY(m.block(kFlash)->drillable);
        QVERIFY(!m.block(kSram)->drillable);
    }

    void testToggle_ignoresGapsAndLeaves() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        QVERIFY(!m.toggle(m.topLevel().items[1].id));
        QVERIFY(!m.toggle(kSram));
        QVERIFY(!m.toggle("nope"));
        QCOMPARE(m.levelCount(), 1);
    }

    void testExpand_compactThenRelayout() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        QVERIFY(m.toggle(kFlash));
        QVERIFY(m.isExpanded(kFlash));

        const Level* lv = m.level(kFlash);
        QVERIFY(lv);
        QCOMPARE(lv->depth, 1);
        QCOMPARE(lv->items.size(), 3);
        QCOMPARE(lv->items[0].id, kBoot);
        QCOMPARE(lv->items[1].id, kApp);
        QVERIFY(lv->items[2].isGap);
        QCOMPARE(lv->items[2].start, (uint64_t)0x38000);
        for (int i = 0; i < 3; i++)
            QCOMPARE(m.heightAt(*lv, i), 44);

        // Growth waits for relayout
        QCOMPARE(m.block(kFlash)->height, 140);
        QCOMPARE(m.requiredHeight(kFlash), 152);

        RelayoutStats s = m.relayout();
        QVERIFY(s.converged);
        QCOMPARE(s.passes, 2);
        QCOMPARE(s.changed, 1);
        QCOMPARE(m.block(kFlash)->height, 152);
        QCOMPARE(m.totalHeight(), 396);
    }

    void testCollapse_restoresBase() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        m.toggle(kFlash);
        m.relayout();
        QVERIFY(m.toggle(kFlash));
        QVERIFY(!m.isExpanded(kFlash));
        QCOMPARE(m.block(kFlash)->height, 140);
        QVERIFY(!m.level(kFlash));
        QVERIFY(!m.block(kBoot));
        QCOMPARE(m.blockCount(), 2);
        QCOMPARE(m.totalHeight(), 384);
    }

    void testBaseHeightSurvivesCollapse() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        m.toggle(kFlash);
        m.toggle(kApp);
        m.relayout();
        QCOMPARE(m.block(kApp)->height, 108);
        m.toggle(kFlash);
        m.toggle(kFlash);
        QCOMPARE(m.baseHeight(kApp), 44);
        QCOMPARE(m.block(kApp)->height, 44);
        QVERIFY(!m.isExpanded(kApp));
    }

    void testRenderTop_clearsBaseCache() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        QCOMPARE(m.baseHeight(kFlash), 140);
        m.renderTop(200);
        QCOMPARE(m.baseHeight(kFlash), 108);
        QCOMPARE(m.block(kFlash)->height, 108);
        QCOMPARE(m.totalHeight(), 320);
    }

    void testExpandAll_fixedPoint() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        m.expandAll();
        QCOMPARE(m.expandedBlocks(), (QVector<QString>{kApp, kFlash}));
        QCOMPARE(m.visibleLevels(), (QVector<QString>{kRoot, kFlash, kApp}));

        RelayoutStats s = m.relayout();
        QVERIFY(s.converged);
        QCOMPARE(m.block(kApp)->height, 108);
        QCOMPARE(m.block(kFlash)->height, 216);
        QCOMPARE(m.totalHeight(), 460);

        // Parent contains its padded children at every level
        for (const QString& id : m.expandedBlocks())
            QVERIFY(m.block(id)->height >= m.contentHeight(*m.level(id)) + m.config().innerPadY());
    }

    void testRelayout_passCeiling() {
        LayoutConfig cfg;
        cfg.relayoutPasses = 1;
        LayoutModel m(&m_tree, cfg);
        m.renderTop(900);
        m.expandAll();
        RelayoutStats s = m.relayout();
        QVERIFY(!s.converged);
        QCOMPARE(s.passes, 1);
        QCOMPARE(m.block(kFlash)->height, 216);
    }

    void testRelayout_nothingExpanded() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        RelayoutStats s = m.relayout();
        QVERIFY(s.converged);
        QCOMPARE(s.passes, 1);
        QCOMPARE(s.changed, 0);
    }

    void testExpandRecursively_rebuildsOpenBlock() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        m.toggle(kFlash);
        m.relayout();
        m.expandRecursively(kFlash);
        QVERIFY(m.isExpanded(kFlash));
        QVERIFY(m.isExpanded(kApp));
        m.relayout();
        QCOMPARE(m.block(kFlash)->height, 216);
    }

    void testCollapseAll() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        m.expandAll();
        m.relayout();
        m.collapseAll();
        QCOMPARE(m.levelCount(), 1);
        QVERIFY(!m.isExpanded(kFlash));
        QVERIFY(!m.block(kApp));
        QCOMPARE(m.block(kFlash)->height, 140);
        QCOMPARE(m.totalHeight(), 384);
    }

    void testMarkers() {
        LayoutModel m(&m_tree);
        m.renderTop(900);
        m.toggle(kFlash);
        m.relayout();
        m.refreshMarkers();

        const QVector<BoundaryMarker>& top = m.topLevel().markers;
        QCOMPARE(top.size(), 5);
        const double topY[] = {0, 152, 204, 344, 396};
        for (int i = 0; i < 5; i++)
            QCOMPARE(top[i].y, topY[i]);
        QCOMPARE(top[4].address, (uint64_t)0x10000000);

        const QVector<BoundaryMarker>& inner = m.level(kFlash)->markers;
        QCOMPARE(inner.size(), 4);
        const uint64_t addr[] = {0x0, 0x8000, 0x38000, 0x40000};
        for (int i = 0; i < 4; i++) {
            QCOMPARE(inner[i].y, 44.0 * i);
            QCOMPARE(inner[i].address, addr[i]);
        }
        QCOMPARE(inner[2].bgIndex, 1);
    }

    void testEmptyTree() {
        FlatTree empty;
        LayoutModel m(&empty);
        m.renderTop(900);
        QVERIFY(m.rootId().isEmpty());
        QCOMPARE(m.totalHeight(), 0);
        QVERIFY(m.visibleLevels().isEmpty());
        QVERIFY(m.relayout().converged);
    }
};

QTEST_MAIN(TestLayout)
#include "test_layout.moc"
