#include <QtTest/QTest>
#include <QRandomGenerator>
#include "core.h"

using namespace mmv;

static DisplayItem block(uint64_t size) {
    DisplayItem d;
    d.name = QStringLiteral("b");
    d.size = size;
    return d;
}

static DisplayItem gap(uint64_t size) {
    DisplayItem d;
    d.name = QString::fromLatin1(kGapName);
    d.size = size;
    d.isGap = true;
    return d;
}

static int sum(const QVector<int>& v) {
    int t = 0;
    for (int h : v) t += h;
    return t;
}

class TestAllocator : public QObject {
    Q_OBJECT
private slots:
    void testFit_equalSizesShareLeftover() {
        QVector<DisplayItem> items{block(1), block(1), block(1)};
        HeightResult r = computeHeightsToFit(items, 10, 140, 100, 20);
        QCOMPARE(r.heights, (QVector<int>{34, 33, 33}));
        QCOMPARE(r.total, 100);
    }

    void testFit_gapsTakeFixedExtent() {
        QVector<DisplayItem> items{block(100), gap(1000000), block(100)};
        HeightResult r = computeHeightsToFit(items, 52, 140, 300, 52);
        QCOMPARE(r.heights, (QVector<int>{124, 52, 124}));
        QCOMPARE(r.total, 300);
    }

    void testFit_clampedAtMax() {
        QVector<DisplayItem> items{block(1000000), block(1)};
        HeightResult r = computeHeightsToFit(items, 52, 140, 200, 52);
        QCOMPARE(r.heights, (QVector<int>{140, 60}));
        QCOMPARE(r.total, 200);
    }

    void testFit_shrinksOnlyAboveMin() {
        QVector<DisplayItem> items{block(1000), block(1), block(1)};
        HeightResult r = computeHeightsToFit(items, 52, 140, 200, 52);
        QCOMPARE(r.heights, (QVector<int>{96, 52, 52}));
        QCOMPARE(r.total, 200);
    }

    void testFit_budgetUnreachable() {
        // Everything pinned at max: the total stays short of the budget
        QVector<DisplayItem> items{block(1), block(1)};
        HeightResult r = computeHeightsToFit(items, 52, 140, 900, 52);
        QCOMPARE(r.heights, (QVector<int>{140, 140}));
        QCOMPARE(r.total, 280);

        // Everything pinned at min: the total overshoots
        r = computeHeightsToFit(items, 52, 140, 50, 52);
        QCOMPARE(r.heights, (QVector<int>{52, 52}));
        QCOMPARE(r.total, 104);
    }

    void testFit_zeroSizesCountAsOne() {
        QVector<DisplayItem> items{block(0), block(0)};
        HeightResult r = computeHeightsToFit(items, 10, 100, 100, 20);
        QCOMPARE(r.heights, (QVector<int>{50, 50}));
    }

    void testFit_empty() {
        HeightResult r = computeHeightsToFit({}, 52, 140, 500, 52);
        QVERIFY(r.heights.isEmpty());
        QCOMPARE(r.total, 0);
    }

    void testFit_randomizedBounds() {
        QRandomGenerator rng(0x5eed);
        for (int round = 0; round < 200; round++) {
            QVector<DisplayItem> items;
            int blocks = 0;
            int gaps = 0;
            const int n = 1 + (int)rng.bounded(12);
            for (int i = 0; i < n; i++) {
                if (rng.bounded(3) == 0) {
                    items.append(gap(rng.bounded(1u << 20)));
                    gaps++;
                } else {
                    items.append(block(rng.bounded(1u << 30)));
                    blocks++;
                }
            }
            const int minE = 20 + (int)rng.bounded(40);
            const int maxE = minE + (int)rng.bounded(200);
            const int gapE = 10 + (int)rng.bounded(60);
            const int budget = (int)rng.bounded(3000);

            HeightResult r = computeHeightsToFit(items, minE, maxE, budget, gapE);
            QCOMPARE(r.heights.size(), n);
            QCOMPARE(r.total, sum(r.heights));
            for (int i = 0; i < n; i++) {
                if (items[i].isGap) {
                    QCOMPARE(r.heights[i], gapE);
                } else {
                    QVERIFY(r.heights[i] >= minE);
                    QVERIFY(r.heights[i] <= maxE);
                }
            }
            const int lo = blocks * minE + gaps * gapE;
            const int hi = blocks * maxE + gaps * gapE;
            if (budget >= lo && budget <= hi)
                QCOMPARE(r.total, budget);
        }
    }

    void testCompact() {
        QVector<DisplayItem> items{block(1), gap(5), block(1 << 20)};
        HeightResult r = computeCompactHeights(items, 44, 30);
        QCOMPARE(r.heights, (QVector<int>{44, 30, 44}));
        QCOMPARE(r.total, 118);
    }

    void testTopLevelBudget() {
        LayoutConfig cfg;
        QVector<DisplayItem> items{block(1), gap(1), block(1)};   // 52 * 3 = 156
        QCOMPARE(topLevelBudget(items, cfg, 900), 900);
        QCOMPARE(topLevelBudget(items, cfg, 100), 320);

        QVector<DisplayItem> many;
        for (int i = 0; i < 10; i++) many.append(block(1));
        QCOMPARE(topLevelBudget(many, cfg, 300), 520);
    }
};

QTEST_MAIN(TestAllocator)
#include "test_allocator.moc"
