#include <QtTest>
#include <cmath>
#include <limits>

#include "utils/rollingstats.h"

class TestRollingStats : public QObject
{
    Q_OBJECT

private slots:
    // ========== Empty window ==========

    void testEmptyWindow()
    {
        RollingStats stats(8);
        QVERIFY(stats.isEmpty());
        QVERIFY(!stats.isFull());
        QCOMPARE(stats.count(), static_cast<size_t>(0));
        QCOMPARE(stats.windowSize(), static_cast<size_t>(8));
        QCOMPARE(stats.mean(), 0.0);
        QCOMPARE(stats.last(), 0.0);
        QVERIFY(std::isinf(stats.min()) && stats.min() > 0);
        QVERIFY(std::isinf(stats.max()) && stats.max() < 0);
    }

    void testDefaultWindowMatchesControllerWindow()
    {
        RollingStats stats;
        QCOMPARE(stats.windowSize(), static_cast<size_t>(20));
    }

    void testZeroWindowActsAsOne()
    {
        RollingStats stats(0);
        QCOMPARE(stats.windowSize(), static_cast<size_t>(1));

        stats.addSample(3.0);
        stats.addSample(7.0);
        QCOMPARE(stats.count(), static_cast<size_t>(1));
        QCOMPARE(stats.mean(), 7.0);
    }

    // ========== Accumulation ==========

    void testLatencySamples()
    {
        RollingStats stats(20);
        stats.addSample(42.0);
        stats.addSample(58.0);

        QCOMPARE(stats.count(), static_cast<size_t>(2));
        QCOMPARE(stats.mean(), 50.0);
        QCOMPARE(stats.min(), 42.0);
        QCOMPARE(stats.max(), 58.0);
        QCOMPARE(stats.last(), 58.0);
    }

    void testLossFractionFromBinarySamples()
    {
        // Loss is tracked as 1.0 per lost sample and 0.0 per success
        RollingStats loss(20);
        for (int i = 0; i < 19; ++i) {
            loss.addSample(0.0);
        }
        loss.addSample(1.0);

        QVERIFY(std::abs(loss.mean() - 0.05) < 1e-9);
    }

    // ========== Eviction ==========

    void testOldestSampleEvicted()
    {
        RollingStats stats(3);
        stats.addSample(10.0);
        stats.addSample(20.0);
        stats.addSample(30.0);
        QVERIFY(stats.isFull());

        stats.addSample(40.0);

        QCOMPARE(stats.count(), static_cast<size_t>(3));
        QCOMPARE(stats.mean(), 30.0);
        QCOMPARE(stats.min(), 20.0);
        QCOMPARE(stats.max(), 40.0);
    }

    void testEvictingExtremeRescans()
    {
        RollingStats stats(3);
        stats.addSample(5.0);    // min
        stats.addSample(500.0);  // max
        stats.addSample(50.0);

        stats.addSample(60.0);   // evicts 5
        QCOMPARE(stats.min(), 50.0);
        QCOMPARE(stats.max(), 500.0);

        stats.addSample(70.0);   // evicts 500
        QCOMPARE(stats.min(), 50.0);
        QCOMPARE(stats.max(), 70.0);
    }

    void testHighLatencySpikeAgesOut()
    {
        RollingStats stats(4);
        stats.addSample(900.0);
        for (int i = 0; i < 4; ++i) {
            stats.addSample(20.0);
        }

        QCOMPARE(stats.mean(), 20.0);
        QCOMPARE(stats.max(), 20.0);
    }

    void testManyWraparounds()
    {
        RollingStats stats(5);
        for (int i = 1; i <= 23; ++i) {
            stats.addSample(static_cast<double>(i));
        }

        // Window holds 19..23
        QCOMPARE(stats.count(), static_cast<size_t>(5));
        QCOMPARE(stats.min(), 19.0);
        QCOMPARE(stats.max(), 23.0);
        QCOMPARE(stats.mean(), 21.0);
        QCOMPARE(stats.last(), 23.0);
    }

    // ========== Clear ==========

    void testClear()
    {
        RollingStats stats(4);
        stats.addSample(1.0);
        stats.addSample(2.0);

        stats.clear();

        QVERIFY(stats.isEmpty());
        QCOMPARE(stats.mean(), 0.0);
        QCOMPARE(stats.last(), 0.0);

        stats.addSample(9.0);
        QCOMPARE(stats.min(), 9.0);
        QCOMPARE(stats.max(), 9.0);
    }

    // ========== SmoothedAverage ==========

    void testSmoothedAverageStartsFromZero()
    {
        SmoothedAverage avg(0.1);
        QCOMPARE(avg.value(), 0.0);

        avg.addSample(1000.0);
        QCOMPARE(avg.value(), 100.0);

        avg.addSample(1000.0);
        QCOMPARE(avg.value(), 190.0);
        QCOMPARE(avg.count(), static_cast<size_t>(2));
    }

    void testSmoothedAverageConverges()
    {
        SmoothedAverage avg(0.1);
        for (int i = 0; i < 200; ++i) {
            avg.addSample(500.0);
        }
        QVERIFY(std::abs(avg.value() - 500.0) < 0.01);
    }

    void testSmoothedAverageAlphaClamped()
    {
        SmoothedAverage full(2.0);
        QCOMPARE(full.alpha(), 1.0);
        full.addSample(42.0);
        QCOMPARE(full.value(), 42.0);

        SmoothedAverage none(-1.0);
        QCOMPARE(none.alpha(), 0.0);
        none.addSample(42.0);
        QCOMPARE(none.value(), 0.0);
    }

    void testSmoothedAverageClear()
    {
        SmoothedAverage avg(0.5);
        avg.addSample(10.0);
        avg.clear();
        QCOMPARE(avg.value(), 0.0);
        QCOMPARE(avg.count(), static_cast<size_t>(0));
    }
};

QTEST_MAIN(TestRollingStats)
#include "test_rollingstats.moc"
