#include <QtTest/QtTest>
#include "core/pipeline/admission_queue.h"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

class TestAdmissionQueue : public QObject {
    Q_OBJECT

private slots:
    void testFifoOrder();
    void testRejectsWhenFull();
    void testRemoveWaitingJob();
    void testPermitBoundsConcurrentGenerations();
    void testPermitMoveKeepsSingleSlot();
    void testShutdownWakesWaiters();
    void testReopenKeepsWaitingJobs();
};

void TestAdmissionQueue::testFifoOrder()
{
    gf::AdmissionQueue queue(4, 4);
    QVERIFY(queue.tryEnqueue(QStringLiteral("a")));
    QVERIFY(queue.tryEnqueue(QStringLiteral("b")));
    QVERIFY(queue.tryEnqueue(QStringLiteral("c")));

    auto first = queue.acquire();
    auto second = queue.acquire();
    auto third = queue.acquire();
    QVERIFY(first && second && third);
    QCOMPARE(first->jobId, QStringLiteral("a"));
    QCOMPARE(second->jobId, QStringLiteral("b"));
    QCOMPARE(third->jobId, QStringLiteral("c"));
    QCOMPARE(queue.size(), size_t(0));
}

void TestAdmissionQueue::testRejectsWhenFull()
{
    gf::AdmissionQueue queue(2, 1);
    QVERIFY(queue.tryEnqueue(QStringLiteral("a")));
    QVERIFY(queue.tryEnqueue(QStringLiteral("b")));
    QVERIFY(queue.isFull());
    QVERIFY(!queue.tryEnqueue(QStringLiteral("c")));
    QVERIFY(!queue.contains(QStringLiteral("c")));

    const gf::AdmissionStats stats = queue.stats();
    QCOMPARE(stats.depth, size_t(2));
    QCOMPARE(stats.capacity, size_t(2));
    QCOMPARE(stats.rejected, size_t(1));

    // Admission frees a queue slot even while generation is busy.
    auto admitted = queue.acquire();
    QVERIFY(admitted.has_value());
    QVERIFY(queue.tryEnqueue(QStringLiteral("c")));
}

void TestAdmissionQueue::testRemoveWaitingJob()
{
    gf::AdmissionQueue queue(4, 1);
    queue.tryEnqueue(QStringLiteral("a"));
    queue.tryEnqueue(QStringLiteral("b"));

    QVERIFY(queue.remove(QStringLiteral("a")));
    QVERIFY(!queue.remove(QStringLiteral("a")));
    QVERIFY(!queue.contains(QStringLiteral("a")));

    auto admitted = queue.acquire();
    QVERIFY(admitted.has_value());
    QCOMPARE(admitted->jobId, QStringLiteral("b"));
}

void TestAdmissionQueue::testPermitBoundsConcurrentGenerations()
{
    gf::AdmissionQueue queue(8, 1);
    queue.tryEnqueue(QStringLiteral("a"));
    queue.tryEnqueue(QStringLiteral("b"));

    auto first = queue.acquire();
    QVERIFY(first.has_value());
    QCOMPARE(queue.stats().activeGenerations, 1);

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        auto second = queue.acquire();
        acquired = second.has_value() && second->jobId == QLatin1String("b");
    });

    // The only slot is held; the second job must wait.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    QVERIFY(!acquired.load());

    first->permit.release();
    waiter.join();
    QVERIFY(acquired.load());
    QCOMPARE(queue.stats().activeGenerations, 0);
}

void TestAdmissionQueue::testPermitMoveKeepsSingleSlot()
{
    gf::AdmissionQueue queue(4, 2);
    queue.tryEnqueue(QStringLiteral("a"));

    auto admitted = queue.acquire();
    QVERIFY(admitted.has_value());
    gf::AdmissionQueue::GenerationPermit moved = std::move(admitted->permit);
    QVERIFY(moved.isHeld());
    QVERIFY(!admitted->permit.isHeld());
    QCOMPARE(queue.stats().activeGenerations, 1);

    moved.release();
    moved.release();
    QCOMPARE(queue.stats().activeGenerations, 0);

    {
        queue.tryEnqueue(QStringLiteral("b"));
        auto scoped = queue.acquire();
        QCOMPARE(queue.stats().activeGenerations, 1);
    }
    QCOMPARE(queue.stats().activeGenerations, 0);
}

void TestAdmissionQueue::testShutdownWakesWaiters()
{
    gf::AdmissionQueue queue(4, 1);
    auto future = std::async(std::launch::async, [&] { return queue.acquire().has_value(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue.shutdown();
    QVERIFY(future.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    QVERIFY(!future.get());
    QVERIFY(!queue.tryEnqueue(QStringLiteral("late")));
    QVERIFY(queue.stats().isShutdown);
}

void TestAdmissionQueue::testReopenKeepsWaitingJobs()
{
    gf::AdmissionQueue queue(4, 1);
    queue.tryEnqueue(QStringLiteral("kept"));
    queue.shutdown();
    QVERIFY(!queue.acquire().has_value());

    queue.reopen();
    auto admitted = queue.acquire();
    QVERIFY(admitted.has_value());
    QCOMPARE(admitted->jobId, QStringLiteral("kept"));
}

QTEST_MAIN(TestAdmissionQueue)
#include "test_admission_queue.moc"
