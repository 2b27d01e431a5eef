#include <QtTest/QtTest>

#include <QSemaphore>
#include <QThread>

#include <memory>
#include <vector>

#include "salon/core/SessionContextManager.hpp"
#include "salon/data/InMemoryBookingLedger.hpp"
#include "salon/data/InMemoryServiceCatalog.hpp"

using namespace salon;

namespace {

const QString kAna = QStringLiteral("+351910000001");

core::OperatingHours lisbonHours()
{
    core::OperatingHours hours = core::OperatingHours::standard();
    hours.timeZone = QTimeZone(QByteArrayLiteral("Europe/Lisbon"));
    return hours;
}

QDateTime utc(int year, int month, int day, int hour, int minute)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

} // namespace

class SessionContextManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void firstContactCreatesClientAndSession();
    void sameDayReturnsSameContext();
    void nextDaySupersedesContext();
    void dayFollowsBusinessTimeZone();
    void summaryIsAppended();
    void assembleMergesProfileCatalogAndPreviousSummary();
    void concurrentFirstContactsShareOneSession();
    void updateProfileRequiresKnownClient();
};

void SessionContextManagerTest::firstContactCreatesClientAndSession()
{
    data::InMemoryBookingLedger ledger;
    data::InMemoryServiceCatalog catalog(data::defaultServices());
    const auto hours = lisbonHours();
    core::SessionContextManager manager(ledger, catalog, hours);

    const auto now = utc(2030, 1, 7, 10, 0);
    const auto context = manager.resolve(kAna, now);
    QVERIFY(context.ok());
    QCOMPARE(context->client.phone, kAna);
    QVERIFY(!context->client.hasName());
    QCOMPARE(context->client.createdAt, now);
    QCOMPARE(context->day, QDate(2030, 1, 7));
    QCOMPARE(context->token, QStringLiteral("+351910000001_20300107"));
    QVERIFY(context->summary.isEmpty());

    QVERIFY(ledger.findClient(kAna).ok());
}

void SessionContextManagerTest::sameDayReturnsSameContext()
{
    data::InMemoryBookingLedger ledger;
    data::InMemoryServiceCatalog catalog;
    const auto hours = lisbonHours();
    core::SessionContextManager manager(ledger, catalog, hours);

    const auto morning = manager.resolve(kAna, utc(2030, 1, 7, 9, 0));
    const auto evening = manager.resolve(kAna, utc(2030, 1, 7, 20, 30));
    QVERIFY(morning.ok());
    QVERIFY(evening.ok());
    QCOMPARE(evening->token, morning->token);
    QCOMPARE(evening->createdAt, morning->createdAt);
    QCOMPARE(evening->lastSeen, utc(2030, 1, 7, 20, 30));
    QCOMPARE(ledger.fetchSessions(kAna)->size(), static_cast<size_t>(1));
}

void SessionContextManagerTest::nextDaySupersedesContext()
{
    data::InMemoryBookingLedger ledger;
    data::InMemoryServiceCatalog catalog;
    const auto hours = lisbonHours();
    core::SessionContextManager manager(ledger, catalog, hours);

    const auto monday = manager.resolve(kAna, utc(2030, 1, 7, 9, 0));
    const auto tuesday = manager.resolve(kAna, utc(2030, 1, 8, 9, 0));
    QVERIFY(monday.ok());
    QVERIFY(tuesday.ok());
    QVERIFY(monday->token != tuesday->token);

    const auto history = manager.history(kAna);
    QVERIFY(history.ok());
    QCOMPARE(history->size(), static_cast<size_t>(2));
    QCOMPARE(history->front().token, tuesday->token);
    QCOMPARE(history->back().token, monday->token);
}

void SessionContextManagerTest::dayFollowsBusinessTimeZone()
{
    data::InMemoryBookingLedger ledger;
    data::InMemoryServiceCatalog catalog;
    auto hours = lisbonHours();
    hours.timeZone = QTimeZone(QByteArrayLiteral("Asia/Tokyo"));
    core::SessionContextManager manager(ledger, catalog, hours);

    // 23:30 UTC is already the next morning in Tokyo.
    const auto late = manager.resolve(kAna, utc(2030, 1, 7, 23, 30));
    const auto early = manager.resolve(kAna, utc(2030, 1, 8, 1, 0));
    QVERIFY(late.ok());
    QCOMPARE(late->day, QDate(2030, 1, 8));
    QCOMPARE(early->token, late->token);
}

void SessionContextManagerTest::summaryIsAppended()
{
    data::InMemoryBookingLedger ledger;
    data::InMemoryServiceCatalog catalog;
    const auto hours = lisbonHours();
    core::SessionContextManager manager(ledger, catalog, hours);

    const auto context = manager.resolve(kAna, utc(2030, 1, 7, 9, 0));
    QVERIFY(context.ok());
    QVERIFY(manager.appendSummary(context.value(), QStringLiteral("asked for gel")).ok());
    const auto updated = manager.appendSummary(context.value(), QStringLiteral("offered 10:00"));
    QVERIFY(updated.ok());
    QCOMPARE(updated->summary, QStringLiteral("asked for gel\noffered 10:00"));

    const auto again = manager.resolve(kAna, utc(2030, 1, 7, 11, 0));
    QCOMPARE(again->summary, updated->summary);

    core::SessionContext unknown;
    unknown.token = QStringLiteral("nobody_20300107");
    QCOMPARE(manager.appendSummary(unknown, QStringLiteral("x")).error(), core::BookingError::NotFound);
}

void SessionContextManagerTest::assembleMergesProfileCatalogAndPreviousSummary()
{
    data::InMemoryBookingLedger ledger;
    data::InMemoryServiceCatalog catalog(data::defaultServices());
    const auto hours = lisbonHours();
    core::SessionContextManager manager(ledger, catalog, hours, QStringLiteral("Elegant Nails Spa"));

    const auto monday = manager.resolve(kAna, utc(2030, 1, 7, 9, 0));
    QVERIFY(manager.appendSummary(monday.value(), QStringLiteral("booked gel manicure")).ok());

    data::Client profile = monday->client;
    profile.name = QStringLiteral("Ana");
    QVERIFY(manager.updateProfile(profile).ok());

    const auto tuesday = manager.resolve(kAna, utc(2030, 1, 8, 9, 0));
    const auto context = manager.assemble(tuesday.value(), utc(2030, 1, 8, 9, 0));
    QVERIFY(context.ok());
    QCOMPARE(context->session.client.name, QStringLiteral("Ana"));
    QCOMPARE(context->services.size(), data::defaultServices().size());
    QCOMPARE(context->previousSummary, QStringLiteral("booked gel manicure"));
    QCOMPARE(context->salonName, QStringLiteral("Elegant Nails Spa"));
    QCOMPARE(context->openingHours, QStringLiteral("Mon-Sat 09:00-19:00, Sun 11:00-17:00"));
}

void SessionContextManagerTest::concurrentFirstContactsShareOneSession()
{
    data::InMemoryBookingLedger ledger;
    data::InMemoryServiceCatalog catalog;
    const auto hours = lisbonHours();
    core::SessionContextManager manager(ledger, catalog, hours);

    constexpr int kWorkers = 6;
    QSemaphore gate;
    std::vector<QString> tokens(kWorkers);
    std::vector<std::unique_ptr<QThread>> workers;
    for (int i = 0; i < kWorkers; ++i) {
        workers.emplace_back(QThread::create([&manager, &gate, &tokens, i] {
            gate.acquire();
            const auto context = manager.resolve(kAna, utc(2030, 1, 7, 9, i));
            if (context.ok()) {
                tokens[static_cast<size_t>(i)] = context->token;
            }
        }));
        workers.back()->start();
    }
    gate.release(kWorkers);
    for (auto &worker : workers) {
        QVERIFY(worker->wait(10000));
    }

    for (const auto &token : tokens) {
        QCOMPARE(token, QStringLiteral("+351910000001_20300107"));
    }
    QCOMPARE(ledger.fetchSessions(kAna)->size(), static_cast<size_t>(1));
}

void SessionContextManagerTest::updateProfileRequiresKnownClient()
{
    data::InMemoryBookingLedger ledger;
    data::InMemoryServiceCatalog catalog;
    const auto hours = lisbonHours();
    core::SessionContextManager manager(ledger, catalog, hours);

    data::Client stranger;
    stranger.phone = QStringLiteral("+351910009999");
    stranger.name = QStringLiteral("Nobody");
    QCOMPARE(manager.updateProfile(stranger).error(), core::BookingError::UnknownClient);
}

QTEST_GUILESS_MAIN(SessionContextManagerTest)
#include "SessionContextManagerTest.moc"
