#include <QtTest/QtTest>

#include <algorithm>

#include "salon/core/AvailabilityEngine.hpp"
#include "salon/data/InMemoryServiceCatalog.hpp"

using namespace salon;

namespace {

const QDate kMonday(2030, 1, 7);
constexpr data::ServiceId kManicure = 1;
constexpr data::ServiceId kNailArt = 2;

core::OperatingHours weekdayHours()
{
    core::OperatingHours hours;
    hours.timeZone = QTimeZone::utc();
    for (int day = Qt::Monday; day <= Qt::Saturday; ++day) {
        hours.setHours(day, QTime(9, 0), QTime(19, 0));
    }
    return hours;
}

data::InMemoryServiceCatalog makeCatalog()
{
    data::Service manicure;
    manicure.id = kManicure;
    manicure.name = QStringLiteral("Basic Manicure");
    manicure.durationMinutes = 30;
    manicure.priceMinor = 2300;

    data::Service nailArt;
    nailArt.id = kNailArt;
    nailArt.name = QStringLiteral("Nail Art");
    nailArt.durationMinutes = 90;
    nailArt.priceMinor = 4600;

    data::Service retired;
    retired.id = 3;
    retired.name = QStringLiteral("Paraffin");
    retired.durationMinutes = 30;
    retired.active = false;

    return data::InMemoryServiceCatalog({manicure, nailArt, retired});
}

QDateTime at(int hour, int minute)
{
    return QDateTime(kMonday, QTime(hour, minute), QTimeZone::utc());
}

data::Appointment booked(int hour, int minute, int minutes,
                         data::AppointmentStatus status = data::AppointmentStatus::Confirmed)
{
    data::Appointment appointment;
    appointment.clientPhone = QStringLiteral("+351910000000");
    appointment.serviceId = kManicure;
    appointment.start = at(hour, minute);
    appointment.end = appointment.start.addSecs(minutes * 60);
    appointment.status = status;
    return appointment;
}

} // namespace

class AvailabilityEngineTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyLedgerOffersEarliestSlots();
    void skipsOverlappingStarts();
    void cancelledAppointmentsDoNotBlock();
    void longServiceMustFitBeforeClosing();
    void noAvailabilityIsEmptyNotError();
    void unknownOrInactiveService();
    void notBeforeDropsPastSlots();
    void respectsMaxResults();
};

void AvailabilityEngineTest::emptyLedgerOffersEarliestSlots()
{
    const auto catalog = makeCatalog();
    const auto hours = weekdayHours();
    core::AvailabilityEngine engine(catalog, hours);

    const auto slots = engine.findAvailable(kMonday, kManicure, {}, 10);
    QVERIFY(slots.ok());
    QCOMPARE(slots->size(), static_cast<size_t>(10));
    QCOMPARE(slots->front().start, at(9, 0));
    QCOMPARE(slots->front().end, at(9, 30));
    QCOMPARE(slots->at(1).start, at(9, 15));
    QCOMPARE(slots->back().start, at(11, 15));
}

void AvailabilityEngineTest::skipsOverlappingStarts()
{
    const auto catalog = makeCatalog();
    const auto hours = weekdayHours();
    core::AvailabilityEngine engine(catalog, hours);

    const auto slots = engine.findAvailable(kMonday, kManicure, {booked(9, 0, 30)}, 10);
    QVERIFY(slots.ok());
    QCOMPARE(slots->front().start, at(9, 30));
    for (const auto &slot : slots.value()) {
        QVERIFY(slot.start >= at(9, 30));
    }

    // A hold in the middle of the morning blocks both neighbours.
    const auto around = engine.findAvailable(kMonday, kManicure,
                                             {booked(10, 0, 30, data::AppointmentStatus::Pending)}, 40);
    QVERIFY(around.ok());
    for (const auto &slot : around.value()) {
        QVERIFY(slot.start != at(9, 45));
        QVERIFY(slot.start != at(10, 0));
        QVERIFY(slot.start != at(10, 15));
    }
    QVERIFY(std::find(around->begin(), around->end(), core::TimeSlot{at(9, 30), at(10, 0)}) != around->end());
    QVERIFY(std::find(around->begin(), around->end(), core::TimeSlot{at(10, 30), at(11, 0)}) != around->end());
}

void AvailabilityEngineTest::cancelledAppointmentsDoNotBlock()
{
    const auto catalog = makeCatalog();
    const auto hours = weekdayHours();
    core::AvailabilityEngine engine(catalog, hours);

    const auto slots =
        engine.findAvailable(kMonday, kManicure, {booked(9, 0, 30, data::AppointmentStatus::Cancelled)}, 1);
    QVERIFY(slots.ok());
    QCOMPARE(slots->size(), static_cast<size_t>(1));
    QCOMPARE(slots->front().start, at(9, 0));
}

void AvailabilityEngineTest::longServiceMustFitBeforeClosing()
{
    const auto catalog = makeCatalog();
    const auto hours = weekdayHours();
    core::AvailabilityEngine engine(catalog, hours);

    const auto slots = engine.findAvailable(kMonday, kNailArt, {}, 100);
    QVERIFY(slots.ok());
    QCOMPARE(slots->back().start, at(17, 30));
    QCOMPARE(slots->back().end, at(19, 0));
    // 40 base slots, the last five starts cannot hold 90 minutes.
    QCOMPARE(slots->size(), static_cast<size_t>(35));
}

void AvailabilityEngineTest::noAvailabilityIsEmptyNotError()
{
    const auto catalog = makeCatalog();
    const auto hours = weekdayHours();
    core::AvailabilityEngine engine(catalog, hours);

    const auto closed = engine.findAvailable(kMonday.addDays(-1), kManicure, {}, 10);
    QVERIFY(closed.ok());
    QVERIFY(closed->empty());

    data::Appointment allDay = booked(9, 0, 600);
    const auto full = engine.findAvailable(kMonday, kManicure, {allDay}, 10);
    QVERIFY(full.ok());
    QVERIFY(full->empty());
}

void AvailabilityEngineTest::unknownOrInactiveService()
{
    const auto catalog = makeCatalog();
    const auto hours = weekdayHours();
    core::AvailabilityEngine engine(catalog, hours);

    const auto unknown = engine.findAvailable(kMonday, 42, {}, 10);
    QVERIFY(!unknown.ok());
    QCOMPARE(unknown.error(), core::BookingError::UnknownService);

    const auto inactive = engine.findAvailable(kMonday, 3, {}, 10);
    QVERIFY(!inactive.ok());
    QCOMPARE(inactive.error(), core::BookingError::UnknownService);
}

void AvailabilityEngineTest::notBeforeDropsPastSlots()
{
    const auto catalog = makeCatalog();
    const auto hours = weekdayHours();
    core::AvailabilityEngine engine(catalog, hours);

    const auto slots = engine.findAvailable(kMonday, kManicure, {}, 3, at(12, 5));
    QVERIFY(slots.ok());
    QCOMPARE(slots->size(), static_cast<size_t>(3));
    QCOMPARE(slots->front().start, at(12, 15));
}

void AvailabilityEngineTest::respectsMaxResults()
{
    const auto catalog = makeCatalog();
    const auto hours = weekdayHours();
    core::AvailabilityEngine engine(catalog, hours);

    QCOMPARE(engine.findAvailable(kMonday, kManicure, {}, 2)->size(), static_cast<size_t>(2));
    QCOMPARE(engine.findAvailable(kMonday, kManicure, {}, 0)->size(), static_cast<size_t>(0));
    QCOMPARE(engine.findAvailable(kMonday, kManicure, {}, 1000)->size(), static_cast<size_t>(39));
}

QTEST_GUILESS_MAIN(AvailabilityEngineTest)
#include "AvailabilityEngineTest.moc"
