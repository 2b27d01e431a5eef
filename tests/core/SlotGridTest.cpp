#include <QtTest/QtTest>

#include "salon/core/SlotGrid.hpp"

using namespace salon;

namespace {

core::OperatingHours weekdayHours(int granularity = 15)
{
    core::OperatingHours hours;
    hours.timeZone = QTimeZone::utc();
    hours.granularityMinutes = granularity;
    for (int day = Qt::Monday; day <= Qt::Saturday; ++day) {
        hours.setHours(day, QTime(9, 0), QTime(19, 0));
    }
    return hours;
}

QDateTime at(const QDate &date, int hour, int minute)
{
    return QDateTime(date, QTime(hour, minute), QTimeZone::utc());
}

const QDate kMonday(2030, 1, 7);
const QDate kSunday(2030, 1, 6);

} // namespace

class SlotGridTest : public QObject
{
    Q_OBJECT

private slots:
    void coversOpeningHours();
    void closedDayIsEmpty();
    void dropsTrailingRemainder();
    void spanNeedsContiguousSlots();
    void indexOfAlignedStartsOnly();
};

void SlotGridTest::coversOpeningHours()
{
    const auto grid = core::SlotGrid::generate(kMonday, weekdayHours());
    QCOMPARE(grid.size(), static_cast<size_t>(40));
    QCOMPARE(grid.front().start, at(kMonday, 9, 0));
    QCOMPARE(grid.front().end, at(kMonday, 9, 15));
    QCOMPARE(grid.back().start, at(kMonday, 18, 45));
    QCOMPARE(grid.back().end, at(kMonday, 19, 0));
    for (size_t i = 1; i < grid.size(); ++i) {
        QCOMPARE(grid[i].start, grid[i - 1].end);
    }
}

void SlotGridTest::closedDayIsEmpty()
{
    QVERIFY(core::SlotGrid::generate(kSunday, weekdayHours()).empty());
    QVERIFY(core::SlotGrid::generate(QDate(), weekdayHours()).empty());
}

void SlotGridTest::dropsTrailingRemainder()
{
    auto hours = weekdayHours(25);
    hours.setHours(Qt::Monday, QTime(9, 0), QTime(10, 0));
    const auto grid = core::SlotGrid::generate(kMonday, hours);
    QCOMPARE(grid.size(), static_cast<size_t>(2));
    QCOMPARE(grid.back().end, at(kMonday, 9, 50));
}

void SlotGridTest::spanNeedsContiguousSlots()
{
    const auto grid = core::SlotGrid::generate(kMonday, weekdayHours());

    const auto first = core::SlotGrid::spanAt(grid, 0, 45);
    QVERIFY(first.has_value());
    QCOMPARE(first->end, at(kMonday, 9, 45));

    // 18:30 + 45 min runs past closing.
    const auto late = core::SlotGrid::spanAt(grid, grid.size() - 2, 45);
    QVERIFY(!late.has_value());
    QVERIFY(core::SlotGrid::spanAt(grid, grid.size() - 3, 45).has_value());

    std::vector<core::TimeSlot> gapped = {
        {at(kMonday, 9, 0), at(kMonday, 9, 15)},
        {at(kMonday, 9, 30), at(kMonday, 9, 45)},
    };
    QVERIFY(!core::SlotGrid::spanAt(gapped, 0, 30).has_value());
}

void SlotGridTest::indexOfAlignedStartsOnly()
{
    const auto grid = core::SlotGrid::generate(kMonday, weekdayHours());
    QCOMPARE(core::SlotGrid::indexOf(grid, at(kMonday, 9, 30)).value(), static_cast<size_t>(2));
    QVERIFY(!core::SlotGrid::indexOf(grid, at(kMonday, 9, 20)).has_value());
    QVERIFY(!core::SlotGrid::indexOf(grid, at(kMonday, 8, 45)).has_value());
    QVERIFY(!core::SlotGrid::indexOf(grid, at(kMonday, 19, 0)).has_value());
}

QTEST_GUILESS_MAIN(SlotGridTest)
#include "SlotGridTest.moc"
