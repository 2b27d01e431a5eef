#include "salon/core/OperatingHours.hpp"

#include <QLocale>
#include <QStringList>

namespace salon {
namespace core {

namespace {
const DayHours kClosed{};

int indexFor(int dayOfWeek)
{
    if (dayOfWeek < Qt::Monday || dayOfWeek > Qt::Sunday) {
        return -1;
    }
    return dayOfWeek - Qt::Monday;
}

QString rangeText(const DayHours &hours)
{
    if (!hours.isOpen()) {
        return QStringLiteral("closed");
    }
    return QStringLiteral("%1-%2").arg(hours.open.toString(QStringLiteral("HH:mm")),
                                       hours.close.toString(QStringLiteral("HH:mm")));
}
} // namespace

OperatingHours::OperatingHours()
    : timeZone(QTimeZone::systemTimeZone())
{
}

OperatingHours OperatingHours::standard()
{
    OperatingHours hours;
    for (int day = Qt::Monday; day <= Qt::Saturday; ++day) {
        hours.setHours(day, QTime(9, 0), QTime(19, 0));
    }
    hours.setHours(Qt::Sunday, QTime(11, 0), QTime(17, 0));
    const QTimeZone lisbon(QByteArrayLiteral("Europe/Lisbon"));
    if (lisbon.isValid()) {
        hours.timeZone = lisbon;
    }
    return hours;
}

const DayHours &OperatingHours::hoursFor(int dayOfWeek) const
{
    const int index = indexFor(dayOfWeek);
    if (index < 0) {
        return kClosed;
    }
    return days[static_cast<size_t>(index)];
}

void OperatingHours::setHours(int dayOfWeek, const QTime &open, const QTime &close)
{
    const int index = indexFor(dayOfWeek);
    if (index < 0) {
        return;
    }
    days[static_cast<size_t>(index)] = DayHours{open, close};
}

void OperatingHours::setClosed(int dayOfWeek)
{
    setHours(dayOfWeek, QTime(), QTime());
}

QString OperatingHours::describe() const
{
    const QLocale c = QLocale::c();
    QStringList parts;
    int runStart = Qt::Monday;
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        const bool lastOfRun = day == Qt::Sunday || rangeText(hoursFor(day + 1)) != rangeText(hoursFor(day));
        if (!lastOfRun) {
            continue;
        }
        if (hoursFor(day).isOpen()) {
            QString label = c.dayName(runStart, QLocale::ShortFormat);
            if (day != runStart) {
                label += QLatin1Char('-') + c.dayName(day, QLocale::ShortFormat);
            }
            parts << QStringLiteral("%1 %2").arg(label, rangeText(hoursFor(day)));
        }
        runStart = day + 1;
    }
    if (parts.isEmpty()) {
        return QStringLiteral("closed");
    }
    return parts.join(QStringLiteral(", "));
}

} // namespace core
} // namespace salon
