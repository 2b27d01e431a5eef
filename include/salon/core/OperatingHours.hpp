#pragma once

#include <QString>
#include <QTime>
#include <QTimeZone>

#include <array>

namespace salon {
namespace core {

struct DayHours
{
    QTime open;
    QTime close;

    bool isOpen() const { return open.isValid() && close.isValid() && open < close; }
};

struct OperatingHours
{
    OperatingHours();

    // Mon-Sat 09:00-19:00, Sun 11:00-17:00, 15 minute slots.
    static OperatingHours standard();

    const DayHours &hoursFor(int dayOfWeek) const;
    void setHours(int dayOfWeek, const QTime &open, const QTime &close);
    void setClosed(int dayOfWeek);

    // "Mon-Sat 09:00-19:00, Sun 11:00-17:00"
    QString describe() const;

    std::array<DayHours, 7> days; // Qt::Monday at index 0
    int granularityMinutes = 15;
    QTimeZone timeZone;
};

} // namespace core
} // namespace salon
