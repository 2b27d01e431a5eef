#pragma once

#include <QDate>
#include <QDateTime>

#include <optional>
#include <vector>

#include "salon/core/OperatingHours.hpp"

namespace salon {
namespace core {

struct TimeSlot
{
    QDateTime start;
    QDateTime end;

    bool operator==(const TimeSlot &other) const { return start == other.start && end == other.end; }
    bool operator!=(const TimeSlot &other) const { return !(*this == other); }
};

class SlotGrid
{
public:
    // Base slots of one granularity each inside [open, close) of the date's
    // weekday, in the business time zone. A trailing remainder shorter than the
    // granularity is dropped; a closed day yields no slots.
    static std::vector<TimeSlot> generate(const QDate &date, const OperatingHours &hours);

    // The span [grid[index].start, +durationMinutes) if a contiguous run of grid
    // slots starting at index covers it.
    static std::optional<TimeSlot> spanAt(const std::vector<TimeSlot> &grid, std::size_t index, int durationMinutes);

    static std::optional<std::size_t> indexOf(const std::vector<TimeSlot> &grid, const QDateTime &start);
};

} // namespace core
} // namespace salon
