#include "salon/core/SlotGrid.hpp"

namespace salon {
namespace core {

std::vector<TimeSlot> SlotGrid::generate(const QDate &date, const OperatingHours &hours)
{
    std::vector<TimeSlot> slots;
    if (!date.isValid() || hours.granularityMinutes <= 0) {
        return slots;
    }
    const DayHours &day = hours.hoursFor(date.dayOfWeek());
    if (!day.isOpen()) {
        return slots;
    }

    const qint64 step = static_cast<qint64>(hours.granularityMinutes) * 60;
    const QDateTime close(date, day.close, hours.timeZone);
    QDateTime start(date, day.open, hours.timeZone);
    while (start.addSecs(step) <= close) {
        const QDateTime end = start.addSecs(step);
        slots.push_back(TimeSlot{start, end});
        start = end;
    }
    return slots;
}

std::optional<TimeSlot> SlotGrid::spanAt(const std::vector<TimeSlot> &grid, std::size_t index, int durationMinutes)
{
    if (index >= grid.size() || durationMinutes <= 0) {
        return std::nullopt;
    }
    const QDateTime start = grid[index].start;
    const QDateTime end = start.addSecs(static_cast<qint64>(durationMinutes) * 60);

    std::size_t last = index;
    while (grid[last].end < end) {
        if (last + 1 >= grid.size() || grid[last + 1].start != grid[last].end) {
            return std::nullopt;
        }
        ++last;
    }
    return TimeSlot{start, end};
}

std::optional<std::size_t> SlotGrid::indexOf(const std::vector<TimeSlot> &grid, const QDateTime &start)
{
    for (std::size_t i = 0; i < grid.size(); ++i) {
        if (grid[i].start == start) {
            return i;
        }
        if (grid[i].start > start) {
            break;
        }
    }
    return std::nullopt;
}

} // namespace core
} // namespace salon
