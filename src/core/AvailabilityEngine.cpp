#include "salon/core/AvailabilityEngine.hpp"

#include "salon/core/Logging.hpp"
#include "salon/data/ServiceCatalog.hpp"

namespace salon {
namespace core {

AvailabilityEngine::AvailabilityEngine(const data::ServiceCatalog &catalog, const OperatingHours &hours)
    : m_catalog(catalog)
    , m_hours(hours)
{
}

Result<std::vector<TimeSlot>> AvailabilityEngine::findAvailable(const QDate &date,
                                                                data::ServiceId serviceId,
                                                                const std::vector<data::Appointment> &existingAppointments,
                                                                int maxResults,
                                                                const QDateTime &notBefore) const
{
    const auto service = m_catalog.findById(serviceId);
    if (!service) {
        return BookingError::UnknownService;
    }

    std::vector<const data::Appointment *> blocking;
    for (const auto &appointment : existingAppointments) {
        if (appointment.isActive()) {
            blocking.push_back(&appointment);
        }
    }

    std::vector<TimeSlot> available;
    const auto grid = SlotGrid::generate(date, m_hours);
    for (std::size_t i = 0; i < grid.size() && static_cast<int>(available.size()) < maxResults; ++i) {
        if (notBefore.isValid() && grid[i].start < notBefore) {
            continue;
        }
        const auto span = SlotGrid::spanAt(grid, i, service->durationMinutes);
        if (!span) {
            continue;
        }
        bool free = true;
        for (const auto *appointment : blocking) {
            if (appointment->overlaps(span->start, span->end)) {
                free = false;
                break;
            }
        }
        if (free) {
            available.push_back(*span);
        }
    }

    qCDebug(lcBooking) << "availability" << date << "service" << serviceId << "->" << available.size() << "slots";
    return available;
}

} // namespace core
} // namespace salon
