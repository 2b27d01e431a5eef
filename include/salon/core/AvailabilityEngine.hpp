#pragma once

#include <QDate>
#include <QDateTime>

#include <vector>

#include "salon/core/OperatingHours.hpp"
#include "salon/core/Result.hpp"
#include "salon/core/SlotGrid.hpp"
#include "salon/data/Appointment.hpp"

namespace salon {
namespace data {
class ServiceCatalog;
}

namespace core {

// Advisory, lock-free availability lookup. A slot offered here may still be
// lost to a concurrent commit; the ConflictGuard decides.
class AvailabilityEngine
{
public:
    AvailabilityEngine(const data::ServiceCatalog &catalog, const OperatingHours &hours);

    // Earliest-first starts on the slot grid of date where the whole service
    // fits into contiguous open time and overlaps no Pending or Confirmed
    // appointment. Stops after maxResults hits. Candidates starting before
    // notBefore (when valid) are skipped.
    Result<std::vector<TimeSlot>> findAvailable(const QDate &date,
                                                data::ServiceId serviceId,
                                                const std::vector<data::Appointment> &existingAppointments,
                                                int maxResults = 10,
                                                const QDateTime &notBefore = QDateTime()) const;

private:
    const data::ServiceCatalog &m_catalog;
    const OperatingHours &m_hours;
};

} // namespace core
} // namespace salon
