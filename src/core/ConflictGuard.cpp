#include "salon/core/ConflictGuard.hpp"

#include "salon/core/Logging.hpp"
#include "salon/core/SlotGrid.hpp"
#include "salon/data/BookingLedger.hpp"
#include "salon/data/ServiceCatalog.hpp"

#include <QMutexLocker>

#include <chrono>
#include <mutex>

namespace salon {
namespace core {

ConflictGuard::ConflictGuard(data::BookingLedger &ledger,
                             const data::ServiceCatalog &catalog,
                             const OperatingHours &hours,
                             int lockTimeoutMs)
    : m_ledger(ledger)
    , m_catalog(catalog)
    , m_hours(hours)
    , m_lockTimeoutMs(lockTimeoutMs)
{
}

ConflictGuard::~ConflictGuard() = default;

Result<data::Appointment> ConflictGuard::commit(const QString &clientPhone,
                                                data::ServiceId serviceId,
                                                const QDateTime &requestedStart,
                                                const QDateTime &now,
                                                const QString &notes)
{
    return place(clientPhone, serviceId, requestedStart, now, notes, data::AppointmentStatus::Confirmed);
}

Result<data::Appointment> ConflictGuard::hold(const QString &clientPhone,
                                              data::ServiceId serviceId,
                                              const QDateTime &requestedStart,
                                              const QDateTime &now,
                                              const QString &notes)
{
    return place(clientPhone, serviceId, requestedStart, now, notes, data::AppointmentStatus::Pending);
}

Result<data::Appointment> ConflictGuard::confirm(const QUuid &appointmentId)
{
    auto updated = m_ledger.updateStatus(appointmentId, data::AppointmentStatus::Confirmed);
    if (updated) {
        qCInfo(lcBooking) << "confirmed" << appointmentId;
    }
    return updated;
}

Result<data::Appointment> ConflictGuard::cancel(const QUuid &appointmentId)
{
    auto updated = m_ledger.updateStatus(appointmentId, data::AppointmentStatus::Cancelled);
    if (updated) {
        qCInfo(lcBooking) << "cancelled" << appointmentId << "freeing" << updated->start << "-" << updated->end;
    } else {
        qCDebug(lcBooking) << "cancel" << appointmentId << "failed:" << errorName(updated.error());
    }
    return updated;
}

Result<data::Appointment> ConflictGuard::place(const QString &clientPhone,
                                               data::ServiceId serviceId,
                                               const QDateTime &requestedStart,
                                               const QDateTime &now,
                                               const QString &notes,
                                               data::AppointmentStatus status)
{
    const auto client = m_ledger.findClient(clientPhone);
    if (!client) {
        return client.error() == BookingError::NotFound ? BookingError::UnknownClient : client.error();
    }

    const auto service = m_catalog.findById(serviceId);
    if (!service) {
        return BookingError::UnknownService;
    }

    if (!requestedStart.isValid() || (now.isValid() && requestedStart < now)) {
        return BookingError::InvalidSlot;
    }
    const QDate day = requestedStart.toTimeZone(m_hours.timeZone).date();
    const auto grid = SlotGrid::generate(day, m_hours);
    const auto index = SlotGrid::indexOf(grid, requestedStart);
    if (!index) {
        qCDebug(lcBooking) << "start" << requestedStart << "is not on the slot grid of" << day;
        return BookingError::InvalidSlot;
    }
    const auto span = SlotGrid::spanAt(grid, *index, service->durationMinutes);
    if (!span) {
        qCDebug(lcBooking) << service->name << "at" << requestedStart << "does not fit before closing";
        return BookingError::InvalidSlot;
    }

    const QDate today = now.isValid() ? now.toTimeZone(m_hours.timeZone).date() : QDate();
    const auto mutex = dayLock(day, today);
    std::unique_lock<QMutex> lock(*mutex, std::chrono::milliseconds(m_lockTimeoutMs));
    if (!lock.owns_lock()) {
        qCWarning(lcBooking) << "timed out waiting for the booking lock of" << day;
        return BookingError::StorageTimeout;
    }

    // Re-check under the lock: the caller's availability read may be stale.
    const auto existing = m_ledger.fetchAppointments(span->start, span->end);
    if (!existing) {
        return existing.error();
    }
    for (const auto &appointment : existing.value()) {
        if (appointment.isActive() && appointment.overlaps(span->start, span->end)) {
            qCInfo(lcBooking) << "slot conflict for" << clientPhone << "at" << span->start << "with" << appointment.id;
            return BookingError::SlotConflict;
        }
    }

    data::Appointment appointment;
    appointment.clientPhone = client->phone;
    appointment.serviceId = service->id;
    appointment.start = span->start;
    appointment.end = span->end;
    appointment.status = status;
    appointment.notes = notes;
    appointment.createdAt = now.isValid() ? now : QDateTime::currentDateTimeUtc();

    auto inserted = m_ledger.insertAppointment(appointment);
    if (inserted) {
        qCInfo(lcBooking) << "booked" << service->name << "for" << clientPhone << "at" << span->start << "as"
                          << data::statusToString(status);
    }
    return inserted;
}

std::size_t ConflictGuard::lockedDayCount() const
{
    QMutexLocker locker(&m_tableMutex);
    return m_dayLocks.size();
}

std::shared_ptr<QMutex> ConflictGuard::dayLock(const QDate &day, const QDate &today)
{
    QMutexLocker locker(&m_tableMutex);
    if (today.isValid()) {
        m_dayLocks.erase(m_dayLocks.begin(), m_dayLocks.lower_bound(today));
    }
    auto &slot = m_dayLocks[day];
    if (!slot) {
        slot = std::make_shared<QMutex>();
    }
    return slot;
}

} // namespace core
} // namespace salon
