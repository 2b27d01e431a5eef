#pragma once

#include <QDate>
#include <QDateTime>
#include <QMutex>
#include <QString>
#include <QUuid>

#include <cstddef>
#include <map>
#include <memory>

#include "salon/core/OperatingHours.hpp"
#include "salon/core/Result.hpp"
#include "salon/data/Appointment.hpp"

namespace salon {
namespace data {
class BookingLedger;
class ServiceCatalog;
}

namespace core {

// The only writer of appointments. Validation happens before any mutation; the
// overlap check and the insert run under one lock per business day, so
// concurrent commits for the same day are serialized while reads stay lock-free.
class ConflictGuard
{
public:
    ConflictGuard(data::BookingLedger &ledger,
                  const data::ServiceCatalog &catalog,
                  const OperatingHours &hours,
                  int lockTimeoutMs = 2000);
    ~ConflictGuard();

    ConflictGuard(const ConflictGuard &) = delete;
    ConflictGuard &operator=(const ConflictGuard &) = delete;

    // Books a Confirmed appointment. now, when valid, rejects starts in the past.
    Result<data::Appointment> commit(const QString &clientPhone,
                                     data::ServiceId serviceId,
                                     const QDateTime &requestedStart,
                                     const QDateTime &now = QDateTime(),
                                     const QString &notes = QString());

    // Same checks as commit, but the appointment stays Pending until confirm().
    Result<data::Appointment> hold(const QString &clientPhone,
                                   data::ServiceId serviceId,
                                   const QDateTime &requestedStart,
                                   const QDateTime &now = QDateTime(),
                                   const QString &notes = QString());

    Result<data::Appointment> confirm(const QUuid &appointmentId);
    Result<data::Appointment> cancel(const QUuid &appointmentId);

    // Number of business days that currently have a booking lock.
    std::size_t lockedDayCount() const;

private:
    Result<data::Appointment> place(const QString &clientPhone,
                                    data::ServiceId serviceId,
                                    const QDateTime &requestedStart,
                                    const QDateTime &now,
                                    const QString &notes,
                                    data::AppointmentStatus status);
    // Locks of days before today are dropped from the table. A caller still
    // holding one keeps it alive through the shared pointer.
    std::shared_ptr<QMutex> dayLock(const QDate &day, const QDate &today);

    data::BookingLedger &m_ledger;
    const data::ServiceCatalog &m_catalog;
    const OperatingHours &m_hours;
    int m_lockTimeoutMs = 2000;

    mutable QMutex m_tableMutex;
    std::map<QDate, std::shared_ptr<QMutex>> m_dayLocks;
};

} // namespace core
} // namespace salon
