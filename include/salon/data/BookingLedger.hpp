#pragma once

#include <vector>

#include "salon/core/Result.hpp"
#include "salon/data/Appointment.hpp"
#include "salon/data/Client.hpp"
#include "salon/data/SessionRecord.hpp"

namespace salon {
namespace data {

template <typename T>
using LedgerResult = core::Result<T>;

// Transactional store for clients, appointments and session records. Every
// write either applies completely or leaves the ledger unchanged. Implementations
// must be safe to call from several threads and give up with StorageTimeout
// instead of blocking indefinitely. Lookups of missing records fail with NotFound.
class BookingLedger
{
public:
    virtual ~BookingLedger() = default;

    virtual LedgerResult<Client> findClient(const QString &phone) const = 0;
    // Returns the stored client, creating it with defaults when the phone is unseen.
    virtual LedgerResult<Client> upsertClient(const QString &phone, const QDateTime &now) = 0;
    // Name, email and preferences only; phone and createdAt are immutable.
    virtual LedgerResult<Client> updateClient(const Client &client) = 0;

    // Appointments intersecting [from, to), any status, ordered by start.
    virtual LedgerResult<std::vector<Appointment>> fetchAppointments(const QDateTime &from,
                                                                     const QDateTime &to) const = 0;
    virtual LedgerResult<std::vector<Appointment>> fetchClientAppointments(const QString &phone) const = 0;
    virtual LedgerResult<Appointment> findAppointment(const QUuid &id) const = 0;
    // Fails with SlotConflict when an active appointment overlaps the new one.
    virtual LedgerResult<Appointment> insertAppointment(const Appointment &appointment) = 0;
    virtual LedgerResult<Appointment> updateStatus(const QUuid &id, AppointmentStatus status) = 0;

    // Inserts the record unless its token exists; in that case only lastSeen is
    // refreshed. Returns the surviving record.
    virtual LedgerResult<SessionRecord> upsertSession(const SessionRecord &candidate) = 0;
    virtual LedgerResult<SessionRecord> findSession(const QString &token) const = 0;
    // Newest day first.
    virtual LedgerResult<std::vector<SessionRecord>> fetchSessions(const QString &phone) const = 0;
    // Appends one line to the rolling summary.
    virtual LedgerResult<SessionRecord> appendSummary(const QString &token, const QString &note) = 0;
};

} // namespace data
} // namespace salon
