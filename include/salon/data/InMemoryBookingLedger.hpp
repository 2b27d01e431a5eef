#pragma once

#include <QReadWriteLock>

#include "salon/data/BookingLedger.hpp"
#include "salon/data/LedgerState.hpp"

namespace salon {
namespace data {

class InMemoryBookingLedger : public BookingLedger
{
public:
    explicit InMemoryBookingLedger(int lockTimeoutMs = 2000);
    ~InMemoryBookingLedger() override;

    LedgerResult<Client> findClient(const QString &phone) const override;
    LedgerResult<Client> upsertClient(const QString &phone, const QDateTime &now) override;
    LedgerResult<Client> updateClient(const Client &client) override;

    LedgerResult<std::vector<Appointment>> fetchAppointments(const QDateTime &from,
                                                             const QDateTime &to) const override;
    LedgerResult<std::vector<Appointment>> fetchClientAppointments(const QString &phone) const override;
    LedgerResult<Appointment> findAppointment(const QUuid &id) const override;
    LedgerResult<Appointment> insertAppointment(const Appointment &appointment) override;
    LedgerResult<Appointment> updateStatus(const QUuid &id, AppointmentStatus status) override;

    LedgerResult<SessionRecord> upsertSession(const SessionRecord &candidate) override;
    LedgerResult<SessionRecord> findSession(const QString &token) const override;
    LedgerResult<std::vector<SessionRecord>> fetchSessions(const QString &phone) const override;
    LedgerResult<SessionRecord> appendSummary(const QString &token, const QString &note) override;

protected:
    InMemoryBookingLedger(LedgerState initialState, int lockTimeoutMs);

    // Runs under the write lock after every mutation. Returning false makes the
    // caller undo the mutation and report StorageUnavailable.
    virtual bool persist(const LedgerState &state);

private:
    mutable QReadWriteLock m_lock;
    LedgerState m_state;
    int m_lockTimeoutMs = 2000;
};

} // namespace data
} // namespace salon
