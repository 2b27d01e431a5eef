#include "salon/data/InMemoryBookingLedger.hpp"

#include "salon/core/Logging.hpp"

#include <algorithm>

namespace salon {
namespace data {

using core::BookingError;

namespace {

class TimedLock
{
public:
    enum class Mode
    {
        Read,
        Write,
    };

    TimedLock(QReadWriteLock &lock, Mode mode, int timeoutMs)
        : m_lock(lock)
    {
        m_locked = mode == Mode::Read ? lock.tryLockForRead(timeoutMs) : lock.tryLockForWrite(timeoutMs);
    }

    ~TimedLock()
    {
        if (m_locked) {
            m_lock.unlock();
        }
    }

    TimedLock(const TimedLock &) = delete;
    TimedLock &operator=(const TimedLock &) = delete;

    bool locked() const { return m_locked; }

private:
    QReadWriteLock &m_lock;
    bool m_locked = false;
};

void sortByStart(std::vector<Appointment> &appointments)
{
    std::sort(appointments.begin(), appointments.end(), [](const Appointment &lhs, const Appointment &rhs) {
        if (lhs.start == rhs.start) {
            return lhs.end < rhs.end;
        }
        return lhs.start < rhs.start;
    });
}

} // namespace

InMemoryBookingLedger::InMemoryBookingLedger(int lockTimeoutMs)
    : m_lockTimeoutMs(lockTimeoutMs)
{
}

InMemoryBookingLedger::InMemoryBookingLedger(LedgerState initialState, int lockTimeoutMs)
    : m_state(std::move(initialState))
    , m_lockTimeoutMs(lockTimeoutMs)
{
}

InMemoryBookingLedger::~InMemoryBookingLedger() = default;

bool InMemoryBookingLedger::persist(const LedgerState &)
{
    return true;
}

LedgerResult<Client> InMemoryBookingLedger::findClient(const QString &phone) const
{
    TimedLock lock(m_lock, TimedLock::Mode::Read, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    if (!m_state.clients.contains(phone)) {
        return BookingError::NotFound;
    }
    return m_state.clients.value(phone);
}

LedgerResult<Client> InMemoryBookingLedger::upsertClient(const QString &phone, const QDateTime &now)
{
    TimedLock lock(m_lock, TimedLock::Mode::Write, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    if (m_state.clients.contains(phone)) {
        return m_state.clients.value(phone);
    }

    Client client;
    client.phone = phone;
    client.createdAt = now;
    m_state.clients.insert(phone, client);
    if (!persist(m_state)) {
        m_state.clients.remove(phone);
        return BookingError::StorageUnavailable;
    }
    qCInfo(lcLedger) << "new client" << phone;
    return client;
}

LedgerResult<Client> InMemoryBookingLedger::updateClient(const Client &client)
{
    TimedLock lock(m_lock, TimedLock::Mode::Write, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    if (!m_state.clients.contains(client.phone)) {
        return BookingError::NotFound;
    }

    const Client previous = m_state.clients.value(client.phone);
    Client updated = previous;
    updated.name = client.name;
    updated.email = client.email;
    updated.preferences = client.preferences;
    m_state.clients.insert(updated.phone, updated);
    if (!persist(m_state)) {
        m_state.clients.insert(previous.phone, previous);
        return BookingError::StorageUnavailable;
    }
    return updated;
}

LedgerResult<std::vector<Appointment>> InMemoryBookingLedger::fetchAppointments(const QDateTime &from,
                                                                                const QDateTime &to) const
{
    TimedLock lock(m_lock, TimedLock::Mode::Read, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    std::vector<Appointment> result;
    for (auto it = m_state.appointments.constBegin(); it != m_state.appointments.constEnd(); ++it) {
        if (it.value().overlaps(from, to)) {
            result.push_back(it.value());
        }
    }
    sortByStart(result);
    return result;
}

LedgerResult<std::vector<Appointment>> InMemoryBookingLedger::fetchClientAppointments(const QString &phone) const
{
    TimedLock lock(m_lock, TimedLock::Mode::Read, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    std::vector<Appointment> result;
    for (const auto &appointment : m_state.appointments) {
        if (appointment.clientPhone == phone) {
            result.push_back(appointment);
        }
    }
    sortByStart(result);
    return result;
}

LedgerResult<Appointment> InMemoryBookingLedger::findAppointment(const QUuid &id) const
{
    TimedLock lock(m_lock, TimedLock::Mode::Read, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    if (!m_state.appointments.contains(id)) {
        return BookingError::NotFound;
    }
    return m_state.appointments.value(id);
}

LedgerResult<Appointment> InMemoryBookingLedger::insertAppointment(const Appointment &appointment)
{
    TimedLock lock(m_lock, TimedLock::Mode::Write, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }

    Appointment stored = appointment;
    if (stored.id.isNull()) {
        stored.id = QUuid::createUuid();
    }
    if (m_state.appointments.contains(stored.id)) {
        return BookingError::SlotConflict;
    }
    if (stored.isActive()) {
        for (const auto &existing : m_state.appointments) {
            if (existing.isActive() && existing.overlaps(stored.start, stored.end)) {
                qCDebug(lcLedger) << "insert rejected, overlaps" << existing.id;
                return BookingError::SlotConflict;
            }
        }
    }

    m_state.appointments.insert(stored.id, stored);
    if (!persist(m_state)) {
        m_state.appointments.remove(stored.id);
        return BookingError::StorageUnavailable;
    }
    return stored;
}

LedgerResult<Appointment> InMemoryBookingLedger::updateStatus(const QUuid &id, AppointmentStatus status)
{
    TimedLock lock(m_lock, TimedLock::Mode::Write, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    if (!m_state.appointments.contains(id)) {
        return BookingError::NotFound;
    }

    const Appointment previous = m_state.appointments.value(id);
    if (previous.status == AppointmentStatus::Cancelled) {
        return BookingError::AlreadyCancelled;
    }
    if (!canTransition(previous.status, status)) {
        return BookingError::InvalidTransition;
    }

    Appointment updated = previous;
    updated.status = status;
    m_state.appointments.insert(id, updated);
    if (!persist(m_state)) {
        m_state.appointments.insert(id, previous);
        return BookingError::StorageUnavailable;
    }
    return updated;
}

LedgerResult<SessionRecord> InMemoryBookingLedger::upsertSession(const SessionRecord &candidate)
{
    TimedLock lock(m_lock, TimedLock::Mode::Write, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }

    const bool exists = m_state.sessions.contains(candidate.token);
    const SessionRecord previous = m_state.sessions.value(candidate.token);
    SessionRecord surviving = candidate;
    if (exists) {
        surviving = previous;
        surviving.lastSeen = candidate.lastSeen;
    }

    m_state.sessions.insert(surviving.token, surviving);
    if (!persist(m_state)) {
        if (exists) {
            m_state.sessions.insert(previous.token, previous);
        } else {
            m_state.sessions.remove(candidate.token);
        }
        return BookingError::StorageUnavailable;
    }
    return surviving;
}

LedgerResult<SessionRecord> InMemoryBookingLedger::findSession(const QString &token) const
{
    TimedLock lock(m_lock, TimedLock::Mode::Read, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    if (!m_state.sessions.contains(token)) {
        return BookingError::NotFound;
    }
    return m_state.sessions.value(token);
}

LedgerResult<std::vector<SessionRecord>> InMemoryBookingLedger::fetchSessions(const QString &phone) const
{
    TimedLock lock(m_lock, TimedLock::Mode::Read, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    std::vector<SessionRecord> result;
    for (const auto &session : m_state.sessions) {
        if (session.clientPhone == phone) {
            result.push_back(session);
        }
    }
    std::sort(result.begin(), result.end(), [](const SessionRecord &lhs, const SessionRecord &rhs) {
        return lhs.day > rhs.day;
    });
    return result;
}

LedgerResult<SessionRecord> InMemoryBookingLedger::appendSummary(const QString &token, const QString &note)
{
    TimedLock lock(m_lock, TimedLock::Mode::Write, m_lockTimeoutMs);
    if (!lock.locked()) {
        return BookingError::StorageTimeout;
    }
    if (!m_state.sessions.contains(token)) {
        return BookingError::NotFound;
    }

    const SessionRecord previous = m_state.sessions.value(token);
    SessionRecord updated = previous;
    if (!updated.summary.isEmpty()) {
        updated.summary += QLatin1Char('\n');
    }
    updated.summary += note;
    m_state.sessions.insert(token, updated);
    if (!persist(m_state)) {
        m_state.sessions.insert(token, previous);
        return BookingError::StorageUnavailable;
    }
    return updated;
}

} // namespace data
} // namespace salon
