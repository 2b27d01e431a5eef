#include "salon/core/SessionContextManager.hpp"

#include "salon/core/Logging.hpp"
#include "salon/data/BookingLedger.hpp"
#include "salon/data/ServiceCatalog.hpp"

namespace salon {
namespace core {

SessionContextManager::SessionContextManager(data::BookingLedger &ledger,
                                             const data::ServiceCatalog &catalog,
                                             const OperatingHours &hours,
                                             QString salonName)
    : m_ledger(ledger)
    , m_catalog(catalog)
    , m_hours(hours)
    , m_salonName(std::move(salonName))
{
}

QDate SessionContextManager::businessDay(const QDateTime &now) const
{
    return now.toTimeZone(m_hours.timeZone).date();
}

Result<SessionContext> SessionContextManager::resolve(const QString &clientPhone, const QDateTime &now)
{
    if (clientPhone.isEmpty() || !now.isValid()) {
        return BookingError::UnknownClient;
    }

    const auto client = m_ledger.upsertClient(clientPhone, now);
    if (!client) {
        return client.error();
    }

    data::SessionRecord candidate;
    candidate.clientPhone = clientPhone;
    candidate.day = businessDay(now);
    candidate.token = data::sessionToken(clientPhone, candidate.day);
    candidate.createdAt = now;
    candidate.lastSeen = now;

    const auto record = m_ledger.upsertSession(candidate);
    if (!record) {
        return record.error();
    }
    if (record->createdAt == now) {
        qCDebug(lcSession) << "session" << record->token << "opened";
    }
    return join(record.value(), client.value());
}

Result<SessionContext> SessionContextManager::appendSummary(const SessionContext &context, const QString &note)
{
    const auto record = m_ledger.appendSummary(context.token, note);
    if (!record) {
        return record.error();
    }
    const auto client = m_ledger.findClient(record->clientPhone);
    if (!client) {
        return client.error() == BookingError::NotFound ? BookingError::UnknownClient : client.error();
    }
    return join(record.value(), client.value());
}

Result<ConversationContext> SessionContextManager::assemble(const SessionContext &context, const QDateTime &now) const
{
    const auto client = m_ledger.findClient(context.client.phone);
    if (!client) {
        return client.error() == BookingError::NotFound ? BookingError::UnknownClient : client.error();
    }
    const auto sessions = m_ledger.fetchSessions(context.client.phone);
    if (!sessions) {
        return sessions.error();
    }

    ConversationContext result;
    result.session = context;
    result.session.client = client.value();
    result.services = m_catalog.fetchServices();
    result.salonName = m_salonName;
    result.openingHours = m_hours.describe();
    result.now = now;
    for (const auto &record : sessions.value()) {
        if (record.day < context.day && !record.summary.isEmpty()) {
            result.previousSummary = record.summary;
            break;
        }
    }
    return result;
}

Result<std::vector<SessionContext>> SessionContextManager::history(const QString &clientPhone) const
{
    const auto client = m_ledger.findClient(clientPhone);
    if (!client) {
        return client.error() == BookingError::NotFound ? BookingError::UnknownClient : client.error();
    }
    const auto sessions = m_ledger.fetchSessions(clientPhone);
    if (!sessions) {
        return sessions.error();
    }
    std::vector<SessionContext> result;
    result.reserve(sessions->size());
    for (const auto &record : sessions.value()) {
        result.push_back(join(record, client.value()));
    }
    return result;
}

Result<data::Client> SessionContextManager::updateProfile(const data::Client &client)
{
    auto updated = m_ledger.updateClient(client);
    if (!updated) {
        return updated.error() == BookingError::NotFound ? BookingError::UnknownClient : updated.error();
    }
    qCDebug(lcSession) << "profile updated for" << client.phone;
    return updated;
}

SessionContext SessionContextManager::join(const data::SessionRecord &record, const data::Client &client)
{
    SessionContext context;
    context.token = record.token;
    context.client = client;
    context.day = record.day;
    context.summary = record.summary;
    context.createdAt = record.createdAt;
    context.lastSeen = record.lastSeen;
    return context;
}

} // namespace core
} // namespace salon
