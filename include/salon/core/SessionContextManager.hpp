#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>

#include <vector>

#include "salon/core/OperatingHours.hpp"
#include "salon/core/Result.hpp"
#include "salon/data/Client.hpp"
#include "salon/data/Service.hpp"

namespace salon {
namespace data {
class BookingLedger;
class ServiceCatalog;
struct SessionRecord;
}

namespace core {

// One conversation handle per client per business-local day. The client is
// joined in from the ledger on every read, never copied into the session record.
struct SessionContext
{
    QString token;
    data::Client client;
    QDate day;
    QString summary;
    QDateTime createdAt;
    QDateTime lastSeen;
};

// Everything the conversational layer needs to compose a reply.
struct ConversationContext
{
    SessionContext session;
    std::vector<data::Service> services;
    QString previousSummary; // latest non-empty summary of an earlier day
    QString salonName;
    QString openingHours;
    QDateTime now;
};

class SessionContextManager
{
public:
    SessionContextManager(data::BookingLedger &ledger,
                          const data::ServiceCatalog &catalog,
                          const OperatingHours &hours,
                          QString salonName = QString());

    QDate businessDay(const QDateTime &now) const;

    // clientPhone must already be normalized.
    Result<SessionContext> resolve(const QString &clientPhone, const QDateTime &now);
    Result<SessionContext> appendSummary(const SessionContext &context, const QString &note);
    Result<ConversationContext> assemble(const SessionContext &context, const QDateTime &now) const;
    Result<std::vector<SessionContext>> history(const QString &clientPhone) const;
    Result<data::Client> updateProfile(const data::Client &client);

private:
    static SessionContext join(const data::SessionRecord &record, const data::Client &client);

    data::BookingLedger &m_ledger;
    const data::ServiceCatalog &m_catalog;
    const OperatingHours &m_hours;
    QString m_salonName;
};

} // namespace core
} // namespace salon
