#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>

namespace salon {
namespace data {

// Persisted half of a session context. Holds only the client phone; the client
// itself is joined in from the ledger when a context is resolved.
struct SessionRecord
{
    QString token;
    QString clientPhone;
    QDate day;
    QString summary;
    QDateTime createdAt;
    QDateTime lastSeen;
};

QString sessionToken(const QString &clientPhone, const QDate &day);

} // namespace data
} // namespace salon
