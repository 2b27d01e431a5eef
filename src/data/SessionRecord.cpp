#include "salon/data/SessionRecord.hpp"

namespace salon {
namespace data {

QString sessionToken(const QString &clientPhone, const QDate &day)
{
    return QStringLiteral("%1_%2").arg(clientPhone, day.toString(QStringLiteral("yyyyMMdd")));
}

} // namespace data
} // namespace salon
