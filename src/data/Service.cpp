#include "salon/data/Service.hpp"

namespace salon {
namespace data {

QString formatPrice(const Service &service)
{
    const qint64 whole = service.priceMinor / 100;
    const qint64 cents = service.priceMinor % 100;
    return QStringLiteral("%1.%2 %3")
        .arg(whole)
        .arg(cents, 2, 10, QLatin1Char('0'))
        .arg(service.currency);
}

} // namespace data
} // namespace salon
