#pragma once

#include <QString>

namespace salon {
namespace data {

using ServiceId = int;

struct Service
{
    ServiceId id = 0;
    QString name;
    QString description;
    qint64 priceMinor = 0; // cents
    QString currency = QStringLiteral("EUR");
    int durationMinutes = 0;
    bool active = true;
};

QString formatPrice(const Service &service);

} // namespace data
} // namespace salon
