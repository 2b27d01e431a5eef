#pragma once

#include <QString>

#include "salon/core/OperatingHours.hpp"

class QSettings;

namespace salon {
namespace core {

struct SalonSettings
{
    QString salonName = QStringLiteral("Elegant Nails Spa");
    QString defaultCountryCode = QStringLiteral("351");
    OperatingHours hours = OperatingHours::standard();
    int maxResults = 10;
    QString storagePath;
    int storageTimeoutMs = 2000;

    // Missing keys keep their defaults; malformed values are logged and ignored.
    static SalonSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

QString defaultStoragePath();

} // namespace core
} // namespace salon
