#include "salon/core/SalonSettings.hpp"

#include "salon/core/Logging.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QStringList>

namespace salon {
namespace core {

namespace {
const char *const kDayKeys[] = {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};

QString dayKey(int dayOfWeek)
{
    return QStringLiteral("hours/%1").arg(QLatin1String(kDayKeys[dayOfWeek - Qt::Monday]));
}

bool parseRange(const QString &text, DayHours &out)
{
    const QString trimmed = text.trimmed();
    if (trimmed.compare(QLatin1String("closed"), Qt::CaseInsensitive) == 0) {
        out = DayHours{};
        return true;
    }
    const QStringList parts = trimmed.split(QLatin1Char('-'));
    if (parts.size() != 2) {
        return false;
    }
    const QTime open = QTime::fromString(parts.at(0).trimmed(), QStringLiteral("HH:mm"));
    const QTime close = QTime::fromString(parts.at(1).trimmed(), QStringLiteral("HH:mm"));
    if (!open.isValid() || !close.isValid() || open >= close) {
        return false;
    }
    out = DayHours{open, close};
    return true;
}

int positiveInt(QSettings &settings, const QString &key, int fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(key).toInt(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcConfig) << "ignoring invalid value for" << key << settings.value(key);
        return fallback;
    }
    return value;
}

// Accepts "351", "+351" or " 351 "; anything else keeps the fallback.
QString countryCode(QSettings &settings, const QString &key, const QString &fallback)
{
    if (!settings.contains(key)) {
        return fallback;
    }
    QString code = settings.value(key).toString().trimmed();
    if (code.startsWith(QLatin1Char('+'))) {
        code.remove(0, 1);
    }
    bool valid = !code.isEmpty() && code.size() <= 3 && !code.startsWith(QLatin1Char('0'));
    for (const QChar c : code) {
        valid = valid && c >= QLatin1Char('0') && c <= QLatin1Char('9');
    }
    if (!valid) {
        qCWarning(lcConfig) << "ignoring invalid country code" << settings.value(key);
        return fallback;
    }
    return code;
}
} // namespace

QString defaultStoragePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/salon-desk");
    }
    return QDir(storageFolder).filePath(QStringLiteral("salon.ics"));
}

SalonSettings SalonSettings::load(QSettings &settings)
{
    SalonSettings result;
    result.salonName = settings.value(QStringLiteral("salon/name"), result.salonName).toString();
    result.defaultCountryCode =
        countryCode(settings, QStringLiteral("salon/defaultCountryCode"), result.defaultCountryCode);

    if (settings.contains(QStringLiteral("salon/timeZone"))) {
        const QByteArray zoneId = settings.value(QStringLiteral("salon/timeZone")).toString().toUtf8();
        const QTimeZone zone(zoneId);
        if (zone.isValid()) {
            result.hours.timeZone = zone;
        } else {
            qCWarning(lcConfig) << "unknown time zone" << zoneId << "- keeping" << result.hours.timeZone.id();
        }
    }

    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        const QString key = dayKey(day);
        if (!settings.contains(key)) {
            continue;
        }
        DayHours hours;
        if (parseRange(settings.value(key).toString(), hours)) {
            result.hours.days[static_cast<size_t>(day - Qt::Monday)] = hours;
        } else {
            qCWarning(lcConfig) << "ignoring malformed opening hours" << key << settings.value(key);
        }
    }

    result.hours.granularityMinutes =
        positiveInt(settings, QStringLiteral("hours/granularityMinutes"), result.hours.granularityMinutes);
    result.maxResults = positiveInt(settings, QStringLiteral("availability/maxResults"), result.maxResults);
    result.storageTimeoutMs = positiveInt(settings, QStringLiteral("storage/timeoutMs"), result.storageTimeoutMs);
    result.storagePath = settings.value(QStringLiteral("storage/path")).toString();
    if (result.storagePath.isEmpty()) {
        result.storagePath = defaultStoragePath();
    }

    qCDebug(lcConfig) << "loaded settings for" << result.salonName << result.hours.describe();
    return result;
}

void SalonSettings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("salon/name"), salonName);
    settings.setValue(QStringLiteral("salon/defaultCountryCode"), defaultCountryCode);
    settings.setValue(QStringLiteral("salon/timeZone"), QString::fromUtf8(hours.timeZone.id()));
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        const DayHours &dayHours = hours.hoursFor(day);
        const QString value = dayHours.isOpen()
            ? QStringLiteral("%1-%2").arg(dayHours.open.toString(QStringLiteral("HH:mm")),
                                          dayHours.close.toString(QStringLiteral("HH:mm")))
            : QStringLiteral("closed");
        settings.setValue(dayKey(day), value);
    }
    settings.setValue(QStringLiteral("hours/granularityMinutes"), hours.granularityMinutes);
    settings.setValue(QStringLiteral("availability/maxResults"), maxResults);
    settings.setValue(QStringLiteral("storage/path"), storagePath);
    settings.setValue(QStringLiteral("storage/timeoutMs"), storageTimeoutMs);
}

} // namespace core
} // namespace salon
