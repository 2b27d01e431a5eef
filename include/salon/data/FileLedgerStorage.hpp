#pragma once

#include <QDateTime>
#include <QMutex>
#include <QString>
#include <vector>

#include "salon/data/LedgerState.hpp"
#include "salon/data/Service.hpp"

namespace salon {
namespace data {

// Clients, services, appointments and sessions in one iCalendar-flavoured text
// file. The whole file is rewritten atomically on every save.
class FileLedgerStorage
{
public:
    explicit FileLedgerStorage(QString filePath);
    ~FileLedgerStorage() = default;

    const QString &filePath() const;
    const LedgerState &state() const;
    const std::vector<Service> &services() const;

    bool save(const LedgerState &state);
    bool saveServices(std::vector<Service> services);

private:
    void load();
    bool write() const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString formatDateTime(const QDateTime &dt);
    static QDateTime parseDateTime(const QString &value);

    QString m_filePath;
    LedgerState m_state;
    std::vector<Service> m_services;
    mutable QMutex m_writeMutex;
};

} // namespace data
} // namespace salon
