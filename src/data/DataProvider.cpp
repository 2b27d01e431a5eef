#include "salon/data/DataProvider.hpp"

#include "salon/core/Logging.hpp"
#include "salon/data/FileBookingLedger.hpp"
#include "salon/data/FileLedgerStorage.hpp"
#include "salon/data/InMemoryServiceCatalog.hpp"

#include <QDir>
#include <QFileInfo>

namespace salon {
namespace data {

DataProvider::DataProvider(const QString &storagePath, int granularityMinutes, int lockTimeoutMs)
{
    QDir dir = QFileInfo(storagePath).dir();
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    m_storage = std::make_shared<FileLedgerStorage>(storagePath);
    m_ledger = std::make_unique<FileBookingLedger>(m_storage, lockTimeoutMs);
    m_catalog = std::make_unique<InMemoryServiceCatalog>(m_storage->services(), granularityMinutes);

    seedDefaultServices();
}

DataProvider::~DataProvider() = default;

BookingLedger &DataProvider::ledger()
{
    return *m_ledger;
}

ServiceCatalog &DataProvider::catalog()
{
    return *m_catalog;
}

void DataProvider::seedDefaultServices()
{
    if (!m_storage->services().empty()) {
        return;
    }
    for (const auto &service : defaultServices()) {
        m_catalog->addService(service);
    }
    if (!m_storage->saveServices(m_catalog->allServices())) {
        qCWarning(lcLedger) << "default services could not be written to" << m_storage->filePath();
        return;
    }
    qCInfo(lcLedger) << "seeded" << m_catalog->allServices().size() << "default services";
}

} // namespace data
} // namespace salon
