#pragma once

#include <memory>
#include <QString>

namespace salon {
namespace data {

class BookingLedger;
class FileLedgerStorage;
class InMemoryServiceCatalog;
class ServiceCatalog;

// Opens the ledger file and provisions the service catalog, seeding the default
// salon services the first time the file is created.
class DataProvider
{
public:
    DataProvider(const QString &storagePath, int granularityMinutes, int lockTimeoutMs);
    ~DataProvider();

    BookingLedger &ledger();
    ServiceCatalog &catalog();

private:
    void seedDefaultServices();

    std::shared_ptr<FileLedgerStorage> m_storage;
    std::unique_ptr<BookingLedger> m_ledger;
    std::unique_ptr<InMemoryServiceCatalog> m_catalog;
};

} // namespace data
} // namespace salon
