#pragma once

#include "salon/data/FileLedgerStorage.hpp"
#include "salon/data/InMemoryBookingLedger.hpp"

#include <memory>

namespace salon {
namespace data {

class FileBookingLedger : public InMemoryBookingLedger
{
public:
    explicit FileBookingLedger(std::shared_ptr<FileLedgerStorage> storage, int lockTimeoutMs = 2000);
    ~FileBookingLedger() override = default;

protected:
    bool persist(const LedgerState &state) override;

private:
    std::shared_ptr<FileLedgerStorage> m_storage;
};

} // namespace data
} // namespace salon
