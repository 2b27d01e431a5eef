#include "salon/data/FileBookingLedger.hpp"

#include "salon/core/Logging.hpp"

namespace salon {
namespace data {

FileBookingLedger::FileBookingLedger(std::shared_ptr<FileLedgerStorage> storage, int lockTimeoutMs)
    : InMemoryBookingLedger(storage ? storage->state() : LedgerState{}, lockTimeoutMs)
    , m_storage(std::move(storage))
{
}

bool FileBookingLedger::persist(const LedgerState &state)
{
    if (!m_storage) {
        return false;
    }
    if (!m_storage->save(state)) {
        qCWarning(lcLedger) << "could not write ledger file" << m_storage->filePath();
        return false;
    }
    return true;
}

} // namespace data
} // namespace salon
