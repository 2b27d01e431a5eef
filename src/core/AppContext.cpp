#include "salon/core/AppContext.hpp"

#include "salon/data/DataProvider.hpp"

#include "salon/core/BookingService.hpp"

namespace salon {
namespace core {

AppContext::AppContext(const SalonSettings &settings)
    : m_dataProvider(std::make_unique<data::DataProvider>(settings.storagePath,
                                                          settings.hours.granularityMinutes,
                                                          settings.storageTimeoutMs))
    , m_bookingService(std::make_unique<BookingService>(m_dataProvider->ledger(), m_dataProvider->catalog(), settings))
{
}

AppContext::~AppContext() = default;

BookingService &AppContext::bookingService()
{
    return *m_bookingService;
}

} // namespace core
} // namespace salon
