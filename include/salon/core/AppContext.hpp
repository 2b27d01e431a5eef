#pragma once

#include <memory>

#include "salon/core/SalonSettings.hpp"

namespace salon {
namespace data {
class DataProvider;
}

namespace core {

class BookingService;

// Owns the file-backed ledger and the booking service built on it.
class AppContext
{
public:
    explicit AppContext(const SalonSettings &settings);
    ~AppContext();

    BookingService &bookingService();

private:
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<BookingService> m_bookingService;
};

} // namespace core
} // namespace salon
