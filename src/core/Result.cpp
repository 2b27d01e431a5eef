#include "salon/core/Result.hpp"

namespace salon {
namespace core {

QString errorName(BookingError error)
{
    switch (error) {
    case BookingError::UnknownClient:
        return QStringLiteral("UnknownClient");
    case BookingError::UnknownService:
        return QStringLiteral("UnknownService");
    case BookingError::InvalidSlot:
        return QStringLiteral("InvalidSlot");
    case BookingError::SlotConflict:
        return QStringLiteral("SlotConflict");
    case BookingError::NotFound:
        return QStringLiteral("NotFound");
    case BookingError::AlreadyCancelled:
        return QStringLiteral("AlreadyCancelled");
    case BookingError::InvalidTransition:
        return QStringLiteral("InvalidTransition");
    case BookingError::StorageTimeout:
        return QStringLiteral("StorageTimeout");
    case BookingError::StorageUnavailable:
        return QStringLiteral("StorageUnavailable");
    }
    return QStringLiteral("Unknown");
}

bool isRetryable(BookingError error)
{
    return error == BookingError::StorageTimeout || error == BookingError::SlotConflict;
}

} // namespace core
} // namespace salon
