#include "salon/data/Appointment.hpp"

namespace salon {
namespace data {

bool canTransition(AppointmentStatus from, AppointmentStatus to)
{
    switch (from) {
    case AppointmentStatus::Pending:
        return to == AppointmentStatus::Confirmed || to == AppointmentStatus::Cancelled;
    case AppointmentStatus::Confirmed:
        return to == AppointmentStatus::Cancelled;
    case AppointmentStatus::Cancelled:
        return false;
    }
    return false;
}

QString statusToString(AppointmentStatus status)
{
    switch (status) {
    case AppointmentStatus::Pending:
        return QStringLiteral("TENTATIVE");
    case AppointmentStatus::Cancelled:
        return QStringLiteral("CANCELLED");
    case AppointmentStatus::Confirmed:
    default:
        return QStringLiteral("CONFIRMED");
    }
}

std::optional<AppointmentStatus> statusFromString(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == QLatin1String("TENTATIVE")) {
        return AppointmentStatus::Pending;
    }
    if (normalized == QLatin1String("CANCELLED")) {
        return AppointmentStatus::Cancelled;
    }
    if (normalized == QLatin1String("CONFIRMED")) {
        return AppointmentStatus::Confirmed;
    }
    return std::nullopt;
}

} // namespace data
} // namespace salon
