#pragma once

#include <QDateTime>
#include <QString>
#include <QUuid>

#include <optional>

#include "salon/data/Service.hpp"

namespace salon {
namespace data {

enum class AppointmentStatus
{
    Pending,
    Confirmed,
    Cancelled,
};

struct Appointment
{
    QUuid id = QUuid::createUuid();
    QString clientPhone;
    ServiceId serviceId = 0;
    QDateTime start;
    QDateTime end;
    AppointmentStatus status = AppointmentStatus::Confirmed;
    QString notes;
    QDateTime createdAt;

    // Pending and Confirmed appointments hold their interval.
    bool isActive() const { return status != AppointmentStatus::Cancelled; }
    bool overlaps(const QDateTime &otherStart, const QDateTime &otherEnd) const
    {
        return start < otherEnd && otherStart < end;
    }
};

// Pending -> Confirmed, Pending -> Cancelled, Confirmed -> Cancelled.
bool canTransition(AppointmentStatus from, AppointmentStatus to);
QString statusToString(AppointmentStatus status);
// nullopt for anything but TENTATIVE, CONFIRMED or CANCELLED.
std::optional<AppointmentStatus> statusFromString(const QString &value);

} // namespace data
} // namespace salon
