#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QUuid>

#include <functional>
#include <optional>
#include <vector>

#include "salon/core/AvailabilityEngine.hpp"
#include "salon/core/ConflictGuard.hpp"
#include "salon/core/Result.hpp"
#include "salon/core/SalonSettings.hpp"
#include "salon/core/SessionContextManager.hpp"
#include "salon/data/Appointment.hpp"
#include "salon/data/Client.hpp"
#include "salon/data/Service.hpp"

namespace salon {
namespace data {
class BookingLedger;
class ServiceCatalog;
}

namespace core {

// Entry point for the conversational layer. Phone numbers are accepted in any
// common notation and normalized with the configured default country code.
class BookingService
{
public:
    using Clock = std::function<QDateTime()>;

    BookingService(data::BookingLedger &ledger,
                   const data::ServiceCatalog &catalog,
                   SalonSettings settings,
                   Clock clock = Clock());
    ~BookingService();

    BookingService(const BookingService &) = delete;
    BookingService &operator=(const BookingService &) = delete;

    Result<SessionContext> resolveSession(const QString &clientPhone, const QDateTime &now);
    Result<SessionContext> appendSummary(const SessionContext &context, const QString &note);
    Result<ConversationContext> conversationContext(const SessionContext &context) const;
    Result<std::vector<SessionContext>> sessionHistory(const QString &clientPhone) const;

    // maxResults <= 0 uses the configured default. Slots already in the past are
    // never offered.
    Result<std::vector<TimeSlot>> checkAvailability(const QDate &date, data::ServiceId serviceId,
                                                    int maxResults = 0) const;
    Result<data::Appointment> bookAppointment(const QString &clientPhone, data::ServiceId serviceId,
                                              const QDateTime &start, const QString &notes = QString());
    Result<data::Appointment> holdAppointment(const QString &clientPhone, data::ServiceId serviceId,
                                              const QDateTime &start, const QString &notes = QString());
    Result<data::Appointment> confirmAppointment(const QUuid &appointmentId);
    Result<data::Appointment> cancelAppointment(const QUuid &appointmentId);
    Result<std::vector<data::Appointment>> clientAppointments(const QString &clientPhone) const;

    Result<data::Client> updateClientProfile(const QString &clientPhone, const QString &name,
                                             const QString &email, const QString &preferences);

    std::vector<data::Service> listServices() const;

    const SalonSettings &settings() const;
    QDateTime now() const;

private:
    std::optional<QString> normalize(const QString &clientPhone) const;

    data::BookingLedger &m_ledger;
    const data::ServiceCatalog &m_catalog;
    SalonSettings m_settings;
    Clock m_clock;
    AvailabilityEngine m_availability;
    ConflictGuard m_guard;
    SessionContextManager m_sessions;
};

} // namespace core
} // namespace salon
