#include "salon/core/BookingService.hpp"

#include "salon/core/Logging.hpp"
#include "salon/core/PhoneNumber.hpp"
#include "salon/data/BookingLedger.hpp"
#include "salon/data/ServiceCatalog.hpp"

#include <QTime>

namespace salon {
namespace core {

BookingService::BookingService(data::BookingLedger &ledger,
                               const data::ServiceCatalog &catalog,
                               SalonSettings settings,
                               Clock clock)
    : m_ledger(ledger)
    , m_catalog(catalog)
    , m_settings(std::move(settings))
    , m_clock(clock ? std::move(clock) : Clock([] { return QDateTime::currentDateTimeUtc(); }))
    , m_availability(m_catalog, m_settings.hours)
    , m_guard(m_ledger, m_catalog, m_settings.hours, m_settings.storageTimeoutMs)
    , m_sessions(m_ledger, m_catalog, m_settings.hours, m_settings.salonName)
{
}

BookingService::~BookingService() = default;

Result<SessionContext> BookingService::resolveSession(const QString &clientPhone, const QDateTime &now)
{
    const auto phone = normalize(clientPhone);
    if (!phone) {
        return BookingError::UnknownClient;
    }
    return m_sessions.resolve(*phone, now);
}

Result<SessionContext> BookingService::appendSummary(const SessionContext &context, const QString &note)
{
    return m_sessions.appendSummary(context, note);
}

Result<ConversationContext> BookingService::conversationContext(const SessionContext &context) const
{
    return m_sessions.assemble(context, now());
}

Result<std::vector<SessionContext>> BookingService::sessionHistory(const QString &clientPhone) const
{
    const auto phone = normalize(clientPhone);
    if (!phone) {
        return BookingError::UnknownClient;
    }
    return m_sessions.history(*phone);
}

Result<std::vector<TimeSlot>> BookingService::checkAvailability(const QDate &date, data::ServiceId serviceId,
                                                                int maxResults) const
{
    if (!date.isValid()) {
        return BookingError::InvalidSlot;
    }
    const QDateTime dayStart(date, QTime(0, 0), m_settings.hours.timeZone);
    const QDateTime dayEnd(date.addDays(1), QTime(0, 0), m_settings.hours.timeZone);
    const auto existing = m_ledger.fetchAppointments(dayStart, dayEnd);
    if (!existing) {
        return existing.error();
    }
    const int limit = maxResults > 0 ? maxResults : m_settings.maxResults;
    return m_availability.findAvailable(date, serviceId, existing.value(), limit, now());
}

Result<data::Appointment> BookingService::bookAppointment(const QString &clientPhone, data::ServiceId serviceId,
                                                          const QDateTime &start, const QString &notes)
{
    const auto phone = normalize(clientPhone);
    if (!phone) {
        return BookingError::UnknownClient;
    }
    return m_guard.commit(*phone, serviceId, start, now(), notes);
}

Result<data::Appointment> BookingService::holdAppointment(const QString &clientPhone, data::ServiceId serviceId,
                                                          const QDateTime &start, const QString &notes)
{
    const auto phone = normalize(clientPhone);
    if (!phone) {
        return BookingError::UnknownClient;
    }
    return m_guard.hold(*phone, serviceId, start, now(), notes);
}

Result<data::Appointment> BookingService::confirmAppointment(const QUuid &appointmentId)
{
    return m_guard.confirm(appointmentId);
}

Result<data::Appointment> BookingService::cancelAppointment(const QUuid &appointmentId)
{
    return m_guard.cancel(appointmentId);
}

Result<std::vector<data::Appointment>> BookingService::clientAppointments(const QString &clientPhone) const
{
    const auto phone = normalize(clientPhone);
    if (!phone) {
        return BookingError::UnknownClient;
    }
    return m_ledger.fetchClientAppointments(*phone);
}

Result<data::Client> BookingService::updateClientProfile(const QString &clientPhone, const QString &name,
                                                         const QString &email, const QString &preferences)
{
    const auto phone = normalize(clientPhone);
    if (!phone) {
        return BookingError::UnknownClient;
    }
    data::Client client;
    client.phone = *phone;
    client.name = name.trimmed();
    client.email = email.trimmed();
    client.preferences = preferences;
    return m_sessions.updateProfile(client);
}

std::vector<data::Service> BookingService::listServices() const
{
    return m_catalog.fetchServices();
}

const SalonSettings &BookingService::settings() const
{
    return m_settings;
}

QDateTime BookingService::now() const
{
    return m_clock();
}

std::optional<QString> BookingService::normalize(const QString &clientPhone) const
{
    const auto phone = normalizePhone(clientPhone, m_settings.defaultCountryCode);
    if (!phone) {
        qCDebug(lcBooking) << "rejecting unparseable phone number" << clientPhone;
    }
    return phone;
}

} // namespace core
} // namespace salon
