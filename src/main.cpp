#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QDateTime>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <QUuid>

#include <memory>

#include "version.h"

#include "salon/core/AppContext.hpp"
#include "salon/core/BookingService.hpp"
#include "salon/core/SalonSettings.hpp"

namespace {

enum ExitCode
{
    Success = 0,
    BookingFailed = 1,
    UsageError = 2,
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int reportError(salon::core::BookingError error)
{
    err() << "error: " << salon::core::errorName(error);
    if (salon::core::isRetryable(error)) {
        err() << " (retry with a fresh availability lookup)";
    }
    err() << Qt::endl;
    return BookingFailed;
}

QString formatTime(const QDateTime &dt, const QTimeZone &zone)
{
    return dt.toTimeZone(zone).toString(QStringLiteral("yyyy-MM-dd HH:mm"));
}

void printAppointment(const salon::data::Appointment &appointment, const QTimeZone &zone)
{
    out() << appointment.id.toString(QUuid::WithoutBraces) << "  " << formatTime(appointment.start, zone) << " - "
          << appointment.end.toTimeZone(zone).toString(QStringLiteral("HH:mm")) << "  service "
          << appointment.serviceId << "  " << salon::data::statusToString(appointment.status) << "  "
          << appointment.clientPhone << Qt::endl;
}

int runServices(salon::core::BookingService &service)
{
    for (const auto &entry : service.listServices()) {
        out() << entry.id << "  " << entry.name << "  " << entry.durationMinutes << " min  "
              << salon::data::formatPrice(entry) << Qt::endl;
    }
    return Success;
}

int runAvailability(salon::core::BookingService &service, const QStringList &args)
{
    if (args.size() < 2) {
        return UsageError;
    }
    const QDate date = QDate::fromString(args.at(0), Qt::ISODate);
    bool ok = false;
    const int serviceId = args.at(1).toInt(&ok);
    if (!date.isValid() || !ok) {
        return UsageError;
    }
    const auto slots = service.checkAvailability(date, serviceId);
    if (!slots) {
        return reportError(slots.error());
    }
    if (slots->empty()) {
        out() << "no availability on " << date.toString(Qt::ISODate) << Qt::endl;
    }
    for (const auto &slot : slots.value()) {
        out() << formatTime(slot.start, service.settings().hours.timeZone) << Qt::endl;
    }
    return Success;
}

int runBook(salon::core::BookingService &service, const QStringList &args)
{
    if (args.size() < 3) {
        return UsageError;
    }
    bool ok = false;
    const int serviceId = args.at(1).toInt(&ok);
    const QDateTime localStart = QDateTime::fromString(args.at(2), QStringLiteral("yyyy-MM-dd'T'HH:mm"));
    if (!ok || !localStart.isValid()) {
        return UsageError;
    }
    const QDateTime start(localStart.date(), localStart.time(), service.settings().hours.timeZone);
    const auto appointment = service.bookAppointment(args.at(0), serviceId, start);
    if (!appointment) {
        if (appointment.error() == salon::core::BookingError::UnknownClient) {
            err() << "hint: run \"session " << args.at(0) << "\" first to register the client" << Qt::endl;
        }
        return reportError(appointment.error());
    }
    printAppointment(appointment.value(), service.settings().hours.timeZone);
    return Success;
}

int runCancel(salon::core::BookingService &service, const QStringList &args)
{
    if (args.isEmpty()) {
        return UsageError;
    }
    const QUuid id(QStringLiteral("{%1}").arg(args.at(0)));
    if (id.isNull()) {
        return UsageError;
    }
    const auto appointment = service.cancelAppointment(id);
    if (!appointment) {
        return reportError(appointment.error());
    }
    printAppointment(appointment.value(), service.settings().hours.timeZone);
    return Success;
}

int runSession(salon::core::BookingService &service, const QStringList &args)
{
    if (args.isEmpty()) {
        return UsageError;
    }
    const auto session = service.resolveSession(args.at(0), service.now());
    if (!session) {
        return reportError(session.error());
    }
    const auto context = service.conversationContext(session.value());
    if (!context) {
        return reportError(context.error());
    }
    out() << "session   " << session->token << Qt::endl;
    out() << "client    " << session->client.phone
          << (session->client.hasName() ? QStringLiteral(" (%1)").arg(session->client.name) : QString()) << Qt::endl;
    out() << "salon     " << context->salonName << ", " << context->openingHours << Qt::endl;
    out() << "services  " << context->services.size() << Qt::endl;
    if (!context->previousSummary.isEmpty()) {
        out() << "previous  " << context->previousSummary << Qt::endl;
    }
    const auto appointments = service.clientAppointments(args.at(0));
    if (!appointments) {
        return reportError(appointments.error());
    }
    for (const auto &appointment : appointments.value()) {
        printAppointment(appointment, service.settings().hours.timeZone);
    }
    return Success;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Salon Desk"));
    QCoreApplication::setApplicationName(QStringLiteral("salon-desk"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kSalonDeskVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Front desk for the salon booking ledger."));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                    QStringLiteral("Read settings from <file> (INI)."),
                                    QStringLiteral("file"));
    parser.addOption(configOption);
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("services | availability <yyyy-MM-dd> <serviceId> | "
                                                "book <phone> <serviceId> <yyyy-MM-ddTHH:mm> (after session <phone>) | "
                                                "cancel <uuid> | session <phone>"));
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(UsageError);
    }
    const QString command = args.takeFirst();

    std::unique_ptr<QSettings> settingsStore;
    if (parser.isSet(configOption)) {
        settingsStore = std::make_unique<QSettings>(parser.value(configOption), QSettings::IniFormat);
    } else {
        settingsStore = std::make_unique<QSettings>();
    }
    const auto settings = salon::core::SalonSettings::load(*settingsStore);

    salon::core::AppContext context(settings);
    auto &service = context.bookingService();

    int result = UsageError;
    if (command == QLatin1String("services")) {
        result = runServices(service);
    } else if (command == QLatin1String("availability")) {
        result = runAvailability(service, args);
    } else if (command == QLatin1String("book")) {
        result = runBook(service, args);
    } else if (command == QLatin1String("cancel")) {
        result = runCancel(service, args);
    } else if (command == QLatin1String("session")) {
        result = runSession(service, args);
    }

    if (result == UsageError) {
        err() << "usage: " << parser.helpText() << Qt::endl;
    }
    return result;
}
