#include "salon/data/FileLedgerStorage.hpp"

#include "salon/core/Logging.hpp"

#include <QDate>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>
#include <utility>

namespace salon {
namespace data {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QString withBraces = QStringLiteral("{%1}").arg(value);
    return QUuid(withBraces);
}

bool parseBool(const QString &value)
{
    return value.compare(QLatin1String("TRUE"), Qt::CaseInsensitive) == 0;
}
} // namespace

FileLedgerStorage::FileLedgerStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &FileLedgerStorage::filePath() const
{
    return m_filePath;
}

const LedgerState &FileLedgerStorage::state() const
{
    return m_state;
}

const std::vector<Service> &FileLedgerStorage::services() const
{
    return m_services;
}

bool FileLedgerStorage::save(const LedgerState &state)
{
    QMutexLocker locker(&m_writeMutex);
    LedgerState previous = std::move(m_state);
    m_state = state;
    if (!write()) {
        m_state = std::move(previous);
        return false;
    }
    return true;
}

bool FileLedgerStorage::saveServices(std::vector<Service> services)
{
    QMutexLocker locker(&m_writeMutex);
    std::swap(m_services, services);
    if (!write()) {
        std::swap(m_services, services);
        return false;
    }
    return true;
}

void FileLedgerStorage::load()
{
    m_state = LedgerState{};
    m_services.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(lcLedger) << "cannot open ledger file" << m_filePath << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    enum class Section {
        None,
        Appointment,
        Client,
        Service,
        Session
    };

    Section currentSection = Section::None;
    Appointment currentAppointment;
    bool currentStatusValid = true;
    Client currentClient;
    Service currentService;
    SessionRecord currentSession;

    auto finalizeAppointment = [&]() {
        if (currentAppointment.id.isNull() || !currentAppointment.start.isValid()
            || !currentAppointment.end.isValid()) {
            qCWarning(lcLedger) << "skipping incomplete appointment record in" << m_filePath;
            return;
        }
        if (!currentStatusValid) {
            qCWarning(lcLedger) << "skipping appointment" << currentAppointment.id << "with unknown status in"
                                << m_filePath;
            return;
        }
        m_state.appointments.insert(currentAppointment.id, currentAppointment);
    };

    auto finalizeClient = [&]() {
        if (currentClient.phone.isEmpty()) {
            return;
        }
        m_state.clients.insert(currentClient.phone, currentClient);
    };

    auto finalizeService = [&]() {
        if (currentService.id <= 0 || currentService.durationMinutes <= 0) {
            qCWarning(lcLedger) << "skipping invalid service record" << currentService.name;
            return;
        }
        m_services.push_back(currentService);
    };

    auto finalizeSession = [&]() {
        if (currentSession.clientPhone.isEmpty() || !currentSession.day.isValid()) {
            return;
        }
        currentSession.token = sessionToken(currentSession.clientPhone, currentSession.day);
        m_state.sessions.insert(currentSession.token, currentSession);
    };

    auto handleLine = [&](const QString &line) {
        if (line.startsWith(QLatin1String("BEGIN:"))) {
            const QString kind = line.mid(6);
            if (kind == QLatin1String("VEVENT")) {
                currentSection = Section::Appointment;
                currentAppointment = Appointment{};
                currentAppointment.id = QUuid();
                currentStatusValid = true;
            } else if (kind == QLatin1String("X-CLIENT")) {
                currentSection = Section::Client;
                currentClient = Client{};
            } else if (kind == QLatin1String("X-SERVICE")) {
                currentSection = Section::Service;
                currentService = Service{};
            } else if (kind == QLatin1String("X-SESSION")) {
                currentSection = Section::Session;
                currentSession = SessionRecord{};
            }
            return;
        }
        if (line.startsWith(QLatin1String("END:"))) {
            switch (currentSection) {
            case Section::Appointment:
                finalizeAppointment();
                break;
            case Section::Client:
                finalizeClient();
                break;
            case Section::Service:
                finalizeService();
                break;
            case Section::Session:
                finalizeSession();
                break;
            case Section::None:
                break;
            }
            currentSection = Section::None;
            return;
        }

        if (currentSection == Section::None) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString name = line.left(colonIndex).section(';', 0, 0).toUpper();
        const QString rawValue = line.mid(colonIndex + 1);
        const QString value = decodeText(rawValue);

        if (currentSection == Section::Appointment) {
            if (name == QLatin1String("UID")) {
                currentAppointment.id = parseUid(value);
            } else if (name == QLatin1String("DTSTART")) {
                currentAppointment.start = parseDateTime(rawValue);
            } else if (name == QLatin1String("DTEND")) {
                currentAppointment.end = parseDateTime(rawValue);
            } else if (name == QLatin1String("STATUS")) {
                const auto status = statusFromString(rawValue);
                currentStatusValid = status.has_value();
                if (status) {
                    currentAppointment.status = *status;
                }
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentAppointment.notes = value;
            } else if (name == QLatin1String("CREATED")) {
                currentAppointment.createdAt = parseDateTime(rawValue);
            } else if (name == QLatin1String("X-SALON-CLIENT")) {
                currentAppointment.clientPhone = value;
            } else if (name == QLatin1String("X-SALON-SERVICE")) {
                currentAppointment.serviceId = rawValue.toInt();
            }
            return;
        }

        if (currentSection == Section::Client) {
            if (name == QLatin1String("TEL")) {
                currentClient.phone = value;
            } else if (name == QLatin1String("FN")) {
                currentClient.name = value;
            } else if (name == QLatin1String("EMAIL")) {
                currentClient.email = value;
            } else if (name == QLatin1String("NOTE")) {
                currentClient.preferences = value;
            } else if (name == QLatin1String("CREATED")) {
                currentClient.createdAt = parseDateTime(rawValue);
            }
            return;
        }

        if (currentSection == Section::Service) {
            if (name == QLatin1String("X-ID")) {
                currentService.id = rawValue.toInt();
            } else if (name == QLatin1String("SUMMARY")) {
                currentService.name = value;
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentService.description = value;
            } else if (name == QLatin1String("X-PRICE")) {
                currentService.priceMinor = rawValue.toLongLong();
            } else if (name == QLatin1String("X-CURRENCY")) {
                currentService.currency = value;
            } else if (name == QLatin1String("X-DURATION")) {
                currentService.durationMinutes = rawValue.toInt();
            } else if (name == QLatin1String("X-ACTIVE")) {
                currentService.active = parseBool(rawValue);
            }
            return;
        }

        if (currentSection == Section::Session) {
            if (name == QLatin1String("TEL")) {
                currentSession.clientPhone = value;
            } else if (name == QLatin1String("X-DAY")) {
                currentSession.day = QDate::fromString(rawValue, DATE_FORMAT);
            } else if (name == QLatin1String("DESCRIPTION")) {
                currentSession.summary = value;
            } else if (name == QLatin1String("CREATED")) {
                currentSession.createdAt = parseDateTime(rawValue);
            } else if (name == QLatin1String("X-LAST-SEEN")) {
                currentSession.lastSeen = parseDateTime(rawValue);
            }
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }

    std::sort(m_services.begin(), m_services.end(), [](const Service &lhs, const Service &rhs) {
        return lhs.id < rhs.id;
    });
    qCDebug(lcLedger) << "loaded" << m_state.clients.size() << "clients," << m_state.appointments.size()
                      << "appointments," << m_services.size() << "services from" << m_filePath;
}

bool FileLedgerStorage::write() const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qCWarning(lcLedger) << "cannot open" << m_filePath << "for writing:" << file.errorString();
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//Salon Desk//EN\n";

    for (const Service &service : m_services) {
        stream << "BEGIN:X-SERVICE\n";
        stream << "X-ID:" << service.id << '\n';
        stream << "SUMMARY:" << encodeText(service.name) << '\n';
        if (!service.description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(service.description) << '\n';
        }
        stream << "X-PRICE:" << service.priceMinor << '\n';
        stream << "X-CURRENCY:" << encodeText(service.currency) << '\n';
        stream << "X-DURATION:" << service.durationMinutes << '\n';
        stream << "X-ACTIVE:" << (service.active ? "TRUE" : "FALSE") << '\n';
        stream << "END:X-SERVICE\n";
    }

    auto clients = m_state.clients.values();
    std::sort(clients.begin(), clients.end(), [](const Client &lhs, const Client &rhs) {
        return lhs.phone < rhs.phone;
    });
    for (const Client &client : clients) {
        stream << "BEGIN:X-CLIENT\n";
        stream << "TEL:" << encodeText(client.phone) << '\n';
        if (!client.name.isEmpty()) {
            stream << "FN:" << encodeText(client.name) << '\n';
        }
        if (!client.email.isEmpty()) {
            stream << "EMAIL:" << encodeText(client.email) << '\n';
        }
        if (!client.preferences.isEmpty()) {
            stream << "NOTE:" << encodeText(client.preferences) << '\n';
        }
        if (client.createdAt.isValid()) {
            stream << "CREATED:" << formatDateTime(client.createdAt) << '\n';
        }
        stream << "END:X-CLIENT\n";
    }

    auto appointments = m_state.appointments.values();
    std::sort(appointments.begin(), appointments.end(), [](const Appointment &lhs, const Appointment &rhs) {
        return lhs.start < rhs.start;
    });
    for (const Appointment &appointment : appointments) {
        stream << "BEGIN:VEVENT\n";
        stream << "UID:" << prepareUid(appointment.id) << '\n';
        stream << "DTSTART:" << formatDateTime(appointment.start) << '\n';
        stream << "DTEND:" << formatDateTime(appointment.end) << '\n';
        stream << "STATUS:" << statusToString(appointment.status) << '\n';
        stream << "X-SALON-CLIENT:" << encodeText(appointment.clientPhone) << '\n';
        stream << "X-SALON-SERVICE:" << appointment.serviceId << '\n';
        if (!appointment.notes.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(appointment.notes) << '\n';
        }
        if (appointment.createdAt.isValid()) {
            stream << "CREATED:" << formatDateTime(appointment.createdAt) << '\n';
        }
        stream << "END:VEVENT\n";
    }

    auto sessions = m_state.sessions.values();
    std::sort(sessions.begin(), sessions.end(), [](const SessionRecord &lhs, const SessionRecord &rhs) {
        return lhs.token < rhs.token;
    });
    for (const SessionRecord &session : sessions) {
        stream << "BEGIN:X-SESSION\n";
        stream << "TEL:" << encodeText(session.clientPhone) << '\n';
        stream << "X-DAY:" << session.day.toString(DATE_FORMAT) << '\n';
        if (!session.summary.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(session.summary) << '\n';
        }
        if (session.createdAt.isValid()) {
            stream << "CREATED:" << formatDateTime(session.createdAt) << '\n';
        }
        if (session.lastSeen.isValid()) {
            stream << "X-LAST-SEEN:" << formatDateTime(session.lastSeen) << '\n';
        }
        stream << "END:X-SESSION\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    return file.commit();
}

QString FileLedgerStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileLedgerStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (c != '\\' || i + 1 >= text.size()) {
            decoded += c;
            continue;
        }
        const QChar next = text.at(++i);
        if (next == 'n' || next == 'N') {
            decoded += '\n';
        } else {
            decoded += next;
        }
    }
    return decoded;
}

QString FileLedgerStorage::formatDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return {};
    }
    return dt.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QDateTime FileLedgerStorage::parseDateTime(const QString &value)
{
    QDateTime dt = QDateTime::fromString(value, QLatin1String(DATE_TIME_FORMAT));
    if (dt.isValid()) {
        dt.setTimeSpec(Qt::UTC);
        return dt;
    }
    return QDateTime::fromString(value, Qt::ISODate);
}

} // namespace data
} // namespace salon
