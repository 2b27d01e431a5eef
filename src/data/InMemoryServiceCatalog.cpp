#include "salon/data/InMemoryServiceCatalog.hpp"

#include "salon/core/Logging.hpp"

namespace salon {
namespace data {

InMemoryServiceCatalog::InMemoryServiceCatalog(int granularityMinutes)
    : m_granularityMinutes(granularityMinutes > 0 ? granularityMinutes : 15)
{
}

InMemoryServiceCatalog::InMemoryServiceCatalog(const std::vector<Service> &services, int granularityMinutes)
    : InMemoryServiceCatalog(granularityMinutes)
{
    for (const auto &service : services) {
        addService(service);
    }
}

InMemoryServiceCatalog::~InMemoryServiceCatalog() = default;

std::vector<Service> InMemoryServiceCatalog::fetchServices() const
{
    std::vector<Service> result;
    for (const auto &service : m_services) {
        if (service.active) {
            result.push_back(service);
        }
    }
    return result;
}

std::optional<Service> InMemoryServiceCatalog::findById(ServiceId id) const
{
    const auto it = m_services.constFind(id);
    if (it == m_services.constEnd() || !it->active) {
        return std::nullopt;
    }
    return *it;
}

bool InMemoryServiceCatalog::addService(Service service)
{
    if (service.durationMinutes <= 0 || service.durationMinutes % m_granularityMinutes != 0) {
        qCWarning(lcLedger) << "rejecting service" << service.name << "with duration" << service.durationMinutes
                            << "min, granularity is" << m_granularityMinutes << "min";
        return false;
    }
    if (service.id <= 0) {
        service.id = m_services.isEmpty() ? 1 : m_services.lastKey() + 1;
    }
    m_services.insert(service.id, service);
    return true;
}

std::vector<Service> InMemoryServiceCatalog::allServices() const
{
    return std::vector<Service>(m_services.cbegin(), m_services.cend());
}

std::vector<Service> defaultServices()
{
    auto make = [](ServiceId id, const char *name, const char *description, int minutes, qint64 cents) {
        Service service;
        service.id = id;
        service.name = QString::fromUtf8(name);
        service.description = QString::fromUtf8(description);
        service.durationMinutes = minutes;
        service.priceMinor = cents;
        return service;
    };

    return {
        make(1, "Manicure Básica", "Manicure clássica com verniz", 45, 2300),
        make(2, "Manicure em Gel", "Manicure com verniz gel de longa duração", 60, 3200),
        make(3, "Pedicure Básica", "Pedicure clássica com verniz", 60, 2800),
        make(4, "Pedicure em Gel", "Pedicure com verniz gel de longa duração", 75, 3700),
        make(5, "Nail Art", "Design personalizado de nail art", 90, 4600),
        make(6, "Unhas de Acrílico - Conjunto Completo", "Conjunto completo de unhas de acrílico", 120, 5500),
        make(7, "Preenchimento de Acrílico", "Preenchimento de unhas de acrílico", 90, 3700),
    };
}

} // namespace data
} // namespace salon
