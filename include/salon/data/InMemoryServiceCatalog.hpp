#pragma once

#include <QMap>

#include "salon/data/ServiceCatalog.hpp"

namespace salon {
namespace data {

class InMemoryServiceCatalog : public ServiceCatalog
{
public:
    explicit InMemoryServiceCatalog(int granularityMinutes = 15);
    InMemoryServiceCatalog(const std::vector<Service> &services, int granularityMinutes = 15);
    ~InMemoryServiceCatalog() override;

    std::vector<Service> fetchServices() const override;
    std::optional<Service> findById(ServiceId id) const override;

    // Provisioning only. Rejects services whose duration is not a positive
    // multiple of the granularity; a zero id is replaced by the next free id.
    bool addService(Service service);
    std::vector<Service> allServices() const;

private:
    QMap<ServiceId, Service> m_services;
    int m_granularityMinutes = 15;
};

std::vector<Service> defaultServices();

} // namespace data
} // namespace salon
