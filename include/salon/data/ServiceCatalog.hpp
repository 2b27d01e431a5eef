#pragma once

#include <optional>
#include <vector>

#include "salon/data/Service.hpp"

namespace salon {
namespace data {

class ServiceCatalog
{
public:
    virtual ~ServiceCatalog() = default;

    // Active services only, ordered by id.
    virtual std::vector<Service> fetchServices() const = 0;
    // Inactive services are reported as missing.
    virtual std::optional<Service> findById(ServiceId id) const = 0;
};

} // namespace data
} // namespace salon
