#pragma once

#include <QHash>
#include <QString>
#include <QUuid>

#include "salon/data/Appointment.hpp"
#include "salon/data/Client.hpp"
#include "salon/data/SessionRecord.hpp"

namespace salon {
namespace data {

struct LedgerState
{
    QHash<QString, Client> clients;         // by phone
    QHash<QUuid, Appointment> appointments; // by id
    QHash<QString, SessionRecord> sessions; // by token
};

} // namespace data
} // namespace salon
