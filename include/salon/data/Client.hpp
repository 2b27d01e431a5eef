#pragma once

#include <QDateTime>
#include <QString>

namespace salon {
namespace data {

struct Client
{
    QString phone; // E.164, e.g. +351912345678
    QString name;
    QString email;
    QString preferences;
    QDateTime createdAt;

    bool hasName() const { return !name.trimmed().isEmpty(); }
};

} // namespace data
} // namespace salon
