#pragma once

#include <QString>

#include <optional>

namespace salon {
namespace core {

// Normalizes a phone number to E.164 ("+<country><number>"). Spaces, dashes,
// dots and parentheses are ignored, a leading "00" is read as "+", and numbers
// without an international prefix get defaultCountryCode. Returns nullopt when
// the result would not have 8 to 15 ASCII digits. "+" is accepted only as the
// first character.
std::optional<QString> normalizePhone(const QString &raw, const QString &defaultCountryCode);

} // namespace core
} // namespace salon
