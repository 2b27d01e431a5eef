#include "salon/core/PhoneNumber.hpp"

namespace salon {
namespace core {

std::optional<QString> normalizePhone(const QString &raw, const QString &defaultCountryCode)
{
    const QString trimmed = raw.trimmed();
    QString digits;
    bool international = trimmed.startsWith(QLatin1Char('+'));
    for (int i = international ? 1 : 0; i < trimmed.size(); ++i) {
        const QChar c = trimmed.at(i);
        // ASCII digits only, so each phone has exactly one key.
        if (c >= QLatin1Char('0') && c <= QLatin1Char('9')) {
            digits += c;
        } else if (c == QLatin1Char(' ') || c == QLatin1Char('-') || c == QLatin1Char('.')
                   || c == QLatin1Char('(') || c == QLatin1Char(')')) {
            continue;
        } else {
            return std::nullopt;
        }
    }

    if (!international && digits.startsWith(QLatin1String("00"))) {
        digits = digits.mid(2);
        international = true;
    }
    if (!international) {
        if (digits.startsWith(QLatin1Char('0'))) {
            digits = digits.mid(1);
        }
        digits.prepend(defaultCountryCode);
    }

    if (digits.size() < 8 || digits.size() > 15 || digits.startsWith(QLatin1Char('0'))) {
        return std::nullopt;
    }
    for (const QChar c : digits) {
        if (c < QLatin1Char('0') || c > QLatin1Char('9')) {
            return std::nullopt;
        }
    }
    return QStringLiteral("+") + digits;
}

} // namespace core
} // namespace salon
