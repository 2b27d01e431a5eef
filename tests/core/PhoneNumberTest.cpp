#include <QtTest/QtTest>

#include "salon/core/PhoneNumber.hpp"

using salon::core::normalizePhone;

class PhoneNumberTest : public QObject
{
    Q_OBJECT

private slots:
    void normalizes_data();
    void normalizes();
    void rejects_data();
    void rejects();
    void rejectsMalformedCountryCode();
};

void PhoneNumberTest::normalizes_data()
{
    QTest::addColumn<QString>("raw");
    QTest::addColumn<QString>("expected");

    QTest::newRow("e164") << "+351910000001" << "+351910000001";
    QTest::newRow("spaced") << "+351 910 000 001" << "+351910000001";
    QTest::newRow("double zero") << "00351 910-000-001" << "+351910000001";
    QTest::newRow("national") << "910 000 001" << "+351910000001";
    QTest::newRow("trunk zero") << "0910000001" << "+351910000001";
    QTest::newRow("punctuated") << "(91) 000.0001" << "+351910000001";
    QTest::newRow("other country") << "+44 20 7946 0958" << "+442079460958";
}

void PhoneNumberTest::normalizes()
{
    QFETCH(QString, raw);
    QFETCH(QString, expected);
    const auto phone = normalizePhone(raw, QStringLiteral("351"));
    QVERIFY(phone.has_value());
    QCOMPARE(*phone, expected);
}

void PhoneNumberTest::rejects_data()
{
    QTest::addColumn<QString>("raw");

    QTest::newRow("empty") << "";
    QTest::newRow("letters") << "call me";
    QTest::newRow("too short") << "+3511234";
    QTest::newRow("too long") << "+3519100000011234";
    QTest::newRow("extension") << "+351910000001 ext 2";
    QTest::newRow("arabic-indic digits") << QString::fromUtf8("+\u0663\u0665\u0661\u0669\u0661\u0660\u0660\u0660\u0660\u0660\u0660\u0660\u0661");
    QTest::newRow("fullwidth digits") << QString::fromUtf8("\uFF19\uFF11\uFF10 \uFF10\uFF10\uFF10 \uFF10\uFF10\uFF11");
    QTest::newRow("inner plus") << "351+910000001";
    QTest::newRow("double plus") << "++351910000001";
}

void PhoneNumberTest::rejects()
{
    QFETCH(QString, raw);
    QVERIFY(!normalizePhone(raw, QStringLiteral("351")).has_value());
}

void PhoneNumberTest::rejectsMalformedCountryCode()
{
    QVERIFY(!normalizePhone(QStringLiteral("910000001"), QStringLiteral("+351")).has_value());
    QVERIFY(normalizePhone(QStringLiteral("+351910000001"), QStringLiteral("+351")).has_value());
}

QTEST_GUILESS_MAIN(PhoneNumberTest)
#include "PhoneNumberTest.moc"
