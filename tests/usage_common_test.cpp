#include <QtTest/QtTest>

#include "usage_common.h"

namespace {

QString qs(const std::string& s)
{
    return QString::fromStdString(s);
}

} // namespace

class UsageCommonTest : public QObject {
    Q_OBJECT

private slots:
    void truncatesByCharacter();
    void parsesWholeIntegersOnly();
    void formatsDurations();
    void trimsAndLowers();
};

void UsageCommonTest::truncatesByCharacter()
{
    QCOMPARE(qs(truncate_message("short", 30)), QStringLiteral("short"));
    QCOMPARE(qs(truncate_message("abcdef", 3)), QStringLiteral("abc"));

    // Multi-byte characters count once and are never split.
    const std::string s = "ééééé";
    QCOMPARE(QString::fromStdString(truncate_message(s, 2)), QString::fromUtf8("éé"));
    QCOMPARE(truncate_message(s, 2).size(), size_t(4));
}

void UsageCommonTest::parsesWholeIntegersOnly()
{
    long long v = 0;
    QVERIFY(parse_int_strict("42", &v));
    QCOMPARE(v, 42LL);
    QVERIFY(parse_int_strict("  -7\n", &v));
    QCOMPARE(v, -7LL);
    QVERIFY(!parse_int_strict("", &v));
    QVERIFY(!parse_int_strict("4 2", &v));
    QVERIFY(!parse_int_strict("1e3", &v));
    QVERIFY(!parse_int_strict("99999999999999999999999", &v));
    QVERIFY(!parse_int_strict("12", nullptr));
}

void UsageCommonTest::formatsDurations()
{
    QCOMPARE(qs(format_duration_hm(0)), QStringLiteral("0m"));
    QCOMPARE(qs(format_duration_hm(599)), QStringLiteral("9m"));
    QCOMPARE(qs(format_duration_hm(600)), QStringLiteral("10m"));
    QCOMPARE(qs(format_duration_hm(3600)), QStringLiteral("1h 0m"));
    QCOMPARE(qs(format_duration_hm(5400)), QStringLiteral("1h 30m"));
    QCOMPARE(qs(format_duration_hm(-30)), QStringLiteral("0m"));
}

void UsageCommonTest::trimsAndLowers()
{
    QCOMPARE(qs(trim("  a b \r\n")), QStringLiteral("a b"));
    QCOMPARE(qs(trim("   ")), QString());
    QCOMPARE(qs(to_lower("Anthropic-RateLimit")), QStringLiteral("anthropic-ratelimit"));
}

QTEST_GUILESS_MAIN(UsageCommonTest)
#include "usage_common_test.moc"
