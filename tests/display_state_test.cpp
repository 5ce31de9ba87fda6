#include <QtTest/QtTest>

#include <cstdlib>
#include <ctime>

#include "display_state.h"
#include "test_support.h"

namespace {

constexpr time_t kNow = 1700000000;  // 2023-11-14 22:13:20 UTC

QString qs(const std::string& s)
{
    return QString::fromStdString(s);
}

} // namespace

class DisplayStateTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void iconThresholds();
    void percentFloors();
    void resetFormatting();
    void snapshotEndToEnd();
    void missingResetsAndStatus();
    void unauthorizedShowsKeyGlyph();
    void httpErrorShowsCode();
    void networkErrorTruncatesMessage();
    void credentialMissingAndPending();
    void updateTimesFollowPollInterval();
    void reducerIsDeterministic();
    void menuLayoutHasStableItems();
};

void DisplayStateTest::initTestCase()
{
    setenv("TZ", "UTC", 1);
    tzset();
}

void DisplayStateTest::iconThresholds()
{
    QCOMPARE(qs(usage_icon(0.0)), qs(kGlyphGreen));
    QCOMPARE(qs(usage_icon(0.49)), qs(kGlyphGreen));
    QCOMPARE(qs(usage_icon(0.50)), qs(kGlyphYellow));
    QCOMPARE(qs(usage_icon(0.79)), qs(kGlyphYellow));
    QCOMPARE(qs(usage_icon(0.80)), qs(kGlyphRed));
    QCOMPARE(qs(usage_icon(1.0)), qs(kGlyphRed));
}

void DisplayStateTest::percentFloors()
{
    QCOMPARE(usage_percent(0.799), 79);
    QCOMPARE(usage_percent(0.45), 45);
    QCOMPARE(usage_percent(0.29), 28);
    QCOMPARE(usage_percent(0.79999999999), 79);
    QCOMPARE(usage_percent(0.0), 0);
    QCOMPARE(usage_percent(1.0), 100);
}

void DisplayStateTest::resetFormatting()
{
    QCOMPARE(qs(format_reset(std::nullopt, kNow)), QStringLiteral("unknown"));
    QCOMPARE(qs(format_reset(int64_t(kNow - 1), kNow)), QStringLiteral("just reset"));
    QCOMPARE(qs(format_reset(int64_t(kNow + 600), kNow)), QStringLiteral("10:23 PM (10m)"));
    QCOMPARE(qs(format_reset(int64_t(kNow + 90 * 60), kNow)), QStringLiteral("11:43 PM (1h 30m)"));

    const QString ten = qs(format_reset(int64_t(kNow + 600), kNow));
    QVERIFY(ten.endsWith(QStringLiteral("(10m)")));
    QVERIFY(!ten.contains(QStringLiteral("h ")));
}

void DisplayStateTest::snapshotEndToEnd()
{
    const UsageSnapshot s = make_snapshot(0.45, 0.85, kNow + 600, kNow + 7200, "allowed");
    const DisplayState d = reduce_display_state(make_success(s), 300, kNow);

    QVERIFY(d.kind == DisplayKind::Usage);
    QCOMPARE(qs(d.title), QString::fromUtf8("🟢🔴 45/85%"));
    QCOMPARE(qs(d.session_text), QStringLiteral("Session (5h): 45%"));
    QCOMPARE(qs(d.weekly_text), QStringLiteral("Weekly (7d): 85%"));
    QVERIFY(qs(d.session_reset_text).endsWith(QStringLiteral("(10m)")));
    QVERIFY(qs(d.weekly_reset_text).endsWith(QStringLiteral("(2h 0m)")));
    QCOMPARE(qs(d.status_line()), QStringLiteral("Status: allowed"));
    QCOMPARE(qs(d.item_text(MenuItemId::Status)), QStringLiteral("Status: allowed"));
}

void DisplayStateTest::missingResetsAndStatus()
{
    const UsageSnapshot s = make_snapshot(0.5, 0.0, std::nullopt, kNow - 5, "unknown");
    const DisplayState d = reduce_display_state(make_success(s), 300, kNow);

    QCOMPARE(qs(d.title), QString::fromUtf8("🟡🟢 50/0%"));
    QCOMPARE(qs(d.session_reset_text), QStringLiteral("  Resets: unknown"));
    QCOMPARE(qs(d.weekly_reset_text), QStringLiteral("  Resets: just reset"));
    QCOMPARE(qs(d.status_text), QStringLiteral("unknown"));
}

void DisplayStateTest::unauthorizedShowsKeyGlyph()
{
    const DisplayState d = reduce_display_state(
        make_failure(FailureKind::Unauthorized, 401, "Unauthorized"), 300, kNow);

    QVERIFY(d.kind == DisplayKind::Unauthorized);
    QCOMPARE(qs(d.title), qs(kGlyphKey));
    QCOMPARE(qs(d.status_text), QStringLiteral("Token expired"));
    QCOMPARE(qs(d.session_text), QStringLiteral("Session (5h): --"));
}

void DisplayStateTest::httpErrorShowsCode()
{
    const DisplayState d = reduce_display_state(
        make_failure(FailureKind::HttpError, 529, "HTTP error: 529"), 300, kNow);

    QVERIFY(d.kind == DisplayKind::Failure);
    QCOMPARE(qs(d.title), qs(kGlyphError));
    QCOMPARE(qs(d.status_line()), QStringLiteral("Status: Error 529"));
}

void DisplayStateTest::networkErrorTruncatesMessage()
{
    const std::string message = "Couldn't resolve host name (Could not resolve host: api.example)";
    const DisplayState d = reduce_display_state(
        make_failure(FailureKind::NetworkError, 0, message), 300, kNow);

    QCOMPARE(qs(d.title), qs(kGlyphError));
    QCOMPARE(d.status_text.size(), size_t(30));
    QCOMPARE(qs(d.status_text), qs(message.substr(0, 30)));

    const DisplayState u = reduce_display_state(
        make_failure(FailureKind::Unknown, 200, "could not convert string to float: 'abc'"), 300, kNow);
    QCOMPARE(qs(u.status_text), QStringLiteral("could not convert string to fl"));
}

void DisplayStateTest::credentialMissingAndPending()
{
    const DisplayState missing = make_credential_missing_state();
    QVERIFY(missing.kind == DisplayKind::CredentialMissing);
    QCOMPARE(qs(missing.title), qs(kGlyphWarning));
    QCOMPARE(qs(missing.status_text), QStringLiteral("Token not set"));
    QCOMPARE(missing.next_refresh_at, time_t(0));

    const DisplayState pending = make_pending_state();
    QVERIFY(pending.kind == DisplayKind::Pending);
    QCOMPARE(qs(pending.title), qs(kGlyphPending));
    QCOMPARE(qs(pending.item_text(MenuItemId::LastUpdate)), QStringLiteral("Last update: --"));
}

void DisplayStateTest::updateTimesFollowPollInterval()
{
    const DisplayState d = reduce_display_state(make_success(UsageSnapshot{}), 60, kNow);
    QCOMPARE(qs(d.last_update_text), QStringLiteral("Last update: 22:13:20"));
    QCOMPARE(qs(d.next_update_text), QStringLiteral("Next update: 22:14:20"));
    QCOMPARE(d.next_refresh_at, time_t(kNow + 60));

    const DisplayState f = reduce_display_state(make_failure(FailureKind::HttpError, 500, ""), 300, kNow);
    QCOMPARE(qs(f.next_update_text), QStringLiteral("Next update: 22:18:20"));
}

void DisplayStateTest::reducerIsDeterministic()
{
    const FetchResult r = make_success(make_snapshot(0.1, 0.9, kNow + 100, std::nullopt, "allowed_warning"));
    QVERIFY(reduce_display_state(r, 300, kNow) == reduce_display_state(r, 300, kNow));
    QVERIFY(reduce_display_state(r, 300, kNow) != reduce_display_state(r, 300, kNow + 1));
}

void DisplayStateTest::menuLayoutHasStableItems()
{
    const std::vector<MenuItemDescriptor> layout = default_menu_layout();
    QVERIFY(!layout.empty());
    QVERIFY(layout.front().id == MenuItemId::Session);
    QVERIFY(layout.back().id == MenuItemId::Quit);

    int refresh_items = 0;
    for (const MenuItemDescriptor& d : layout) {
        if (d.id == MenuItemId::RefreshNow) {
            refresh_items++;
            QVERIFY(d.activatable);
        }
        if (d.id == MenuItemId::Status) {
            QVERIFY(!d.activatable);
        }
    }
    QCOMPARE(refresh_items, 1);
}

QTEST_GUILESS_MAIN(DisplayStateTest)
#include "display_state_test.moc"
