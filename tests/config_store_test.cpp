#include <QtTest/QtTest>
#include <QTemporaryDir>

#include <fstream>
#include <memory>
#include <sys/stat.h>

#include "config_store.h"

namespace {

QString qs(const std::string& s)
{
    return QString::fromStdString(s);
}

void write_file(const std::string& path, const std::string& contents)
{
    std::ofstream out(path, std::ios::trunc);
    out << contents;
}

} // namespace

class ConfigStoreTest : public QObject {
    Q_OBJECT

private slots:
    void init();
    void missingFileUsesDefaults();
    void corruptFileUsesDefaults();
    void nonObjectUsesDefaults();
    void loadsRecognisedKeys();
    void clampsAndIgnoresBadInterval();
    void saveRoundTripsAndKeepsUnknownKeys();
    void saveCreatesPrivateFile();
    void defaultPathHonoursXdg();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
    std::string m_path;
};

void ConfigStoreTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_path = m_dir->filePath(QStringLiteral("config.json")).toStdString();
}

void ConfigStoreTest::missingFileUsesDefaults()
{
    ConfigStore config(m_path);
    QVERIFY(!config.load());
    QVERIFY(!config.has_credential());
    QCOMPARE(config.poll_interval(), kDefaultPollIntervalSeconds);
}

void ConfigStoreTest::corruptFileUsesDefaults()
{
    write_file(m_path, "{\"oauth_token\": \"abc\", ");

    ConfigStore config(m_path);
    QVERIFY(!config.load());
    QVERIFY(!config.has_credential());
    QCOMPARE(config.poll_interval(), 300);
}

void ConfigStoreTest::nonObjectUsesDefaults()
{
    write_file(m_path, "[1, 2, 3]");

    ConfigStore config(m_path);
    QVERIFY(!config.load());
    QVERIFY(!config.has_credential());
}

void ConfigStoreTest::loadsRecognisedKeys()
{
    write_file(m_path, R"({"oauth_token": "sk-ant-oat01-abc", "refresh_interval": 120, "theme": "dark"})");

    ConfigStore config(m_path);
    QVERIFY(config.load());
    QCOMPARE(qs(config.credential()), QStringLiteral("sk-ant-oat01-abc"));
    QCOMPARE(config.poll_interval(), 120);
}

void ConfigStoreTest::clampsAndIgnoresBadInterval()
{
    write_file(m_path, R"({"refresh_interval": 2})");
    ConfigStore low(m_path);
    QVERIFY(low.load());
    QCOMPARE(low.poll_interval(), kMinPollIntervalSeconds);

    write_file(m_path, R"({"refresh_interval": "fast", "oauth_token": 42})");
    ConfigStore bad(m_path);
    QVERIFY(bad.load());
    QCOMPARE(bad.poll_interval(), kDefaultPollIntervalSeconds);
    QVERIFY(!bad.has_credential());
}

void ConfigStoreTest::saveRoundTripsAndKeepsUnknownKeys()
{
    write_file(m_path, R"({"oauth_token": "old", "window": {"x": 10}})");

    ConfigStore config(m_path);
    QVERIFY(config.load());
    config.set_credential(" new-token\n");
    config.set_poll_interval(45);
    QVERIFY(config.save());

    std::ifstream in(m_path);
    const json saved = json::parse(in);
    QCOMPARE(qs(saved.at("oauth_token").get<std::string>()), QStringLiteral("new-token"));
    QCOMPARE(saved.at("refresh_interval").get<int>(), 45);
    QCOMPARE(saved.at("window").at("x").get<int>(), 10);

    ConfigStore reloaded(m_path);
    QVERIFY(reloaded.load());
    QCOMPARE(qs(reloaded.credential()), QStringLiteral("new-token"));
    QCOMPARE(reloaded.poll_interval(), 45);
}

void ConfigStoreTest::saveCreatesPrivateFile()
{
    const std::string nested = m_dir->filePath(QStringLiteral("a/b/config.json")).toStdString();
    ConfigStore config(nested);
    config.set_credential("secret");
    QVERIFY(config.save());

    struct stat st;
    QCOMPARE(stat(nested.c_str(), &st), 0);
    QCOMPARE(int(st.st_mode & 0777), 0600);
    QVERIFY(!QFile::exists(QString::fromStdString(nested + ".tmp")));
}

void ConfigStoreTest::defaultPathHonoursXdg()
{
    const QByteArray old = qgetenv("XDG_CONFIG_HOME");
    qputenv("XDG_CONFIG_HOME", "/tmp/xdg-test");
    QCOMPARE(qs(default_config_path()), QStringLiteral("/tmp/xdg-test/usage-inspector/config.json"));
    if (old.isEmpty()) {
        qunsetenv("XDG_CONFIG_HOME");
    } else {
        qputenv("XDG_CONFIG_HOME", old);
    }
}

QTEST_GUILESS_MAIN(ConfigStoreTest)
#include "config_store_test.moc"
