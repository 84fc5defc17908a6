#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "engine/report_config.hpp"

using namespace sheltercontrol;

static bool writeFile(const QString &path, const QByteArray &data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(data) == data.size();
}

template <typename Fn>
static bool throwsInvalidConfig(Fn fn)
{
    try {
        fn();
    } catch (const InvalidConfig &) {
        return true;
    }
    return false;
}

class ReportConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();

    void testDefaults();
    void testPartialJson();
    void testRejectsBadValues();
    void testLoadFromFile();
    void testLoadFailures();
    void testEnvironmentOverrides();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ReportConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ReportConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ReportConfigTests::cleanup()
{
    qunsetenv("SHELTERCONTROL_DETAIL_ROWS");
    qunsetenv("SHELTERCONTROL_LEADERBOARD_SIZE");
}

void ReportConfigTests::testDefaults()
{
    const ReportConfig config = loadReportConfig(QString());
    QCOMPARE(config.detailRowLimit, std::size_t(20));
    QCOMPARE(config.leaderboardSize, std::size_t(10));
    QCOMPARE(config.detailTextWidth, std::size_t(30));
    QCOMPARE(QString::fromStdString(config.defaultShelterName), QStringLiteral("Shelter"));
    QCOMPARE(QString::fromStdString(config.productLabel), QStringLiteral("ShelterControl v1.0"));
}

void ReportConfigTests::testPartialJson()
{
    const auto config = nlohmann::json::parse(
        R"({"leaderboard_size": 5, "default_shelter_name": "Casa Abrigo"})").get<ReportConfig>();
    QCOMPARE(config.leaderboardSize, std::size_t(5));
    QCOMPARE(config.detailRowLimit, std::size_t(20));
    QCOMPARE(QString::fromStdString(config.defaultShelterName), QStringLiteral("Casa Abrigo"));

    const nlohmann::json roundTrip = config;
    QCOMPARE(roundTrip.at("leaderboard_size").get<int>(), 5);
}

void ReportConfigTests::testRejectsBadValues()
{
    QVERIFY(throwsInvalidConfig([] {
        nlohmann::json::parse(R"({"detail_row_limit": 0})").get<ReportConfig>();
    }));
    QVERIFY(throwsInvalidConfig([] {
        nlohmann::json::parse(R"({"leaderboard_size": "ten"})").get<ReportConfig>();
    }));
    QVERIFY(throwsInvalidConfig([] {
        nlohmann::json::parse(R"({"product_label": 3})").get<ReportConfig>();
    }));
    QVERIFY(throwsInvalidConfig([] {
        nlohmann::json::parse("[1, 2]").get<ReportConfig>();
    }));
}

void ReportConfigTests::testLoadFromFile()
{
    const QString path = m_tempDir.path() + "/config.json";
    QVERIFY(writeFile(path, R"({"detail_row_limit": 5, "detail_text_width": 12})"));

    const ReportConfig config = loadReportConfig(path);
    QCOMPARE(config.detailRowLimit, std::size_t(5));
    QCOMPARE(config.detailTextWidth, std::size_t(12));
    QCOMPARE(config.leaderboardSize, std::size_t(10));
}

void ReportConfigTests::testLoadFailures()
{
    const QString missing = m_tempDir.path() + "/missing.json";
    QVERIFY(throwsInvalidConfig([&missing] { loadReportConfig(missing); }));

    const QString broken = m_tempDir.path() + "/broken.json";
    QVERIFY(writeFile(broken, "{not json"));
    QVERIFY(throwsInvalidConfig([&broken] { loadReportConfig(broken); }));
}

void ReportConfigTests::testEnvironmentOverrides()
{
    const QString path = m_tempDir.path() + "/env.json";
    QVERIFY(writeFile(path, R"({"detail_row_limit": 5})"));

    qputenv("SHELTERCONTROL_DETAIL_ROWS", "7");
    qputenv("SHELTERCONTROL_LEADERBOARD_SIZE", "3");
    const ReportConfig config = loadReportConfig(path);
    QCOMPARE(config.detailRowLimit, std::size_t(7));
    QCOMPARE(config.leaderboardSize, std::size_t(3));

    qputenv("SHELTERCONTROL_DETAIL_ROWS", "-1");
    QVERIFY(throwsInvalidConfig([] { loadReportConfig(QString()); }));

    qputenv("SHELTERCONTROL_DETAIL_ROWS", "many");
    QVERIFY(throwsInvalidConfig([] { loadReportConfig(QString()); }));
}

QTEST_MAIN(ReportConfigTests)
#include "test_report_config.moc"
