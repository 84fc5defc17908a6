#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>

#include <nlohmann/json.hpp>

#include "common/time_utils.hpp"
#include "engine/report_assembler.hpp"
#include "report/ReportRenderer.hpp"

using namespace sheltercontrol;

namespace {

RawRecordSet recordsWithWarning()
{
    return nlohmann::json::parse(R"({
        "persons": [
            {"id": "p1", "entry_date": "2025-11-18T09:00:00Z", "is_active": true}
        ],
        "donations": [
            {"id": "d1", "donation_date": "2025-11-16T10:00:00Z", "food_type": "Rice",
             "donor_name": "Ana", "quantity_kg": 5}
        ],
        "deliveries": [
            {"id": "e1", "delivery_date": "2025-11-18T14:00:00Z", "quantity_kg": 2,
             "person_name": "Carla", "food_type": "Rice"},
            {"id": "e2", "delivery_date": "not a date", "quantity_kg": 1}
        ]
    })").get<RawRecordSet>();
}

DateWindow window()
{
    return DateWindow{makeUtcDate(2025, 11, 14), makeUtcDate(2025, 11, 21)};
}

} // namespace

class ReportRendererTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testDocumentJson();
    void testMarkdown();
    void testMarkdownWithoutWarnings();
    void testSummaryJson();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ReportRendererTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ReportRendererTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ReportRendererTests::testDocumentJson()
{
    FixedClock clock(makeUtcDate(2025, 11, 21));
    ReportAssembler assembler(clock);
    const ReportDocument document = assembler.buildWeekly(window(), "Casa", recordsWithWarning());
    const nlohmann::json payload = documentToJson(document);

    QCOMPARE(QString::fromStdString(payload.at("kind").get<std::string>()), QStringLiteral("weekly"));
    QCOMPARE(QString::fromStdString(payload.at("title").get<std::string>()),
             QStringLiteral("Weekly Report - Casa"));
    QCOMPARE(QString::fromStdString(payload.at("window").at("start").get<std::string>()),
             QStringLiteral("2025-11-14T00:00:00Z"));
    QCOMPARE(QString::fromStdString(payload.at("generatedAt").get<std::string>()),
             QStringLiteral("2025-11-21T00:00:00Z"));

    const auto &sections = payload.at("sections");
    QCOMPARE(sections.size(), document.sections.size());
    QCOMPARE(QString::fromStdString(sections[0].at("kind").get<std::string>()),
             QStringLiteral("metric_table"));
    QCOMPARE(sections[0].at("header").size(), std::size_t(2));
    QCOMPARE(sections[0].at("rows").size(), std::size_t(8));

    bool sawChart = false;
    bool sawDetail = false;
    for (const auto &section : sections) {
        const std::string kind = section.at("kind").get<std::string>();
        if (kind == "chart") {
            sawChart = true;
            QVERIFY(section.contains("chartKind"));
            QCOMPARE(section.at("labels").size(), section.at("values").size());
        } else if (kind == "detail_table") {
            sawDetail = true;
            QCOMPARE(section.at("limit").get<int>(), 20);
            QCOMPARE(section.at("available").get<int>(), 1);
        }
    }
    QVERIFY(sawChart);
    QVERIFY(sawDetail);

    const auto &diagnostics = payload.at("diagnostics");
    QCOMPARE(diagnostics.at("warningCount").get<int>(), 1);
    QCOMPARE(diagnostics.at("undated").at("deliveries").get<int>(), 1);
    QCOMPARE(QString::fromStdString(diagnostics.at("warnings")[0].at("recordKind").get<std::string>()),
             QStringLiteral("delivery"));
}

void ReportRendererTests::testMarkdown()
{
    FixedClock clock(makeUtcDate(2025, 11, 21));
    ReportAssembler assembler(clock);
    const ReportDocument document = assembler.buildWeekly(window(), "Casa", recordsWithWarning());
    const QString markdown = QString::fromStdString(renderMarkdown(document));

    QVERIFY(markdown.startsWith(QStringLiteral("# Weekly Report - Casa\n")));
    QVERIFY(markdown.contains(QStringLiteral("Period: 14/11/2025 - 21/11/2025")));
    QVERIFY(markdown.contains(QStringLiteral("## Executive Summary")));
    QVERIFY(markdown.contains(QStringLiteral("| Metric | Value |")));
    QVERIFY(markdown.contains(QStringLiteral("| Total deliveries | 2 |")));
    QVERIFY(markdown.contains(QStringLiteral("| **Total** | **1** | **5.0** |")));
    QVERIFY(markdown.contains(QStringLiteral("_line chart: Deliveries by Date_")));
    QVERIFY(markdown.contains(QStringLiteral("| 18/11/2025 | Rice | Carla | 2.0 kg |")));
    QVERIFY(markdown.contains(QStringLiteral("## Data Quality")));
    QVERIFY(markdown.contains(QStringLiteral("deliveries 1")));
    QVERIFY(markdown.endsWith(QStringLiteral("Generated at 21/11/2025 00:00 | ShelterControl v1.0\n")));
}

void ReportRendererTests::testMarkdownWithoutWarnings()
{
    FixedClock clock(makeUtcDate(2025, 11, 21));
    ReportAssembler assembler(clock);
    const ReportDocument document = assembler.buildMonthly(11, 2025, "Casa", RawRecordSet{});
    const QString markdown = QString::fromStdString(renderMarkdown(document));

    QVERIFY(markdown.contains(QStringLiteral("# Monthly Report - Casa")));
    QVERIFY(markdown.contains(QStringLiteral("November 2025")));
    QVERIFY(markdown.contains(QStringLiteral("| No data | 0 | 0.0 |")));
    QVERIFY(!markdown.contains(QStringLiteral("## Data Quality")));
    QVERIFY(!markdown.contains(QStringLiteral("chart:")));
}

void ReportRendererTests::testSummaryJson()
{
    FixedClock clock(makeUtcDate(2025, 11, 21));
    ReportAssembler assembler(clock);

    const nlohmann::json payload =
        summaryToJson(assembler.summarize(window(), recordsWithWarning()));
    QCOMPARE(payload.at("total_persons").get<int>(), 1);
    QCOMPARE(payload.at("total_deliveries").get<int>(), 2);
    QCOMPARE(payload.at("unique_donors").get<int>(), 1);
    QCOMPARE(payload.at("max_days_sheltered").get<int>(), 2);
    QCOMPARE(payload.at("food_types").at("Rice").get<int>(), 1);
    QCOMPARE(payload.at("total_quantity_delivered").get<double>(), 3.0);
    QVERIFY(payload.contains("diagnostics"));

    const nlohmann::json empty = summaryToJson(assembler.summarize(window(), RawRecordSet{}));
    QCOMPARE(empty.at("total_persons").get<int>(), 0);
    QVERIFY(!empty.contains("avg_days_sheltered"));
    QVERIFY(!empty.contains("food_types"));
    QVERIFY(!empty.contains("total_quantity_delivered"));
}

QTEST_MAIN(ReportRendererTests)
#include "test_report_renderer.moc"
