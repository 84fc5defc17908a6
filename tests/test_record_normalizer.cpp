#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/time_utils.hpp"
#include "engine/record_normalizer.hpp"

using namespace sheltercontrol;

namespace {

bool hasWarningFor(const std::vector<NormalizationWarning> &warnings, const std::string &field)
{
    for (const auto &warning : warnings) {
        if (warning.field == field) {
            return true;
        }
    }
    return false;
}

} // namespace

class RecordNormalizerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testPersonComplete();
    void testPersonDefaults();
    void testNonObjectRecord();
    void testDonationCoercion();
    void testDonationBadValues();
    void testDeliveryNestedNames();
    void testDeliveryFlatNamesWin();
    void testDeliveryDefaults();
    void testNormalizeAllOrder();
    void testRecordSetCollections();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void RecordNormalizerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void RecordNormalizerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void RecordNormalizerTests::testPersonComplete()
{
    const auto raw = nlohmann::json::parse(R"({
        "id": "p1",
        "entry_date": "2025-11-18T10:00:00Z",
        "is_active": true
    })");

    const auto result = normalizePerson(raw, 0);
    QVERIFY(result.warnings.empty());
    QCOMPARE(QString::fromStdString(result.record.id), QStringLiteral("p1"));
    QVERIFY(result.record.entryDate.has_value());
    QVERIFY(*result.record.entryDate == makeUtcDate(2025, 11, 18) + std::chrono::hours(10));
    QVERIFY(result.record.isActive);
}

void RecordNormalizerTests::testPersonDefaults()
{
    const auto result = normalizePerson(nlohmann::json::object(), 3);
    QCOMPARE(QString::fromStdString(result.record.id), QStringLiteral("person-3"));
    QVERIFY(!result.record.entryDate.has_value());
    QVERIFY(!result.record.isActive);
    QCOMPARE(result.warnings.size(), std::size_t(1));
    QCOMPARE(QString::fromStdString(result.warnings.front().field), QStringLiteral("entry_date"));
    QCOMPARE(result.warnings.front().index, std::size_t(3));

    // Numeric ids are kept as text; "1" reads as an active flag.
    const auto numeric = normalizePerson(
        nlohmann::json{{"id", 7}, {"entry_date", "2025-11-01"}, {"is_active", "1"}}, 0);
    QCOMPARE(QString::fromStdString(numeric.record.id), QStringLiteral("7"));
    QVERIFY(numeric.record.isActive);
    QVERIFY(numeric.warnings.empty());

    const auto badDate = normalizePerson(nlohmann::json{{"entry_date", "yesterday"}}, 0);
    QVERIFY(!badDate.record.entryDate.has_value());
    QVERIFY(hasWarningFor(badDate.warnings, "entry_date"));
}

void RecordNormalizerTests::testNonObjectRecord()
{
    const auto result = normalizeDonation(nlohmann::json(42), 5);
    QCOMPARE(QString::fromStdString(result.record.id), QStringLiteral("donation-5"));
    QCOMPARE(QString::fromStdString(result.record.foodType), QStringLiteral("Unspecified"));
    QCOMPARE(QString::fromStdString(result.record.donorName), QStringLiteral("Anonymous"));
    QCOMPARE(result.record.quantityKg, 0.0);
    QVERIFY(hasWarningFor(result.warnings, ""));
}

void RecordNormalizerTests::testDonationCoercion()
{
    const auto raw = nlohmann::json::parse(R"({
        "id": "d1",
        "donation_date": "2025-11-16T08:00:00+01:00",
        "food_type": "   ",
        "quantity_kg": "12.5",
        "is_delivered": "false"
    })");

    const auto result = normalizeDonation(raw, 0);
    QVERIFY(result.warnings.empty());
    QCOMPARE(QString::fromStdString(result.record.foodType), QStringLiteral("Unspecified"));
    QCOMPARE(QString::fromStdString(result.record.donorName), QStringLiteral("Anonymous"));
    QCOMPARE(result.record.quantityKg, 12.5);
    QVERIFY(!result.record.isDelivered);
    QVERIFY(*result.record.donationDate == makeUtcDate(2025, 11, 16) + std::chrono::hours(7));

    // Older exports carry "quantity" instead of "quantity_kg".
    const auto legacy = normalizeDonation(nlohmann::json{{"quantity", 4}}, 1);
    QCOMPARE(legacy.record.quantityKg, 4.0);
}

void RecordNormalizerTests::testDonationBadValues()
{
    const auto negative = normalizeDonation(
        nlohmann::json{{"donation_date", "2025-11-16"}, {"quantity_kg", -3}}, 0);
    QCOMPARE(negative.record.quantityKg, 0.0);
    QVERIFY(hasWarningFor(negative.warnings, "quantity_kg"));

    const auto text = normalizeDonation(
        nlohmann::json{{"donation_date", "2025-11-16"}, {"quantity_kg", "lots"}}, 0);
    QCOMPARE(text.record.quantityKg, 0.0);
    QVERIFY(hasWarningFor(text.warnings, "quantity_kg"));

    const auto flag = normalizeDonation(
        nlohmann::json{{"donation_date", "2025-11-16"}, {"is_delivered", "yes"}}, 0);
    QVERIFY(!flag.record.isDelivered);
    QVERIFY(hasWarningFor(flag.warnings, "is_delivered"));

    const auto wrongType = normalizeDonation(
        nlohmann::json{{"donation_date", "2025-11-16"}, {"food_type", 5}}, 0);
    QCOMPARE(QString::fromStdString(wrongType.record.foodType), QStringLiteral("Unspecified"));
    QVERIFY(hasWarningFor(wrongType.warnings, "food_type"));

    // Null is the same as absent and does not warn.
    const auto nulls = normalizeDonation(
        nlohmann::json{{"donation_date", "2025-11-16"}, {"donor_name", nullptr}}, 0);
    QCOMPARE(QString::fromStdString(nulls.record.donorName), QStringLiteral("Anonymous"));
    QVERIFY(nulls.warnings.empty());
}

void RecordNormalizerTests::testDeliveryNestedNames()
{
    const auto raw = nlohmann::json::parse(R"({
        "id": "e1",
        "delivery_date": "2025-11-18",
        "quantity": 2,
        "sheltered_persons": {"full_name": "Ana Lima"},
        "food_donations": {"food_name": "Rice"}
    })");

    const auto result = normalizeDelivery(raw, 0);
    QVERIFY(result.warnings.empty());
    QCOMPARE(QString::fromStdString(result.record.personName), QStringLiteral("Ana Lima"));
    QCOMPARE(QString::fromStdString(result.record.foodType), QStringLiteral("Rice"));
    QCOMPARE(QString::fromStdString(result.record.unit), QStringLiteral("kg"));
    QCOMPARE(result.record.quantityKg, 2.0);

    const auto joined = normalizeDelivery(nlohmann::json::parse(R"({
        "delivery_date": "2025-11-18",
        "person": {"full_name": "Bruno"},
        "donation": {"food_type": "Beans"}
    })"), 1);
    QCOMPARE(QString::fromStdString(joined.record.personName), QStringLiteral("Bruno"));
    QCOMPARE(QString::fromStdString(joined.record.foodType), QStringLiteral("Beans"));
}

void RecordNormalizerTests::testDeliveryFlatNamesWin()
{
    const auto raw = nlohmann::json::parse(R"({
        "delivery_date": "2025-11-18",
        "person_name": "Carla",
        "food_name": "Pasta",
        "unit": "units",
        "sheltered_persons": {"full_name": "Someone Else"},
        "food_donations": {"food_name": "Rice"}
    })");

    const auto result = normalizeDelivery(raw, 0);
    QCOMPARE(QString::fromStdString(result.record.personName), QStringLiteral("Carla"));
    QCOMPARE(QString::fromStdString(result.record.foodType), QStringLiteral("Pasta"));
    QCOMPARE(QString::fromStdString(result.record.unit), QStringLiteral("units"));
}

void RecordNormalizerTests::testDeliveryDefaults()
{
    const auto result = normalizeDelivery(nlohmann::json::object(), 2);
    QCOMPARE(QString::fromStdString(result.record.id), QStringLiteral("delivery-2"));
    QCOMPARE(QString::fromStdString(result.record.personName), QStringLiteral("N/A"));
    QCOMPARE(QString::fromStdString(result.record.foodType), QStringLiteral("N/A"));
    QVERIFY(!result.record.deliveryDate.has_value());
    QCOMPARE(result.warnings.size(), std::size_t(1));

    const auto badNested = normalizeDelivery(
        nlohmann::json{{"delivery_date", "2025-11-18"}, {"sheltered_persons", "Ana"}}, 0);
    QCOMPARE(QString::fromStdString(badNested.record.personName), QStringLiteral("N/A"));
    QVERIFY(hasWarningFor(badNested.warnings, "sheltered_persons"));
}

void RecordNormalizerTests::testNormalizeAllOrder()
{
    RawRecordSet raw;
    raw.persons.push_back(nlohmann::json::object());
    raw.donations.push_back(nlohmann::json{{"donation_date", "2025-11-16"}});
    raw.deliveries.push_back(nlohmann::json{{"delivery_date", "garbage"}});

    const NormalizedRecords result = normalizeAll(raw);
    QCOMPARE(result.persons.size(), std::size_t(1));
    QCOMPARE(result.donations.size(), std::size_t(1));
    QCOMPARE(result.deliveries.size(), std::size_t(1));
    QCOMPARE(result.warnings.size(), std::size_t(2));
    QVERIFY(result.warnings[0].recordKind == RecordKind::Person);
    QVERIFY(result.warnings[1].recordKind == RecordKind::Delivery);
}

void RecordNormalizerTests::testRecordSetCollections()
{
    const auto partial = nlohmann::json::parse(
        R"({"persons": [{"id": "p1"}], "donations": null})").get<RawRecordSet>();
    QCOMPARE(partial.persons.size(), std::size_t(1));
    QVERIFY(partial.donations.empty());
    QVERIFY(partial.deliveries.empty());

    bool thrown = false;
    try {
        nlohmann::json::parse(R"({"deliveries": {"id": "e1"}})").get<RawRecordSet>();
    } catch (const nlohmann::json::type_error &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

QTEST_MAIN(RecordNormalizerTests)
#include "test_record_normalizer.moc"
