#include "engine/record_normalizer.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace sheltercontrol {

namespace {

bool isBlank(const std::string &value)
{
    for (const char ch : value) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::string idPrefix(RecordKind kind)
{
    switch (kind) {
    case RecordKind::Person:
        return "person";
    case RecordKind::Donation:
        return "donation";
    case RecordKind::Delivery:
        return "delivery";
    }
    return "record";
}

// Reads fields off one raw record and files a warning for everything it
// has to coerce or default because the value was unusable.
class FieldReader {
public:
    FieldReader(const nlohmann::json &raw, RecordKind kind, std::size_t index,
                std::vector<NormalizationWarning> &warnings)
        : m_raw(raw)
        , m_kind(kind)
        , m_index(index)
        , m_warnings(warnings)
    {
        m_id = readId();
        if (!m_raw.is_object()) {
            warn("", "record is not a JSON object");
        }
    }

    const std::string &id() const
    {
        return m_id;
    }

    std::optional<TimePoint> timestamp(const char *field)
    {
        const nlohmann::json *value = find(m_raw, field);
        if (!value) {
            warn(field, "missing date");
            return std::nullopt;
        }
        if (!value->is_string()) {
            warn(field, "date is not a string");
            return std::nullopt;
        }
        const auto parsed = parseIso8601(value->get<std::string>());
        if (!parsed.has_value()) {
            warn(field, "unparsable date '" + value->get<std::string>() + "'");
        }
        return parsed;
    }

    std::string text(const char *field, const std::string &fallback)
    {
        return optionalText(field).value_or(fallback);
    }

    std::optional<std::string> optionalText(const char *field)
    {
        return textAt(m_raw, field);
    }

    std::optional<std::string> nestedText(const char *object, const char *field)
    {
        const nlohmann::json *nested = find(m_raw, object);
        if (!nested) {
            return std::nullopt;
        }
        if (!nested->is_object()) {
            warn(object, "nested reference is not an object");
            return std::nullopt;
        }
        return textAt(*nested, field, std::string(object) + "." + field);
    }

    bool has(const char *field) const
    {
        return find(m_raw, field) != nullptr;
    }

    double quantity(const char *field)
    {
        const nlohmann::json *value = find(m_raw, field);
        if (!value) {
            return 0.0;
        }

        double amount = 0.0;
        if (value->is_number()) {
            amount = value->get<double>();
        } else if (value->is_string()) {
            const std::string text = value->get<std::string>();
            char *end = nullptr;
            amount = std::strtod(text.c_str(), &end);
            if (end == text.c_str() || !isBlank(end)) {
                warn(field, "non-numeric quantity '" + text + "'");
                return 0.0;
            }
        } else {
            warn(field, "quantity has unsupported type");
            return 0.0;
        }

        if (!std::isfinite(amount)) {
            warn(field, "quantity is not finite");
            return 0.0;
        }
        if (amount < 0.0) {
            warn(field, "negative quantity clamped to 0");
            return 0.0;
        }
        return amount;
    }

    bool flag(const char *field)
    {
        const nlohmann::json *value = find(m_raw, field);
        if (!value) {
            return false;
        }
        if (value->is_boolean()) {
            return value->get<bool>();
        }
        if (value->is_number_integer()) {
            return value->get<long long>() != 0;
        }
        if (value->is_string()) {
            const std::string text = value->get<std::string>();
            if (text == "true" || text == "1") {
                return true;
            }
            if (text == "false" || text == "0") {
                return false;
            }
        }
        warn(field, "unrecognized boolean, defaulting to false");
        return false;
    }

private:
    // Null counts as absent.
    static const nlohmann::json *find(const nlohmann::json &object, const char *field)
    {
        if (!object.is_object()) {
            return nullptr;
        }
        const auto it = object.find(field);
        if (it == object.end() || it->is_null()) {
            return nullptr;
        }
        return &*it;
    }

    std::optional<std::string> textAt(const nlohmann::json &object, const char *field)
    {
        return textAt(object, field, field);
    }

    std::optional<std::string> textAt(const nlohmann::json &object, const char *field,
                                      const std::string &path)
    {
        const nlohmann::json *value = find(object, field);
        if (!value) {
            return std::nullopt;
        }
        if (!value->is_string()) {
            warn(path, "expected a string");
            return std::nullopt;
        }
        const std::string text = value->get<std::string>();
        if (isBlank(text)) {
            return std::nullopt;
        }
        return text;
    }

    std::string readId() const
    {
        const nlohmann::json *value = find(m_raw, "id");
        if (value && value->is_string() && !value->get<std::string>().empty()) {
            return value->get<std::string>();
        }
        if (value && value->is_number_integer()) {
            return std::to_string(value->get<long long>());
        }
        return idPrefix(m_kind) + "-" + std::to_string(m_index);
    }

    void warn(const std::string &field, const std::string &message)
    {
        NormalizationWarning warning;
        warning.recordKind = m_kind;
        warning.recordId = m_id;
        warning.index = m_index;
        warning.field = field;
        warning.message = message;
        m_warnings.push_back(std::move(warning));
    }

    const nlohmann::json &m_raw;
    RecordKind m_kind;
    std::size_t m_index;
    std::vector<NormalizationWarning> &m_warnings;
    std::string m_id;
};

} // namespace

Normalized<ShelteredPerson> normalizePerson(const nlohmann::json &raw, std::size_t index)
{
    Normalized<ShelteredPerson> result;
    FieldReader reader(raw, RecordKind::Person, index, result.warnings);

    result.record.id = reader.id();
    result.record.entryDate = reader.timestamp("entry_date");
    result.record.isActive = reader.flag("is_active");
    return result;
}

Normalized<FoodDonation> normalizeDonation(const nlohmann::json &raw, std::size_t index)
{
    Normalized<FoodDonation> result;
    FieldReader reader(raw, RecordKind::Donation, index, result.warnings);

    FoodDonation &donation = result.record;
    donation.id = reader.id();
    donation.donationDate = reader.timestamp("donation_date");
    donation.foodType = reader.text("food_type", kUnspecifiedLabel);
    donation.donorName = reader.text("donor_name", kAnonymousLabel);
    donation.quantityKg = reader.has("quantity_kg")
        ? reader.quantity("quantity_kg")
        : reader.quantity("quantity");
    donation.isDelivered = reader.flag("is_delivered");
    return result;
}

Normalized<FoodDelivery> normalizeDelivery(const nlohmann::json &raw, std::size_t index)
{
    Normalized<FoodDelivery> result;
    FieldReader reader(raw, RecordKind::Delivery, index, result.warnings);

    FoodDelivery &delivery = result.record;
    delivery.id = reader.id();
    delivery.deliveryDate = reader.timestamp("delivery_date");
    delivery.quantityKg = reader.has("quantity_kg")
        ? reader.quantity("quantity_kg")
        : reader.quantity("quantity");
    delivery.unit = reader.text("unit", kDefaultUnit);

    // Flat labels win; otherwise fall back to the joined person/donation rows.
    std::optional<std::string> person = reader.optionalText("person_name");
    if (!person) {
        person = reader.nestedText("sheltered_persons", "full_name");
    }
    if (!person) {
        person = reader.nestedText("person", "full_name");
    }
    delivery.personName = person.value_or(kNotAvailableLabel);

    std::optional<std::string> food = reader.optionalText("food_type");
    if (!food) {
        food = reader.optionalText("food_name");
    }
    if (!food) {
        food = reader.nestedText("food_donations", "food_name");
    }
    if (!food) {
        food = reader.nestedText("donation", "food_type");
    }
    delivery.foodType = food.value_or(kNotAvailableLabel);
    return result;
}

NormalizedRecords normalizeAll(const RawRecordSet &raw)
{
    NormalizedRecords result;
    result.persons.reserve(raw.persons.size());
    result.donations.reserve(raw.donations.size());
    result.deliveries.reserve(raw.deliveries.size());

    auto absorb = [&result](std::vector<NormalizationWarning> &warnings) {
        for (auto &warning : warnings) {
            result.warnings.push_back(std::move(warning));
        }
    };

    for (std::size_t i = 0; i < raw.persons.size(); ++i) {
        auto normalized = normalizePerson(raw.persons[i], i);
        result.persons.push_back(std::move(normalized.record));
        absorb(normalized.warnings);
    }
    for (std::size_t i = 0; i < raw.donations.size(); ++i) {
        auto normalized = normalizeDonation(raw.donations[i], i);
        result.donations.push_back(std::move(normalized.record));
        absorb(normalized.warnings);
    }
    for (std::size_t i = 0; i < raw.deliveries.size(); ++i) {
        auto normalized = normalizeDelivery(raw.deliveries[i], i);
        result.deliveries.push_back(std::move(normalized.record));
        absorb(normalized.warnings);
    }

    for (const auto &warning : result.warnings) {
        SCLOG_WARN(QStringLiteral("RecordNormalizer"),
                   QStringLiteral("normalizeAll"),
                   QStringLiteral("malformed_record"),
                   QStringLiteral("best_effort_coercion"),
                   QStringLiteral("field_default"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json(warning));
    }

    SCLOG_DEBUG(QStringLiteral("RecordNormalizer"),
                QStringLiteral("normalizeAll"),
                QStringLiteral("normalize_complete"),
                QStringLiteral("report_request"),
                QStringLiteral("field_extraction"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"persons", result.persons.size()},
                                {"donations", result.donations.size()},
                                {"deliveries", result.deliveries.size()},
                                {"warnings", result.warnings.size()}}));
    return result;
}

} // namespace sheltercontrol
