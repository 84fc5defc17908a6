#include "engine/report_config.hpp"

#include <QByteArray>
#include <QFile>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace sheltercontrol {

namespace {

std::size_t readLimit(const nlohmann::json &j, const char *key, std::size_t fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    const auto &value = j.at(key);
    if (!value.is_number_integer()) {
        throw InvalidConfig(std::string(key) + " must be an integer");
    }
    const long long limit = value.get<long long>();
    if (limit <= 0) {
        throw InvalidConfig(std::string(key) + " must be positive");
    }
    return static_cast<std::size_t>(limit);
}

std::string readText(const nlohmann::json &j, const char *key, const std::string &fallback)
{
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j.at(key).is_string()) {
        throw InvalidConfig(std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

void applyLimitOverride(const char *name, std::size_t &target)
{
    if (!qEnvironmentVariableIsSet(name)) {
        return;
    }
    bool ok = false;
    const int value = qEnvironmentVariableIntValue(name, &ok);
    if (!ok || value <= 0) {
        throw InvalidConfig(std::string(name) + " must be a positive integer");
    }
    target = static_cast<std::size_t>(value);
}

} // namespace

void from_json(const nlohmann::json &j, ReportConfig &config)
{
    if (!j.is_object()) {
        throw InvalidConfig("configuration must be a JSON object");
    }
    config.detailRowLimit = readLimit(j, "detail_row_limit", config.detailRowLimit);
    config.leaderboardSize = readLimit(j, "leaderboard_size", config.leaderboardSize);
    config.detailTextWidth = readLimit(j, "detail_text_width", config.detailTextWidth);
    config.defaultShelterName =
        readText(j, "default_shelter_name", config.defaultShelterName);
    config.productLabel = readText(j, "product_label", config.productLabel);
}

void to_json(nlohmann::json &j, const ReportConfig &config)
{
    j = nlohmann::json{
        {"detail_row_limit", config.detailRowLimit},
        {"leaderboard_size", config.leaderboardSize},
        {"detail_text_width", config.detailTextWidth},
        {"default_shelter_name", config.defaultShelterName},
        {"product_label", config.productLabel}
    };
}

void applyEnvironmentOverrides(ReportConfig &config)
{
    applyLimitOverride("SHELTERCONTROL_DETAIL_ROWS", config.detailRowLimit);
    applyLimitOverride("SHELTERCONTROL_LEADERBOARD_SIZE", config.leaderboardSize);
}

ReportConfig loadReportConfig(const QString &path)
{
    ReportConfig config;

    if (!path.isEmpty()) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            throw InvalidConfig("cannot open config file " + path.toStdString());
        }
        const QByteArray data = file.readAll();
        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(data.toStdString());
        } catch (const nlohmann::json::parse_error &ex) {
            throw InvalidConfig("config file is not valid JSON: "
                                + std::string(ex.what()));
        }
        from_json(parsed, config);
    }

    applyEnvironmentOverrides(config);

    SCLOG_DEBUG(QStringLiteral("ReportConfig"),
                QStringLiteral("loadReportConfig"),
                QStringLiteral("config_loaded"),
                QStringLiteral("startup"),
                path.isEmpty() ? QStringLiteral("defaults") : QStringLiteral("config_file"),
                logging::defaultWho(),
                QString(),
                nlohmann::json(config));
    return config;
}

} // namespace sheltercontrol
