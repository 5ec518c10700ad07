#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace rs {

std::optional<ExtractionSettings> SettingsManager::load()
{
    return loadFrom(settingsFilePath());
}

std::optional<ExtractionSettings> SettingsManager::loadFrom(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rsCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rsCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const ExtractionSettings& settings)
{
    return saveTo(settings, settingsFilePath());
}

bool SettingsManager::saveTo(const ExtractionSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rsCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rsCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rsCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/recipescan/settings.json");
}

QJsonObject SettingsManager::toJson(const ExtractionSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("language"), settings.language);
    json.insert(QStringLiteral("reversedOrderThreshold"), settings.reversedOrderThreshold);
    json.insert(QStringLiteral("suspiciousQuantityThreshold"), settings.suspiciousQuantityThreshold);
    json.insert(QStringLiteral("fuzzyThreshold"), settings.fuzzyThreshold);
    json.insert(QStringLiteral("energyKcalCeiling"), settings.energyKcalCeiling);
    json.insert(QStringLiteral("maxNutritionValue"), settings.maxNutritionValue);
    json.insert(QStringLiteral("minStepTitleLength"), settings.minStepTitleLength);
    json.insert(QStringLiteral("maxStepTitleLength"), settings.maxStepTitleLength);
    json.insert(QStringLiteral("tessdataPath"), settings.tessdataPath);
    json.insert(QStringLiteral("recognitionLanguage"), settings.recognitionLanguage);
    return json;
}

ExtractionSettings SettingsManager::fromJson(const QJsonObject& json)
{
    ExtractionSettings settings;

    settings.language = json.value(QStringLiteral("language")).toString(settings.language);

    settings.reversedOrderThreshold = json.value(QStringLiteral("reversedOrderThreshold"))
                                          .toInt(settings.reversedOrderThreshold);

    settings.suspiciousQuantityThreshold =
        json.value(QStringLiteral("suspiciousQuantityThreshold"))
            .toDouble(settings.suspiciousQuantityThreshold);

    settings.fuzzyThreshold = json.value(QStringLiteral("fuzzyThreshold"))
                                  .toDouble(settings.fuzzyThreshold);

    settings.energyKcalCeiling = json.value(QStringLiteral("energyKcalCeiling"))
                                     .toDouble(settings.energyKcalCeiling);

    settings.maxNutritionValue = json.value(QStringLiteral("maxNutritionValue"))
                                     .toDouble(settings.maxNutritionValue);

    settings.minStepTitleLength = json.value(QStringLiteral("minStepTitleLength"))
                                      .toInt(settings.minStepTitleLength);

    settings.maxStepTitleLength = json.value(QStringLiteral("maxStepTitleLength"))
                                      .toInt(settings.maxStepTitleLength);

    settings.tessdataPath = json.value(QStringLiteral("tessdataPath"))
                                .toString(settings.tessdataPath);

    settings.recognitionLanguage = json.value(QStringLiteral("recognitionLanguage"))
                                       .toString(settings.recognitionLanguage);

    return settings;
}

} // namespace rs
