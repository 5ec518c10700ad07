#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rs {

// SettingsManager -- JSON save/load for extraction settings.
//
// The default location is:
//   <GenericDataLocation>/recipescan/settings.json
// Keys missing from the file keep their defaults.
class SettingsManager {
public:
    // Load settings from the default path. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<ExtractionSettings> load();
    static std::optional<ExtractionSettings> loadFrom(const QString& filePath);

    // Save settings. Creates the parent directory if it doesn't exist.
    // Returns true on success.
    static bool save(const ExtractionSettings& settings);
    static bool saveTo(const ExtractionSettings& settings, const QString& filePath);

    // Returns the default file path for the settings file.
    static QString settingsFilePath();

    // Convert settings to/from JSON.
    static QJsonObject toJson(const ExtractionSettings& settings);
    static ExtractionSettings fromJson(const QJsonObject& json);
};

} // namespace rs
