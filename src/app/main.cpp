#include "core/extraction/field_dispatcher.h"
#include "core/extraction/patch_serializer.h"
#include "core/matching/edit_distance_matcher.h"
#include "core/recognition/tesseract_recognizer.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "core/terms/term_provider.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QTextStream>

#include <cstdio>
#include <memory>

namespace {

int failUsage(const QCommandLineParser& parser, const QString& message)
{
    QTextStream err(stderr);
    err << message << '\n' << parser.helpText();
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("recipescan"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Reads one recipe field from a photographed recipe card."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("image"), QStringLiteral("Recipe card image."));

    const QCommandLineOption fieldOption(
        QStringLiteral("field"),
        QStringLiteral("Field to read: image, title, description, tags, persons, time, "
                       "preparation, ingredients, nutrition."),
        QStringLiteral("kind"));
    const QCommandLineOption personsOption(
        QStringLiteral("persons"),
        QStringLiteral("Serving count of the recipe form (ingredients are scaled to it)."),
        QStringLiteral("N"));
    const QCommandLineOption langOption(
        QStringLiteral("lang"), QStringLiteral("Term-list language (en, fr, ...)."),
        QStringLiteral("xx"));
    const QCommandLineOption termsOption(
        QStringLiteral("terms"), QStringLiteral("JSON term-list file."),
        QStringLiteral("file"));
    const QCommandLineOption settingsOption(
        QStringLiteral("settings"), QStringLiteral("JSON settings file."),
        QStringLiteral("file"));
    parser.addOption(fieldOption);
    parser.addOption(personsOption);
    parser.addOption(langOption);
    parser.addOption(termsOption);
    parser.addOption(settingsOption);

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        return failUsage(parser, QStringLiteral("Expected exactly one image path."));
    }
    if (!parser.isSet(fieldOption)) {
        return failUsage(parser, QStringLiteral("Missing --field."));
    }

    const rs::RecipeField field = rs::recipeFieldFromString(parser.value(fieldOption));
    if (field == rs::RecipeField::Unknown) {
        return failUsage(parser, QStringLiteral("Unknown field '%1'.")
                                     .arg(parser.value(fieldOption)));
    }

    rs::RecipeFormState state;
    if (parser.isSet(personsOption)) {
        bool ok = false;
        state.persons = parser.value(personsOption).toInt(&ok);
        if (!ok) {
            return failUsage(parser, QStringLiteral("--persons expects an integer."));
        }
    }

    // Settings: explicit file, else the default location, else defaults
    rs::ExtractionSettings settings;
    if (parser.isSet(settingsOption)) {
        const auto loaded = rs::SettingsManager::loadFrom(parser.value(settingsOption));
        if (!loaded.has_value()) {
            return failUsage(parser, QStringLiteral("Cannot read settings file '%1'.")
                                         .arg(parser.value(settingsOption)));
        }
        settings = *loaded;
    } else if (const auto stored = rs::SettingsManager::load()) {
        settings = *stored;
    }
    if (parser.isSet(langOption)) {
        settings.language = parser.value(langOption);
    }

    std::unique_ptr<rs::TermProvider> terms;
    if (parser.isSet(termsOption)) {
        auto loaded = rs::JsonTermProvider::loadFrom(parser.value(termsOption));
        if (!loaded.has_value()) {
            return failUsage(parser, QStringLiteral("Cannot read term file '%1'.")
                                         .arg(parser.value(termsOption)));
        }
        terms = std::make_unique<rs::JsonTermProvider>(std::move(*loaded));
    } else {
        terms = std::make_unique<rs::BuiltinTermProvider>();
    }

    LOG_INFO(rsCore, "Reading %s from %s (language %s)",
             qUtf8Printable(rs::recipeFieldToString(field)),
             qUtf8Printable(positional.front()),
             qUtf8Printable(settings.language));

    rs::FieldDispatcher dispatcher(
        std::make_unique<rs::TesseractRecognizer>(settings.tessdataPath,
                                                  settings.recognitionLanguage),
        std::move(terms),
        std::make_unique<rs::EditDistanceMatcher>(),
        settings);

    // Warnings are reported in the JSON output
    const rs::ExtractionOutcome outcome =
        dispatcher.extract(positional.front(), field, state, [](const QString&) {});

    QTextStream out(stdout);
    out << QJsonDocument(rs::PatchSerializer::toJson(outcome)).toJson(QJsonDocument::Indented);
    return 0;
}
