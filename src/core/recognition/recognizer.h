#pragma once

#include "core/shared/types.h"

#include <QString>
#include <optional>

namespace rs {

// Result of a text recognition attempt.
// The document is populated only on Success; an image without any text
// is still a Success with an empty document.
struct RecognitionResult {
    enum class Status {
        Success,
        Inaccessible,
        UnsupportedFormat,
        CorruptedFile,
        EngineUnavailable,
    };

    Status status = Status::EngineUnavailable;
    RecognizedDocument document;
    std::optional<QString> errorMessage;
    int durationMs = 0;
};

QString recognitionStatusToString(RecognitionResult::Status status);

// TextRecognizer -- abstract interface for image-to-text backends.
//
// Implementations return the block/line layout of the image; line order
// within the document is whatever the backend traverses.
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;

    virtual RecognitionResult recognize(const QString& imagePath) = 0;

    // Returns true if this recognizer can read images with the given extension.
    // The extension should be lowercase without a leading dot (e.g. "png").
    virtual bool supports(const QString& extension) const = 0;
};

} // namespace rs
