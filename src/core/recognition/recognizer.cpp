#include "core/recognition/recognizer.h"

namespace rs {

QString recognitionStatusToString(RecognitionResult::Status status)
{
    switch (status) {
    case RecognitionResult::Status::Success:           return QStringLiteral("success");
    case RecognitionResult::Status::Inaccessible:      return QStringLiteral("inaccessible");
    case RecognitionResult::Status::UnsupportedFormat: return QStringLiteral("unsupported_format");
    case RecognitionResult::Status::CorruptedFile:     return QStringLiteral("corrupted_file");
    case RecognitionResult::Status::EngineUnavailable: return QStringLiteral("engine_unavailable");
    }
    return QStringLiteral("unknown");
}

} // namespace rs
