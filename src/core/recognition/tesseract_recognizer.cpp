#include "core/recognition/tesseract_recognizer.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QFileInfo>
#include <QSet>

#ifdef TESSERACT_FOUND
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <leptonica/allheaders.h>
#endif

namespace rs {

namespace {

const QSet<QString>& ocrSupportedExtensions()
{
    static const QSet<QString> exts = {
        QStringLiteral("png"),
        QStringLiteral("jpg"),
        QStringLiteral("jpeg"),
        QStringLiteral("webp"),
        QStringLiteral("bmp"),
        QStringLiteral("tiff"),
        QStringLiteral("tif"),
    };
    return exts;
}

} // anonymous namespace

// ── Impl (pimpl) ────────────────────────────────────────────

struct TesseractRecognizer::Impl {
#ifdef TESSERACT_FOUND
    std::unique_ptr<tesseract::TessBaseAPI> api;
    bool initialised = false;

    Impl(const QString& tessdataPath, const QString& language)
    {
        api = std::make_unique<tesseract::TessBaseAPI>();
        const QByteArray pathUtf8 = tessdataPath.toUtf8();
        const QByteArray langUtf8 = language.toUtf8();
        int rc = api->Init(tessdataPath.isEmpty() ? nullptr : pathUtf8.constData(),
                           langUtf8.constData());
        if (rc != 0) {
            LOG_ERROR(rsOcr, "Tesseract Init failed (rc=%d, lang=%s). "
                      "Check TESSDATA_PREFIX and the traineddata file.",
                      rc, langUtf8.constData());
            api.reset();
            initialised = false;
        } else {
            initialised = true;
            LOG_INFO(rsOcr, "Tesseract OCR engine initialised (lang=%s)", langUtf8.constData());
        }
    }

    ~Impl()
    {
        if (api) {
            api->End();
        }
    }
#else
    bool initialised = false;

    Impl(const QString&, const QString&) {}
#endif
};

// ── Construction / destruction ──────────────────────────────

TesseractRecognizer::TesseractRecognizer(const QString& tessdataPath, const QString& language)
    : m_impl(std::make_unique<Impl>(tessdataPath, language))
{
}

TesseractRecognizer::~TesseractRecognizer() = default;

TesseractRecognizer::TesseractRecognizer(TesseractRecognizer&&) noexcept = default;
TesseractRecognizer& TesseractRecognizer::operator=(TesseractRecognizer&&) noexcept = default;

// ── Interface ───────────────────────────────────────────────

bool TesseractRecognizer::supports(const QString& extension) const
{
    return ocrSupportedExtensions().contains(extension.toLower());
}

bool TesseractRecognizer::isAvailable() const
{
    return m_impl && m_impl->initialised;
}

RecognitionResult TesseractRecognizer::recognize(const QString& imagePath)
{
    QElapsedTimer timer;
    timer.start();

    RecognitionResult result;

    // Check file accessibility
    QFileInfo info(imagePath);
    if (!info.exists() || !info.isFile()) {
        result.status = RecognitionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File does not exist or is not a regular file");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    if (!info.isReadable()) {
        result.status = RecognitionResult::Status::Inaccessible;
        result.errorMessage = QStringLiteral("File is not readable");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    if (!supports(info.suffix())) {
        result.status = RecognitionResult::Status::UnsupportedFormat;
        result.errorMessage = QStringLiteral("Unsupported image extension: %1").arg(info.suffix());
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

#ifdef TESSERACT_FOUND
    if (!m_impl || !m_impl->initialised || !m_impl->api) {
        result.status = RecognitionResult::Status::EngineUnavailable;
        result.errorMessage = QStringLiteral("Tesseract engine failed to initialise");
        result.durationMs = static_cast<int>(timer.elapsed());
        return result;
    }

    // Load image via Leptonica
    const QByteArray pathUtf8 = imagePath.toUtf8();
    Pix* image = pixRead(pathUtf8.constData());
    if (!image) {
        result.status = RecognitionResult::Status::UnsupportedFormat;
        result.errorMessage = QStringLiteral("Leptonica failed to read image");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_WARN(rsOcr, "Leptonica pixRead failed: %s", qUtf8Printable(imagePath));
        return result;
    }

    // Convert to grayscale if needed (improves OCR accuracy)
    if (pixGetDepth(image) > 8) {
        Pix* gray = pixConvertRGBToGray(image, 0.0f, 0.0f, 0.0f);  // equal weight
        pixDestroy(&image);
        if (!gray) {
            result.status = RecognitionResult::Status::CorruptedFile;
            result.errorMessage = QStringLiteral("Failed to convert image to grayscale");
            result.durationMs = static_cast<int>(timer.elapsed());
            return result;
        }
        image = gray;
    }

    m_impl->api->SetImage(image);

    if (m_impl->api->Recognize(nullptr) != 0) {
        m_impl->api->Clear();
        pixDestroy(&image);
        result.status = RecognitionResult::Status::CorruptedFile;
        result.errorMessage = QStringLiteral("Tesseract recognition failed");
        result.durationMs = static_cast<int>(timer.elapsed());
        LOG_WARN(rsOcr, "Tesseract Recognize failed: %s", qUtf8Printable(imagePath));
        return result;
    }

    // Walk the layout: a new TextBlock at each block boundary, one line
    // per text line.
    std::unique_ptr<tesseract::ResultIterator> it(m_impl->api->GetIterator());
    if (it) {
        TextBlock current;
        do {
            if (it->IsAtBeginningOf(tesseract::RIL_BLOCK) && !current.lines.empty()) {
                result.document.blocks.push_back(std::move(current));
                current = TextBlock();
            }

            char* lineText = it->GetUTF8Text(tesseract::RIL_TEXTLINE);
            if (lineText) {
                const QString line = QString::fromUtf8(lineText).trimmed();
                delete[] lineText;
                if (!line.isEmpty()) {
                    current.lines.push_back(line);
                }
            }
        } while (it->Next(tesseract::RIL_TEXTLINE));

        if (!current.lines.empty()) {
            result.document.blocks.push_back(std::move(current));
        }
    }

    // Clean up Tesseract state and Leptonica image
    m_impl->api->Clear();
    pixDestroy(&image);

    result.status = RecognitionResult::Status::Success;
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_DEBUG(rsOcr, "OCR recognised %d blocks from %s in %d ms",
              static_cast<int>(result.document.blocks.size()),
              qUtf8Printable(imagePath),
              result.durationMs);

    return result;

#else
    // Tesseract not available
    result.status = RecognitionResult::Status::EngineUnavailable;
    result.errorMessage = QStringLiteral("Text recognition unavailable (Tesseract not found)");
    result.durationMs = static_cast<int>(timer.elapsed());
    LOG_INFO(rsOcr, "Text recognition skipped (no Tesseract): %s",
             qUtf8Printable(imagePath));
    return result;
#endif
}

} // namespace rs
