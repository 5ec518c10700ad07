#pragma once

#include "core/recognition/recognizer.h"
#include <memory>

namespace rs {

// TesseractRecognizer -- recognises recipe-card text via Tesseract OCR.
//
// When compiled with TESSERACT_FOUND, initialises a Tesseract engine with
// the configured language model and uses Leptonica for image I/O and
// grayscale conversion. Text is read back block by block, line by line.
// Without Tesseract, every call returns EngineUnavailable.
//
// Supported image formats: PNG, JPEG, WebP, BMP, TIFF.
class TesseractRecognizer : public TextRecognizer {
public:
    // Empty tessdataPath = engine default (TESSDATA_PREFIX).
    explicit TesseractRecognizer(const QString& tessdataPath = QString(),
                                 const QString& language = QStringLiteral("eng"));
    ~TesseractRecognizer() override;

    // Non-copyable (owns Tesseract engine state)
    TesseractRecognizer(const TesseractRecognizer&) = delete;
    TesseractRecognizer& operator=(const TesseractRecognizer&) = delete;
    TesseractRecognizer(TesseractRecognizer&&) noexcept;
    TesseractRecognizer& operator=(TesseractRecognizer&&) noexcept;

    RecognitionResult recognize(const QString& imagePath) override;
    bool supports(const QString& extension) const override;

    bool isAvailable() const;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace rs
