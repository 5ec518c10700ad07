#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(rsCore, "recipescan.core")
Q_LOGGING_CATEGORY(rsOcr, "recipescan.ocr")
Q_LOGGING_CATEGORY(rsParse, "recipescan.parse")
