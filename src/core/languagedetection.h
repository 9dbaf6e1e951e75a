// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "panesync_export.h"
#include <QString>

namespace PaneSync {

/**
 * @brief Editor language detection from file paths
 *
 * Special file names (Makefile, Dockerfile, package.json, ...) are checked
 * first, then the lower-cased extension. Unknown files are "plaintext".
 */
namespace LanguageDetection {

/**
 * @brief Detect the editor language id for a path
 * @param filePath Absolute or relative path; only the file name is inspected
 * @return Language id such as "typescript" or "markdown", never empty
 */
PANESYNC_EXPORT QString detectLanguageFromPath(const QString& filePath);

/**
 * @brief Human-readable name for a language id (for tab tooltips)
 */
PANESYNC_EXPORT QString displayName(const QString& languageId);

} // namespace LanguageDetection
} // namespace PaneSync
