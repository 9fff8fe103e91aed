#pragma once

#include <QKeySequence>
#include <QString>
#include <optional>

namespace Glowpoint {
namespace ChordParser {

/**
 * @brief Normalize a chord for comparison: lowercase, no whitespace.
 */
QString normalize(const QString& chord);

/**
 * @brief Parse a configuration chord into a single-combination key sequence.
 *
 * Accepts "<ctrl>+<shift>+s" style tokens as well as Qt portable text
 * ("Ctrl+Shift+S"). Exactly one non-modifier key is required.
 *
 * @return std::nullopt for empty or malformed chords.
 */
std::optional<QKeySequence> parse(const QString& chord);

/**
 * @brief Human readable form, e.g. "<ctrl>+<shift>+s" -> "Ctrl+Shift+S".
 *
 * Unknown tokens are shown with their brackets stripped.
 */
QString formatForDisplay(const QString& chord);

} // namespace ChordParser
} // namespace Glowpoint
