/*
 * bulletnormalizer.h — Idempotent cleanup of bullet-list text blocks
 *
 * Legacy and freshly rendered problem lists share one form: one "• "
 * bullet per line, dash-led milestone lines grouped under a single
 * localized header, duplicates removed (first occurrence wins).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_BULLETNORMALIZER_H
#define VISITREPORT_BULLETNORMALIZER_H

#include <QList>
#include <QString>
#include <QStringList>

namespace BulletNormalizer {

// A paragraph carrying an opaque style tag (e.g. a DOCX style id).
struct StyledLine {
    QString text;
    QString style;

    bool operator==(const StyledLine &other) const
    {
        return text == other.text && style == other.style;
    }
};

// Explicit line separator honored in preference to newlines.
inline const QChar kSeparator = QChar(QChar::ParagraphSeparator);

// Normalize a plain-text block. Output lines are joined with '\n'.
QString normalizeBlock(const QString &text, const QString &milestonesHeader);

// Same rules over a styled paragraph list. Each contiguous run of bullet
// paragraphs is normalized on its own; any other paragraph (a heading,
// plain body text) passes through and ends the run. Inserted header
// lines take the style of the line they precede.
QList<StyledLine> normalizeStyled(const QList<StyledLine> &lines,
                                  const QString &milestonesHeader);

// Split on the separator token if present, else on line breaks.
QStringList splitLines(const QString &text);

// Leading bullet glyphs and surrounding whitespace removed.
QString stripBullet(const QString &line);

// Legacy list markers ("- ", "– ", "• ", ...) removed from the start.
QString stripListMarker(const QString &line);

bool isBulletLine(const QString &line);

// Comparison key used for de-duplication.
QString canonicalKey(const QString &line);

} // namespace BulletNormalizer

#endif // VISITREPORT_BULLETNORMALIZER_H
