/*
 * rtfutils.h — Shared RTF utility functions
 *
 * Provides escapeText() for 7-bit-safe body text, hexDump() for picture
 * payloads and toTwips() for sizing, used by RtfWriter.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_RTFUTILS_H
#define VISITREPORT_RTFUTILS_H

#include <QByteArray>
#include <QString>
#include <QtMath>

namespace RtfUtils {

/// Escape RTF special characters and fold everything else to 7-bit ASCII.
/// Dashes, bullets, quotes and non-breaking spaces get ASCII stand-ins;
/// any other non-ASCII character becomes '?'. Newlines become \par.
inline QByteArray escapeText(const QString &text)
{
    QByteArray result;
    result.reserve(text.size() + 16);

    for (QChar ch : text) {
        ushort code = ch.unicode();
        if (code == '\\')
            result.append("\\\\");
        else if (code == '{')
            result.append("\\{");
        else if (code == '}')
            result.append("\\}");
        else if (code == '\t')
            result.append("\\tab ");
        else if (code == '\n' || code == 0x2029 || code == 0x2028)
            result.append("\\par\n");
        else if (code == '\r')
            continue;
        else if (code == 0x00A0) // non-breaking space
            result.append(' ');
        else if (code == 0x00AD) // soft hyphen
            continue;
        else if (code == 0x2010 || code == 0x2011 || code == 0x2012
                 || code == 0x2013 || code == 0x2014 || code == 0x2212) // dashes, minus
            result.append('-');
        else if (code == 0x2022 || code == 0x00B7 || code == 0x25E6) // bullets
            result.append('*');
        else if (code == 0x2018 || code == 0x2019) // smart single quotes
            result.append('\'');
        else if (code == 0x201C || code == 0x201D) // smart double quotes
            result.append('"');
        else if (code == 0x2026) // ellipsis
            result.append("...");
        else if (code > 127 || code < 32)
            result.append('?');
        else
            result.append(static_cast<char>(code));
    }

    return result;
}

/// Uppercase hex of raw bytes, wrapped every lineLength bytes.
inline QByteArray hexDump(const QByteArray &data, int lineLength = 64)
{
    QByteArray result;
    result.reserve(data.size() * 2 + data.size() / lineLength + 1);
    for (int i = 0; i < data.size(); ++i) {
        uchar v = data[i];
        result.append("0123456789ABCDEF"[v / 16]);
        result.append("0123456789ABCDEF"[v % 16]);
        if (i % lineLength == lineLength - 1)
            result.append('\n');
    }
    return result;
}

/// Convert points to twips (1 point = 20 twips).
inline int toTwips(qreal points)
{
    return qRound(points * 20.0);
}

/// Convert points to half-points (1 point = 2 half-points).
inline int toHalfPoints(qreal points)
{
    return qRound(points * 2.0);
}

} // namespace RtfUtils

#endif // VISITREPORT_RTFUTILS_H
