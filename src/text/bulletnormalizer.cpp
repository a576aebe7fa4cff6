/*
 * bulletnormalizer.cpp — Idempotent cleanup of bullet-list text blocks
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "bulletnormalizer.h"

#include <QRegularExpression>
#include <QSet>

namespace BulletNormalizer {

static const QString kBullet = QStringLiteral("• ");

static bool isBulletGlyph(QChar ch)
{
    return ch == QChar(0x2022)    // •
        || ch == QChar(0x00B7)    // ·
        || ch == QChar(0x25E6);   // ◦
}

static bool isDash(QChar ch)
{
    return ch == QLatin1Char('-')
        || ch == QChar(0x2013)    // en dash
        || ch == QChar(0x2014);   // em dash
}

QStringList splitLines(const QString &text)
{
    QStringList parts;
    if (text.contains(kSeparator)) {
        parts = text.split(kSeparator);
    } else {
        static const QRegularExpression newline(QStringLiteral("\\r\\n|\\r|\\n"));
        parts = text.split(newline);
    }

    QStringList lines;
    for (const QString &p : std::as_const(parts)) {
        const QString t = p.trimmed();
        if (!t.isEmpty())
            lines.append(t);
    }
    return lines;
}

QString stripBullet(const QString &line)
{
    QString t = line.trimmed();
    while (!t.isEmpty() && isBulletGlyph(t.at(0)))
        t = t.mid(1).trimmed();
    return t;
}

QString stripListMarker(const QString &line)
{
    static const QStringList markers = {
        QStringLiteral("• -"), QStringLiteral("•-"), QStringLiteral("- "),
        QStringLiteral("– "), QStringLiteral("— "), QStringLiteral("• "),
        QStringLiteral("· "),
    };
    QString t = line.trimmed();
    bool stripped = true;
    while (stripped) {
        stripped = false;
        for (const QString &m : markers) {
            if (t.startsWith(m)) {
                t = t.mid(m.size()).trimmed();
                stripped = true;
                break;
            }
        }
    }
    return t;
}

static bool startsWithDash(const QString &content)
{
    return !content.isEmpty() && isDash(content.at(0));
}

static QString stripDashRun(const QString &content)
{
    int i = 0;
    while (i < content.size() && isDash(content.at(i)))
        ++i;
    return content.mid(i).trimmed();
}

bool isBulletLine(const QString &line)
{
    const QString t = line.trimmed();
    if (t.isEmpty())
        return false;
    if (isBulletGlyph(t.at(0)))
        return true;
    // "- item" is a legacy bullet; a bare "—" placeholder is not
    return startsWithDash(t) && !stripDashRun(t).isEmpty();
}

QString canonicalKey(const QString &line)
{
    static const QRegularExpression spaces(QStringLiteral("\\s+"));
    QString key = stripBullet(line);
    key.replace(spaces, QStringLiteral(" "));
    key = key.toCaseFolded();

    // "teeth erupted (18 teeth)" -> "teeth erupted (18)"
    static const QRegularExpression trailing(
        QStringLiteral("\\((\\d+)\\s+([^()\\s]+)\\)$"));
    const auto m = trailing.match(key);
    if (m.hasMatch()) {
        const QString before = key.left(m.capturedStart());
        const QRegularExpression word(
            QStringLiteral("\\b%1\\b").arg(QRegularExpression::escape(m.captured(2))));
        if (word.match(before).hasMatch())
            key = before + QLatin1Char('(') + m.captured(1) + QLatin1Char(')');
    }
    return key;
}

// Core rule set over one run of lines.
static QList<StyledLine> normalizeRun(const QList<StyledLine> &run,
                                      const QString &milestonesHeader)
{
    QList<StyledLine> out;
    QSet<QString> seen;
    bool inDashRun = false;

    auto addLine = [&](const QString &content, const QString &style) {
        const QString line = kBullet + content;
        const QString key = canonicalKey(line);
        if (key.isEmpty() || seen.contains(key))
            return;
        seen.insert(key);
        out.append({line, style});
    };

    for (const StyledLine &l : run) {
        const QString content = stripBullet(l.text);
        if (content.isEmpty())
            continue;

        if (startsWithDash(content)) {
            const QString item = stripDashRun(content);
            if (item.isEmpty())
                continue;
            if (!inDashRun) {
                addLine(milestonesHeader, l.style);
                inDashRun = true;
            }
            addLine(item, l.style);
        } else {
            inDashRun = false;
            addLine(content, l.style);
        }
    }
    return out;
}

QString normalizeBlock(const QString &text, const QString &milestonesHeader)
{
    QList<StyledLine> run;
    const QStringList lines = splitLines(text);
    for (const QString &l : lines)
        run.append({l, QString()});

    QStringList out;
    const QList<StyledLine> normalized = normalizeRun(run, milestonesHeader);
    for (const StyledLine &l : normalized)
        out.append(l.text);
    return out.join(QLatin1Char('\n'));
}

QList<StyledLine> normalizeStyled(const QList<StyledLine> &lines,
                                  const QString &milestonesHeader)
{
    QList<StyledLine> out;
    QList<StyledLine> run;

    auto flush = [&]() {
        if (!run.isEmpty())
            out.append(normalizeRun(run, milestonesHeader));
        run.clear();
    };

    for (const StyledLine &l : lines) {
        if (isBulletLine(l.text)) {
            run.append(l);
            continue;
        }
        flush();
        out.append(l);
    }
    flush();
    return out;
}

} // namespace BulletNormalizer
