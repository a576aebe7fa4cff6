/*
 * reportdocument.cpp — Block list helpers
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportdocument.h"

#include <type_traits>

namespace Report {

void Document::addHeading(int level, const QString &text)
{
    m_blocks.append(Heading{level, text});
}

void Document::addParagraph(const QString &text, ParagraphRole role,
                            Qt::Alignment alignment)
{
    m_blocks.append(Paragraph{role, alignment, text});
}

void Document::addBullet(const QString &text)
{
    m_blocks.append(BulletItem{text});
}

void Document::addImage(int chartIndex, const QString &caption,
                        const QSizeF &pointSize)
{
    m_blocks.append(ImagePlaceholder{chartIndex, caption, pointSize});
}

void Document::addPageBreak()
{
    m_blocks.append(PageBreak{});
}

int Document::imageCount() const
{
    int count = 0;
    for (const auto &block : m_blocks) {
        if (std::holds_alternative<ImagePlaceholder>(block))
            ++count;
    }
    return count;
}

QList<QList<Block>> Document::segments() const
{
    QList<QList<Block>> result;
    QList<Block> current;
    for (const auto &block : m_blocks) {
        if (std::holds_alternative<PageBreak>(block)) {
            result.append(current);
            current.clear();
            continue;
        }
        current.append(block);
    }
    if (!current.isEmpty() || result.isEmpty())
        result.append(current);
    return result;
}

QStringList Document::textLines() const
{
    QStringList lines;
    for (const auto &block : m_blocks) {
        std::visit([&lines](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, ImagePlaceholder>)
                lines.append(b.caption);
            else if constexpr (!std::is_same_v<T, PageBreak>)
                lines.append(b.text);
        }, block);
    }
    return lines;
}

static QString roleName(ParagraphRole role)
{
    switch (role) {
    case ParagraphRole::Title:   return QStringLiteral("title");
    case ParagraphRole::Meta:    return QStringLiteral("meta");
    case ParagraphRole::Body:    return QStringLiteral("body");
    case ParagraphRole::Caption: return QStringLiteral("caption");
    }
    return QString();
}

QString Document::dump() const
{
    QString out;
    for (const auto &block : m_blocks) {
        std::visit([&out](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Heading>) {
                out += QStringLiteral("H%1 %2\n").arg(b.level).arg(b.text);
            } else if constexpr (std::is_same_v<T, Paragraph>) {
                out += QStringLiteral("P[%1] %2\n").arg(roleName(b.role), b.text);
            } else if constexpr (std::is_same_v<T, BulletItem>) {
                out += QStringLiteral("B %1\n").arg(b.text);
            } else if constexpr (std::is_same_v<T, ImagePlaceholder>) {
                out += QStringLiteral("IMG %1 %2x%3 %4\n")
                           .arg(b.chartIndex)
                           .arg(b.pointSize.width())
                           .arg(b.pointSize.height())
                           .arg(b.caption);
            } else if constexpr (std::is_same_v<T, PageBreak>) {
                out += QStringLiteral("BREAK\n");
            }
        }, block);
    }
    return out;
}

} // namespace Report
