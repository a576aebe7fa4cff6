/*
 * reportdocument.h — Format-neutral block list shared by all serializers
 *
 * The assembler produces a Document; the PDF flow, the RTF writer and
 * the DOCX package all consume the same block order.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_REPORTDOCUMENT_H
#define VISITREPORT_REPORTDOCUMENT_H

#include <QList>
#include <QSizeF>
#include <QString>
#include <QStringList>
#include <Qt>

#include <variant>

namespace Report {

enum class ParagraphRole {
    Title,
    Meta,
    Body,
    Caption,
};

struct Heading {
    int level = 1;              // 1 = section, 2 = sub-heading
    QString text;
};

struct Paragraph {
    ParagraphRole role = ParagraphRole::Body;
    Qt::Alignment alignment = Qt::AlignLeft;
    QString text;
};

struct BulletItem {
    QString text;               // carries its own leading marker
};

struct ImagePlaceholder {
    int chartIndex = -1;        // index into the export's ChartImage list
    QString caption;
    QSizeF pointSize;
};

struct PageBreak {
};

using Block = std::variant<Heading, Paragraph, BulletItem, ImagePlaceholder, PageBreak>;

class Document
{
public:
    void addHeading(int level, const QString &text);
    void addParagraph(const QString &text,
                      ParagraphRole role = ParagraphRole::Body,
                      Qt::Alignment alignment = Qt::AlignLeft);
    void addBullet(const QString &text);
    void addImage(int chartIndex, const QString &caption, const QSizeF &pointSize);
    void addPageBreak();

    const QList<Block> &blocks() const { return m_blocks; }
    bool isEmpty() const { return m_blocks.isEmpty(); }
    int imageCount() const;

    // Content between explicit page breaks. A leading or doubled break
    // yields an empty segment so every segment starts a fresh page.
    QList<QList<Block>> segments() const;

    // Visible text of every block in order: headings, paragraphs,
    // bullets and image captions.
    QStringList textLines() const;

    // Canonical text form, one block per line. Used for comparisons.
    QString dump() const;

private:
    QList<Block> m_blocks;
};

} // namespace Report

#endif // VISITREPORT_REPORTDOCUMENT_H
