/*
 * textflow.cpp — Flows a Report block list into a QTextDocument and
 *                slices it into pages
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textflow.h"

#include <QAbstractTextDocumentLayout>
#include <QDebug>
#include <QFont>
#include <QPainter>
#include <QTextBlock>
#include <QTextCursor>
#include <QTextDocument>
#include <QTextImageFormat>
#include <QTextLayout>
#include <QUrl>

#include <type_traits>

namespace Layout {

static constexpr qreal kEpsilon = 0.01;

TextFlow::TextFlow(const PageGeometry &geometry)
    : m_geometry(geometry)
{
}

QTextCharFormat TextFlow::titleCharFormat()
{
    QTextCharFormat cf;
    cf.setFontPointSize(16.0);
    cf.setFontWeight(QFont::Bold);
    return cf;
}

QTextCharFormat TextFlow::headingCharFormat(int level)
{
    QTextCharFormat cf;
    cf.setFontPointSize(level <= 1 ? 13.0 : 11.0);
    cf.setFontWeight(QFont::Bold);
    return cf;
}

QTextCharFormat TextFlow::bodyCharFormat()
{
    QTextCharFormat cf;
    cf.setFontPointSize(10.0);
    return cf;
}

QTextCharFormat TextFlow::metaCharFormat()
{
    QTextCharFormat cf;
    cf.setFontPointSize(9.0);
    return cf;
}

QTextCharFormat TextFlow::captionCharFormat()
{
    QTextCharFormat cf;
    cf.setFontPointSize(10.0);
    cf.setFontItalic(true);
    return cf;
}

static QTextBlockFormat headingBlockFormat(int level)
{
    QTextBlockFormat bf;
    bf.setHeadingLevel(level);
    bf.setTopMargin(level <= 1 ? 12.0 : 8.0);
    bf.setBottomMargin(4.0);
    return bf;
}

static QTextBlockFormat bodyBlockFormat(Qt::Alignment alignment)
{
    QTextBlockFormat bf;
    bf.setAlignment(alignment);
    bf.setBottomMargin(3.0);
    return bf;
}

QSizeF TextFlow::imageSize(const Report::ImagePlaceholder &image,
                           const QList<Report::ChartImage> &charts) const
{
    const bool known = image.chartIndex >= 0 && image.chartIndex < charts.size();
    QSizeF size = image.pointSize;
    if (size.isEmpty() && known)
        size = charts.at(image.chartIndex).pointSize;
    if (size.isEmpty() && known)
        return m_geometry.chartDisplaySize(charts.at(image.chartIndex).image.size());
    return m_geometry.fitChartSize(size);
}

std::unique_ptr<QTextDocument> TextFlow::build(const QList<Report::Block> &blocks,
                                               const QList<Report::ChartImage> &charts,
                                               QPaintDevice *device) const
{
    auto document = std::make_unique<QTextDocument>();
    if (device)
        document->documentLayout()->setPaintDevice(device);
    document->setDocumentMargin(0);
    document->setUndoRedoEnabled(false);
    document->setTextWidth(m_geometry.contentRect().width());

    QFont base = document->defaultFont();
    base.setPointSizeF(10.0);
    document->setDefaultFont(base);

    QTextCursor cursor(document.get());
    bool first = true;

    auto startBlock = [&](const QTextBlockFormat &bf, const QTextCharFormat &cf) {
        if (first) {
            cursor.setBlockFormat(bf);
            cursor.setBlockCharFormat(cf);
            first = false;
        } else {
            cursor.insertBlock(bf, cf);
        }
        cursor.setCharFormat(cf);
    };

    for (const auto &block : blocks) {
        std::visit([&](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Report::Heading>) {
                const QTextCharFormat cf = headingCharFormat(b.level);
                startBlock(headingBlockFormat(b.level), cf);
                cursor.insertText(b.text, cf);
            } else if constexpr (std::is_same_v<T, Report::Paragraph>) {
                QTextCharFormat cf;
                switch (b.role) {
                case Report::ParagraphRole::Title:   cf = titleCharFormat(); break;
                case Report::ParagraphRole::Meta:    cf = metaCharFormat(); break;
                case Report::ParagraphRole::Caption: cf = captionCharFormat(); break;
                case Report::ParagraphRole::Body:    cf = bodyCharFormat(); break;
                }
                QTextBlockFormat bf = bodyBlockFormat(b.alignment);
                if (b.role == Report::ParagraphRole::Title)
                    bf.setBottomMargin(8.0);
                startBlock(bf, cf);
                cursor.insertText(b.text, cf);
            } else if constexpr (std::is_same_v<T, Report::BulletItem>) {
                QTextBlockFormat bf = bodyBlockFormat(Qt::AlignLeft);
                bf.setLeftMargin(8.0);
                const QTextCharFormat cf = bodyCharFormat();
                startBlock(bf, cf);
                cursor.insertText(b.text, cf);
            } else if constexpr (std::is_same_v<T, Report::ImagePlaceholder>) {
                const QTextCharFormat cf = captionCharFormat();
                startBlock(bodyBlockFormat(Qt::AlignHCenter), cf);
                cursor.insertText(b.caption, cf);

                if (b.chartIndex < 0 || b.chartIndex >= charts.size()
                    || charts.at(b.chartIndex).image.isNull()) {
                    qWarning() << "TextFlow: no image for chart" << b.chartIndex;
                    return;
                }
                const QUrl url(QStringLiteral("chart://%1").arg(b.chartIndex));
                document->addResource(QTextDocument::ImageResource, url,
                                      charts.at(b.chartIndex).image);
                const QSizeF size = imageSize(b, charts);

                startBlock(bodyBlockFormat(Qt::AlignHCenter), bodyCharFormat());
                QTextImageFormat imgFmt;
                imgFmt.setName(url.toString());
                imgFmt.setWidth(size.width());
                imgFmt.setHeight(size.height());
                cursor.insertImage(imgFmt);
            } else if constexpr (std::is_same_v<T, Report::PageBreak>) {
                // Segments are split before they reach the flow
            }
        }, block);
    }

    return document;
}

QList<LineExtent> TextFlow::lineExtents(QTextDocument *document)
{
    QList<LineExtent> extents;
    // Force layout of the whole document
    document->documentLayout()->documentSize();

    for (QTextBlock block = document->begin(); block.isValid(); block = block.next()) {
        const QTextLayout *layout = block.layout();
        if (!layout)
            continue;
        const qreal origin = layout->position().y();
        for (int i = 0; i < layout->lineCount(); ++i) {
            const QTextLine line = layout->lineAt(i);
            const qreal top = origin + line.y();
            extents.append({top, top + line.height()});
        }
    }
    return extents;
}

QList<PageSlice> TextFlow::paginate(QTextDocument *document) const
{
    QList<PageSlice> slices;
    const qreal pageHeight = m_geometry.contentRect().height();
    const qreal total = document->documentLayout()->documentSize().height();
    const QList<LineExtent> lines = lineExtents(document);

    qreal start = 0;
    while (start < total - kEpsilon) {
        const qreal limit = start + pageHeight;
        qreal end = qMin(total, limit);
        for (const LineExtent &line : lines) {
            if (line.top < start - kEpsilon)
                continue;
            if (line.bottom > limit + kEpsilon) {
                end = line.top;
                break;
            }
        }

        const qreal consumed = end - start;
        if (consumed <= kEpsilon) {
            qWarning() << "TextFlow: zero-length fit at" << start << "of" << total;
            break;
        }
        slices.append({start, consumed});
        start = end;
    }
    return slices;
}

QTransform TextFlow::pageTransform(const PageSlice &slice) const
{
    const QRectF content = m_geometry.contentRect();
    return QTransform::fromTranslate(content.left(), content.top() - slice.top);
}

void TextFlow::drawSlice(QPainter *painter, QTextDocument *document,
                         const PageSlice &slice) const
{
    const QRectF clip(0, slice.top, m_geometry.contentRect().width(), slice.height);

    painter->save();
    painter->setTransform(pageTransform(slice), true);
    painter->setClipRect(clip);

    QAbstractTextDocumentLayout::PaintContext ctx;
    ctx.clip = clip;
    ctx.palette.setColor(QPalette::Text, Qt::black);
    document->documentLayout()->draw(painter, ctx);

    painter->restore();
}

} // namespace Layout
