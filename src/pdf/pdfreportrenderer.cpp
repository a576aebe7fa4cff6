/*
 * pdfreportrenderer.cpp — Report documents to PDF via QPdfWriter
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfreportrenderer.h"
#include "textflow.h"

#include <QBuffer>
#include <QDebug>
#include <QPainter>
#include <QPdfWriter>
#include <QTextDocument>

#include <memory>
#include <type_traits>
#include <vector>

static constexpr int kResolution = 72; // 1 device unit == 1 pt

namespace {

struct PageJob {
    int part = -1;
    int segment = -1;
    int document = -1;          // laid out flow document, -1 for none
    Layout::PageSlice slice;
    bool blank = false;
};

void trimPages(QList<PageJob> *pages, PdfReportRenderer::Trim trim)
{
    if (trim == PdfReportRenderer::Trim::LeadingBlank) {
        while (!pages->isEmpty() && pages->first().blank)
            pages->removeFirst();
    } else if (trim == PdfReportRenderer::Trim::TrailingBlank) {
        while (!pages->isEmpty() && pages->last().blank)
            pages->removeLast();
    }
}

} // namespace

PdfReportRenderer::PdfReportRenderer(const PageGeometry &geometry)
    : m_geometry(geometry)
{
}

bool PdfReportRenderer::hasText(const QList<Report::Block> &segment)
{
    for (const auto &block : segment) {
        const bool text = std::visit([](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Report::ImagePlaceholder>)
                return !b.caption.trimmed().isEmpty();
            else if constexpr (std::is_same_v<T, Report::PageBreak>)
                return false;
            else
                return !b.text.trimmed().isEmpty();
        }, block);
        if (text)
            return true;
    }
    return false;
}

QSizeF PdfReportRenderer::chartSize(const Report::ImagePlaceholder &image,
                                    const QList<Report::ChartImage> &charts) const
{
    return Layout::TextFlow(m_geometry).imageSize(image, charts);
}

bool PdfReportRenderer::render(const QList<Part> &parts,
                               const QList<Report::ChartImage> &charts,
                               QByteArray *pdf, QString *error) const
{
    pdf->clear();
    QBuffer buffer(pdf);
    if (!buffer.open(QIODevice::WriteOnly)) {
        *error = QStringLiteral("cannot open PDF buffer");
        return false;
    }

    QPdfWriter writer(&buffer);
    writer.setResolution(kResolution);
    writer.setPageSize(m_geometry.qPageSize());
    writer.setPageMargins(QMarginsF(0, 0, 0, 0), QPageLayout::Point);
    writer.setCreator(m_creator);
    if (!m_title.isEmpty())
        writer.setTitle(m_title);

    // Plan every page first so blank pages can be dropped before drawing
    const Layout::TextFlow flow(m_geometry);
    QList<QList<QList<Report::Block>>> segments;
    std::vector<std::unique_ptr<QTextDocument>> documents;
    QList<PageJob> pages;

    for (int p = 0; p < parts.size(); ++p) {
        const Part &part = parts.at(p);
        segments.append(part.document.segments());
        const QList<QList<Report::Block>> &partSegments = segments.last();

        QList<PageJob> partPages;
        for (int s = 0; s < partSegments.size(); ++s) {
            const QList<Report::Block> &segment = partSegments.at(s);
            PageJob job;
            job.part = p;
            job.segment = s;
            job.blank = !hasText(segment);

            // Each segment starts on a fresh page
            if (segment.isEmpty() || part.kind == PartKind::Charts) {
                partPages.append(job);
                continue;
            }

            documents.push_back(flow.build(segment, charts, &writer));
            job.document = int(documents.size()) - 1;
            const QList<Layout::PageSlice> slices = flow.paginate(documents.back().get());
            for (const Layout::PageSlice &slice : slices) {
                job.slice = slice;
                partPages.append(job);
            }
        }

        trimPages(&partPages, part.trim);
        pages.append(partPages);
    }

    if (pages.isEmpty()) {
        *error = QStringLiteral("no pages left to write");
        return false;
    }

    QPainter painter;
    if (!painter.begin(&writer)) {
        *error = QStringLiteral("cannot open PDF drawing context");
        return false;
    }

    for (int i = 0; i < pages.size(); ++i) {
        if (i > 0)
            writer.newPage();
        const PageJob &job = pages.at(i);
        if (job.document >= 0) {
            flow.drawSlice(&painter, documents.at(job.document).get(), job.slice);
        } else if (parts.at(job.part).kind == PartKind::Charts) {
            drawChartPage(&painter, segments.at(job.part).at(job.segment), charts);
        }
    }

    painter.end();
    return true;
}

bool PdfReportRenderer::renderReport(const Report::Document &body,
                                     const Report::Document &chartsDocument,
                                     const QList<Report::ChartImage> &charts,
                                     QByteArray *pdf, QString *error) const
{
    QList<Part> parts{{body, PartKind::Flowed, Trim::TrailingBlank}};
    if (!chartsDocument.isEmpty())
        parts.append({chartsDocument, PartKind::Charts, Trim::LeadingBlank});
    return render(parts, charts, pdf, error);
}

bool PdfReportRenderer::renderBody(const Report::Document &document,
                                   const QList<Report::ChartImage> &charts,
                                   QByteArray *pdf, QString *error) const
{
    return render({{document, PartKind::Flowed, Trim::None}}, charts, pdf, error);
}

bool PdfReportRenderer::renderCharts(const Report::Document &document,
                                     const QList<Report::ChartImage> &charts,
                                     QByteArray *pdf, QString *error) const
{
    return render({{document, PartKind::Charts, Trim::None}}, charts, pdf, error);
}

// Draws wrapped text at *y and advances it.
static void drawTextBlock(QPainter *painter, const QRectF &content, qreal *y,
                          const QString &text, const QFont &font,
                          Qt::Alignment alignment, qreal spacingAfter)
{
    painter->setFont(font);
    const QRectF area(content.left(), *y, content.width(), content.bottom() - *y);
    QRectF used;
    painter->drawText(area, int(alignment) | Qt::AlignTop | Qt::TextWordWrap, text, &used);
    *y += used.height() + spacingAfter;
}

void PdfReportRenderer::drawChartPage(QPainter *painter,
                                      const QList<Report::Block> &segment,
                                      const QList<Report::ChartImage> &charts) const
{
    const QRectF content = m_geometry.contentRect();
    qreal y = content.top();

    painter->save();
    painter->setPen(Qt::black);

    for (const auto &block : segment) {
        std::visit([&](const auto &b) {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, Report::Heading>) {
                drawTextBlock(painter, content, &y, b.text,
                              Layout::TextFlow::headingCharFormat(b.level).font(),
                              Qt::AlignLeft, 8.0);
            } else if constexpr (std::is_same_v<T, Report::Paragraph>) {
                drawTextBlock(painter, content, &y, b.text,
                              Layout::TextFlow::bodyCharFormat().font(),
                              b.alignment, 6.0);
            } else if constexpr (std::is_same_v<T, Report::BulletItem>) {
                drawTextBlock(painter, content, &y, b.text,
                              Layout::TextFlow::bodyCharFormat().font(),
                              Qt::AlignLeft, 3.0);
            } else if constexpr (std::is_same_v<T, Report::ImagePlaceholder>) {
                drawTextBlock(painter, content, &y, b.caption,
                              Layout::TextFlow::captionCharFormat().font(),
                              Qt::AlignHCenter, 6.0);
                if (b.chartIndex < 0 || b.chartIndex >= charts.size())
                    return;
                const QImage &image = charts.at(b.chartIndex).image;
                if (image.isNull())
                    return;

                QSizeF size = chartSize(b, charts);
                const qreal room = content.bottom() - y;
                if (size.height() > room && room > 0) {
                    qWarning() << "PdfReportRenderer: chart shrunk to fit below its caption";
                    size = QSizeF(size.width() * room / size.height(), room);
                }
                const QRectF target(content.left() + (content.width() - size.width()) / 2.0,
                                    y, size.width(), size.height());
                painter->drawImage(target, image);
                y += size.height() + 6.0;
            } else if constexpr (std::is_same_v<T, Report::PageBreak>) {
            }
        }, block);
    }

    painter->restore();
}
