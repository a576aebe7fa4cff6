/*
 * pdfreportrenderer.h — Report documents to PDF via QPdfWriter
 *
 * Every part is drawn in one QPdfWriter session, so the text layer and
 * document info of each page are the ones QPdfWriter wrote. Flowed parts
 * go through Layout::TextFlow, one fresh page per segment. Chart parts
 * are drawn directly: one segment per page, headings and summary text
 * on top, then the captioned image.
 *
 * A page whose segment carries no text is blank. Trimming drops blank
 * pages at the start or end of a part before anything is drawn.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_PDFREPORTRENDERER_H
#define VISITREPORT_PDFREPORTRENDERER_H

#include <QByteArray>
#include <QList>
#include <QSizeF>
#include <QString>

#include "pagegeometry.h"
#include "reportdocument.h"
#include "reportmodel.h"

class QPainter;

class PdfReportRenderer
{
public:
    enum class PartKind {
        Flowed,
        Charts,
    };

    enum class Trim {
        None,
        LeadingBlank,
        TrailingBlank,
    };

    struct Part {
        Report::Document document;
        PartKind kind = PartKind::Flowed;
        Trim trim = Trim::None;
    };

    explicit PdfReportRenderer(const PageGeometry &geometry);

    void setDocumentTitle(const QString &title) { m_title = title; }
    void setCreator(const QString &creator) { m_creator = creator; }

    // Draws the parts in order into one PDF. Returns false with *error
    // set when the drawing context cannot be opened or trimming leaves
    // no page at all.
    bool render(const QList<Part> &parts, const QList<Report::ChartImage> &charts,
                QByteArray *pdf, QString *error) const;

    // Body with trailing blank pages dropped, then the charts document
    // with leading blank pages dropped. An empty charts document is
    // skipped.
    bool renderReport(const Report::Document &body, const Report::Document &chartsDocument,
                      const QList<Report::ChartImage> &charts,
                      QByteArray *pdf, QString *error) const;

    // Single untrimmed parts.
    bool renderBody(const Report::Document &document,
                    const QList<Report::ChartImage> &charts,
                    QByteArray *pdf, QString *error) const;
    bool renderCharts(const Report::Document &document,
                      const QList<Report::ChartImage> &charts,
                      QByteArray *pdf, QString *error) const;

    // Size a chart image is drawn at, in points.
    QSizeF chartSize(const Report::ImagePlaceholder &image,
                     const QList<Report::ChartImage> &charts) const;

    static bool hasText(const QList<Report::Block> &segment);

private:
    void drawChartPage(QPainter *painter, const QList<Report::Block> &segment,
                       const QList<Report::ChartImage> &charts) const;

    PageGeometry m_geometry;
    QString m_title;
    QString m_creator{QStringLiteral("VisitReport")};
};

#endif // VISITREPORT_PDFREPORTRENDERER_H
