/*
 * textflow.h — Flows a Report block list into a QTextDocument and
 *              slices it into pages
 *
 * Flow coordinates have a top-left origin and one continuous column the
 * width of the content rect. A PageSlice is the vertical band of that
 * column that lands on one page.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_TEXTFLOW_H
#define VISITREPORT_TEXTFLOW_H

#include <QList>
#include <QTextBlockFormat>
#include <QTextCharFormat>
#include <QTransform>

#include <memory>

#include "pagegeometry.h"
#include "reportdocument.h"
#include "reportmodel.h"

class QPainter;
class QPaintDevice;
class QTextDocument;

namespace Layout {

struct PageSlice {
    qreal top = 0;
    qreal height = 0;
};

struct LineExtent {
    qreal top = 0;
    qreal bottom = 0;
};

class TextFlow
{
public:
    explicit TextFlow(const PageGeometry &geometry);

    // The document measures text against device when given; pass the
    // paint device the pages will be drawn on.
    std::unique_ptr<QTextDocument> build(const QList<Report::Block> &blocks,
                                         const QList<Report::ChartImage> &charts,
                                         QPaintDevice *device = nullptr) const;

    // Every laid out line, in flow order. Inline images are part of the
    // line that holds them.
    static QList<LineExtent> lineExtents(QTextDocument *document);

    // Repeatedly fit whole lines into the content height. Stops early on
    // a zero-length fit (a single line taller than the page).
    QList<PageSlice> paginate(QTextDocument *document) const;

    // Maps flow coordinates of slice to page coordinates.
    QTransform pageTransform(const PageSlice &slice) const;

    void drawSlice(QPainter *painter, QTextDocument *document,
                   const PageSlice &slice) const;

    static QTextCharFormat titleCharFormat();
    static QTextCharFormat headingCharFormat(int level);
    static QTextCharFormat bodyCharFormat();
    static QTextCharFormat metaCharFormat();
    static QTextCharFormat captionCharFormat();

    // Logical point size of the image, else of its chart, else the
    // default chart size; fitted to the page.
    QSizeF imageSize(const Report::ImagePlaceholder &image,
                     const QList<Report::ChartImage> &charts) const;

private:

    PageGeometry m_geometry;
};

} // namespace Layout

#endif // VISITREPORT_TEXTFLOW_H
