/*
 * pagegeometry.h — Physical page and content rectangle, in points
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_PAGEGEOMETRY_H
#define VISITREPORT_PAGEGEOMETRY_H

#include <QPageSize>
#include <QRectF>
#include <QSize>
#include <QSizeF>

#include <algorithm>

struct PageGeometry
{
    QSizeF pageSize{595.0, 842.0};   // A4 portrait
    qreal inset = 36.0;              // uniform margin

    // Widest chart drawn on a page (18 cm)
    static constexpr qreal kMaxChartWidth = 18.0 * 72.0 / 2.54;

    static PageGeometry a4() { return PageGeometry{}; }
    static PageGeometry usLetter() { return PageGeometry{QSizeF(612.0, 792.0), 36.0}; }

    QRectF contentRect() const
    {
        return QRectF(inset, inset,
                      pageSize.width() - 2 * inset,
                      pageSize.height() - 2 * inset);
    }

    QSizeF contentSizePoints() const { return contentRect().size(); }

    QPageSize qPageSize() const
    {
        return QPageSize(pageSize, QPageSize::Point, QString(), QPageSize::ExactMatch);
    }

    qreal chartWidth() const
    {
        return std::min(contentRect().width(), kMaxChartWidth);
    }

    // A requested chart size scaled down to the 18 cm width cap and the
    // content height, aspect ratio preserved. Smaller sizes are kept.
    QSizeF fitChartSize(const QSizeF &size) const
    {
        if (size.isEmpty())
            return QSizeF();
        qreal w = size.width();
        qreal h = size.height();
        if (w > chartWidth()) {
            h = h * chartWidth() / w;
            w = chartWidth();
        }
        const qreal maxH = contentRect().height();
        if (h > maxH) {
            w = w * maxH / h;
            h = maxH;
        }
        return QSizeF(w, h);
    }

    // Default display size for a chart image: content width capped at
    // 18 cm, source aspect ratio preserved, never taller than the content
    // area.
    QSizeF chartDisplaySize(const QSize &pixelSize) const
    {
        if (pixelSize.isEmpty())
            return QSizeF();
        const qreal w = chartWidth();
        return fitChartSize(QSizeF(w, w * pixelSize.height() / pixelSize.width()));
    }
};

#endif // VISITREPORT_PAGEGEOMETRY_H
