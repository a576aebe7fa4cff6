/*
 * exportoptions.h — Per-controller export configuration
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_EXPORTOPTIONS_H
#define VISITREPORT_EXPORTOPTIONS_H

#include <QSizeF>
#include <QString>

#include "pagegeometry.h"

struct ExportOptions
{
    PageGeometry geometry;
    QString localeCode{QStringLiteral("en")};
    QString milestoneItemPrefix;
    QString exportDirectory;        // empty = <Documents>/VisitReport/Reports
    QSizeF chartSize;               // empty = derived from geometry
    bool debug = false;

    // Logical size requested from the chart renderer
    QSizeF chartLogicalSize() const
    {
        if (!chartSize.isEmpty())
            return chartSize;
        const qreal w = geometry.chartWidth();
        return QSizeF(w, w * 0.75);
    }
};

#endif // VISITREPORT_EXPORTOPTIONS_H
