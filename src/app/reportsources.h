/*
 * reportsources.h — Collaborators that feed an export
 *
 * The controller only sees these interfaces: where visit data, section
 * visibility and chart images come from is up to the caller.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_REPORTSOURCES_H
#define VISITREPORT_REPORTSOURCES_H

#include <QList>
#include <QSizeF>
#include <QString>

#include "reportmodel.h"

class VisitDataSource
{
public:
    virtual ~VisitDataSource() = default;

    // Fresh snapshot of one visit. Returns false with *error set when the
    // visit does not exist or cannot be read.
    virtual bool load(Report::VisitKind kind, const QString &visitId,
                      Report::VisitReportData *data, QString *error) = 0;
};

class VisibilityProvider
{
public:
    virtual ~VisibilityProvider() = default;
    virtual Report::SectionVisibility visibility(const QString &visitId) = 0;
};

class ChartRenderer
{
public:
    virtual ~ChartRenderer() = default;

    // Weight, length/height, head circumference, in that order, for the
    // metrics that have a chart.
    virtual QList<Report::ChartImage> render(const Report::GrowthSeries &series,
                                             const QSizeF &logicalSize) = 0;
};

#endif // VISITREPORT_REPORTSOURCES_H
