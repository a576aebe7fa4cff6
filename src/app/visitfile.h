/*
 * visitfile.h — Visit snapshot read from a JSON file
 *
 * Serves as data source, visibility provider and chart source for the
 * command line front end. Chart images are files next to the JSON file.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_VISITFILE_H
#define VISITREPORT_VISITFILE_H

#include <QDir>
#include <QJsonObject>
#include <QString>

#include "reportsources.h"

class VisitFile : public VisitDataSource,
                  public VisibilityProvider,
                  public ChartRenderer
{
public:
    VisitFile() = default;

    // Returns false with *error set when the file is missing or is not a
    // JSON object.
    bool open(const QString &path, QString *error);

    QString visitId() const;
    Report::VisitKind kind() const;

    bool load(Report::VisitKind kind, const QString &visitId,
              Report::VisitReportData *data, QString *error) override;
    Report::SectionVisibility visibility(const QString &visitId) override;
    QList<Report::ChartImage> render(const Report::GrowthSeries &series,
                                     const QSizeF &logicalSize) override;

    static bool parse(const QJsonObject &root, Report::VisitReportData *data, QString *error);
    static Report::SectionVisibility parseVisibility(const QJsonObject &flags);
    static std::optional<Report::GrowthMetric> metricFromName(const QString &name);

private:
    QJsonObject m_root;
    QDir m_baseDir;
};

#endif // VISITREPORT_VISITFILE_H
