/*
 * exportcontroller.h — One synchronous report export, start to finish
 *
 * load -> visibility -> assemble -> charts -> serialize -> atomic write
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_EXPORTCONTROLLER_H
#define VISITREPORT_EXPORTCONTROLLER_H

#include <QByteArray>
#include <QString>

#include <optional>

#include "exportoptions.h"
#include "reportdocument.h"
#include "reportmodel.h"

class ChartRenderer;
class Localizer;
class ReportAssembler;
class VisibilityProvider;
class VisitDataSource;

enum class ExportFormat {
    Pdf,
    Rtf,
    Docx,
};

struct ExportResult {
    enum class Error {
        None,
        Cancelled,
        DataUnavailable,
        Serialization,
        Packaging,
        Write,
    };

    Error error = Error::None;
    QString message;    // localized, empty on success
    QString path;       // written file, or the offending path on failure

    bool ok() const { return error == Error::None; }
};

class ExportController
{
public:
    ExportController(const ExportOptions &options,
                     VisitDataSource *dataSource,
                     VisibilityProvider *visibility = nullptr,
                     ChartRenderer *charts = nullptr);

    // destination: a file path, an existing directory (the suggested file
    // name is appended), nullopt for the export directory, or an empty
    // string when the user cancelled the destination prompt.
    ExportResult exportReport(Report::VisitKind kind, const QString &visitId,
                              ExportFormat format,
                              const std::optional<QString> &destination = std::nullopt);

    // Everything except the write. *data receives the loaded snapshot.
    ExportResult render(Report::VisitKind kind, const QString &visitId,
                        ExportFormat format, QByteArray *bytes,
                        Report::VisitReportData *data = nullptr);

    QString exportDirectory() const;

    // "<patient>_<visit type>_report_<visit date>"
    static QString suggestedFileStem(const Report::VisitReportData &data);
    static QString sanitizeFileComponent(const QString &text);
    static QString extension(ExportFormat format);
    static std::optional<ExportFormat> formatFromName(const QString &name);

private:
    ExportResult renderPdf(const Report::Document &body, const Report::Document &charts,
                           const QList<Report::ChartImage> &images, const QString &title,
                           QByteArray *bytes) const;
    ExportResult renderRtf(const Report::Document &body, const Report::Document &charts,
                           const QList<Report::ChartImage> &images, QByteArray *bytes) const;
    ExportResult renderDocx(const Report::Document &body, const Report::Document &charts,
                            const QList<Report::ChartImage> &images,
                            const Report::VisitReportData &data,
                            const Localizer &localizer, const ReportAssembler &assembler,
                            QByteArray *bytes) const;
    ExportResult writeAtomically(const QString &path, const QByteArray &bytes) const;

    ExportOptions m_options;
    VisitDataSource *m_dataSource;
    VisibilityProvider *m_visibility;
    ChartRenderer *m_charts;
};

#endif // VISITREPORT_EXPORTCONTROLLER_H
