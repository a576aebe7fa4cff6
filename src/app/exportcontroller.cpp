#include "exportcontroller.h"
#include "docxpackage.h"
#include "localizer.h"
#include "pdfinspector.h"
#include "pdfreportrenderer.h"
#include "reportassembler.h"
#include "reportdates.h"
#include "reportsources.h"
#include "rtfwriter.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <QStandardPaths>

#include <KLocalizedString>

using namespace Report;

static ExportResult failure(ExportResult::Error error, const QString &message,
                            const QString &path = QString())
{
    ExportResult result;
    result.error = error;
    result.message = message;
    result.path = path;
    return result;
}

ExportController::ExportController(const ExportOptions &options,
                                   VisitDataSource *dataSource,
                                   VisibilityProvider *visibility,
                                   ChartRenderer *charts)
    : m_options(options)
    , m_dataSource(dataSource)
    , m_visibility(visibility)
    , m_charts(charts)
{
}

QString ExportController::exportDirectory() const
{
    if (!m_options.exportDirectory.isEmpty())
        return m_options.exportDirectory;
    return QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation)
           + QStringLiteral("/VisitReport/Reports");
}

QString ExportController::extension(ExportFormat format)
{
    switch (format) {
    case ExportFormat::Pdf:  return QStringLiteral("pdf");
    case ExportFormat::Rtf:  return QStringLiteral("rtf");
    case ExportFormat::Docx: return QStringLiteral("docx");
    }
    return QString();
}

std::optional<ExportFormat> ExportController::formatFromName(const QString &name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("pdf"))
        return ExportFormat::Pdf;
    if (n == QLatin1String("rtf"))
        return ExportFormat::Rtf;
    if (n == QLatin1String("docx"))
        return ExportFormat::Docx;
    return std::nullopt;
}

QString ExportController::sanitizeFileComponent(const QString &text)
{
    QString out;
    out.reserve(text.size());
    for (QChar ch : text.trimmed()) {
        switch (ch.unicode()) {
        case ':': case '/': case '\\': case '*': case '?':
        case '"': case '<': case '>': case '|':
        case '\n': case '\r': case '\t':
            out.append(QLatin1Char('-'));
            break;
        case ' ':
            out.append(QLatin1Char('_'));
            break;
        default:
            out.append(ch);
        }
    }
    return out;
}

QString ExportController::suggestedFileStem(const VisitReportData &data)
{
    QString patient = data.meta.name.trimmed();
    if (patient.isEmpty())
        patient = data.meta.alias.trimmed();
    if (patient.isEmpty())
        patient = QStringLiteral("patient");

    QString visitType;
    if (data.meta.visitTypeReadable && !data.meta.visitTypeReadable->trimmed().isEmpty())
        visitType = data.meta.visitTypeReadable->trimmed().toLower();
    else
        visitType = data.kind == VisitKind::Well ? QStringLiteral("well") : QStringLiteral("sick");

    QString date = data.meta.visitDateISO.trimmed().left(10);
    if (date.isEmpty())
        date = QStringLiteral("undated");

    return sanitizeFileComponent(patient) + QLatin1Char('_')
         + sanitizeFileComponent(visitType) + QStringLiteral("_report_")
         + sanitizeFileComponent(date);
}

ExportResult ExportController::renderPdf(const Document &body, const Document &charts,
                                         const QList<ChartImage> &images, const QString &title,
                                         QByteArray *bytes) const
{
    PdfReportRenderer renderer(m_options.geometry);
    renderer.setDocumentTitle(title);

    QString error;
    if (!renderer.renderReport(body, charts, images, bytes, &error))
        return failure(ExportResult::Error::Serialization,
                       i18n("PDF export failed: %1", error));

    // Read the result back; an unreadable page fails the export
    const QList<int> blank = PdfInspector::blankPages(*bytes, QStringLiteral("report"), &error);
    if (!error.isEmpty())
        return failure(ExportResult::Error::Serialization,
                       i18n("PDF export failed: %1", error));

    if (m_options.debug)
        qDebug() << "ExportController: PDF pages" << PdfInspector::pageCount(*bytes)
                 << "blank" << blank;
    return {};
}

ExportResult ExportController::renderRtf(const Document &body, const Document &charts,
                                         const QList<ChartImage> &images,
                                         QByteArray *bytes) const
{
    RtfWriter writer(m_options.geometry);
    writer.begin();
    writer.appendDocument(body, images);
    if (!charts.isEmpty())
        writer.appendDocument(charts, images);
    *bytes = writer.finish();

    if (!writer.errorString().isEmpty())
        return failure(ExportResult::Error::Serialization,
                       i18n("RTF export failed: %1", writer.errorString()));
    if (writer.skippedCharts() > 0)
        qWarning() << "ExportController:" << writer.skippedCharts() << "chart(s) left out of RTF";
    return {};
}

ExportResult ExportController::renderDocx(const Document &body, const Document &charts,
                                          const QList<ChartImage> &images,
                                          const VisitReportData &data,
                                          const Localizer &localizer,
                                          const ReportAssembler &assembler,
                                          QByteArray *bytes) const
{
    Docx::PackageBuilder builder(localizer, assembler.sectionHeadingLabels(),
                                 m_options.geometry);

    Docx::PackageInfo info;
    info.creator = data.meta.clinicianName.trimmed().isEmpty()
        ? QStringLiteral("VisitReport") : data.meta.clinicianName.trimmed();
    const auto generated = ReportDates::parseDateTime(data.meta.generatedAtISO);
    info.created = generated ? *generated : QDateTime::currentDateTime();
    info.modified = info.created;

    QList<Document> documents{body};
    if (!charts.isEmpty())
        documents.append(charts);

    QString errorPath;
    if (!builder.build(documents, images, info, bytes, &errorPath))
        return failure(ExportResult::Error::Packaging,
                       i18n("Could not package the document: %1", errorPath), errorPath);
    return {};
}

ExportResult ExportController::render(VisitKind kind, const QString &visitId,
                                      ExportFormat format, QByteArray *bytes,
                                      VisitReportData *loaded)
{
    VisitReportData data;
    QString error;
    if (!m_dataSource || !m_dataSource->load(kind, visitId, &data, &error))
        return failure(ExportResult::Error::DataUnavailable,
                       i18n("Visit %1 could not be loaded: %2", visitId, error));
    data.kind = kind;
    if (data.meta.generatedAtISO.isEmpty())
        data.meta.generatedAtISO = QDateTime::currentDateTime().toString(Qt::ISODate);

    SectionVisibility visibility;
    if (kind == VisitKind::Well && m_visibility)
        visibility = m_visibility->visibility(visitId);

    Localizer localizer(m_options.localeCode);
    ReportAssembler assembler(localizer, m_options.milestoneItemPrefix);
    const Document body = assembler.assembleBody(data, visibility);

    // Charts are requested fresh for every export
    QList<ChartImage> images;
    Document charts;
    if (kind == VisitKind::Well && data.growth && !data.growth->isEmpty() && m_charts) {
        images = m_charts->render(*data.growth, m_options.chartLogicalSize());
        // One logical size per chart, shared by all three formats
        for (ChartImage &image : images) {
            image.pointSize = image.pointSize.isEmpty()
                ? m_options.geometry.chartDisplaySize(image.image.size())
                : m_options.geometry.fitChartSize(image.pointSize);
        }
        charts = assembler.assembleCharts(*data.growth, images);
    }

    if (m_options.debug)
        qDebug() << "ExportController: visit" << visitId << "blocks" << body.blocks().size()
                 << "charts" << images.size();

    ExportResult result;
    switch (format) {
    case ExportFormat::Pdf:
        result = renderPdf(body, charts, images, assembler.reportTitle(body), bytes);
        break;
    case ExportFormat::Rtf:
        result = renderRtf(body, charts, images, bytes);
        break;
    case ExportFormat::Docx:
        result = renderDocx(body, charts, images, data, localizer, assembler, bytes);
        break;
    }

    if (loaded)
        *loaded = data;
    return result;
}

ExportResult ExportController::writeAtomically(const QString &path, const QByteArray &bytes) const
{
    QDir().mkpath(QFileInfo(path).absolutePath());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return failure(ExportResult::Error::Write,
                       i18n("Could not open %1 for writing: %2", path, file.errorString()), path);
    if (file.write(bytes) != bytes.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        return failure(ExportResult::Error::Write,
                       i18n("Could not write %1: %2", path, reason), path);
    }
    if (!file.commit())
        return failure(ExportResult::Error::Write,
                       i18n("Could not save %1: %2", path, file.errorString()), path);

    ExportResult result;
    result.path = path;
    return result;
}

ExportResult ExportController::exportReport(VisitKind kind, const QString &visitId,
                                            ExportFormat format,
                                            const std::optional<QString> &destination)
{
    if (destination && destination->trimmed().isEmpty())
        return failure(ExportResult::Error::Cancelled, i18n("Export cancelled."));

    QByteArray bytes;
    VisitReportData data;
    const ExportResult rendered = render(kind, visitId, format, &bytes, &data);
    if (!rendered.ok())
        return rendered;

    const QString fileName = suggestedFileStem(data) + QLatin1Char('.') + extension(format);
    QString path;
    if (!destination)
        path = QDir(exportDirectory()).filePath(fileName);
    else if (QFileInfo(*destination).isDir())
        path = QDir(*destination).filePath(fileName);
    else
        path = *destination;

    const ExportResult written = writeAtomically(path, bytes);
    if (written.ok() && m_options.debug)
        qDebug() << "ExportController: wrote" << bytes.size() << "bytes to" << path;
    return written;
}
