/*
 * reportassembler.h — VisitReportData to format-neutral Document
 *
 * One pipeline serves well and sick visits; the visit kind selects the
 * section order. Output depends only on the inputs, so repeated calls
 * with equal data produce equal documents.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_REPORTASSEMBLER_H
#define VISITREPORT_REPORTASSEMBLER_H

#include <QList>
#include <QString>
#include <QStringList>

#include "reportdocument.h"
#include "reportmodel.h"
#include "tokenrenderer.h"

class Localizer;

class ReportAssembler
{
public:
    explicit ReportAssembler(const Localizer &localizer,
                             const QString &milestoneItemPrefix = QString());

    Report::Document assembleBody(const Report::VisitReportData &data,
                                  const Report::SectionVisibility &visibility) const;

    // Page break, "Growth Charts" heading, then one page per chart with a
    // summary line and the captioned image.
    Report::Document assembleCharts(const Report::GrowthSeries &series,
                                    const QList<Report::ChartImage> &charts) const;

    // Localized top-level section labels, in no particular order.
    QStringList sectionHeadingLabels() const;

    QString ageAtVisit(const Report::ReportMeta &meta) const;
    QString visitTypeLabel(const Report::ReportMeta &meta) const;
    QString currentVisitLine(const Report::VisitReportData &data) const;

    QString metricTitle(Report::GrowthMetric metric) const;

    // "<patient> — <visit title>" from the name line and the current-visit
    // heading, the name alone without the heading, or the generic title
    // when no name line is present.
    static QString reportTitle(const Localizer &localizer, const QStringList &lines);
    QString reportTitle(const Report::Document &document) const;

private:
    void addHeader(Report::Document &doc, const Report::VisitReportData &data) const;
    void addWellSections(Report::Document &doc, const Report::VisitReportData &data,
                         const Report::SectionVisibility &visibility) const;
    void addSickSections(Report::Document &doc, const Report::VisitReportData &data,
                         const Report::SectionVisibility &visibility) const;

    void addPreviousFindings(Report::Document &doc,
                             const QList<Report::PreviousVisitFindings> &findings) const;
    void addKeyedSection(Report::Document &doc, const Report::KeyedSection &section,
                         const QStringList &canonicalKeys) const;
    void addDevelopment(Report::Document &doc, const Report::VisitReportData &data) const;
    void addMilestones(Report::Document &doc, const Report::VisitReportData &data) const;
    void addPhysicalExam(Report::Document &doc, const QList<Report::ExamGroup> &groups) const;
    void addProblemListing(Report::Document &doc, const Report::VisitReportData &data) const;
    void addText(Report::Document &doc, const QString &text) const;
    void addBulletLines(Report::Document &doc, const QStringList &lines) const;
    void addPlaceholder(Report::Document &doc) const;

    QString orPlaceholder(const QString &value) const;
    QString label(const QString &key) const;

    const Localizer &m_localizer;
    TokenRenderer m_tokens;
};

#endif // VISITREPORT_REPORTASSEMBLER_H
