/*
 * reportassembler.cpp — VisitReportData to format-neutral Document
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportassembler.h"
#include "bulletnormalizer.h"
#include "localizer.h"
#include "reportdates.h"

#include <algorithm>

using namespace Report;

namespace {

// Fixed display order for keyed sections; remaining keys follow sorted.
const QStringList kFeedingKeys = {
    QStringLiteral("Breastfeeding"), QStringLiteral("Formula"), QStringLiteral("Solids"),
    QStringLiteral("Feeds / 24h"), QStringLiteral("Feed Volume (ml)"),
    QStringLiteral("Estimated Total (ml/24h)"), QStringLiteral("Estimated (ml/kg/24h)"),
    QStringLiteral("Milk Types"), QStringLiteral("Food Variety / Quantity"),
    QStringLiteral("Dairy Amount"), QStringLiteral("Regurgitation"),
    QStringLiteral("Wakes for Feeds"), QStringLiteral("Expressed BM"),
    QStringLiteral("Solid Foods Started"), QStringLiteral("Solid Food Start"),
    QStringLiteral("Solid Food Quality"), QStringLiteral("Solid Food Notes"),
    QStringLiteral("Feeding Issue"), QStringLiteral("Feeding Comment"),
    QStringLiteral("Notes"),
};

const QStringList kSupplementationKeys = {
    QStringLiteral("Vitamin D"), QStringLiteral("Vitamin D Given"),
    QStringLiteral("Iron"), QStringLiteral("Other"), QStringLiteral("Notes"),
};

const QStringList kSleepKeys = {
    QStringLiteral("Total hours"), QStringLiteral("Naps"), QStringLiteral("Night wakings"),
    QStringLiteral("Quality"), QStringLiteral("Regular"), QStringLiteral("Snoring"),
    QStringLiteral("Issue Reported"), QStringLiteral("Issue Notes"), QStringLiteral("Notes"),
};

const QStringList kStoolKeys = {
    QStringLiteral("Pattern"), QStringLiteral("Frequency"), QStringLiteral("Consistency"),
    QStringLiteral("Color"), QStringLiteral("Notes"),
};

const QStringList kDevelopmentKeys = {
    QStringLiteral("Test"), QStringLiteral("Result"), QStringLiteral("Score"),
    QStringLiteral("Parents' Concerns"), QStringLiteral("Notes"),
};

const QStringList kMeasurementKeys = {
    QStringLiteral("Weight"), QStringLiteral("Length"),
    QStringLiteral("Head Circumference"), QStringLiteral("Weight gain since discharge"),
};

const QStringList kBasicsKeys = {
    QStringLiteral("Feeding"), QStringLiteral("Urination"), QStringLiteral("Breathing"),
    QStringLiteral("Pain"), QStringLiteral("Context"),
};

const QStringList kSectionKeys = {
    QStringLiteral("section.perinatal"), QStringLiteral("section.previous_findings"),
    QStringLiteral("section.parents_concerns"), QStringLiteral("section.feeding"),
    QStringLiteral("section.supplementation"), QStringLiteral("section.stool"),
    QStringLiteral("section.sleep"), QStringLiteral("section.development"),
    QStringLiteral("section.milestones"), QStringLiteral("section.measurements"),
    QStringLiteral("section.physical_exam"), QStringLiteral("section.problem_listing"),
    QStringLiteral("section.conclusions"), QStringLiteral("section.guidance"),
    QStringLiteral("section.clinician_comments"), QStringLiteral("section.next_visit"),
    QStringLiteral("section.main_complaint"), QStringLiteral("section.hpi"),
    QStringLiteral("section.duration"), QStringLiteral("section.basics"),
    QStringLiteral("section.pmh"), QStringLiteral("section.vaccination"),
    QStringLiteral("section.vitals"), QStringLiteral("section.investigations"),
    QStringLiteral("section.working_diagnosis"), QStringLiteral("section.icd10"),
    QStringLiteral("section.plan"), QStringLiteral("section.medications"),
    QStringLiteral("section.followup"),
};

} // namespace

ReportAssembler::ReportAssembler(const Localizer &localizer,
                                 const QString &milestoneItemPrefix)
    : m_localizer(localizer)
    , m_tokens(localizer, milestoneItemPrefix)
{
}

QString ReportAssembler::label(const QString &key) const
{
    return m_localizer.text(key);
}

QString ReportAssembler::orPlaceholder(const QString &value) const
{
    const QString t = value.trimmed();
    return t.isEmpty() ? label(QStringLiteral("report.placeholder")) : t;
}

QStringList ReportAssembler::sectionHeadingLabels() const
{
    QStringList labels;
    for (const QString &key : kSectionKeys)
        labels.append(label(key));
    return labels;
}

QString ReportAssembler::ageAtVisit(const ReportMeta &meta) const
{
    if (!ReportDates::isPlaceholder(meta.ageAtVisit))
        return meta.ageAtVisit.trimmed();

    const auto dob = ReportDates::parseDate(meta.dobISO);
    auto reference = ReportDates::parseDate(meta.visitDateISO);
    if (!reference)
        reference = ReportDates::parseDate(meta.generatedAtISO);
    if (!dob || !reference)
        return label(QStringLiteral("report.placeholder"));

    const QString age = ReportDates::ageString(*dob, *reference);
    return age.isEmpty() ? label(QStringLiteral("report.placeholder")) : age;
}

QString ReportAssembler::visitTypeLabel(const ReportMeta &meta) const
{
    if (meta.visitTypeReadable && !meta.visitTypeReadable->trimmed().isEmpty())
        return meta.visitTypeReadable->trimmed();
    if (!meta.visitTypeId.trimmed().isEmpty())
        return ReportDates::readableVisitType(meta.visitTypeId);
    return QString();
}

QString ReportAssembler::currentVisitLine(const VisitReportData &data) const
{
    QString title = data.currentVisitTitle.trimmed();
    if (title.isEmpty())
        title = orPlaceholder(visitTypeLabel(data.meta));
    return m_localizer.format(QStringLiteral("section.current_visit"), {title});
}

QString ReportAssembler::metricTitle(GrowthMetric metric) const
{
    switch (metric) {
    case GrowthMetric::Weight:
        return label(QStringLiteral("charts.metric.weight"));
    case GrowthMetric::Length:
        return label(QStringLiteral("charts.metric.length"));
    case GrowthMetric::HeadCircumference:
        return label(QStringLiteral("charts.metric.head_circumference"));
    }
    return QString();
}

QString ReportAssembler::reportTitle(const Localizer &localizer, const QStringList &lines)
{
    const QString namePrefix = localizer.prefixOf(QStringLiteral("report.header.name"));
    const QString visitPrefix = localizer.prefixOf(QStringLiteral("section.current_visit"));
    QString name;
    QString visit;
    for (const QString &line : lines) {
        const QString t = line.trimmed();
        if (name.isEmpty() && !namePrefix.isEmpty() && t.startsWith(namePrefix))
            name = t.mid(namePrefix.size()).trimmed();
        else if (visit.isEmpty() && !visitPrefix.isEmpty() && t.startsWith(visitPrefix))
            visit = t.mid(visitPrefix.size()).trimmed();
    }

    if (name.isEmpty())
        return localizer.text(QStringLiteral("report.generic_title"));
    if (visit.isEmpty())
        return name;
    return name + localizer.text(QStringLiteral("report.title_separator")) + visit;
}

QString ReportAssembler::reportTitle(const Document &document) const
{
    return reportTitle(m_localizer, document.textLines());
}

// --- Blocks ---

void ReportAssembler::addPlaceholder(Document &doc) const
{
    doc.addParagraph(label(QStringLiteral("report.placeholder")));
}

void ReportAssembler::addText(Document &doc, const QString &text) const
{
    const QStringList lines = BulletNormalizer::splitLines(text);
    if (lines.isEmpty()) {
        addPlaceholder(doc);
        return;
    }
    for (const QString &line : lines)
        doc.addParagraph(line);
}

void ReportAssembler::addBulletLines(Document &doc, const QStringList &lines) const
{
    if (lines.isEmpty()) {
        addPlaceholder(doc);
        return;
    }
    for (const QString &line : lines) {
        const QString content = BulletNormalizer::stripListMarker(line);
        if (!content.isEmpty())
            doc.addBullet(TokenRenderer::kBullet + content);
    }
}

void ReportAssembler::addKeyedSection(Document &doc, const KeyedSection &section,
                                      const QStringList &canonicalKeys) const
{
    QStringList lines;
    for (const QString &key : canonicalKeys) {
        const QString value = section.value(key).trimmed();
        if (!value.isEmpty())
            lines.append(key + QStringLiteral(": ") + value);
    }

    // QMap iterates in key order
    for (auto it = section.constBegin(); it != section.constEnd(); ++it) {
        if (canonicalKeys.contains(it.key()))
            continue;
        const QString value = it.value().trimmed();
        if (!value.isEmpty())
            lines.append(it.key() + QStringLiteral(": ") + value);
    }

    if (lines.isEmpty()) {
        addPlaceholder(doc);
        return;
    }
    for (const QString &line : std::as_const(lines))
        doc.addBullet(TokenRenderer::kBullet + line);
}

void ReportAssembler::addPreviousFindings(Document &doc,
                                          const QList<PreviousVisitFindings> &findings) const
{
    if (findings.isEmpty()) {
        addPlaceholder(doc);
        return;
    }

    for (const auto &f : findings) {
        const QString date = ReportDates::humanDate(f.date, m_localizer.locale());
        doc.addHeading(2, m_localizer.format(QStringLiteral("section.previous_item"),
                                             {orPlaceholder(f.title), orPlaceholder(date)}));

        const QStringList lines = BulletNormalizer::splitLines(f.findings);
        if (lines.isEmpty()) {
            addPlaceholder(doc);
        } else if (lines.size() == 1) {
            doc.addParagraph(BulletNormalizer::stripListMarker(lines.first()));
        } else {
            addBulletLines(doc, lines);
        }
    }
}

void ReportAssembler::addDevelopment(Document &doc, const VisitReportData &data) const
{
    QStringList lines;
    const QString result = data.mchatResult.trimmed();
    if (!result.isEmpty() || data.mchatScore) {
        const QString resultLabel =
            m_tokens.resolveCodedResult(QStringLiteral("mchat.result"), result);
        QString line;
        if (!result.isEmpty() && data.mchatScore) {
            line = m_localizer.format(QStringLiteral("development.mchat.result_score"),
                                      {resultLabel, QString::number(*data.mchatScore)});
        } else if (data.mchatScore) {
            line = m_localizer.format(QStringLiteral("development.mchat.score_only"),
                                      {QString::number(*data.mchatScore)});
        } else {
            line = m_localizer.format(QStringLiteral("development.mchat.result_only"),
                                      {resultLabel});
        }
        lines.append(line);
    }

    for (const QString &key : kDevelopmentKeys) {
        const QString value = data.development.value(key).trimmed();
        if (!value.isEmpty())
            lines.append(key + QStringLiteral(": ") + value);
    }
    for (auto it = data.development.constBegin(); it != data.development.constEnd(); ++it) {
        if (!kDevelopmentKeys.contains(it.key()) && !it.value().trimmed().isEmpty())
            lines.append(it.key() + QStringLiteral(": ") + it.value().trimmed());
    }

    if (lines.isEmpty()) {
        addPlaceholder(doc);
        return;
    }
    for (const QString &line : std::as_const(lines))
        doc.addBullet(TokenRenderer::kBullet + line);
}

void ReportAssembler::addMilestones(Document &doc, const VisitReportData &data) const
{
    if (!data.milestones) {
        addPlaceholder(doc);
        return;
    }

    const MilestoneSummary &m = *data.milestones;
    if (m.total > 0) {
        doc.addParagraph(m_localizer.format(QStringLiteral("milestones.achieved"),
                                            {QString::number(m.achieved),
                                             QString::number(m.total)}));
    } else {
        doc.addParagraph(label(QStringLiteral("milestones.achieved_unknown")));
    }

    if (!m.flags.isEmpty()) {
        doc.addParagraph(label(QStringLiteral("milestones.flags")));
        addBulletLines(doc, m.flags);
    }
}

void ReportAssembler::addPhysicalExam(Document &doc, const QList<ExamGroup> &groups) const
{
    bool any = false;
    for (const auto &group : groups) {
        QStringList lines;
        for (const QString &l : group.lines) {
            if (!l.trimmed().isEmpty())
                lines.append(l);
        }
        if (lines.isEmpty())
            continue;
        any = true;
        if (!group.title.trimmed().isEmpty())
            doc.addHeading(2, group.title.trimmed());
        addBulletLines(doc, lines);
    }
    if (!any)
        addPlaceholder(doc);
}

void ReportAssembler::addProblemListing(Document &doc, const VisitReportData &data) const
{
    const QString rendered = m_tokens.render(data.problemTokens, data.problemListing);
    const QString normalized = BulletNormalizer::normalizeBlock(
        rendered, label(TokenRenderer::kMilestoneHeaderKey));

    const QStringList lines = normalized.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    if (lines.isEmpty()) {
        addPlaceholder(doc);
        return;
    }
    for (const QString &line : lines)
        doc.addBullet(line);
}

// --- Header ---

void ReportAssembler::addHeader(Document &doc, const VisitReportData &data) const
{
    const ReportMeta &meta = data.meta;
    const QLocale locale = m_localizer.locale();

    doc.addParagraph(label(data.kind == VisitKind::Well
                               ? QStringLiteral("report.title.well")
                               : QStringLiteral("report.title.sick")),
                     ParagraphRole::Title, Qt::AlignHCenter);

    auto stamp = [&](const std::optional<QString> &iso) {
        return orPlaceholder(iso ? ReportDates::humanDateTime(*iso, locale) : QString());
    };
    doc.addParagraph(m_localizer.format(QStringLiteral("report.header.timestamps"),
                                        {stamp(meta.createdAtISO),
                                         stamp(meta.updatedAtISO),
                                         stamp(meta.generatedAtISO)}),
                     ParagraphRole::Meta);

    doc.addParagraph(m_localizer.format(QStringLiteral("report.header.identity"),
                                        {orPlaceholder(meta.alias), orPlaceholder(meta.mrn)}),
                     ParagraphRole::Meta);
    doc.addParagraph(m_localizer.format(QStringLiteral("report.header.name"),
                                        {orPlaceholder(meta.name)}),
                     ParagraphRole::Meta);
    doc.addParagraph(m_localizer.format(QStringLiteral("report.header.dob_sex_age"),
                                        {orPlaceholder(ReportDates::humanDate(meta.dobISO, locale)),
                                         orPlaceholder(meta.sex),
                                         ageAtVisit(meta)}),
                     ParagraphRole::Meta);
    doc.addParagraph(m_localizer.format(QStringLiteral("report.header.visit"),
                                        {orPlaceholder(ReportDates::humanDate(meta.visitDateISO, locale)),
                                         orPlaceholder(visitTypeLabel(meta))}),
                     ParagraphRole::Meta);
    doc.addParagraph(m_localizer.format(QStringLiteral("report.header.clinician"),
                                        {orPlaceholder(meta.clinicianName)}),
                     ParagraphRole::Meta);
}

// --- Section order ---

void ReportAssembler::addWellSections(Document &doc, const VisitReportData &data,
                                      const SectionVisibility &visibility) const
{
    doc.addHeading(1, label(QStringLiteral("section.perinatal")));
    addText(doc, data.perinatalSummary);

    doc.addHeading(1, label(QStringLiteral("section.previous_findings")));
    addPreviousFindings(doc, data.previousFindings);

    doc.addHeading(1, currentVisitLine(data));

    if (visibility.isVisible(Section::ParentsConcerns)) {
        doc.addHeading(1, label(QStringLiteral("section.parents_concerns")));
        addText(doc, data.parentsConcerns);
    }
    if (visibility.isVisible(Section::Feeding)) {
        doc.addHeading(1, label(QStringLiteral("section.feeding")));
        addKeyedSection(doc, data.feeding, kFeedingKeys);
    }
    if (visibility.isVisible(Section::Supplementation)) {
        doc.addHeading(1, label(QStringLiteral("section.supplementation")));
        addKeyedSection(doc, data.supplementation, kSupplementationKeys);
    }

    doc.addHeading(1, label(QStringLiteral("section.stool")));
    addKeyedSection(doc, data.stool, kStoolKeys);

    if (visibility.isVisible(Section::Sleep)) {
        doc.addHeading(1, label(QStringLiteral("section.sleep")));
        addKeyedSection(doc, data.sleep, kSleepKeys);
    }
    if (visibility.isVisible(Section::Development)) {
        doc.addHeading(1, label(QStringLiteral("section.development")));
        addDevelopment(doc, data);
    }
    if (visibility.isVisible(Section::Milestones)) {
        doc.addHeading(1, label(QStringLiteral("section.milestones")));
        addMilestones(doc, data);
    }
    if (visibility.isVisible(Section::Measurements)) {
        doc.addHeading(1, label(QStringLiteral("section.measurements")));
        addKeyedSection(doc, data.measurements, kMeasurementKeys);
    }
    if (visibility.isVisible(Section::PhysicalExam)) {
        doc.addHeading(1, label(QStringLiteral("section.physical_exam")));
        addPhysicalExam(doc, data.physicalExam);
    }
    if (visibility.isVisible(Section::ProblemListing)) {
        doc.addHeading(1, label(QStringLiteral("section.problem_listing")));
        addProblemListing(doc, data);
    }
    if (visibility.isVisible(Section::Conclusions)) {
        doc.addHeading(1, label(QStringLiteral("section.conclusions")));
        addText(doc, data.conclusions);
    }
    if (visibility.isVisible(Section::AnticipatoryGuidance)) {
        doc.addHeading(1, label(QStringLiteral("section.guidance")));
        addText(doc, data.anticipatoryGuidance);
    }
    if (visibility.isVisible(Section::ClinicianComments)) {
        doc.addHeading(1, label(QStringLiteral("section.clinician_comments")));
        addText(doc, data.clinicianComments);
    }
    if (visibility.isVisible(Section::NextVisit)) {
        doc.addHeading(1, label(QStringLiteral("section.next_visit")));
        doc.addParagraph(orPlaceholder(
            data.nextVisitDate ? ReportDates::humanDate(*data.nextVisitDate, m_localizer.locale())
                               : QString()));
    }
}

void ReportAssembler::addSickSections(Document &doc, const VisitReportData &data,
                                      const SectionVisibility &visibility) const
{
    doc.addHeading(1, label(QStringLiteral("section.main_complaint")));
    addText(doc, data.mainComplaint);
    doc.addHeading(1, label(QStringLiteral("section.hpi")));
    addText(doc, data.hpi);
    doc.addHeading(1, label(QStringLiteral("section.duration")));
    addText(doc, data.duration);
    doc.addHeading(1, label(QStringLiteral("section.basics")));
    addKeyedSection(doc, data.basics, kBasicsKeys);
    doc.addHeading(1, label(QStringLiteral("section.pmh")));
    addText(doc, data.pastMedicalHistory);
    doc.addHeading(1, label(QStringLiteral("section.perinatal")));
    addText(doc, data.perinatalSummary);
    doc.addHeading(1, label(QStringLiteral("section.vaccination")));
    addText(doc, data.vaccination);
    doc.addHeading(1, label(QStringLiteral("section.vitals")));
    addBulletLines(doc, data.vitalsSummary);

    if (visibility.isVisible(Section::PhysicalExam)) {
        doc.addHeading(1, label(QStringLiteral("section.physical_exam")));
        addPhysicalExam(doc, data.physicalExam);
    }
    if (visibility.isVisible(Section::ProblemListing)) {
        doc.addHeading(1, label(QStringLiteral("section.problem_listing")));
        addProblemListing(doc, data);
    }

    doc.addHeading(1, label(QStringLiteral("section.investigations")));
    addText(doc, data.investigations);
    doc.addHeading(1, label(QStringLiteral("section.working_diagnosis")));
    addText(doc, data.workingDiagnosis);

    doc.addHeading(1, label(QStringLiteral("section.icd10")));
    const QString code = data.icd10Code.trimmed();
    const QString codeLabel = data.icd10Label.trimmed();
    if (code.isEmpty())
        addPlaceholder(doc);
    else if (codeLabel.isEmpty())
        doc.addParagraph(code);
    else
        doc.addParagraph(m_localizer.format(QStringLiteral("section.icd10_item"),
                                            {code, codeLabel}));

    if (visibility.isVisible(Section::AnticipatoryGuidance)) {
        doc.addHeading(1, label(QStringLiteral("section.plan")));
        addText(doc, data.plan);
    }

    doc.addHeading(1, label(QStringLiteral("section.medications")));
    addText(doc, data.medications);

    if (visibility.isVisible(Section::ClinicianComments)) {
        doc.addHeading(1, label(QStringLiteral("section.clinician_comments")));
        addText(doc, data.clinicianComments);
    }
    if (visibility.isVisible(Section::NextVisit)) {
        doc.addHeading(1, label(QStringLiteral("section.followup")));
        doc.addParagraph(orPlaceholder(
            data.nextVisitDate ? ReportDates::humanDate(*data.nextVisitDate, m_localizer.locale())
                               : QString()));
    }
}

Document ReportAssembler::assembleBody(const VisitReportData &data,
                                       const SectionVisibility &visibility) const
{
    Document doc;
    addHeader(doc, data);
    if (data.kind == VisitKind::Well)
        addWellSections(doc, data, visibility);
    else
        addSickSections(doc, data, visibility);
    return doc;
}

Document ReportAssembler::assembleCharts(const GrowthSeries &series,
                                         const QList<ChartImage> &charts) const
{
    Document doc;
    if (charts.isEmpty())
        return doc;

    doc.addPageBreak();
    for (int i = 0; i < charts.size(); ++i) {
        const ChartImage &chart = charts.at(i);
        if (i == 0)
            doc.addHeading(1, label(QStringLiteral("charts.title")));
        else
            doc.addPageBreak();

        const QString title = chart.title.isEmpty() ? metricTitle(chart.metric) : chart.title;
        const auto it = series.points.find(chart.metric);
        if (it == series.points.end() || it->second.isEmpty()) {
            doc.addParagraph(m_localizer.format(QStringLiteral("charts.summary_empty"), {title}));
        } else {
            const QList<GrowthPoint> &points = it->second;
            const auto [minIt, maxIt] = std::minmax_element(
                points.cbegin(), points.cend(),
                [](const GrowthPoint &a, const GrowthPoint &b) { return a.ageMonths < b.ageMonths; });
            doc.addParagraph(m_localizer.format(QStringLiteral("charts.summary"),
                                                {title,
                                                 QString::number(points.size()),
                                                 QString::number(minIt->ageMonths, 'f', 1),
                                                 QString::number(maxIt->ageMonths, 'f', 1)}));
        }
        doc.addImage(i, title, chart.pointSize);
    }
    return doc;
}
