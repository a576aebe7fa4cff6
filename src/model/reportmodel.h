/*
 * reportmodel.h — Visit snapshot types consumed by the report pipeline
 *
 * Everything here is a plain value built fresh for one export call.
 * Metadata is carried as explicit typed fields.
 *
 * NOTE: Qt GUI headers (QImage) must be included BEFORE opening the
 * Report namespace to avoid ADL issues with Qt6 macros.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_REPORTMODEL_H
#define VISITREPORT_REPORTMODEL_H

#include <QByteArray>
#include <QDate>
#include <QImage>
#include <QList>
#include <QMap>
#include <QSizeF>
#include <QString>
#include <QStringList>

#include <map>
#include <optional>

namespace Report {

enum class VisitKind {
    Well,
    Sick,
};

struct ReportMeta {
    QString alias;
    QString mrn;
    QString name;
    QString dobISO;
    QString sex;
    QString visitDateISO;
    QString visitTypeId;
    QString ageAtVisit;          // may be empty or a placeholder; recomputed then
    QString clinicianName;
    std::optional<QString> visitTypeReadable;
    std::optional<QString> createdAtISO;
    std::optional<QString> updatedAtISO;
    QString generatedAtISO;
};

struct ProblemToken {
    QString key;
    QStringList args;
};

struct PreviousVisitFindings {
    QString title;
    QString date;
    QString findings;
};

struct ExamGroup {
    QString title;
    QStringList lines;
};

struct MilestoneSummary {
    int achieved = 0;
    int total = 0;
    QStringList flags;
};

// Keys are display labels, values are already human readable.
using KeyedSection = QMap<QString, QString>;

enum class GrowthMetric {
    Weight,
    Length,
    HeadCircumference,
};

struct GrowthPoint {
    qreal ageMonths = 0;
    qreal value = 0;
};

struct GrowthSeries {
    QString dobISO;
    QString sex;
    QString cutoffDateISO;
    std::map<GrowthMetric, QList<GrowthPoint>> points;

    bool isEmpty() const
    {
        for (const auto &[metric, list] : points) {
            if (!list.isEmpty())
                return false;
        }
        return true;
    }
};

struct ChartImage {
    GrowthMetric metric = GrowthMetric::Weight;
    QString title;
    QImage image;
    QByteArray emf;              // optional vector form, empty when absent
    QSizeF pointSize;            // logical size used by every output format
};

struct VisitReportData {
    ReportMeta meta;
    VisitKind kind = VisitKind::Well;

    // Never gated
    QString perinatalSummary;
    QList<PreviousVisitFindings> previousFindings;

    // Current visit
    QString currentVisitTitle;
    QString parentsConcerns;
    KeyedSection feeding;
    KeyedSection supplementation;
    KeyedSection sleep;
    KeyedSection stool;
    KeyedSection development;
    QString mchatResult;         // coded, e.g. "medium_risk"
    std::optional<int> mchatScore;
    KeyedSection measurements;
    QList<ExamGroup> physicalExam;
    std::optional<MilestoneSummary> milestones;
    QList<ProblemToken> problemTokens;
    QString problemListing;      // plain-text fallback for the tokens
    QString conclusions;
    QString anticipatoryGuidance;
    QString clinicianComments;
    std::optional<QString> nextVisitDate;

    // Sick visits
    QString mainComplaint;
    QString hpi;
    QString duration;
    KeyedSection basics;
    QString pastMedicalHistory;
    QString vaccination;
    QStringList vitalsSummary;
    QString investigations;
    QString workingDiagnosis;
    QString icd10Code;
    QString icd10Label;
    QString plan;
    QString medications;

    std::optional<GrowthSeries> growth;
};

// Gated current-visit sections.
enum class Section {
    ParentsConcerns,
    Feeding,
    Supplementation,
    Sleep,
    Development,
    Milestones,
    Measurements,
    PhysicalExam,
    ProblemListing,
    Conclusions,
    AnticipatoryGuidance,
    ClinicianComments,
    NextVisit,
};

class SectionVisibility
{
public:
    void set(Section section, bool visible) { m_flags[section] = visible; }

    // Absent flags mean "show".
    bool isVisible(Section section) const
    {
        auto it = m_flags.find(section);
        return it == m_flags.end() || it->second;
    }

    std::optional<bool> flag(Section section) const
    {
        auto it = m_flags.find(section);
        if (it == m_flags.end())
            return std::nullopt;
        return it->second;
    }

private:
    std::map<Section, bool> m_flags;
};

} // namespace Report

#endif // VISITREPORT_REPORTMODEL_H
