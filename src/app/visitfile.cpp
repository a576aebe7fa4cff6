/*
 * visitfile.cpp — Visit snapshot read from a JSON file
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "visitfile.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <algorithm>
#include <utility>

using namespace Report;

namespace {

QString str(const QJsonObject &obj, const char *key)
{
    return obj.value(QLatin1String(key)).toString();
}

std::optional<QString> optionalStr(const QJsonObject &obj, const char *key)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (!v.isString())
        return std::nullopt;
    return v.toString();
}

QStringList strings(const QJsonValue &value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &v : array)
        out.append(v.toVariant().toString());
    return out;
}

KeyedSection keyed(const QJsonObject &obj, const char *key)
{
    KeyedSection section;
    const QJsonObject values = obj.value(QLatin1String(key)).toObject();
    for (auto it = values.begin(); it != values.end(); ++it)
        section.insert(it.key(), it.value().toVariant().toString());
    return section;
}

const std::pair<const char *, Section> kSectionNames[] = {
    {"parents_concerns", Section::ParentsConcerns},
    {"feeding", Section::Feeding},
    {"supplementation", Section::Supplementation},
    {"sleep", Section::Sleep},
    {"development", Section::Development},
    {"milestones", Section::Milestones},
    {"measurements", Section::Measurements},
    {"physical_exam", Section::PhysicalExam},
    {"problem_listing", Section::ProblemListing},
    {"conclusions", Section::Conclusions},
    {"anticipatory_guidance", Section::AnticipatoryGuidance},
    {"clinician_comments", Section::ClinicianComments},
    {"next_visit", Section::NextVisit},
};

const std::pair<const char *, GrowthMetric> kMetricNames[] = {
    {"weight", GrowthMetric::Weight},
    {"length", GrowthMetric::Length},
    {"head_circumference", GrowthMetric::HeadCircumference},
};

} // namespace

bool VisitFile::open(const QString &path, QString *error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        *error = QStringLiteral("%1 at offset %2")
                     .arg(parseError.errorString())
                     .arg(parseError.offset);
        return false;
    }
    if (!doc.isObject()) {
        *error = QStringLiteral("top level is not an object");
        return false;
    }

    m_root = doc.object();
    m_baseDir = QFileInfo(path).absoluteDir();
    return true;
}

QString VisitFile::visitId() const
{
    return m_root.value(QLatin1String("id")).toVariant().toString();
}

VisitKind VisitFile::kind() const
{
    return str(m_root, "kind").compare(QLatin1String("sick"), Qt::CaseInsensitive) == 0
        ? VisitKind::Sick : VisitKind::Well;
}

bool VisitFile::load(VisitKind kind, const QString &visitId,
                     VisitReportData *data, QString *error)
{
    if (m_root.isEmpty()) {
        *error = QStringLiteral("no visit file is open");
        return false;
    }
    if (!visitId.isEmpty() && visitId != this->visitId()) {
        *error = QStringLiteral("visit %1 is not in this file").arg(visitId);
        return false;
    }
    if (kind != this->kind()) {
        *error = QStringLiteral("visit %1 is a %2 visit")
                     .arg(visitId, this->kind() == VisitKind::Sick ? QStringLiteral("sick")
                                                                   : QStringLiteral("well"));
        return false;
    }
    return parse(m_root, data, error);
}

SectionVisibility VisitFile::visibility(const QString &)
{
    return parseVisibility(m_root.value(QLatin1String("visibility")).toObject());
}

std::optional<GrowthMetric> VisitFile::metricFromName(const QString &name)
{
    for (const auto &[key, metric] : kMetricNames) {
        if (name == QLatin1String(key))
            return metric;
    }
    return std::nullopt;
}

SectionVisibility VisitFile::parseVisibility(const QJsonObject &flags)
{
    SectionVisibility visibility;
    for (const auto &[key, section] : kSectionNames) {
        const QJsonValue v = flags.value(QLatin1String(key));
        if (v.isBool())
            visibility.set(section, v.toBool());
    }
    return visibility;
}

bool VisitFile::parse(const QJsonObject &root, VisitReportData *data, QString *error)
{
    const QJsonObject meta = root.value(QLatin1String("meta")).toObject();
    if (meta.isEmpty()) {
        *error = QStringLiteral("missing \"meta\" object");
        return false;
    }

    VisitReportData d;
    d.kind = str(root, "kind").compare(QLatin1String("sick"), Qt::CaseInsensitive) == 0
        ? VisitKind::Sick : VisitKind::Well;

    d.meta.alias = str(meta, "alias");
    d.meta.mrn = str(meta, "mrn");
    d.meta.name = str(meta, "name");
    d.meta.dobISO = str(meta, "dob");
    d.meta.sex = str(meta, "sex");
    d.meta.visitDateISO = str(meta, "visit_date");
    d.meta.visitTypeId = str(meta, "visit_type");
    d.meta.ageAtVisit = str(meta, "age");
    d.meta.clinicianName = str(meta, "clinician");
    d.meta.visitTypeReadable = optionalStr(meta, "visit_type_readable");
    d.meta.createdAtISO = optionalStr(meta, "created_at");
    d.meta.updatedAtISO = optionalStr(meta, "updated_at");
    d.meta.generatedAtISO = str(meta, "generated_at");

    d.perinatalSummary = str(root, "perinatal_summary");
    const QJsonArray previous = root.value(QLatin1String("previous_findings")).toArray();
    for (const QJsonValue &v : previous) {
        const QJsonObject o = v.toObject();
        d.previousFindings.append({str(o, "title"), str(o, "date"), str(o, "findings")});
    }

    d.currentVisitTitle = str(root, "current_visit_title");
    d.parentsConcerns = str(root, "parents_concerns");
    d.feeding = keyed(root, "feeding");
    d.supplementation = keyed(root, "supplementation");
    d.sleep = keyed(root, "sleep");
    d.stool = keyed(root, "stool");
    d.development = keyed(root, "development");
    d.measurements = keyed(root, "measurements");

    const QJsonObject mchat = root.value(QLatin1String("mchat")).toObject();
    d.mchatResult = str(mchat, "result");
    if (mchat.value(QLatin1String("score")).isDouble())
        d.mchatScore = mchat.value(QLatin1String("score")).toInt();

    const QJsonArray exam = root.value(QLatin1String("physical_exam")).toArray();
    for (const QJsonValue &v : exam) {
        const QJsonObject o = v.toObject();
        d.physicalExam.append({str(o, "title"), strings(o.value(QLatin1String("lines")))});
    }

    const QJsonValue milestones = root.value(QLatin1String("milestones"));
    if (milestones.isObject()) {
        const QJsonObject o = milestones.toObject();
        MilestoneSummary summary;
        summary.achieved = o.value(QLatin1String("achieved")).toInt();
        summary.total = o.value(QLatin1String("total")).toInt();
        summary.flags = strings(o.value(QLatin1String("flags")));
        d.milestones = summary;
    }

    const QJsonArray tokens = root.value(QLatin1String("problem_tokens")).toArray();
    for (const QJsonValue &v : tokens) {
        const QJsonObject o = v.toObject();
        d.problemTokens.append({str(o, "key"), strings(o.value(QLatin1String("args")))});
    }
    d.problemListing = str(root, "problem_listing");
    d.conclusions = str(root, "conclusions");
    d.anticipatoryGuidance = str(root, "anticipatory_guidance");
    d.clinicianComments = str(root, "clinician_comments");
    d.nextVisitDate = optionalStr(root, "next_visit_date");

    d.mainComplaint = str(root, "main_complaint");
    d.hpi = str(root, "hpi");
    d.duration = str(root, "duration");
    d.basics = keyed(root, "basics");
    d.pastMedicalHistory = str(root, "past_medical_history");
    d.vaccination = str(root, "vaccination");
    d.vitalsSummary = strings(root.value(QLatin1String("vitals")));
    d.investigations = str(root, "investigations");
    d.workingDiagnosis = str(root, "working_diagnosis");
    const QJsonObject icd10 = root.value(QLatin1String("icd10")).toObject();
    d.icd10Code = str(icd10, "code");
    d.icd10Label = str(icd10, "label");
    d.plan = str(root, "plan");
    d.medications = str(root, "medications");

    const QJsonValue growth = root.value(QLatin1String("growth"));
    if (growth.isObject()) {
        const QJsonObject o = growth.toObject();
        GrowthSeries series;
        series.dobISO = str(o, "dob").isEmpty() ? d.meta.dobISO : str(o, "dob");
        series.sex = str(o, "sex").isEmpty() ? d.meta.sex : str(o, "sex");
        series.cutoffDateISO = str(o, "cutoff");
        for (const auto &[key, metric] : kMetricNames) {
            const QJsonArray rows = o.value(QLatin1String(key)).toArray();
            QList<GrowthPoint> points;
            for (const QJsonValue &row : rows) {
                const QJsonArray pair = row.toArray();
                if (pair.size() != 2) {
                    *error = QStringLiteral("growth.%1: expected [age_months, value] pairs")
                                 .arg(QLatin1String(key));
                    return false;
                }
                points.append({pair.at(0).toDouble(), pair.at(1).toDouble()});
            }
            if (!points.isEmpty())
                series.points[metric] = points;
        }
        d.growth = series;
    }

    *data = std::move(d);
    return true;
}

QList<ChartImage> VisitFile::render(const GrowthSeries &series, const QSizeF &logicalSize)
{
    Q_UNUSED(logicalSize)

    QList<ChartImage> charts;
    const QJsonArray entries = m_root.value(QLatin1String("charts")).toArray();
    for (const QJsonValue &v : entries) {
        const QJsonObject o = v.toObject();
        const auto metric = metricFromName(str(o, "metric"));
        if (!metric) {
            qWarning() << "VisitFile: unknown chart metric" << str(o, "metric");
            continue;
        }
        if (series.points.find(*metric) == series.points.end())
            continue;

        ChartImage chart;
        chart.metric = *metric;
        chart.title = str(o, "title");

        const QString imagePath = m_baseDir.filePath(str(o, "image"));
        if (!chart.image.load(imagePath)) {
            qWarning() << "VisitFile: cannot read chart image" << imagePath;
            continue;
        }

        const QString emf = str(o, "emf");
        if (!emf.isEmpty()) {
            QFile emfFile(m_baseDir.filePath(emf));
            if (emfFile.open(QIODevice::ReadOnly))
                chart.emf = emfFile.readAll();
            else
                qWarning() << "VisitFile: cannot read" << emfFile.fileName();
        }

        if (o.contains(QLatin1String("width_pt")) && o.contains(QLatin1String("height_pt")))
            chart.pointSize = QSizeF(o.value(QLatin1String("width_pt")).toDouble(),
                                     o.value(QLatin1String("height_pt")).toDouble());
        charts.append(chart);
    }

    // Weight, length, head circumference
    std::stable_sort(charts.begin(), charts.end(), [](const ChartImage &a, const ChartImage &b) {
        return static_cast<int>(a.metric) < static_cast<int>(b.metric);
    });
    return charts;
}
