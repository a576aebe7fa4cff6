#include <gtest/gtest.h>

#include "localizer.h"
#include "reportassembler.h"
#include "testdata.h"

using namespace Report;

namespace {

QStringList lines(const Document &doc)
{
    return doc.dump().split(QLatin1Char('\n'), Qt::SkipEmptyParts);
}

} // namespace

class ReportAssemblerTest : public ::testing::Test
{
protected:
    Localizer localizer;
    ReportAssembler assembler{localizer};
};

TEST_F(ReportAssemblerTest, WellHeaderComesFirst)
{
    const QStringList out = lines(assembler.assembleBody(TestData::wellVisit(), {}));
    ASSERT_GE(out.size(), 7);
    EXPECT_EQ(out.at(0), QStringLiteral("P[title] Well Visit Summary"));
    EXPECT_EQ(out.at(2), QStringLiteral("P[meta] Alias: Blue Fox • MRN: MRN-0042"));
    EXPECT_EQ(out.at(3), QStringLiteral("P[meta] Name: Alice Martin"));
    EXPECT_EQ(out.at(4), QStringLiteral("P[meta] DOB: 1 Jan 2024 • Sex: F • Age at Visit: 2m 19d"));
    EXPECT_EQ(out.at(5), QStringLiteral("P[meta] Visit Date: 20 Mar 2024 • Visit Type: 2-month visit"));
    EXPECT_EQ(out.at(6), QStringLiteral("P[meta] Clinician: Dr. Hale"));
}

TEST_F(ReportAssemblerTest, StoredAgeIsKeptUnlessPlaceholder)
{
    ReportMeta meta = TestData::wellVisit().meta;
    meta.ageAtVisit = QStringLiteral("11 weeks");
    EXPECT_EQ(assembler.ageAtVisit(meta), QStringLiteral("11 weeks"));
    meta.ageAtVisit = QStringLiteral("—");
    EXPECT_EQ(assembler.ageAtVisit(meta), QStringLiteral("2m 19d"));
    meta.dobISO.clear();
    EXPECT_EQ(assembler.ageAtVisit(meta), QStringLiteral("—"));
}

TEST_F(ReportAssemblerTest, WellSectionsInOrder)
{
    const QString dump = assembler.assembleBody(TestData::wellVisit(), {}).dump();
    const QStringList headings = {
        QStringLiteral("H1 Perinatal Summary"),
        QStringLiteral("H1 Findings from Previous Well Visits"),
        QStringLiteral("H2 1-month visit — 1 Feb 2024"),
        QStringLiteral("H1 Current Visit — 2-month visit"),
        QStringLiteral("H1 Parents' Concerns"),
        QStringLiteral("H1 Feeding"),
        QStringLiteral("H1 Supplementation"),
        QStringLiteral("H1 Stool"),
        QStringLiteral("H1 Sleep"),
        QStringLiteral("H1 Development"),
        QStringLiteral("H1 Developmental Milestones"),
        QStringLiteral("H1 Measurements"),
        QStringLiteral("H1 Physical Examination"),
        QStringLiteral("H1 Problem Listing"),
        QStringLiteral("H1 Conclusions"),
        QStringLiteral("H1 Anticipatory Guidance"),
        QStringLiteral("H1 Clinician Comments"),
        QStringLiteral("H1 Next Visit"),
    };
    int last = -1;
    for (const QString &h : headings) {
        const int pos = dump.indexOf(h + QLatin1Char('\n'));
        EXPECT_GT(pos, last) << h.toStdString();
        last = pos;
    }
}

TEST_F(ReportAssemblerTest, WellSectionContent)
{
    const QString dump = assembler.assembleBody(TestData::wellVisit(), {}).dump();
    EXPECT_TRUE(dump.contains(QStringLiteral("B • Mild jaundice\nB • Good latch\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("B • Breastfeeding: Yes\nB • Feeds / 24h: 8\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("B • M-CHAT: Medium risk (score 4)\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("P[body] Achieved: 3/4\nP[body] Flags:\nB • Head control\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("H2 General\nB • Alert, well perfused\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral(
        "H1 Problem Listing\nB • Feeding issue: frequent vomiting\nB • Milestones\n"
        "B • Head control – uncertain\n")));
    EXPECT_TRUE(dump.endsWith(QStringLiteral("H1 Next Visit\nP[body] 20 May 2024\n")));
}

TEST_F(ReportAssemblerTest, EmptySectionsShowPlaceholder)
{
    VisitReportData data = TestData::wellVisit();
    data.feeding.clear();
    data.milestones.reset();
    data.problemTokens.clear();
    data.problemListing.clear();
    const QString dump = assembler.assembleBody(data, {}).dump();
    EXPECT_TRUE(dump.contains(QStringLiteral("H1 Feeding\nP[body] —\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("H1 Developmental Milestones\nP[body] —\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("H1 Problem Listing\nP[body] —\n")));
}

TEST_F(ReportAssemblerTest, ProblemListingFallsBackToPlainText)
{
    VisitReportData data = TestData::wellVisit();
    data.problemTokens.clear();
    data.problemListing = QStringLiteral("- Social smile\n- Head control\n- Rolls over\n"
                                         "• Teeth erupted (2)\n• Teeth erupted (2 teeth)");
    const QString dump = assembler.assembleBody(data, {}).dump();
    EXPECT_TRUE(dump.contains(QStringLiteral(
        "H1 Problem Listing\nB • Milestones\nB • Social smile\nB • Head control\n"
        "B • Rolls over\nB • Teeth erupted (2)\nH1 Conclusions\n")));
}

TEST_F(ReportAssemblerTest, HiddenSectionsAreRemoved)
{
    const VisitReportData data = TestData::wellVisit();
    const QString full = assembler.assembleBody(data, {}).dump();

    const QList<std::pair<Section, QString>> gated = {
        {Section::ParentsConcerns, QStringLiteral("H1 Parents' Concerns\n")},
        {Section::Feeding, QStringLiteral("H1 Feeding\n")},
        {Section::Supplementation, QStringLiteral("H1 Supplementation\n")},
        {Section::Sleep, QStringLiteral("H1 Sleep\n")},
        {Section::Development, QStringLiteral("H1 Development\n")},
        {Section::Milestones, QStringLiteral("H1 Developmental Milestones\n")},
        {Section::Measurements, QStringLiteral("H1 Measurements\n")},
        {Section::PhysicalExam, QStringLiteral("H1 Physical Examination\n")},
        {Section::ProblemListing, QStringLiteral("H1 Problem Listing\n")},
        {Section::Conclusions, QStringLiteral("H1 Conclusions\n")},
        {Section::AnticipatoryGuidance, QStringLiteral("H1 Anticipatory Guidance\n")},
        {Section::ClinicianComments, QStringLiteral("H1 Clinician Comments\n")},
        {Section::NextVisit, QStringLiteral("H1 Next Visit\n")},
    };
    for (const auto &[section, heading] : gated) {
        SectionVisibility hidden;
        hidden.set(section, false);
        const QString dump = assembler.assembleBody(data, hidden).dump();
        EXPECT_TRUE(full.contains(heading));
        EXPECT_FALSE(dump.contains(heading)) << heading.toStdString();
        EXPECT_TRUE(dump.contains(QStringLiteral("H1 Perinatal Summary\n")));
        EXPECT_TRUE(dump.contains(QStringLiteral("H1 Stool\n")));

        SectionVisibility shown;
        shown.set(section, true);
        EXPECT_EQ(assembler.assembleBody(data, shown).dump(), full);
    }
}

TEST_F(ReportAssemblerTest, AssemblyIsDeterministic)
{
    const VisitReportData data = TestData::wellVisit();
    SectionVisibility flags;
    flags.set(Section::Sleep, false);
    EXPECT_EQ(assembler.assembleBody(data, flags).dump(),
              assembler.assembleBody(data, flags).dump());

    ReportAssembler other(localizer);
    EXPECT_EQ(other.assembleBody(data, flags).dump(), assembler.assembleBody(data, flags).dump());
}

TEST_F(ReportAssemblerTest, SickVisitLayout)
{
    const QString dump = assembler.assembleBody(TestData::sickVisit(), {}).dump();
    EXPECT_TRUE(dump.startsWith(QStringLiteral("P[title] Sick Visit Report\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("P[meta] Visit Date: 1 Feb 2024 • Visit Type: Sick visit\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("H1 Main Complaint\nP[body] Fever\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("H1 Vitals Summary\nB • T 38.9 °C\nB • HR 140\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("H1 ICD-10\nP[body] B34.9 — Viral infection, unspecified\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("H1 Plan & Anticipatory Guidance\n")));
    EXPECT_FALSE(dump.contains(QStringLiteral("Current Visit")));
    EXPECT_TRUE(dump.indexOf(QStringLiteral("H1 Investigations")) < dump.indexOf(QStringLiteral("H1 ICD-10")));
}

TEST_F(ReportAssemblerTest, SickVisitGating)
{
    SectionVisibility flags;
    flags.set(Section::PhysicalExam, false);
    flags.set(Section::AnticipatoryGuidance, false);
    flags.set(Section::NextVisit, false);
    const QString dump = assembler.assembleBody(TestData::sickVisit(), flags).dump();
    EXPECT_FALSE(dump.contains(QStringLiteral("H1 Physical Examination\n")));
    EXPECT_FALSE(dump.contains(QStringLiteral("H1 Plan & Anticipatory Guidance\n")));
    EXPECT_FALSE(dump.contains(QStringLiteral("H1 Follow-up / Next Visit\n")));
    EXPECT_TRUE(dump.contains(QStringLiteral("H1 Medications\n")));
}

TEST_F(ReportAssemblerTest, ChartsDocumentHasOnePagePerChart)
{
    const VisitReportData data = TestData::wellVisit();
    QList<ChartImage> charts;
    for (GrowthMetric metric : {GrowthMetric::Weight, GrowthMetric::Length}) {
        ChartImage chart;
        chart.metric = metric;
        chart.image = TestData::chartImage(Qt::blue);
        chart.pointSize = QSizeF(400, 300);
        charts.append(chart);
    }

    const Document doc = assembler.assembleCharts(*data.growth, charts);
    EXPECT_EQ(doc.imageCount(), 2);
    EXPECT_EQ(doc.dump(),
              QStringLiteral("BREAK\n"
                             "H1 Growth Charts\n"
                             "P[body] Weight-for-age: 3 points, 0.0–2.6 months\n"
                             "IMG 0 400x300 Weight-for-age\n"
                             "BREAK\n"
                             "P[body] Length/Height-for-age: 2 points, 0.0–2.6 months\n"
                             "IMG 1 400x300 Length/Height-for-age\n"));

    const QList<QList<Block>> segments = doc.segments();
    ASSERT_EQ(segments.size(), 3);
    EXPECT_TRUE(segments.at(0).isEmpty());

    EXPECT_TRUE(assembler.assembleCharts(*data.growth, {}).isEmpty());
}
