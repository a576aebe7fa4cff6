#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "exportcontroller.h"
#include "pdfinspector.h"
#include "testdata.h"

using namespace Report;

class ExportControllerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        source.visits.insert(QStringLiteral("w1"), TestData::wellVisit());
        source.visits.insert(QStringLiteral("s1"), TestData::sickVisit());
        options.exportDirectory = dir.filePath(QStringLiteral("reports"));
    }

    QStringList writtenFiles() const
    {
        return QDir(options.exportDirectory).entryList(QDir::Files);
    }

    QTemporaryDir dir;
    TestData::MemorySource source;
    ExportOptions options;
};

TEST_F(ExportControllerTest, SuggestedFileStem)
{
    EXPECT_EQ(ExportController::suggestedFileStem(TestData::wellVisit()),
              QStringLiteral("Alice_Martin_2-month_visit_report_2024-03-20"));

    VisitReportData sick = TestData::sickVisit();
    EXPECT_EQ(ExportController::suggestedFileStem(sick),
              QStringLiteral("Tom-_O'Brien_sick_report_2024-02-01"));

    sick.meta.name.clear();
    sick.meta.alias = QStringLiteral("Red/Owl");
    sick.meta.visitTypeReadable = QStringLiteral("Ear Check");
    EXPECT_EQ(ExportController::suggestedFileStem(sick),
              QStringLiteral("Red-Owl_ear_check_report_2024-02-01"));

    EXPECT_EQ(ExportController::sanitizeFileComponent(QStringLiteral("a*b?c\"d<e>f|g\th")),
              QStringLiteral("a-b-c-d-e-f-g-h"));
}

TEST_F(ExportControllerTest, FormatNames)
{
    EXPECT_EQ(ExportController::formatFromName(QStringLiteral("PDF")), ExportFormat::Pdf);
    EXPECT_EQ(ExportController::formatFromName(QStringLiteral("docx")), ExportFormat::Docx);
    EXPECT_FALSE(ExportController::formatFromName(QStringLiteral("odt")).has_value());
    EXPECT_EQ(ExportController::extension(ExportFormat::Rtf), QStringLiteral("rtf"));
}

TEST_F(ExportControllerTest, CancelledExportWritesNothing)
{
    ExportController controller(options, &source, &source, &source);
    const ExportResult result =
        controller.exportReport(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Pdf, QString());
    EXPECT_EQ(result.error, ExportResult::Error::Cancelled);
    EXPECT_EQ(source.loads, 0);
    EXPECT_TRUE(writtenFiles().isEmpty());
}

TEST_F(ExportControllerTest, MissingVisitIsDataUnavailable)
{
    ExportController controller(options, &source, &source, &source);
    const ExportResult result =
        controller.exportReport(VisitKind::Well, QStringLiteral("nope"), ExportFormat::Rtf);
    EXPECT_EQ(result.error, ExportResult::Error::DataUnavailable);
    EXPECT_TRUE(result.message.contains(QLatin1String("nope")));
    EXPECT_TRUE(writtenFiles().isEmpty());

    // A sick id asked for as a well visit does not load either
    EXPECT_EQ(controller.exportReport(VisitKind::Well, QStringLiteral("s1"), ExportFormat::Rtf).error,
              ExportResult::Error::DataUnavailable);
}

TEST_F(ExportControllerTest, PdfIntoDefaultDirectory)
{
    ExportController controller(options, &source, &source, &source);
    const ExportResult result =
        controller.exportReport(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Pdf);
    ASSERT_TRUE(result.ok()) << result.message.toStdString();
    EXPECT_EQ(result.path, QDir(options.exportDirectory)
                               .filePath(QStringLiteral("Alice_Martin_2-month_visit_report_2024-03-20.pdf")));

    QFile file(result.path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QByteArray pdf = file.readAll();
    EXPECT_TRUE(pdf.startsWith("%PDF"));
    // Body, then one page per growth chart
    EXPECT_GE(PdfInspector::pageCount(pdf), 3);
    EXPECT_EQ(source.chartRequests, 1);

    QString error;
    EXPECT_TRUE(PdfInspector::blankPages(pdf, QStringLiteral("report"), &error).isEmpty());
    EXPECT_TRUE(PdfInspector::pageText(pdf, 0).contains(QLatin1String("Alice Martin")));
    EXPECT_EQ(PdfInspector::documentTitle(pdf), QStringLiteral("Alice Martin — 2-month visit"));
}

TEST_F(ExportControllerTest, ChartsAreRequestedForEveryExport)
{
    ExportController controller(options, &source, &source, &source);
    QByteArray bytes;
    ASSERT_TRUE(controller.render(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Rtf, &bytes).ok());
    ASSERT_TRUE(controller.render(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Rtf, &bytes).ok());
    EXPECT_EQ(source.chartRequests, 2);
    EXPECT_EQ(source.loads, 2);
}

TEST_F(ExportControllerTest, RtfToExplicitFile)
{
    ExportController controller(options, &source, &source, &source);
    const QString target = dir.filePath(QStringLiteral("out/visit.rtf"));
    const ExportResult result =
        controller.exportReport(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Rtf, target);
    ASSERT_TRUE(result.ok()) << result.message.toStdString();
    EXPECT_EQ(result.path, target);

    QFile file(target);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QByteArray rtf = file.readAll();
    EXPECT_TRUE(rtf.startsWith("{\\rtf1"));
    EXPECT_EQ(rtf.count("{\\pict"), 2);
}

TEST_F(ExportControllerTest, DocxIntoExistingDirectory)
{
    ExportController controller(options, &source, &source, &source);
    const ExportResult result =
        controller.exportReport(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Docx, dir.path());
    ASSERT_TRUE(result.ok()) << result.message.toStdString();
    EXPECT_TRUE(result.path.endsWith(QLatin1String("_report_2024-03-20.docx")));

    QFile file(result.path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    QStringList order;
    const auto entries = TestData::readZip(file.readAll(), &order);
    ASSERT_FALSE(order.isEmpty());
    EXPECT_EQ(order.first(), QStringLiteral("[Content_Types].xml"));
    int media = 0;
    for (const QString &name : order)
        media += name.startsWith(QLatin1String("word/media/")) ? 1 : 0;
    EXPECT_EQ(media, 2);
}

TEST_F(ExportControllerTest, HiddenSectionsStayHiddenInOutput)
{
    source.flags.set(Section::ClinicianComments, false);
    ExportController controller(options, &source, &source, &source);
    QByteArray rtf;
    ASSERT_TRUE(controller.render(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Rtf, &rtf).ok());
    EXPECT_FALSE(rtf.contains("Clinician Comments"));
    EXPECT_TRUE(rtf.contains("Perinatal Summary"));
}

TEST_F(ExportControllerTest, SickVisitHasNoCharts)
{
    ExportController controller(options, &source, &source, &source);
    QByteArray rtf;
    VisitReportData loaded;
    ASSERT_TRUE(controller.render(VisitKind::Sick, QStringLiteral("s1"), ExportFormat::Rtf,
                                  &rtf, &loaded).ok());
    EXPECT_EQ(loaded.meta.mrn, QString());
    EXPECT_FALSE(rtf.contains("{\\pict"));
    EXPECT_EQ(source.chartRequests, 0);
}

TEST_F(ExportControllerTest, UnwritableDestinationIsWriteError)
{
    QFile blocker(dir.filePath(QStringLiteral("blocker")));
    ASSERT_TRUE(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    ExportController controller(options, &source, &source, &source);
    const ExportResult result = controller.exportReport(
        VisitKind::Sick, QStringLiteral("s1"), ExportFormat::Rtf,
        dir.filePath(QStringLiteral("blocker/report.rtf")));
    EXPECT_EQ(result.error, ExportResult::Error::Write);
    EXPECT_FALSE(QFile::exists(dir.filePath(QStringLiteral("blocker/report.rtf"))));
}

TEST_F(ExportControllerTest, PageGeometryReachesRtfAndDocx)
{
    options.geometry = PageGeometry::usLetter();
    ExportController controller(options, &source, &source, &source);

    QByteArray rtf;
    ASSERT_TRUE(controller.render(VisitKind::Sick, QStringLiteral("s1"), ExportFormat::Rtf, &rtf).ok());
    EXPECT_TRUE(rtf.contains("\\paperw12240\\paperh15840\\margl720"));

    QByteArray docx;
    ASSERT_TRUE(controller.render(VisitKind::Sick, QStringLiteral("s1"), ExportFormat::Docx, &docx).ok());
    const QByteArray document = TestData::readZip(docx).value(QStringLiteral("word/document.xml"));
    EXPECT_TRUE(document.contains("w:w=\"12240\""));
    EXPECT_TRUE(document.contains("w:h=\"15840\""));
}

TEST_F(ExportControllerTest, RendererChartSizeIsUsedByEveryFormat)
{
    source.chartPointSize = QSizeF(240, 180);
    ExportController controller(options, &source, &source, &source);

    QByteArray rtf;
    ASSERT_TRUE(controller.render(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Rtf, &rtf).ok());
    EXPECT_EQ(rtf.count("\\picwgoal4800\\pichgoal3600"), 2);

    QByteArray docx;
    ASSERT_TRUE(controller.render(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Docx, &docx).ok());
    const QByteArray document = TestData::readZip(docx).value(QStringLiteral("word/document.xml"));
    EXPECT_EQ(document.count("cx=\"3048000\" cy=\"2286000\""), 2);

    // Oversized requests are capped the same way for all formats
    source.chartPointSize = QSizeF(1000, 750);
    ASSERT_TRUE(controller.render(VisitKind::Well, QStringLiteral("w1"), ExportFormat::Rtf, &rtf).ok());
    const int twips = qRound(options.geometry.chartWidth() * 20.0);
    EXPECT_EQ(rtf.count("\\picwgoal" + QByteArray::number(twips)), 2);
}
