#include <gtest/gtest.h>

#include <QBuffer>
#include <QPdfWriter>
#include <QTextDocument>

#include <poppler-qt6.h>

#include <algorithm>
#include <memory>

#include "localizer.h"
#include "pdfinspector.h"
#include "pdfreportrenderer.h"
#include "reportassembler.h"
#include "rtfwriter.h"
#include "textflow.h"
#include "testdata.h"

using namespace Report;

class PdfExportTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        data = TestData::wellVisit();
        for (GrowthMetric metric : {GrowthMetric::Weight, GrowthMetric::Length}) {
            ChartImage chart;
            chart.metric = metric;
            chart.image = TestData::chartImage(Qt::blue);
            chart.pointSize = geometry.chartDisplaySize(chart.image.size());
            charts.append(chart);
        }
    }

    PageGeometry geometry;
    Localizer localizer;
    ReportAssembler assembler{localizer};
    PdfReportRenderer renderer{geometry};
    VisitReportData data;
    QList<ChartImage> charts;
};

TEST_F(PdfExportTest, ChartsPdfStartsWithBlankPage)
{
    const Document chartsDoc = assembler.assembleCharts(*data.growth, charts);
    QByteArray pdf;
    QString error;
    ASSERT_TRUE(renderer.renderCharts(chartsDoc, charts, &pdf, &error));
    EXPECT_TRUE(pdf.startsWith("%PDF"));
    EXPECT_EQ(PdfInspector::pageCount(pdf), 3);
    EXPECT_EQ(PdfInspector::blankPages(pdf, QStringLiteral("charts"), &error), QList<int>{0});

    QByteArray trimmed;
    ASSERT_TRUE(renderer.render({{chartsDoc, PdfReportRenderer::PartKind::Charts,
                                  PdfReportRenderer::Trim::LeadingBlank}},
                                charts, &trimmed, &error)) << error.toStdString();
    EXPECT_EQ(PdfInspector::pageCount(trimmed), 2);
}

TEST_F(PdfExportTest, ReportPagesAreBodyPlusOnePerChart)
{
    const Document body = assembler.assembleBody(data, {});
    QByteArray bodyPdf;
    QString error;
    ASSERT_TRUE(renderer.renderBody(body, charts, &bodyPdf, &error));
    const int bodyPages = PdfInspector::pageCount(bodyPdf);
    ASSERT_GE(bodyPages, 1);

    QByteArray report;
    ASSERT_TRUE(renderer.renderReport(body, assembler.assembleCharts(*data.growth, charts),
                                      charts, &report, &error)) << error.toStdString();
    EXPECT_EQ(PdfInspector::pageCount(report), bodyPages + charts.size());
    EXPECT_TRUE(PdfInspector::blankPages(report, QStringLiteral("report"), &error).isEmpty());
    EXPECT_TRUE(error.isEmpty());
}

TEST_F(PdfExportTest, ReportKeepsTextLayerAndTitle)
{
    const Document body = assembler.assembleBody(data, {});
    renderer.setDocumentTitle(assembler.reportTitle(body));

    QByteArray report;
    QString error;
    ASSERT_TRUE(renderer.renderReport(body, assembler.assembleCharts(*data.growth, charts),
                                      charts, &report, &error)) << error.toStdString();

    EXPECT_TRUE(PdfInspector::pageText(report, 0).contains(QLatin1String("Alice Martin")));
    const int last = PdfInspector::pageCount(report) - 1;
    EXPECT_TRUE(PdfInspector::pageText(report, last).contains(QLatin1String("Length")));
    EXPECT_EQ(PdfInspector::documentTitle(report), QStringLiteral("Alice Martin — 2-month visit"));
}

TEST_F(PdfExportTest, TrailingBlankBodyPagesAreDropped)
{
    Document body;
    body.addParagraph(QStringLiteral("Only page"));
    body.addPageBreak();
    body.addPageBreak();

    QByteArray untrimmed;
    QByteArray report;
    QString error;
    ASSERT_TRUE(renderer.renderBody(body, {}, &untrimmed, &error));
    EXPECT_EQ(PdfInspector::pageCount(untrimmed), 2);
    ASSERT_TRUE(renderer.renderReport(body, Document(), {}, &report, &error));
    EXPECT_EQ(PdfInspector::pageCount(report), 1);
    EXPECT_TRUE(PdfInspector::pageText(report, 0).contains(QLatin1String("Only page")));
}

TEST_F(PdfExportTest, ChartDrawnAtItsLogicalSize)
{
    QImage solid(400, 300, QImage::Format_RGB32);
    solid.fill(Qt::blue);
    ChartImage chart;
    chart.metric = GrowthMetric::Weight;
    chart.image = solid;
    chart.pointSize = QSizeF(200, 150);
    const QList<ChartImage> small{chart};
    const Document chartsDoc = assembler.assembleCharts(*data.growth, small);

    QByteArray pdf;
    QString error;
    ASSERT_TRUE(renderer.render({{chartsDoc, PdfReportRenderer::PartKind::Charts,
                                  PdfReportRenderer::Trim::LeadingBlank}},
                                small, &pdf, &error)) << error.toStdString();

    std::unique_ptr<Poppler::Document> doc(Poppler::Document::loadFromData(pdf));
    ASSERT_TRUE(doc);
    ASSERT_EQ(doc->numPages(), 1);
    std::unique_ptr<Poppler::Page> page(doc->page(0));
    ASSERT_TRUE(page);
    const QImage raster = page->renderToImage(72.0, 72.0);
    ASSERT_FALSE(raster.isNull());

    int left = raster.width();
    int right = -1;
    int top = raster.height();
    int bottom = -1;
    for (int y = 0; y < raster.height(); ++y) {
        for (int x = 0; x < raster.width(); ++x) {
            const QColor c = raster.pixelColor(x, y);
            if (c.blue() > 200 && c.red() < 60 && c.green() < 60) {
                left = std::min(left, x);
                right = std::max(right, x);
                top = std::min(top, y);
                bottom = std::max(bottom, y);
            }
        }
    }
    ASSERT_GE(right, left);
    EXPECT_NEAR(right - left + 1, 200, 2);
    EXPECT_NEAR(bottom - top + 1, 150, 2);

    // RTF declares the same goal size: 200 pt = 4000 twips
    RtfWriter writer;
    writer.begin();
    writer.appendDocument(chartsDoc, small);
    EXPECT_TRUE(writer.finish().contains("\\picwgoal4000\\pichgoal3000"));
    EXPECT_EQ(renderer.chartSize(ImagePlaceholder{0, QString(), QSizeF()}, small),
              QSizeF(200, 150));
}

TEST_F(PdfExportTest, OversizedChartIsCappedAtChartWidth)
{
    ChartImage chart;
    chart.image = TestData::chartImage(Qt::blue);
    chart.pointSize = QSizeF(1000, 750);
    const QSizeF size = renderer.chartSize(ImagePlaceholder{0, QString(), QSizeF()}, {chart});
    EXPECT_NEAR(size.width(), geometry.chartWidth(), 1e-6);
    EXPECT_NEAR(size.height(), geometry.chartWidth() * 0.75, 1e-6);
}

TEST_F(PdfExportTest, LongBodyFlowsOntoMorePages)
{
    Document shortDoc;
    shortDoc.addParagraph(QStringLiteral("One line"));

    Document longDoc;
    for (int i = 0; i < 200; ++i)
        longDoc.addBullet(QStringLiteral("• Observation line %1").arg(i));

    QByteArray shortPdf;
    QByteArray longPdf;
    QString error;
    ASSERT_TRUE(renderer.renderBody(shortDoc, {}, &shortPdf, &error));
    ASSERT_TRUE(renderer.renderBody(longDoc, {}, &longPdf, &error));
    EXPECT_EQ(PdfInspector::pageCount(shortPdf), 1);
    EXPECT_GT(PdfInspector::pageCount(longPdf), 1);
}

TEST_F(PdfExportTest, PageBreakStartsNewPage)
{
    Document doc;
    doc.addParagraph(QStringLiteral("first"));
    doc.addPageBreak();
    doc.addParagraph(QStringLiteral("second"));

    QByteArray pdf;
    QString error;
    ASSERT_TRUE(renderer.renderBody(doc, {}, &pdf, &error));
    EXPECT_EQ(PdfInspector::pageCount(pdf), 2);
}

TEST_F(PdfExportTest, PaginationCoversWholeDocument)
{
    Document doc;
    for (int i = 0; i < 120; ++i)
        doc.addParagraph(QStringLiteral("Paragraph %1 with enough words to wrap across the line "
                                        "at least once on an A4 page with half-inch margins.")
                             .arg(i));

    QByteArray scratch;
    QBuffer buffer(&scratch);
    ASSERT_TRUE(buffer.open(QIODevice::WriteOnly));
    QPdfWriter writer(&buffer);
    writer.setResolution(72);

    const Layout::TextFlow flow(geometry);
    const auto textDoc = flow.build(doc.blocks(), {}, &writer);
    const QList<Layout::PageSlice> slices = flow.paginate(textDoc.get());
    ASSERT_GT(slices.size(), 1);

    const qreal pageHeight = geometry.contentRect().height();
    qreal expectedTop = 0;
    for (const Layout::PageSlice &slice : slices) {
        EXPECT_NEAR(slice.top, expectedTop, 1e-6);
        EXPECT_GT(slice.height, 0);
        EXPECT_LE(slice.height, pageHeight + 0.01);
        expectedTop = slice.top + slice.height;
    }
    EXPECT_NEAR(expectedTop, textDoc->size().height(), 1.0);
}

TEST(PdfInspector, UnreadablePdfIsAnError)
{
    QString error;
    EXPECT_TRUE(PdfInspector::blankPages(QByteArray("not a pdf"), QStringLiteral("garbage"),
                                         &error).isEmpty());
    EXPECT_TRUE(error.contains(QLatin1String("garbage")));
    EXPECT_EQ(PdfInspector::pageCount(QByteArray("nope")), -1);
    EXPECT_TRUE(PdfInspector::pageText(QByteArray("nope"), 0).isEmpty());
}

TEST(PdfReportRenderer, NothingLeftAfterTrimmingIsAnError)
{
    Document empty;
    empty.addPageBreak();

    PdfReportRenderer renderer{PageGeometry()};
    QByteArray pdf;
    QString error;
    EXPECT_FALSE(renderer.render({{empty, PdfReportRenderer::PartKind::Flowed,
                                   PdfReportRenderer::Trim::TrailingBlank}},
                                 {}, &pdf, &error));
    EXPECT_FALSE(error.isEmpty());
}
