#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTimeZone>

#include "docxpackage.h"
#include "localizer.h"
#include "reportassembler.h"
#include "testdata.h"

using namespace Report;

class DocxPackageTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        data = TestData::wellVisit();
        for (GrowthMetric metric : {GrowthMetric::Weight, GrowthMetric::Length}) {
            ChartImage chart;
            chart.metric = metric;
            chart.image = TestData::chartImage(Qt::red);
            chart.pointSize = QSizeF(360, 270);
            charts.append(chart);
        }
        documents = {assembler.assembleBody(data, {}),
                     assembler.assembleCharts(*data.growth, charts)};
    }

    Localizer localizer;
    ReportAssembler assembler{localizer};
    Docx::PackageBuilder builder{localizer, assembler.sectionHeadingLabels()};
    VisitReportData data;
    QList<ChartImage> charts;
    QList<Document> documents;
};

TEST_F(DocxPackageTest, ParagraphStyles)
{
    const QList<Docx::PackageParagraph> paras = builder.paragraphs(documents);
    ASSERT_FALSE(paras.isEmpty());
    EXPECT_EQ(paras.first().style, Docx::kStyleTitle);
    EXPECT_TRUE(paras.first().centered);

    auto styleOf = [&](const QString &text) {
        for (const auto &p : paras) {
            if (p.text == text)
                return p.style;
        }
        return QString();
    };
    EXPECT_EQ(styleOf(QStringLiteral("Feeding")), Docx::kStyleHeading1);
    EXPECT_EQ(styleOf(QStringLiteral("Current Visit — 2-month visit")), Docx::kStyleHeading1);
    EXPECT_EQ(styleOf(QStringLiteral("General")), Docx::kStyleHeading2);
    EXPECT_EQ(styleOf(QStringLiteral("Name: Alice Martin")), Docx::kStyleNormal);
    EXPECT_EQ(styleOf(QStringLiteral("• Breastfeeding: Yes")), Docx::kStyleNormal);

    int images = 0;
    for (const auto &p : paras) {
        if (p.kind == Docx::PackageParagraph::Kind::Image)
            ++images;
        if (p.kind == Docx::PackageParagraph::Kind::Text)
            EXPECT_FALSE(p.text.trimmed().isEmpty());
    }
    EXPECT_EQ(images, 2);
}

TEST_F(DocxPackageTest, BulletRunsAreNormalized)
{
    Document doc;
    doc.addHeading(1, QStringLiteral("Problem Listing"));
    doc.addBullet(QStringLiteral("- Social smile"));
    doc.addBullet(QStringLiteral("- Head control"));
    doc.addBullet(QStringLiteral("- Rolls over"));
    doc.addBullet(QStringLiteral("• Social smile"));
    doc.addParagraph(QStringLiteral("   "));

    QStringList texts;
    for (const auto &p : builder.paragraphs({doc}))
        texts.append(p.text);
    EXPECT_EQ(texts, QStringList({QStringLiteral("Problem Listing"),
                                  QStringLiteral("• Milestones"),
                                  QStringLiteral("• Social smile"),
                                  QStringLiteral("• Head control"),
                                  QStringLiteral("• Rolls over")}));
}

TEST_F(DocxPackageTest, DashLedBodyTextIsNotAMilestoneRun)
{
    data.conclusions = QStringLiteral("- Continue vitamin D\n- Recheck weight");
    const QList<Docx::PackageParagraph> paras =
        builder.paragraphs({assembler.assembleBody(data, {})});

    int at = -1;
    for (int i = 0; i < paras.size(); ++i) {
        if (paras.at(i).text == QLatin1String("Conclusions"))
            at = i;
    }
    ASSERT_GE(at, 0);
    ASSERT_LT(at + 2, paras.size());
    EXPECT_EQ(paras.at(at + 1).text, QStringLiteral("- Continue vitamin D"));
    EXPECT_EQ(paras.at(at + 2).text, QStringLiteral("- Recheck weight"));
    EXPECT_FALSE(paras.at(at + 1).bullet);

    Document doc;
    doc.addHeading(1, QStringLiteral("Conclusions"));
    doc.addParagraph(QStringLiteral("- Continue vitamin D"));
    QStringList texts;
    for (const auto &p : builder.paragraphs({doc}))
        texts.append(p.text);
    EXPECT_EQ(texts, QStringList({QStringLiteral("Conclusions"),
                                  QStringLiteral("- Continue vitamin D")}));
}

TEST_F(DocxPackageTest, TitleFromNameAndVisitLines)
{
    EXPECT_EQ(builder.title(builder.paragraphs(documents)),
              QStringLiteral("Alice Martin — 2-month visit"));

    Document anonymous;
    anonymous.addParagraph(QStringLiteral("Nothing identifying"));
    EXPECT_EQ(builder.title(builder.paragraphs({anonymous})), QStringLiteral("Visit Report"));

    // The PDF title comes from the same lines
    EXPECT_EQ(assembler.reportTitle(documents.first()),
              builder.title(builder.paragraphs(documents)));
}

TEST(DocxArchive, EntriesAreRootRelativeWithContentTypesFirst)
{
    QTemporaryDir root;
    ASSERT_TRUE(root.isValid());
    auto put = [&](const QString &name, const QByteArray &data) {
        const QString path = root.filePath(name);
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile file(path);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write(data);
    };
    put(QStringLiteral("word/document.xml"), QByteArray("<w:document/>"));
    put(QStringLiteral("_rels/.rels"), QByteArray("<Relationships/>"));
    put(QStringLiteral("[Content_Types].xml"), QByteArray("<Types/>"));
    put(QStringLiteral("word/media/image1.png"), QByteArray(4096, 'x'));

    QByteArray zip;
    QString error;
    ASSERT_TRUE(Docx::PackageBuilder::archiveDirectory(root.path(), &zip, &error))
        << error.toStdString();
    EXPECT_TRUE(zip.startsWith("PK"));

    QStringList order;
    const QMap<QString, QByteArray> entries = TestData::readZip(zip, &order);
    ASSERT_EQ(order.size(), 4);
    EXPECT_EQ(order.first(), QStringLiteral("[Content_Types].xml"));
    EXPECT_EQ(entries.value(QStringLiteral("word/document.xml")), QByteArray("<w:document/>"));
    EXPECT_EQ(entries.value(QStringLiteral("_rels/.rels")), QByteArray("<Relationships/>"));
    EXPECT_EQ(entries.value(QStringLiteral("word/media/image1.png")), QByteArray(4096, 'x'));
    // Deflated, not stored
    EXPECT_LT(zip.size(), 4096);
}

TEST_F(DocxPackageTest, PackageLayout)
{
    Docx::PackageInfo info;
    info.creator = QStringLiteral("Dr. Hale");
    info.created = QDateTime(QDate(2024, 3, 21), QTime(8, 0), QTimeZone::utc());
    info.modified = info.created;

    QByteArray docx;
    QString error;
    ASSERT_TRUE(builder.build(documents, charts, info, &docx, &error)) << error.toStdString();

    QStringList order;
    const QMap<QString, QByteArray> entries = TestData::readZip(docx, &order);
    ASSERT_FALSE(order.isEmpty());
    EXPECT_EQ(order.first(), QStringLiteral("[Content_Types].xml"));
    for (const QString &name : order) {
        EXPECT_FALSE(name.startsWith(QLatin1Char('/'))) << name.toStdString();
        EXPECT_FALSE(name.contains(QLatin1String("visitreport-docx"))) << name.toStdString();
    }

    for (const char *part : {"_rels/.rels", "docProps/core.xml", "docProps/app.xml",
                             "word/styles.xml", "word/document.xml",
                             "word/_rels/document.xml.rels"}) {
        EXPECT_TRUE(entries.contains(QLatin1String(part))) << part;
    }

    QStringList media;
    for (const QString &name : order) {
        if (name.startsWith(QLatin1String("word/media/")))
            media.append(name);
    }
    EXPECT_EQ(media, QStringList({QStringLiteral("word/media/image1.png"),
                                  QStringLiteral("word/media/image2.png")}));
    EXPECT_TRUE(entries.value(media.first()).startsWith("\x89PNG"));

    const QByteArray document = entries.value(QStringLiteral("word/document.xml"));
    EXPECT_EQ(document.count("<w:drawing>"), 2);
    EXPECT_TRUE(document.contains("cx=\"4572000\" cy=\"3429000\""));
    EXPECT_TRUE(document.contains("r:embed=\"rId2\""));
    EXPECT_TRUE(document.contains("r:embed=\"rId3\""));

    const QByteArray rels = entries.value(QStringLiteral("word/_rels/document.xml.rels"));
    EXPECT_TRUE(rels.contains("Target=\"media/image2.png\""));

    const QString core = QString::fromUtf8(entries.value(QStringLiteral("docProps/core.xml")));
    EXPECT_TRUE(core.contains(QStringLiteral("Alice Martin — 2-month visit")));
    EXPECT_TRUE(core.contains(QStringLiteral("Dr. Hale")));
}

TEST_F(DocxPackageTest, MissingChartImageIsLeftOut)
{
    charts[1].image = QImage();

    QByteArray docx;
    QString error;
    ASSERT_TRUE(builder.build(documents, charts, {}, &docx, &error));

    int media = 0;
    const QMap<QString, QByteArray> entries = TestData::readZip(docx);
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it.key().startsWith(QLatin1String("word/media/")))
            ++media;
    }
    EXPECT_EQ(media, 1);
}
