/*
 * docxpackage.cpp — Report documents to an OOXML word-processing package
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "docxpackage.h"
#include "bulletnormalizer.h"
#include "localizer.h"
#include "reportassembler.h"
#include "rtfutils.h"

#include <QBuffer>
#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QXmlStreamWriter>

#include <KZip>

#include <algorithm>
#include <type_traits>

namespace Docx {

namespace {

const QString kNsW = QStringLiteral("http://schemas.openxmlformats.org/wordprocessingml/2006/main");
const QString kNsR = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships");
const QString kNsWp = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing");
const QString kNsA = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/main");
const QString kNsPic = QStringLiteral("http://schemas.openxmlformats.org/drawingml/2006/picture");
const QString kNsPkgRels = QStringLiteral("http://schemas.openxmlformats.org/package/2006/relationships");
const QString kRelBase = QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/relationships/");

const QString kContentTypesPart = QStringLiteral("[Content_Types].xml");

// Rendered style tags, before mapping to package styles
const QString kTagTitle = QStringLiteral("title");
const QString kTagHeading = QStringLiteral("heading");
const QString kTagSubheading = QStringLiteral("subheading");
const QString kTagBody = QStringLiteral("body");

void startXml(QXmlStreamWriter &xml)
{
    xml.writeStartDocument(QStringLiteral("1.0"), true);
}

bool writeFile(const QString &path, const QByteArray &data)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    return file.write(data) == data.size();
}

} // namespace

PackageBuilder::PackageBuilder(const Localizer &localizer, const QStringList &headingLabels,
                               const PageGeometry &geometry)
    : m_localizer(localizer)
    , m_headingLabels(headingLabels)
    , m_geometry(geometry)
    , m_currentVisitPrefix(localizer.prefixOf(QStringLiteral("section.current_visit")))
{
}

QString PackageBuilder::styleFor(const QString &text, const QString &tag) const
{
    if (tag == kTagTitle)
        return kStyleTitle;
    const QString t = text.trimmed();
    if (m_headingLabels.contains(t)
        || (!m_currentVisitPrefix.isEmpty() && t.startsWith(m_currentVisitPrefix)))
        return kStyleHeading1;
    if (tag == kTagSubheading)
        return kStyleHeading2;
    return kStyleNormal;
}

QList<PackageParagraph> PackageBuilder::paragraphs(const QList<Report::Document> &documents) const
{
    // Render blocks to tagged paragraphs
    QList<PackageParagraph> rendered;
    for (const Report::Document &document : documents) {
        for (const auto &block : document.blocks()) {
            std::visit([&](const auto &b) {
                using T = std::decay_t<decltype(b)>;
                PackageParagraph p;
                if constexpr (std::is_same_v<T, Report::Heading>) {
                    p.text = b.text;
                    p.style = styleFor(b.text, b.level <= 1 ? kTagHeading : kTagSubheading);
                    rendered.append(p);
                } else if constexpr (std::is_same_v<T, Report::Paragraph>) {
                    p.text = b.text;
                    p.style = styleFor(b.text, b.role == Report::ParagraphRole::Title
                                                   ? kTagTitle : kTagBody);
                    p.centered = b.alignment.testFlag(Qt::AlignHCenter);
                    rendered.append(p);
                } else if constexpr (std::is_same_v<T, Report::BulletItem>) {
                    p.text = b.text;
                    p.style = styleFor(b.text, kTagBody);
                    p.bullet = true;
                    rendered.append(p);
                } else if constexpr (std::is_same_v<T, Report::ImagePlaceholder>) {
                    p.text = b.caption;
                    p.centered = true;
                    rendered.append(p);

                    PackageParagraph image;
                    image.kind = PackageParagraph::Kind::Image;
                    image.centered = true;
                    image.chartIndex = b.chartIndex;
                    image.pointSize = b.pointSize;
                    rendered.append(image);
                } else if constexpr (std::is_same_v<T, Report::PageBreak>) {
                    p.kind = PackageParagraph::Kind::PageBreak;
                    rendered.append(p);
                }
            }, block);
        }
    }

    // Drop blanks and normalize each run of bullet paragraphs
    const QString header = m_localizer.text(QStringLiteral("milestone.header"));
    QList<PackageParagraph> result;
    QList<BulletNormalizer::StyledLine> run;

    auto flush = [&]() {
        if (run.isEmpty())
            return;
        const auto normalized = BulletNormalizer::normalizeStyled(run, header);
        for (const auto &line : normalized) {
            PackageParagraph p;
            p.text = line.text;
            p.style = line.style;
            p.bullet = true;
            result.append(p);
        }
        run.clear();
    };

    for (const PackageParagraph &p : std::as_const(rendered)) {
        if (p.kind == PackageParagraph::Kind::Text) {
            if (p.text.trimmed().isEmpty())
                continue;
            if (p.bullet && p.style == kStyleNormal) {
                run.append({p.text, p.style});
                continue;
            }
        }
        flush();
        result.append(p);
    }
    flush();
    return result;
}

QString PackageBuilder::title(const QList<PackageParagraph> &paragraphs) const
{
    QStringList lines;
    for (const PackageParagraph &p : paragraphs) {
        if (p.kind == PackageParagraph::Kind::Text)
            lines.append(p.text);
    }
    return ReportAssembler::reportTitle(m_localizer, lines);
}

// --- Fixed parts ---

QByteArray PackageBuilder::contentTypesXml()
{
    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QXmlStreamWriter xml(&buffer);
    startXml(xml);
    xml.writeStartElement(QStringLiteral("Types"));
    xml.writeDefaultNamespace(QStringLiteral("http://schemas.openxmlformats.org/package/2006/content-types"));

    auto addDefault = [&](const QString &ext, const QString &type) {
        xml.writeEmptyElement(QStringLiteral("Default"));
        xml.writeAttribute(QStringLiteral("Extension"), ext);
        xml.writeAttribute(QStringLiteral("ContentType"), type);
    };
    auto addOverride = [&](const QString &part, const QString &type) {
        xml.writeEmptyElement(QStringLiteral("Override"));
        xml.writeAttribute(QStringLiteral("PartName"), part);
        xml.writeAttribute(QStringLiteral("ContentType"), type);
    };

    addDefault(QStringLiteral("rels"), QStringLiteral("application/vnd.openxmlformats-package.relationships+xml"));
    addDefault(QStringLiteral("xml"), QStringLiteral("application/xml"));
    addDefault(QStringLiteral("png"), QStringLiteral("image/png"));
    addOverride(QStringLiteral("/word/document.xml"),
                QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"));
    addOverride(QStringLiteral("/word/styles.xml"),
                QStringLiteral("application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml"));
    addOverride(QStringLiteral("/docProps/core.xml"),
                QStringLiteral("application/vnd.openxmlformats-package.core-properties+xml"));
    addOverride(QStringLiteral("/docProps/app.xml"),
                QStringLiteral("application/vnd.openxmlformats-officedocument.extended-properties+xml"));

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray PackageBuilder::rootRelsXml()
{
    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QXmlStreamWriter xml(&buffer);
    startXml(xml);
    xml.writeStartElement(QStringLiteral("Relationships"));
    xml.writeDefaultNamespace(kNsPkgRels);

    auto addRel = [&](const QString &id, const QString &type, const QString &target) {
        xml.writeEmptyElement(QStringLiteral("Relationship"));
        xml.writeAttribute(QStringLiteral("Id"), id);
        xml.writeAttribute(QStringLiteral("Type"), type);
        xml.writeAttribute(QStringLiteral("Target"), target);
    };
    addRel(QStringLiteral("rId1"), kRelBase + QStringLiteral("officeDocument"),
           QStringLiteral("word/document.xml"));
    addRel(QStringLiteral("rId2"),
           QStringLiteral("http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties"),
           QStringLiteral("docProps/core.xml"));
    addRel(QStringLiteral("rId3"), kRelBase + QStringLiteral("extended-properties"),
           QStringLiteral("docProps/app.xml"));

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray PackageBuilder::coreXml(const QString &title, const PackageInfo &info)
{
    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QXmlStreamWriter xml(&buffer);
    startXml(xml);
    xml.writeStartElement(QStringLiteral("cp:coreProperties"));
    xml.writeAttribute(QStringLiteral("xmlns:cp"),
                        QStringLiteral("http://schemas.openxmlformats.org/package/2006/metadata/core-properties"));
    xml.writeAttribute(QStringLiteral("xmlns:dc"), QStringLiteral("http://purl.org/dc/elements/1.1/"));
    xml.writeAttribute(QStringLiteral("xmlns:dcterms"), QStringLiteral("http://purl.org/dc/terms/"));
    xml.writeAttribute(QStringLiteral("xmlns:xsi"), QStringLiteral("http://www.w3.org/2001/XMLSchema-instance"));

    xml.writeTextElement(QStringLiteral("dc:title"), title);
    xml.writeTextElement(QStringLiteral("dc:creator"), info.creator);
    xml.writeTextElement(QStringLiteral("cp:lastModifiedBy"), info.creator);

    auto stamp = [&](const QString &name, const QDateTime &dt) {
        xml.writeStartElement(name);
        xml.writeAttribute(QStringLiteral("xsi:type"), QStringLiteral("dcterms:W3CDTF"));
        xml.writeCharacters(dt.toUTC().toString(Qt::ISODate));
        xml.writeEndElement();
    };
    stamp(QStringLiteral("dcterms:created"), info.created);
    stamp(QStringLiteral("dcterms:modified"), info.modified.isValid() ? info.modified : info.created);

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray PackageBuilder::appXml()
{
    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QXmlStreamWriter xml(&buffer);
    startXml(xml);
    xml.writeStartElement(QStringLiteral("Properties"));
    xml.writeDefaultNamespace(
        QStringLiteral("http://schemas.openxmlformats.org/officeDocument/2006/extended-properties"));
    xml.writeTextElement(QStringLiteral("Application"), QStringLiteral("VisitReport"));
    xml.writeTextElement(QStringLiteral("DocSecurity"), QStringLiteral("0"));
    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray PackageBuilder::stylesXml()
{
    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QXmlStreamWriter xml(&buffer);
    startXml(xml);
    xml.writeStartElement(QStringLiteral("w:styles"));
    xml.writeAttribute(QStringLiteral("xmlns:w"), kNsW);

    auto addStyle = [&](const QString &id, const QString &name, int halfPoints,
                        bool bold, int spaceBefore, bool isDefault) {
        xml.writeStartElement(QStringLiteral("w:style"));
        xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("paragraph"));
        if (isDefault)
            xml.writeAttribute(QStringLiteral("w:default"), QStringLiteral("1"));
        xml.writeAttribute(QStringLiteral("w:styleId"), id);

        xml.writeEmptyElement(QStringLiteral("w:name"));
        xml.writeAttribute(QStringLiteral("w:val"), name);
        if (!isDefault) {
            xml.writeEmptyElement(QStringLiteral("w:basedOn"));
            xml.writeAttribute(QStringLiteral("w:val"), kStyleNormal);
            xml.writeEmptyElement(QStringLiteral("w:next"));
            xml.writeAttribute(QStringLiteral("w:val"), kStyleNormal);
            xml.writeEmptyElement(QStringLiteral("w:qFormat"));
        }

        xml.writeStartElement(QStringLiteral("w:pPr"));
        xml.writeEmptyElement(QStringLiteral("w:spacing"));
        xml.writeAttribute(QStringLiteral("w:before"), QString::number(spaceBefore));
        xml.writeAttribute(QStringLiteral("w:after"), QStringLiteral("60"));
        xml.writeEndElement();

        xml.writeStartElement(QStringLiteral("w:rPr"));
        if (bold)
            xml.writeEmptyElement(QStringLiteral("w:b"));
        xml.writeEmptyElement(QStringLiteral("w:sz"));
        xml.writeAttribute(QStringLiteral("w:val"), QString::number(halfPoints));
        xml.writeEndElement();

        xml.writeEndElement();
    };

    addStyle(kStyleNormal, QStringLiteral("Normal"), 20, false, 0, true);
    addStyle(kStyleTitle, QStringLiteral("Title"), 32, true, 0, false);
    addStyle(kStyleHeading1, QStringLiteral("heading 1"), 26, true, 240, false);
    addStyle(kStyleHeading2, QStringLiteral("heading 2"), 22, true, 160, false);

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

QByteArray PackageBuilder::documentRelsXml(int mediaCount)
{
    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QXmlStreamWriter xml(&buffer);
    startXml(xml);
    xml.writeStartElement(QStringLiteral("Relationships"));
    xml.writeDefaultNamespace(kNsPkgRels);

    xml.writeEmptyElement(QStringLiteral("Relationship"));
    xml.writeAttribute(QStringLiteral("Id"), QStringLiteral("rId1"));
    xml.writeAttribute(QStringLiteral("Type"), kRelBase + QStringLiteral("styles"));
    xml.writeAttribute(QStringLiteral("Target"), QStringLiteral("styles.xml"));

    // Media N is image<N>.png with relationship id rId<N + 1>
    for (int i = 1; i <= mediaCount; ++i) {
        xml.writeEmptyElement(QStringLiteral("Relationship"));
        xml.writeAttribute(QStringLiteral("Id"), QStringLiteral("rId%1").arg(i + 1));
        xml.writeAttribute(QStringLiteral("Type"), kRelBase + QStringLiteral("image"));
        xml.writeAttribute(QStringLiteral("Target"), QStringLiteral("media/image%1.png").arg(i));
    }

    xml.writeEndElement();
    xml.writeEndDocument();
    return out;
}

// --- Body ---

static void writeInlineDrawing(QXmlStreamWriter *xml, int mediaNumber, const QSizeF &size)
{
    const QString cx = QString::number(toEmu(size.width()));
    const QString cy = QString::number(toEmu(size.height()));
    const QString id = QString::number(mediaNumber);
    const QString name = QStringLiteral("image%1.png").arg(mediaNumber);

    xml->writeStartElement(QStringLiteral("w:drawing"));
    xml->writeStartElement(QStringLiteral("wp:inline"));
    for (const char *d : {"distT", "distB", "distL", "distR"})
        xml->writeAttribute(QLatin1String(d), QStringLiteral("0"));

    xml->writeEmptyElement(QStringLiteral("wp:extent"));
    xml->writeAttribute(QStringLiteral("cx"), cx);
    xml->writeAttribute(QStringLiteral("cy"), cy);
    xml->writeEmptyElement(QStringLiteral("wp:docPr"));
    xml->writeAttribute(QStringLiteral("id"), id);
    xml->writeAttribute(QStringLiteral("name"), QStringLiteral("Chart %1").arg(mediaNumber));

    xml->writeStartElement(QStringLiteral("wp:cNvGraphicFramePr"));
    xml->writeEmptyElement(QStringLiteral("a:graphicFrameLocks"));
    xml->writeAttribute(QStringLiteral("noChangeAspect"), QStringLiteral("1"));
    xml->writeEndElement();

    xml->writeStartElement(QStringLiteral("a:graphic"));
    xml->writeStartElement(QStringLiteral("a:graphicData"));
    xml->writeAttribute(QStringLiteral("uri"), kNsPic);
    xml->writeStartElement(QStringLiteral("pic:pic"));

    xml->writeStartElement(QStringLiteral("pic:nvPicPr"));
    xml->writeEmptyElement(QStringLiteral("pic:cNvPr"));
    xml->writeAttribute(QStringLiteral("id"), id);
    xml->writeAttribute(QStringLiteral("name"), name);
    xml->writeEmptyElement(QStringLiteral("pic:cNvPicPr"));
    xml->writeEndElement();

    xml->writeStartElement(QStringLiteral("pic:blipFill"));
    xml->writeEmptyElement(QStringLiteral("a:blip"));
    xml->writeAttribute(QStringLiteral("r:embed"), QStringLiteral("rId%1").arg(mediaNumber + 1));
    xml->writeStartElement(QStringLiteral("a:stretch"));
    xml->writeEmptyElement(QStringLiteral("a:fillRect"));
    xml->writeEndElement();
    xml->writeEndElement();

    xml->writeStartElement(QStringLiteral("pic:spPr"));
    xml->writeStartElement(QStringLiteral("a:xfrm"));
    xml->writeEmptyElement(QStringLiteral("a:off"));
    xml->writeAttribute(QStringLiteral("x"), QStringLiteral("0"));
    xml->writeAttribute(QStringLiteral("y"), QStringLiteral("0"));
    xml->writeEmptyElement(QStringLiteral("a:ext"));
    xml->writeAttribute(QStringLiteral("cx"), cx);
    xml->writeAttribute(QStringLiteral("cy"), cy);
    xml->writeEndElement();
    xml->writeStartElement(QStringLiteral("a:prstGeom"));
    xml->writeAttribute(QStringLiteral("prst"), QStringLiteral("rect"));
    xml->writeEmptyElement(QStringLiteral("a:avLst"));
    xml->writeEndElement();
    xml->writeEndElement();

    xml->writeEndElement(); // pic:pic
    xml->writeEndElement(); // a:graphicData
    xml->writeEndElement(); // a:graphic
    xml->writeEndElement(); // wp:inline
    xml->writeEndElement(); // w:drawing
}

QByteArray PackageBuilder::documentXml(const QList<PackageParagraph> &paragraphs,
                                       const QList<Report::ChartImage> &charts,
                                       QList<int> *mediaCharts) const
{
    QByteArray out;
    QBuffer buffer(&out);
    buffer.open(QIODevice::WriteOnly);
    QXmlStreamWriter xml(&buffer);
    startXml(xml);
    xml.writeStartElement(QStringLiteral("w:document"));
    xml.writeAttribute(QStringLiteral("xmlns:w"), kNsW);
    xml.writeAttribute(QStringLiteral("xmlns:r"), kNsR);
    xml.writeAttribute(QStringLiteral("xmlns:wp"), kNsWp);
    xml.writeAttribute(QStringLiteral("xmlns:a"), kNsA);
    xml.writeAttribute(QStringLiteral("xmlns:pic"), kNsPic);
    xml.writeStartElement(QStringLiteral("w:body"));

    for (const PackageParagraph &p : paragraphs) {
        if (p.kind == PackageParagraph::Kind::Image) {
            if (p.chartIndex < 0 || p.chartIndex >= charts.size()
                || charts.at(p.chartIndex).image.isNull()) {
                qWarning() << "PackageBuilder: no image for chart" << p.chartIndex;
                continue;
            }
            const Report::ChartImage &chart = charts.at(p.chartIndex);
            QSizeF size = p.pointSize.isEmpty() ? chart.pointSize : p.pointSize;
            size = size.isEmpty() ? m_geometry.chartDisplaySize(chart.image.size())
                                  : m_geometry.fitChartSize(size);

            mediaCharts->append(p.chartIndex);
            xml.writeStartElement(QStringLiteral("w:p"));
            xml.writeStartElement(QStringLiteral("w:pPr"));
            xml.writeEmptyElement(QStringLiteral("w:jc"));
            xml.writeAttribute(QStringLiteral("w:val"), QStringLiteral("center"));
            xml.writeEndElement();
            xml.writeStartElement(QStringLiteral("w:r"));
            writeInlineDrawing(&xml, mediaCharts->size(), size);
            xml.writeEndElement();
            xml.writeEndElement();
            continue;
        }

        xml.writeStartElement(QStringLiteral("w:p"));
        if (p.kind == PackageParagraph::Kind::PageBreak) {
            xml.writeStartElement(QStringLiteral("w:r"));
            xml.writeEmptyElement(QStringLiteral("w:br"));
            xml.writeAttribute(QStringLiteral("w:type"), QStringLiteral("page"));
            xml.writeEndElement();
            xml.writeEndElement();
            continue;
        }

        xml.writeStartElement(QStringLiteral("w:pPr"));
        xml.writeEmptyElement(QStringLiteral("w:pStyle"));
        xml.writeAttribute(QStringLiteral("w:val"), p.style);
        if (p.centered) {
            xml.writeEmptyElement(QStringLiteral("w:jc"));
            xml.writeAttribute(QStringLiteral("w:val"), QStringLiteral("center"));
        }
        xml.writeEndElement();

        xml.writeStartElement(QStringLiteral("w:r"));
        xml.writeStartElement(QStringLiteral("w:t"));
        xml.writeAttribute(QStringLiteral("xml:space"), QStringLiteral("preserve"));
        xml.writeCharacters(p.text);
        xml.writeEndElement();
        xml.writeEndElement();

        xml.writeEndElement(); // w:p
    }

    // Page size and margins from the export geometry, in twips
    xml.writeStartElement(QStringLiteral("w:sectPr"));
    xml.writeEmptyElement(QStringLiteral("w:pgSz"));
    xml.writeAttribute(QStringLiteral("w:w"),
                       QString::number(RtfUtils::toTwips(m_geometry.pageSize.width())));
    xml.writeAttribute(QStringLiteral("w:h"),
                       QString::number(RtfUtils::toTwips(m_geometry.pageSize.height())));
    xml.writeEmptyElement(QStringLiteral("w:pgMar"));
    const QString margin = QString::number(RtfUtils::toTwips(m_geometry.inset));
    for (const char *side : {"w:top", "w:right", "w:bottom", "w:left"})
        xml.writeAttribute(QLatin1String(side), margin);
    xml.writeEndElement();

    xml.writeEndElement(); // w:body
    xml.writeEndElement(); // w:document
    xml.writeEndDocument();
    return out;
}

// --- Packaging ---

bool PackageBuilder::archiveDirectory(const QString &root, QByteArray *zip, QString *error)
{
    const QDir rootDir(root);
    QStringList entries;
    QDirIterator it(root, QDir::Files | QDir::Hidden, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QString relative = rootDir.relativeFilePath(path);
        if (relative.isEmpty() || relative.startsWith(QLatin1String(".."))) {
            *error = path;
            return false;
        }
        entries.append(relative);
    }

    std::sort(entries.begin(), entries.end(), [](const QString &a, const QString &b) {
        if (a == kContentTypesPart || b == kContentTypesPart)
            return a == kContentTypesPart && b != kContentTypesPart;
        return a < b;
    });

    zip->clear();
    QBuffer buffer(zip);
    KZip archive(&buffer);
    archive.setCompression(KZip::DeflateCompression);
    if (!archive.open(QIODevice::WriteOnly)) {
        qWarning() << "PackageBuilder: cannot open archive:" << archive.errorString();
        *error = root;
        return false;
    }

    for (const QString &entry : std::as_const(entries)) {
        QFile file(rootDir.filePath(entry));
        if (!file.open(QIODevice::ReadOnly)) {
            *error = file.fileName();
            return false;
        }
        if (!archive.writeFile(entry, file.readAll())) {
            qWarning() << "PackageBuilder: cannot add" << entry << archive.errorString();
            *error = entry;
            return false;
        }
    }
    if (!archive.close()) {
        qWarning() << "PackageBuilder: cannot finish archive:" << archive.errorString();
        *error = root;
        return false;
    }
    return true;
}

bool PackageBuilder::build(const QList<Report::Document> &documents,
                           const QList<Report::ChartImage> &charts,
                           const PackageInfo &info,
                           QByteArray *docx, QString *error) const
{
    // Removed on scope exit, success or failure
    QTemporaryDir buildRoot(QDir::tempPath() + QStringLiteral("/visitreport-docx-XXXXXX"));
    if (!buildRoot.isValid()) {
        *error = buildRoot.path();
        return false;
    }

    const QList<PackageParagraph> paras = paragraphs(documents);
    QList<int> mediaCharts;
    const QByteArray body = documentXml(paras, charts, &mediaCharts);

    struct Part {
        QString path;
        QByteArray data;
    };
    QList<Part> parts = {
        {kContentTypesPart, contentTypesXml()},
        {QStringLiteral("_rels/.rels"), rootRelsXml()},
        {QStringLiteral("docProps/core.xml"), coreXml(title(paras), info)},
        {QStringLiteral("docProps/app.xml"), appXml()},
        {QStringLiteral("word/styles.xml"), stylesXml()},
        {QStringLiteral("word/document.xml"), body},
        {QStringLiteral("word/_rels/document.xml.rels"), documentRelsXml(mediaCharts.size())},
    };

    for (int i = 0; i < mediaCharts.size(); ++i) {
        QByteArray png;
        QBuffer buffer(&png);
        buffer.open(QIODevice::WriteOnly);
        const QString path = QStringLiteral("word/media/image%1.png").arg(i + 1);
        if (!charts.at(mediaCharts.at(i)).image.save(&buffer, "PNG")) {
            *error = path;
            return false;
        }
        parts.append({path, png});
    }

    for (const Part &part : std::as_const(parts)) {
        if (!writeFile(buildRoot.filePath(part.path), part.data)) {
            *error = buildRoot.filePath(part.path);
            return false;
        }
    }

    return archiveDirectory(buildRoot.path(), docx, error);
}

} // namespace Docx
