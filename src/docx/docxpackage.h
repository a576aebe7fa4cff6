/*
 * docxpackage.h — Report documents to an OOXML word-processing package
 *
 * Documents are first rendered to (text, style) paragraphs, mapped to
 * the four package styles, normalized, then written as parts under a
 * temporary build root and archived with root-relative entry names.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_DOCXPACKAGE_H
#define VISITREPORT_DOCXPACKAGE_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QSizeF>
#include <QString>
#include <QStringList>

#include "pagegeometry.h"
#include "reportdocument.h"
#include "reportmodel.h"

class Localizer;

namespace Docx {

// Style ids defined in word/styles.xml
inline const QString kStyleNormal = QStringLiteral("Normal");
inline const QString kStyleTitle = QStringLiteral("Title");
inline const QString kStyleHeading1 = QStringLiteral("Heading1");
inline const QString kStyleHeading2 = QStringLiteral("Heading2");

struct PackageParagraph {
    enum class Kind {
        Text,
        Image,
        PageBreak,
    };

    Kind kind = Kind::Text;
    QString text;
    QString style = kStyleNormal;
    bool centered = false;
    bool bullet = false;        // rendered from a list item
    int chartIndex = -1;        // Image only
    QSizeF pointSize;           // Image only
};

struct PackageInfo {
    QString creator;
    QDateTime created;
    QDateTime modified;
};

inline qint64 toEmu(qreal points)
{
    return qRound64(points * 12700.0);
}

class PackageBuilder
{
public:
    PackageBuilder(const Localizer &localizer, const QStringList &headingLabels,
                   const PageGeometry &geometry = PageGeometry());

    // Rendered, style-mapped and normalized paragraphs of the documents
    // in order. Blank text paragraphs are dropped. Only list items take
    // part in bullet normalization; body text is kept as written.
    QList<PackageParagraph> paragraphs(const QList<Report::Document> &documents) const;

    // Package title: patient-name line plus current-visit line, or a
    // generic title when no name line is present.
    QString title(const QList<PackageParagraph> &paragraphs) const;

    // On failure *error names the part or path that could not be written
    // or archived. The temporary build root is removed either way.
    bool build(const QList<Report::Document> &documents,
               const QList<Report::ChartImage> &charts,
               const PackageInfo &info,
               QByteArray *docx, QString *error) const;

    // Archive every file below root, entry names relative to root and
    // "[Content_Types].xml" first.
    static bool archiveDirectory(const QString &root, QByteArray *zip, QString *error);

    static QByteArray contentTypesXml();
    static QByteArray rootRelsXml();
    static QByteArray coreXml(const QString &title, const PackageInfo &info);
    static QByteArray appXml();
    static QByteArray stylesXml();

private:
    QString styleFor(const QString &text, const QString &tag) const;
    QByteArray documentXml(const QList<PackageParagraph> &paragraphs,
                           const QList<Report::ChartImage> &charts,
                           QList<int> *mediaCharts) const;
    static QByteArray documentRelsXml(int mediaCount);

    const Localizer &m_localizer;
    QStringList m_headingLabels;
    PageGeometry m_geometry;
    QString m_currentVisitPrefix;
};

} // namespace Docx

#endif // VISITREPORT_DOCXPACKAGE_H
