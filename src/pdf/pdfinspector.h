/*
 * pdfinspector.h — Reads finished PDF output back through Poppler
 *
 * Used to check rendered reports: page count, extractable text and
 * which pages are blank.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_PDFINSPECTOR_H
#define VISITREPORT_PDFINSPECTOR_H

#include <QByteArray>
#include <QList>
#include <QString>

namespace Poppler {
class Page;
}

namespace PdfInspector {

// No extractable text and no annotations.
bool isBlankPage(const Poppler::Page *page);

// Page count of a PDF blob, -1 if it cannot be loaded.
int pageCount(const QByteArray &pdf);

// Zero-based indices of the blank pages. On an unreadable document or
// page the list is empty and *error names the part and the page.
QList<int> blankPages(const QByteArray &pdf, const QString &partName, QString *error);

// Extractable text of one page, empty when it cannot be read.
QString pageText(const QByteArray &pdf, int page);

// Title entry of the document information dictionary.
QString documentTitle(const QByteArray &pdf);

} // namespace PdfInspector

#endif // VISITREPORT_PDFINSPECTOR_H
