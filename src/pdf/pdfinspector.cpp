/*
 * pdfinspector.cpp — Reads finished PDF output back through Poppler
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfinspector.h"

#include <QRectF>

#include <poppler-qt6.h>

#include <memory>

namespace PdfInspector {

static std::unique_ptr<Poppler::Document> load(const QByteArray &data)
{
    std::unique_ptr<Poppler::Document> doc(Poppler::Document::loadFromData(data));
    if (!doc || doc->isLocked())
        return nullptr;
    return doc;
}

bool isBlankPage(const Poppler::Page *page)
{
    if (!page)
        return false;
    if (!page->text(QRectF()).trimmed().isEmpty())
        return false;
    return page->annotations().empty();
}

int pageCount(const QByteArray &pdf)
{
    std::unique_ptr<Poppler::Document> doc = load(pdf);
    return doc ? doc->numPages() : -1;
}

QList<int> blankPages(const QByteArray &pdf, const QString &partName, QString *error)
{
    std::unique_ptr<Poppler::Document> doc = load(pdf);
    if (!doc) {
        *error = QStringLiteral("cannot read %1").arg(partName);
        return {};
    }

    QList<int> blank;
    for (int i = 0; i < doc->numPages(); ++i) {
        std::unique_ptr<Poppler::Page> page(doc->page(i));
        if (!page) {
            *error = QStringLiteral("cannot read page %1 of %2").arg(i + 1).arg(partName);
            return {};
        }
        if (isBlankPage(page.get()))
            blank.append(i);
    }
    return blank;
}

QString pageText(const QByteArray &pdf, int page)
{
    std::unique_ptr<Poppler::Document> doc = load(pdf);
    if (!doc || page < 0 || page >= doc->numPages())
        return QString();
    std::unique_ptr<Poppler::Page> p(doc->page(page));
    return p ? p->text(QRectF()) : QString();
}

QString documentTitle(const QByteArray &pdf)
{
    std::unique_ptr<Poppler::Document> doc = load(pdf);
    return doc ? doc->info(QStringLiteral("Title")) : QString();
}

} // namespace PdfInspector
