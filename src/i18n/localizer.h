/*
 * localizer.h — Report string catalogs
 *
 * Catalogs are flat JSON objects bundled as Qt resources under
 * :/strings/<locale>.json. Lookups fall back to English, then to the
 * raw key, so a missing entry never fails an export.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_LOCALIZER_H
#define VISITREPORT_LOCALIZER_H

#include <QHash>
#include <QLocale>
#include <QString>
#include <QStringList>

class Localizer
{
public:
    explicit Localizer(const QString &localeCode = QStringLiteral("en"));

    QString localeCode() const { return m_localeCode; }
    QLocale locale() const { return QLocale(m_localeCode); }

    bool contains(const QString &key) const;

    // Template for key, or the key itself when unknown.
    QString text(const QString &key) const;

    // Template with %1..%n substituted in a single pass, so argument
    // text containing "%2" is never re-expanded.
    QString format(const QString &key, const QStringList &args) const;

    // Literal text preceding the first placeholder of a template.
    // "Name: %1" -> "Name: "
    QString prefixOf(const QString &key) const;

    static QString substitute(const QString &tmpl, const QStringList &args);

    // Built-in catalog locales.
    static QStringList availableLocales();

private:
    static QHash<QString, QString> loadCatalog(const QString &localeCode);

    QString m_localeCode;
    QHash<QString, QString> m_strings;
    QHash<QString, QString> m_fallback;
};

#endif // VISITREPORT_LOCALIZER_H
