/*
 * localizer.cpp — Report string catalogs
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "localizer.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>

static const QString kCatalogDir = QStringLiteral(":/strings");

Localizer::Localizer(const QString &localeCode)
    : m_localeCode(localeCode.isEmpty() ? QStringLiteral("en") : localeCode)
{
    m_fallback = loadCatalog(QStringLiteral("en"));
    if (m_localeCode == QLatin1String("en")) {
        m_strings = m_fallback;
        return;
    }

    m_strings = loadCatalog(m_localeCode);
    if (m_strings.isEmpty()) {
        // "fr_CA" -> "fr"
        const QString language = m_localeCode.section(QLatin1Char('_'), 0, 0)
                                     .section(QLatin1Char('-'), 0, 0);
        if (language != m_localeCode)
            m_strings = loadCatalog(language);
    }
    if (m_strings.isEmpty())
        qWarning() << "Localizer: no catalog for" << m_localeCode << "- using English";
}

QHash<QString, QString> Localizer::loadCatalog(const QString &localeCode)
{
    QHash<QString, QString> strings;
    QFile file(kCatalogDir + QLatin1Char('/') + localeCode + QLatin1String(".json"));
    if (!file.open(QIODevice::ReadOnly))
        return strings;

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (doc.isNull() || !doc.isObject()) {
        qWarning() << "Localizer: cannot parse" << file.fileName() << err.errorString();
        return strings;
    }

    const QJsonObject obj = doc.object();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        if (it.value().isString())
            strings.insert(it.key(), it.value().toString());
    }
    return strings;
}

bool Localizer::contains(const QString &key) const
{
    return m_strings.contains(key) || m_fallback.contains(key);
}

QString Localizer::text(const QString &key) const
{
    auto it = m_strings.constFind(key);
    if (it != m_strings.constEnd())
        return it.value();
    it = m_fallback.constFind(key);
    if (it != m_fallback.constEnd())
        return it.value();
    return key;
}

QString Localizer::format(const QString &key, const QStringList &args) const
{
    return substitute(text(key), args);
}

QString Localizer::prefixOf(const QString &key) const
{
    const QString tmpl = text(key);
    const int pos = tmpl.indexOf(QLatin1Char('%'));
    return pos < 0 ? tmpl : tmpl.left(pos);
}

QString Localizer::substitute(const QString &tmpl, const QStringList &args)
{
    QString result;
    result.reserve(tmpl.size());

    const int n = tmpl.size();
    for (int i = 0; i < n; ++i) {
        const QChar ch = tmpl.at(i);
        if (ch != QLatin1Char('%') || i + 1 >= n || !tmpl.at(i + 1).isDigit()) {
            result.append(ch);
            continue;
        }
        int j = i + 1;
        int index = 0;
        while (j < n && tmpl.at(j).isDigit()) {
            index = index * 10 + tmpl.at(j).digitValue();
            ++j;
        }
        if (index >= 1 && index <= args.size())
            result.append(args.at(index - 1));
        // Missing arguments collapse to nothing
        i = j - 1;
    }
    return result;
}

QStringList Localizer::availableLocales()
{
    QStringList locales;
    const QStringList files = QDir(kCatalogDir).entryList({QStringLiteral("*.json")},
                                                          QDir::Files, QDir::Name);
    for (const QString &f : files)
        locales.append(f.chopped(5));
    return locales;
}
