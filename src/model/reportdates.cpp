/*
 * reportdates.cpp — Date parsing and display helpers for report headers
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "reportdates.h"

#include <QHash>
#include <QRegularExpression>
#include <QStringList>

namespace ReportDates {

std::optional<QDateTime> parseDateTime(const QString &raw)
{
    const QString s = raw.trimmed();
    if (s.isEmpty())
        return std::nullopt;

    QDateTime dt = QDateTime::fromString(s, Qt::ISODateWithMs);
    if (!dt.isValid())
        dt = QDateTime::fromString(s, Qt::ISODate);
    if (dt.isValid())
        return dt;

    // SQLite timestamps; fractional part of any length is truncated to ms
    static const QRegularExpression sqlite(
        QStringLiteral("^(\\d{4}-\\d{2}-\\d{2}) (\\d{2}:\\d{2}:\\d{2})(?:\\.(\\d+))?$"));
    const auto m = sqlite.match(s);
    if (m.hasMatch()) {
        QString ms = m.captured(3).left(3);
        while (!ms.isEmpty() && ms.size() < 3)
            ms.append(QLatin1Char('0'));
        const QString iso = m.captured(1) + QLatin1Char('T') + m.captured(2)
            + (ms.isEmpty() ? QString() : QLatin1Char('.') + ms);
        dt = QDateTime::fromString(iso, ms.isEmpty() ? Qt::ISODate : Qt::ISODateWithMs);
        if (dt.isValid())
            return dt;
    }

    const QDate d = QDate::fromString(s.left(10), Qt::ISODate);
    if (d.isValid() && s.size() == 10)
        return QDateTime(d, QTime(0, 0));
    return std::nullopt;
}

std::optional<QDate> parseDate(const QString &raw)
{
    const QString s = raw.trimmed();
    const QDate d = QDate::fromString(s.left(10), Qt::ISODate);
    if (d.isValid())
        return d;
    if (auto dt = parseDateTime(s))
        return dt->date();
    return std::nullopt;
}

QString humanDateTime(const QString &raw, const QLocale &locale)
{
    if (raw.trimmed().isEmpty())
        return QString();
    const auto dt = parseDateTime(raw);
    if (!dt)
        return raw;
    return locale.toString(*dt, QStringLiteral("d MMM yyyy, HH:mm"));
}

QString humanDate(const QString &raw, const QLocale &locale)
{
    if (raw.trimmed().isEmpty())
        return QString();
    const auto d = parseDate(raw);
    if (!d)
        return raw;
    return locale.toString(*d, QStringLiteral("d MMM yyyy"));
}

QString ageString(const QDate &dob, const QDate &reference)
{
    if (!dob.isValid() || !reference.isValid() || reference < dob)
        return QString();

    // Whole months first (Qt clamps to the month end), remaining days after
    int totalMonths = (reference.year() - dob.year()) * 12 + reference.month() - dob.month();
    if (dob.addMonths(totalMonths) > reference)
        --totalMonths;
    const int days = int(dob.addMonths(totalMonths).daysTo(reference));
    const int years = totalMonths / 12;
    const int months = totalMonths % 12;

    if (years == 0 && months == 0)
        return QStringLiteral("%1d").arg(days);
    if (years == 0 && months < 6) {
        if (days == 0)
            return QStringLiteral("%1m").arg(months);
        return QStringLiteral("%1m %2d").arg(months).arg(days);
    }
    if (years == 0)
        return QStringLiteral("%1m").arg(months);
    if (months == 0)
        return QStringLiteral("%1y").arg(years);
    return QStringLiteral("%1y %2m").arg(years).arg(months);
}

bool isPlaceholder(const QString &value)
{
    const QString v = value.trimmed();
    return v.isEmpty()
        || v == QStringLiteral("—")
        || v == QStringLiteral("-")
        || v == QStringLiteral("?");
}

QString readableVisitType(const QString &visitTypeId)
{
    static const QHash<QString, QString> titles = {
        {QStringLiteral("one_month"), QStringLiteral("1-month visit")},
        {QStringLiteral("two_month"), QStringLiteral("2-month visit")},
        {QStringLiteral("four_month"), QStringLiteral("4-month visit")},
        {QStringLiteral("six_month"), QStringLiteral("6-month visit")},
        {QStringLiteral("nine_month"), QStringLiteral("9-month visit")},
        {QStringLiteral("twelve_month"), QStringLiteral("12-month visit")},
        {QStringLiteral("fifteen_month"), QStringLiteral("15-month visit")},
        {QStringLiteral("eighteen_month"), QStringLiteral("18-month visit")},
        {QStringLiteral("twentyfour_month"), QStringLiteral("24-month visit")},
        {QStringLiteral("thirty_month"), QStringLiteral("30-month visit")},
        {QStringLiteral("thirtysix_month"), QStringLiteral("36-month visit")},
        {QStringLiteral("newborn_1st_after_maternity"),
         QStringLiteral("Newborn 1st After Maternity")},
        {QStringLiteral("episode"), QStringLiteral("Sick visit")},
    };

    const QString id = visitTypeId.trimmed();
    auto it = titles.constFind(id);
    if (it != titles.constEnd())
        return it.value();

    static const QRegularExpression ordinal(QStringLiteral("^\\d+(st|nd|rd|th)$"),
                                            QRegularExpression::CaseInsensitiveOption);
    QStringList words;
    const QStringList parts = id.split(QLatin1Char('_'), Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        if (ordinal.match(part).hasMatch())
            words.append(part.toLower());
        else
            words.append(part.left(1).toUpper() + part.mid(1).toLower());
    }
    return words.join(QLatin1Char(' '));
}

} // namespace ReportDates
