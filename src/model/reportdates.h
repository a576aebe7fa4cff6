/*
 * reportdates.h — Date parsing and display helpers for report headers
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef VISITREPORT_REPORTDATES_H
#define VISITREPORT_REPORTDATES_H

#include <QDate>
#include <QDateTime>
#include <QLocale>
#include <QString>

#include <optional>

namespace ReportDates {

// Accepts ISO-8601 (with or without fractional seconds and zone),
// SQLite "yyyy-MM-dd HH:mm:ss[.SSS]" and bare dates.
std::optional<QDateTime> parseDateTime(const QString &raw);
std::optional<QDate> parseDate(const QString &raw);

// Medium date with short time, or the input verbatim if unparseable.
// Empty input yields an empty string.
QString humanDateTime(const QString &raw, const QLocale &locale);

// Medium date only, or the input verbatim if unparseable.
QString humanDate(const QString &raw, const QLocale &locale);

// Compact age between two dates:
//   < 1 month      "12d"
//   < 6 months     "3m 4d" ("3m" when days are zero)
//   6 to 11 months "8m"
//   >= 12 months   "2y 3m" ("2y" when months are zero)
// Returns an empty string when the reference precedes the birth date.
QString ageString(const QDate &dob, const QDate &reference);

// True for values that should be recomputed ("", "—", "-", "?").
bool isPlaceholder(const QString &value);

// "one_month" -> "1-month visit", "episode" -> "Sick visit", unknown ids
// Title Cased from snake_case with lowercase ordinal suffixes.
QString readableVisitType(const QString &visitTypeId);

} // namespace ReportDates

#endif // VISITREPORT_REPORTDATES_H
