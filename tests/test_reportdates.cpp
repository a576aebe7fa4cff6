#include <gtest/gtest.h>

#include <QLocale>

#include "reportdates.h"
#include "testdata.h"

using namespace ReportDates;

TEST(ReportDates, AgeBands)
{
    EXPECT_EQ(ageString(QDate(2024, 1, 1), QDate(2024, 1, 15)), QStringLiteral("14d"));
    EXPECT_EQ(ageString(QDate(2024, 1, 1), QDate(2024, 3, 20)), QStringLiteral("2m 19d"));
    EXPECT_EQ(ageString(QDate(2023, 1, 1), QDate(2023, 8, 1)), QStringLiteral("7m"));
    EXPECT_EQ(ageString(QDate(2022, 1, 1), QDate(2024, 2, 1)), QStringLiteral("2y 1m"));
}

TEST(ReportDates, AgeEdges)
{
    EXPECT_EQ(ageString(QDate(2024, 1, 1), QDate(2024, 1, 1)), QStringLiteral("0d"));
    EXPECT_EQ(ageString(QDate(2024, 1, 1), QDate(2024, 3, 1)), QStringLiteral("2m"));
    EXPECT_EQ(ageString(QDate(2023, 1, 1), QDate(2024, 1, 1)), QStringLiteral("1y"));
    EXPECT_EQ(ageString(QDate(2023, 1, 31), QDate(2023, 3, 1)), QStringLiteral("1m 1d"));
    EXPECT_TRUE(ageString(QDate(2024, 2, 1), QDate(2024, 1, 1)).isEmpty());
}

TEST(ReportDates, ParsesStorageFormats)
{
    EXPECT_TRUE(parseDateTime(QStringLiteral("2024-03-20T09:15:00")).has_value());
    EXPECT_TRUE(parseDateTime(QStringLiteral("2024-03-20T09:15:00.250Z")).has_value());
    EXPECT_TRUE(parseDateTime(QStringLiteral("2024-03-20 10:02:11")).has_value());
    EXPECT_TRUE(parseDateTime(QStringLiteral("2024-03-20 10:02:11.512")).has_value());
    EXPECT_TRUE(parseDateTime(QStringLiteral("2024-03-20")).has_value());
    EXPECT_FALSE(parseDateTime(QStringLiteral("last tuesday")).has_value());
}

TEST(ReportDates, HumanFormsPassThroughUnparseable)
{
    const QLocale c = QLocale::c();
    EXPECT_EQ(humanDate(QStringLiteral("2024-03-20"), c), QStringLiteral("20 Mar 2024"));
    EXPECT_EQ(humanDateTime(QStringLiteral("2024-03-20 10:02:11"), c),
              QStringLiteral("20 Mar 2024, 10:02"));
    EXPECT_EQ(humanDate(QStringLiteral("soon"), c), QStringLiteral("soon"));
    EXPECT_TRUE(humanDateTime(QString(), c).isEmpty());
}

TEST(ReportDates, Placeholders)
{
    EXPECT_TRUE(isPlaceholder(QString()));
    EXPECT_TRUE(isPlaceholder(QStringLiteral(" — ")));
    EXPECT_TRUE(isPlaceholder(QStringLiteral("?")));
    EXPECT_FALSE(isPlaceholder(QStringLiteral("3m")));
}

TEST(ReportDates, ReadableVisitTypes)
{
    EXPECT_EQ(readableVisitType(QStringLiteral("two_month")), QStringLiteral("2-month visit"));
    EXPECT_EQ(readableVisitType(QStringLiteral("episode")), QStringLiteral("Sick visit"));
    EXPECT_EQ(readableVisitType(QStringLiteral("newborn_1st_after_maternity")),
              QStringLiteral("Newborn 1st After Maternity"));
    EXPECT_EQ(readableVisitType(QStringLiteral("school_entry_2nd_check")),
              QStringLiteral("School Entry 2nd Check"));
}
