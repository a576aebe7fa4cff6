#include <QCommandLineParser>
#include <QFileInfo>
#include <QGuiApplication>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include "exportcontroller.h"
#include "localizer.h"
#include "visitfile.h"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("visitreport");

    KAboutData aboutData(
        QStringLiteral("visitreport"),
        i18n("VisitReport"),
        QStringLiteral("0.1.0"),
        i18n("Clinical visit reports as PDF, RTF and DOCX"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2025-2026"));
    aboutData.setOrganizationDomain("visitreport.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    const QCommandLineOption formatOption(
        {QStringLiteral("f"), QStringLiteral("format")},
        i18n("Output format: pdf, rtf or docx."), QStringLiteral("format"),
        QStringLiteral("pdf"));
    const QCommandLineOption outputOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        i18n("Output file or directory. Defaults to the report directory."),
        QStringLiteral("path"));
    const QCommandLineOption localeOption(
        {QStringLiteral("l"), QStringLiteral("locale")},
        i18n("Report language (%1).", Localizer::availableLocales().join(QStringLiteral(", "))),
        QStringLiteral("code"), QStringLiteral("en"));
    const QCommandLineOption pageOption(
        QStringLiteral("page"), i18n("Page size: a4 or letter."),
        QStringLiteral("size"), QStringLiteral("a4"));
    const QCommandLineOption debugOption(
        QStringLiteral("debug"), i18n("Print export traces."));
    parser.addOptions({formatOption, outputOption, localeOption, pageOption, debugOption});
    parser.addPositionalArgument(
        QStringLiteral("visit"), i18n("Visit JSON file"), QStringLiteral("visit.json"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    QTextStream err(stderr);
    QTextStream out(stdout);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        parser.showHelp(1);
    }

    const auto format = ExportController::formatFromName(parser.value(formatOption));
    if (!format) {
        err << i18n("Unknown format: %1", parser.value(formatOption)) << Qt::endl;
        return 1;
    }

    ExportOptions options;
    options.localeCode = parser.value(localeOption);
    options.debug = parser.isSet(debugOption);
    if (parser.value(pageOption).compare(QLatin1String("letter"), Qt::CaseInsensitive) == 0)
        options.geometry = PageGeometry::usLetter();

    VisitFile visit;
    QString error;
    if (!visit.open(QFileInfo(args.first()).absoluteFilePath(), &error)) {
        err << i18n("Cannot read %1: %2", args.first(), error) << Qt::endl;
        return 1;
    }

    ExportController controller(options, &visit, &visit, &visit);
    std::optional<QString> destination;
    if (parser.isSet(outputOption))
        destination = parser.value(outputOption);

    const ExportResult result = controller.exportReport(visit.kind(), visit.visitId(),
                                                        *format, destination);
    if (!result.ok()) {
        err << result.message << Qt::endl;
        return result.error == ExportResult::Error::Cancelled ? 2 : 1;
    }

    out << result.path << Qt::endl;
    return 0;
}
