#include <QCommandLineParser>
#include <QDateTime>
#include <QGuiApplication>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include "recordingsurface.h"
#include "recordreader.h"
#include "reportgenerator.h"
#include "reportoptions.h"
#include "reportsettings.h"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("inspectprint");

    KAboutData aboutData(
        QStringLiteral("inspectprint"),
        i18n("InspectPrint"),
        QStringLiteral("0.1.0"),
        i18n("Paginated PDF reports for inspection records"),
        KAboutLicense::GPL_V3,
        i18n("(c) 2025-2026")
    );
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);
    parser.addPositionalArgument(QStringLiteral("record"),
                                 i18n("Inspection record (JSON)"));
    parser.addPositionalArgument(QStringLiteral("output"),
                                 i18n("PDF file to write"), QStringLiteral("[output]"));

    const QCommandLineOption titleOption(QStringLiteral("title"),
        i18n("Section heading above the table."), i18n("text"));
    const QCommandLineOption versionOption(QStringLiteral("version-label"),
        i18n("Version label printed in the title block and footer."), i18n("label"));
    const QCommandLineOption conditionsOption(QStringLiteral("conditions"),
        i18n("Comma-separated condition codes to include, e.g. FAIR,UNSATISFACTORY."),
        i18n("codes"));
    const QCommandLineOption entryOnlyOption(QStringLiteral("entry-only"),
        i18n("Only entry-level remarks and media."));
    const QCommandLineOption noMediaOption(QStringLiteral("no-media"),
        i18n("Leave out photos and videos."));
    const QCommandLineOption noMetaOption(QStringLiteral("no-meta"),
        i18n("Leave out the record details under the title."));
    const QCommandLineOption scopeOption(QStringLiteral("scope"),
        i18n("Only items of this work-order scope."), i18n("id"));
    const QCommandLineOption signOffOption(QStringLiteral("sign-off"),
        i18n("Append customer and company sign-off boxes."));
    const QCommandLineOption configOption(QStringLiteral("config"),
        i18n("Layout settings file (default: inspectprintrc)."), i18n("file"));
    const QCommandLineOption dryRunOption(QStringLiteral("dry-run"),
        i18n("Lay the report out without writing a PDF and print statistics."));

    parser.addOptions({titleOption, versionOption, conditionsOption, entryOnlyOption,
                       noMediaOption, noMetaOption, scopeOption, signOffOption,
                       configOption, dryRunOption});
    parser.process(app);
    aboutData.processCommandLine(&parser);

    QTextStream err(stderr);
    QTextStream out(stdout);

    const QStringList args = parser.positionalArguments();
    const bool dryRun = parser.isSet(dryRunOption);
    if (args.isEmpty() || (!dryRun && args.size() < 2)) {
        err << i18n("Usage: inspectprint [options] <record.json> <output.pdf>") << Qt::endl;
        return 2;
    }

    QString error;
    const std::optional<Inspection::Record> record = RecordReader::readFile(args.at(0), &error);
    if (!record) {
        err << i18n("Cannot read %1: %2", args.at(0), error) << Qt::endl;
        return 1;
    }

    ReportOptions options;
    options.heading = parser.value(titleOption);
    options.versionLabel = parser.value(versionOption);
    options.allowedConditions = parser.value(conditionsOption)
                                    .split(QLatin1Char(','), Qt::SkipEmptyParts);
    options.entryOnly = parser.isSet(entryOnlyOption);
    options.includeMedia = !parser.isSet(noMediaOption);
    options.includeMeta = !parser.isSet(noMetaOption);
    options.filterByScopeId = parser.value(scopeOption);
    options.includeSignOff = parser.isSet(signOffOption);
    options.generatedOn = QDateTime::currentDateTime();

    const ReportSettings settings = ReportSettings::loadFile(parser.value(configOption));
    ReportGenerator generator(settings);
    ReportResult result;

    bool ok = false;
    if (dryRun) {
        RecordingSurface surface(settings.geometry.pageSize);
        ok = generator.render(&surface, *record, options, -1, &result, &error);
    } else {
        ok = generator.renderToPdf(args.at(1), *record, options, &result, &error);
    }

    if (!ok) {
        err << i18n("Report failed: %1", error) << Qt::endl;
        return 1;
    }

    out << i18n("%1 pages, %2 rows, %3 photos (%4 unavailable), %5 videos",
                result.pages, result.rows, result.photosDrawn,
                result.placeholdersDrawn, result.videosDrawn)
        << Qt::endl;
    return 0;
}
