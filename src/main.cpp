#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QString>
#include <QTextStream>
#include <QTimer>
#include <optional>

#include "version.h"

#include "prayer/core/AppConfig.hpp"
#include "prayer/core/AppContext.hpp"
#include "prayer/core/Clock.hpp"
#include "prayer/core/Logging.hpp"
#include "prayer/data/DataProvider.hpp"
#include "prayer/services/LocationResolver.hpp"
#include "prayer/services/ScheduleCache.hpp"
#include "prayer/services/SettingsStore.hpp"

namespace {

std::optional<double> parseCoordinate(const QString &value)
{
    bool ok = false;
    const double parsed = value.toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return parsed;
}

void printSchedule(const prayer::data::DailyTimes &times)
{
    QTextStream out(stdout);
    out << times.date.toString(Qt::ISODate) << "  " << times.hijri.day << ' ' << times.hijri.monthName << ' '
        << times.hijri.year << " AH\n";
    for (prayer::data::PrayerId prayer : prayer::data::kAllPrayers) {
        const auto time = times.timeFor(prayer);
        out << QStringLiteral("%1").arg(prayer::data::prayerDisplayName(prayer), -8) << ' '
            << (time ? time->toString(QStringLiteral("HH:mm")) : QStringLiteral("--:--")) << '\n';
    }
    out.flush();
}

int runOnce(prayer::core::AppContext &context)
{
    auto &store = context.settingsStore();
    const prayer::data::Settings settings = store.load();
    const auto location = prayer::services::resolveLocation(context.dataProvider().locationSource());

    // Started from the event loop so a synchronous cache hit can still exit it.
    QTimer::singleShot(0, [&context, location, settings]() {
        context.scheduleCache().getOrCompute(
            context.clock().now().date(), location, settings.calculationMethod, settings.legalSchool,
            [settings](const prayer::data::TimesOutcome &outcome) {
                if (!outcome.ok()) {
                    qCCritical(prayer::core::lcApp) << "No prayer times:" << outcome.error->message();
                    QCoreApplication::exit(1);
                    return;
                }
                printSchedule(outcome.times->withOffsets(settings.offsetMinutes));
                QCoreApplication::exit(0);
            });
    });
    return QCoreApplication::exec();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("PrayerKeeper"));
    QCoreApplication::setApplicationName(QStringLiteral("prayer-keeper"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kPrayerKeeperVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Keeps prayer reminders in sync with the daily schedule."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringLiteral("config"), QObject::tr("INI configuration file."),
                                          QStringLiteral("file"));
    const QCommandLineOption storageOption(QStringLiteral("storage"), QObject::tr("Store file."),
                                           QStringLiteral("file"));
    const QCommandLineOption timetableOption(QStringLiteral("timetable"), QObject::tr("Prayer timetable JSON file."),
                                             QStringLiteral("file"));
    const QCommandLineOption latitudeOption(QStringLiteral("latitude"), QObject::tr("Latitude in degrees."),
                                            QStringLiteral("deg"));
    const QCommandLineOption longitudeOption(QStringLiteral("longitude"), QObject::tr("Longitude in degrees."),
                                             QStringLiteral("deg"));
    const QCommandLineOption onceOption(QStringLiteral("once"), QObject::tr("Print today's schedule and exit."));
    parser.addOptions({ configOption, storageOption, timetableOption, latitudeOption, longitudeOption, onceOption });
    parser.process(app);

    prayer::core::AppConfig config = prayer::core::loadConfig(parser.value(configOption));
    if (parser.isSet(storageOption)) {
        config.storagePath = parser.value(storageOption);
    }
    if (parser.isSet(timetableOption)) {
        config.timetablePath = parser.value(timetableOption);
    }
    if (parser.isSet(latitudeOption)) {
        config.latitude = parseCoordinate(parser.value(latitudeOption));
    }
    if (parser.isSet(longitudeOption)) {
        config.longitude = parseCoordinate(parser.value(longitudeOption));
    }
    if (!config.logRules.isEmpty()) {
        QLoggingCategory::setFilterRules(config.logRules);
    }

    prayer::core::AppContext context(config);
    if (parser.isSet(onceOption)) {
        return runOnce(context);
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&context]() { context.shutdown(); });
    context.start();
    return app.exec();
}
