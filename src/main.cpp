#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include "sqlstorage.h"
#include "networkdavclient.h"
#include "notifier.h"
#include "ticker.h"
#include "syncjobregistry.h"

#include <LogMacros.h>

namespace {
    QString defaultConfigFile()
    {
        return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
                + QStringLiteral("/caldav-sync/caldav-syncd.conf");
    }

    QString defaultDatabaseFile()
    {
        return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
                + QStringLiteral("/caldav-sync.db");
    }
}

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    a.setApplicationName(QStringLiteral("caldav-sync"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("CalDAV calendar synchronization daemon"));
    parser.addHelpOption();
    QCommandLineOption configOption(QStringList() << QStringLiteral("c") << QStringLiteral("config"),
                                    QStringLiteral("Read the configuration from <file>."),
                                    QStringLiteral("file"), defaultConfigFile());
    parser.addOption(configOption);
    parser.process(a);

    QSettings config(parser.value(configOption), QSettings::IniFormat);
    config.beginGroup(QStringLiteral("General"));
    const QString databasePath = config.value(QStringLiteral("databasePath"), defaultDatabaseFile()).toString();
    const int globalSyncInterval = config.value(QStringLiteral("globalSyncInterval"), 60).toInt();
    const int defaultSyncInterval = config.value(QStringLiteral("defaultSyncInterval"), 300).toInt();
    const QString uidDomain = config.value(QStringLiteral("uidDomain"), QStringLiteral("caldavclient.local")).toString();
    const int loggingLevel = config.value(QStringLiteral("loggingLevel"), 5).toInt();
    const bool ignoreSslErrors = config.value(QStringLiteral("ignoreSslErrors"), false).toBool();
    config.endGroup();

    // read by the buteo logger when it is first used
    qputenv("MSYNCD_LOGGING_LEVEL", QByteArray::number(loggingLevel));

    if (databasePath != QStringLiteral(":memory:")) {
        QDir().mkpath(QFileInfo(databasePath).absolutePath());
    }
    QScopedPointer<SqlStorage> storage(SqlStorage::open(databasePath));
    if (!storage || !storage->isOpen()) {
        LOG_CRITICAL("unable to open database" << databasePath);
        return 1;
    }
    LOG_DEBUG("Using database" << databasePath);

    Notifier notifier;
    NetworkDavClientFactory clientFactory(ignoreSslErrors);
    TimerScheduler scheduler;
    SyncJobRegistry registry(storage.data(), &clientFactory, &scheduler, &notifier, uidDomain);
    registry.setDefaultSyncInterval(defaultSyncInterval);

    bool ok = false;
    const QList<qint64> activeUsers = storage->activeSessionUserIds(&ok);
    if (!ok) {
        LOG_WARNING("unable to list active sessions");
    }
    Q_FOREACH (qint64 userId, activeUsers) {
        const ServerConnection connection = storage->serverConnection(userId, &ok);
        if (ok && connection.isValid()) {
            registry.setupSyncForUser(userId, connection);
        }
    }
    registry.startGlobalSync(globalSyncInterval);

    QObject::connect(&a, SIGNAL(aboutToQuit()), &registry, SLOT(shutdownAll()));

    return a.exec();
}
