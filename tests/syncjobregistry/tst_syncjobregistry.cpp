/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2026 The caldav-sync contributors.
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public License
 * version 2.1 as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA
 * 02110-1301 USA
 *
 */

#include <QtTest>

#include "syncjobregistry.h"
#include "sqlstorage.h"
#include "notifier.h"
#include "fakedavclient.h"
#include "manualscheduler.h"

#include <SyncResults.h>

namespace {
    ServerConnection connectionFor(qint64 userId)
    {
        ServerConnection connection;
        connection.userId = userId;
        connection.url = QStringLiteral("https://dav.example.com");
        connection.username = QStringLiteral("user%1").arg(userId);
        connection.password = QStringLiteral("secret");
        return connection;
    }
}

class tst_SyncJobRegistry : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void setupRejectsInvalidConnection();
    void setupStartsForcedPass();
    void sessionReferenceCounting();
    void logoutWhilePassRunning();
    void statusOfUnknownUser();
    void forcedRequestsAreQueued();
    void queuedRequestsAreMerged();
    void jobTicker();
    void updateSyncInterval();
    void updateAutoSync();
    void failedPassResults();
    void syncNowCreatesJob();
    void globalTickPrunesInactiveUsers();
    void globalTickSyncsActiveUsers();
    void shutdownAll();

private:
    bool waitForPass(QSignalSpy *spy, int count = 1);

    SqlStorage *mStorage;
    FakeDavServer *mServer;
    FakeDavClientFactory *mFactory;
    ManualScheduler *mScheduler;
    Notifier *mNotifier;
    SyncJobRegistry *mRegistry;
};

void tst_SyncJobRegistry::init()
{
    mStorage = SqlStorage::open(QStringLiteral(":memory:"));
    QVERIFY(mStorage);
    mServer = new FakeDavServer;
    mFactory = new FakeDavClientFactory(mServer);
    mScheduler = new ManualScheduler;
    mNotifier = new Notifier;
    mRegistry = new SyncJobRegistry(mStorage, mFactory, mScheduler, mNotifier, QStringLiteral("example.com"));
}

void tst_SyncJobRegistry::cleanup()
{
    delete mRegistry;
    delete mNotifier;
    delete mScheduler;
    delete mFactory;
    delete mServer;
    delete mStorage;
}

bool tst_SyncJobRegistry::waitForPass(QSignalSpy *spy, int count)
{
    for (int i = 0; i < 50 && spy->count() < count; ++i) {
        spy->wait(100);
    }
    return spy->count() >= count;
}

void tst_SyncJobRegistry::setupRejectsInvalidConnection()
{
    ServerConnection connection = connectionFor(1);
    connection.url.clear();
    QVERIFY(!mRegistry->setupSyncForUser(1, connection));
    QVERIFY(!mRegistry->setupSyncForUser(2, connectionFor(1)));
    QVERIFY(!mRegistry->hasJob(1));
    QCOMPARE(mFactory->createdCount, 0);
}

void tst_SyncJobRegistry::setupStartsForcedPass()
{
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(mRegistry->hasJob(1));
    QCOMPARE(mRegistry->sessionCount(1), 1);
    QCOMPARE(mFactory->createdCount, 1);

    bool ok = false;
    QVERIFY(mStorage->serverConnection(1, &ok).isValid());
    QCOMPARE(mStorage->activeSessionUserIds(&ok), QList<qint64>() << 1);

    QVERIFY(waitForPass(&finished));
    QCOMPARE(finished.first().at(0).toLongLong(), qint64(1));
    QVERIFY(finished.first().at(1).toBool());

    const SyncStatus status = mRegistry->getSyncStatus(1);
    QVERIFY(status.configured);
    QVERIFY(status.syncing);
    QVERIFY(status.autoSync);
    QVERIFY(!status.inProgress);
    QVERIFY(status.lastSync.isValid());
    QCOMPARE(status.interval, 300);
    QCOMPARE(int(mRegistry->syncResults(1).majorCode()), int(Buteo::SyncResults::SYNC_RESULT_SUCCESS));
}

void tst_SyncJobRegistry::sessionReferenceCounting()
{
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(waitForPass(&finished));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QCOMPARE(mRegistry->sessionCount(1), 2);
    // a second session does not start another pass
    QCOMPARE(mFactory->createdCount, 1);

    QVERIFY(mRegistry->handleUserLogout(1));
    QVERIFY(mRegistry->hasJob(1));
    QCOMPARE(mRegistry->sessionCount(1), 1);

    QVERIFY(mRegistry->handleUserLogout(1));
    QVERIFY(!mRegistry->hasJob(1));
    QCOMPARE(mRegistry->sessionCount(1), 0);
    bool ok = false;
    QVERIFY(mStorage->activeSessionUserIds(&ok).isEmpty());

    QVERIFY(!mRegistry->handleUserLogout(1));
}

void tst_SyncJobRegistry::logoutWhilePassRunning()
{
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(mRegistry->getSyncStatus(1).inProgress);
    QVERIFY(mRegistry->handleUserLogout(1));
    QVERIFY(!mRegistry->hasJob(1));

    // the running pass completes without reporting to the registry
    QTest::qWait(200);
    QCOMPARE(finished.count(), 0);
    QCOMPARE(mServer->loginCount, 1);
}

void tst_SyncJobRegistry::statusOfUnknownUser()
{
    mRegistry->setDefaultSyncInterval(600);
    const SyncStatus status = mRegistry->getSyncStatus(42);
    QVERIFY(!status.configured);
    QVERIFY(!status.syncing);
    QVERIFY(!status.inProgress);
    QVERIFY(!status.autoSync);
    QVERIFY(!status.lastSync.isValid());
    QCOMPARE(status.interval, 600);
    QVERIFY(!mRegistry->startSync(42));
    QVERIFY(!mRegistry->stopSync(42));
    QVERIFY(!mRegistry->updateSyncInterval(42, 60));
    QVERIFY(!mRegistry->updateAutoSync(42, true));
}

void tst_SyncJobRegistry::forcedRequestsAreQueued()
{
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(mRegistry->getSyncStatus(1).inProgress);

    SyncOptions forced;
    forced.forceRefresh = true;
    QVERIFY(mRegistry->syncNow(1, forced));
    QVERIFY(mRegistry->syncNow(1, forced));
    QVERIFY(mRegistry->syncNow(1));
    QCOMPARE(mFactory->createdCount, 1);

    QVERIFY(waitForPass(&finished, 2));
    QTest::qWait(100);
    // one queued pass, the duplicate and the unforced request were dropped
    QCOMPARE(finished.count(), 2);
    QCOMPARE(mFactory->createdCount, 2);
}

void tst_SyncJobRegistry::queuedRequestsAreMerged()
{
    const QString workPath = QStringLiteral("/calendars/user1/work/");
    const QString workUrl = QStringLiteral("https://dav.example.com") + workPath;
    CalendarInfo work;
    work.path = workPath;
    work.displayName = QStringLiteral("Work");
    mServer->calendars << work;
    // cancelled locally, still on the server
    const QString href = workUrl + QStringLiteral("cancelled.ics");
    mServer->addObject(workUrl, href, QStringLiteral("\"c1\""),
                       QStringLiteral("BEGIN:VCALENDAR\r\n"
                                      "VERSION:2.0\r\n"
                                      "PRODID:-//Example Server//EN\r\n"
                                      "BEGIN:VEVENT\r\n"
                                      "UID:cancelled@example.com\r\n"
                                      "DTSTAMP:20240101T000000Z\r\n"
                                      "DTSTART:20240301T090000Z\r\n"
                                      "DTEND:20240301T100000Z\r\n"
                                      "SUMMARY:Cancelled\r\n"
                                      "END:VEVENT\r\n"
                                      "END:VCALENDAR\r\n"));

    QVERIFY(mStorage->updateServerConnection(connectionFor(1)));
    Calendar workCalendar;
    workCalendar.userId = 1;
    workCalendar.name = QStringLiteral("Work");
    workCalendar.url = workPath;
    QVERIFY(mStorage->createCalendar(&workCalendar));
    Calendar homeCalendar;
    homeCalendar.userId = 1;
    homeCalendar.name = QStringLiteral("Home");
    homeCalendar.url = QStringLiteral("/calendars/user1/home/");
    QVERIFY(mStorage->createCalendar(&homeCalendar));

    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    SyncOptions home;
    home.forceRefresh = true;
    home.calendarId = homeCalendar.id;
    QVERIFY(mRegistry->syncNow(1, home));
    QVERIFY(mRegistry->getSyncStatus(1).inProgress);

    SyncOptions retryDelete;
    retryDelete.forceRefresh = true;
    retryDelete.calendarId = workCalendar.id;
    retryDelete.preserveLocalDeletes = true;
    QVERIFY(mRegistry->syncNow(1, retryDelete));
    QVERIFY(mRegistry->syncNow(1, home));

    QVERIFY(waitForPass(&finished, 2));
    QTest::qWait(100);
    QCOMPARE(finished.count(), 2);
    QCOMPARE(mServer->deletes, QStringList() << href);
    bool ok = false;
    QVERIFY(mStorage->events(workCalendar.id, &ok).isEmpty());
}

void tst_SyncJobRegistry::jobTicker()
{
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(waitForPass(&finished));

    QCOMPARE(mScheduler->tickers().count(), 1);
    ManualTicker *ticker = mScheduler->tickers().first();
    QVERIFY(ticker->isActive());
    QCOMPARE(ticker->interval(), 300 * 1000);

    QVERIFY(ticker->fire());
    QVERIFY(waitForPass(&finished, 2));
    QCOMPARE(mFactory->createdCount, 2);

    QVERIFY(mRegistry->stopSync(1));
    QVERIFY(!mRegistry->getSyncStatus(1).syncing);
    QVERIFY(!ticker->fire());

    QVERIFY(mRegistry->startSync(1));
    QVERIFY(mRegistry->getSyncStatus(1).syncing);
    QVERIFY(ticker->fire());
    QVERIFY(waitForPass(&finished, 3));
}

void tst_SyncJobRegistry::updateSyncInterval()
{
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(!mRegistry->updateSyncInterval(1, 0));
    QVERIFY(mRegistry->updateSyncInterval(1, 60));

    QCOMPARE(mRegistry->getSyncStatus(1).interval, 60);
    QCOMPARE(mScheduler->tickers().first()->interval(), 60 * 1000);
    bool ok = false;
    QCOMPARE(mStorage->serverConnection(1, &ok).syncInterval, 60);
}

void tst_SyncJobRegistry::updateAutoSync()
{
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(mRegistry->updateAutoSync(1, false));

    SyncStatus status = mRegistry->getSyncStatus(1);
    QVERIFY(!status.autoSync);
    QVERIFY(!status.syncing);
    bool ok = false;
    QVERIFY(!mStorage->serverConnection(1, &ok).autoSync);

    QVERIFY(mRegistry->updateAutoSync(1, true));
    status = mRegistry->getSyncStatus(1);
    QVERIFY(status.autoSync);
    QVERIFY(status.syncing);
    QVERIFY(mStorage->serverConnection(1, &ok).autoSync);
}

void tst_SyncJobRegistry::failedPassResults()
{
    mServer->loginResult = Buteo::SyncResults::AUTHENTICATION_FAILURE;
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(waitForPass(&finished));

    QVERIFY(!finished.first().at(1).toBool());
    const Buteo::SyncResults results = mRegistry->syncResults(1);
    QCOMPARE(int(results.majorCode()), int(Buteo::SyncResults::SYNC_RESULT_FAILED));
    QCOMPARE(int(results.minorCode()), int(Buteo::SyncResults::AUTHENTICATION_FAILURE));
    QVERIFY(!mRegistry->getSyncStatus(1).lastSync.isValid());
}

void tst_SyncJobRegistry::syncNowCreatesJob()
{
    QVERIFY(!mRegistry->syncNow(7));
    QVERIFY(!mRegistry->hasJob(7));

    QVERIFY(mStorage->updateServerConnection(connectionFor(7)));
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->syncNow(7));
    QVERIFY(mRegistry->hasJob(7));
    QCOMPARE(mRegistry->sessionCount(7), 1);
    QVERIFY(waitForPass(&finished));
}

void tst_SyncJobRegistry::globalTickPrunesInactiveUsers()
{
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    QVERIFY(mRegistry->setupSyncForUser(2, connectionFor(2)));
    QVERIFY(waitForPass(&finished, 2));

    QVERIFY(mStorage->setSessionActive(1, false));
    mRegistry->globalTick();
    QVERIFY(!mRegistry->hasJob(1));
    QVERIFY(mRegistry->hasJob(2));
    QVERIFY(waitForPass(&finished, 3));
    QCOMPARE(finished.last().at(0).toLongLong(), qint64(2));
}

void tst_SyncJobRegistry::globalTickSyncsActiveUsers()
{
    QVERIFY(mStorage->updateServerConnection(connectionFor(3)));
    QVERIFY(mStorage->setSessionActive(3, true));
    QVERIFY(mStorage->updateServerConnection(connectionFor(4)));

    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    mRegistry->startGlobalSync(60);
    ManualTicker *globalTicker = mScheduler->tickers().last();
    QCOMPARE(globalTicker->interval(), 60 * 1000);
    QVERIFY(globalTicker->fire());

    QVERIFY(mRegistry->hasJob(3));
    QVERIFY(!mRegistry->hasJob(4));
    QVERIFY(waitForPass(&finished));
    QCOMPARE(finished.first().at(0).toLongLong(), qint64(3));

    // a stopped job is left alone
    QVERIFY(mRegistry->stopSync(3));
    QVERIFY(globalTicker->fire());
    QTest::qWait(100);
    QCOMPARE(finished.count(), 1);
}

void tst_SyncJobRegistry::shutdownAll()
{
    QSignalSpy finished(mRegistry, SIGNAL(syncFinished(qint64,bool)));
    QVERIFY(mRegistry->setupSyncForUser(1, connectionFor(1)));
    mRegistry->startGlobalSync();
    QVERIFY(waitForPass(&finished));

    mRegistry->shutdownAll();
    Q_FOREACH (ManualTicker *ticker, mScheduler->tickers()) {
        QVERIFY(!ticker->isActive());
    }
    QVERIFY(!mRegistry->getSyncStatus(1).syncing);
}

QTEST_MAIN(tst_SyncJobRegistry)
#include "tst_syncjobregistry.moc"
