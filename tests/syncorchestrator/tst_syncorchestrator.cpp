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

#include "syncorchestrator.h"
#include "sqlstorage.h"
#include "notifier.h"
#include "icsserializer.h"
#include "fakedavclient.h"

#include <SyncResults.h>

namespace {
    const qint64 USER_ID = 1;
    const QString SERVER = QStringLiteral("https://dav.example.com");
    const QString WORK_PATH = QStringLiteral("/calendars/jane/work/");
    const QString WORK_URL = SERVER + WORK_PATH;

    QString eventData(const QString &uid, const QString &summary)
    {
        return QStringLiteral("BEGIN:VCALENDAR\r\n"
                              "VERSION:2.0\r\n"
                              "PRODID:-//Example Server//EN\r\n"
                              "BEGIN:VEVENT\r\n"
                              "UID:%1\r\n"
                              "DTSTAMP:20240101T000000Z\r\n"
                              "DTSTART:20240301T090000Z\r\n"
                              "DTEND:20240301T100000Z\r\n"
                              "SUMMARY:%2\r\n"
                              "END:VEVENT\r\n"
                              "END:VCALENDAR\r\n").arg(uid, summary);
    }
}

class tst_SyncOrchestrator : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void noServerConnection();
    void uploadsLocalEvent();
    void pullCreatesCalendarAndEvents();
    void remoteChangeOverwritesSyncedEvent();
    void pendingEditSurvivesPull();
    void preserveLocalEvents();
    void loginFailure();
    void calendarListingFailure();
    void uploadFailureMarksEvent();
    void unknownCalendar();
    void singleCalendarPass();
    void localOnlyCalendarIsNotUploaded();
    void preserveLocalDeletes();
    void secondRequestWhileRunning();

private:
    qint64 createWorkCalendar();
    CalendarEventRecord createLocalEvent(qint64 calendarId, const QString &uid, const QString &title);
    bool runPass(const SyncOptions &options = SyncOptions(), int *minorErrorCode = 0);

    SqlStorage *mStorage;
    FakeDavServer *mServer;
    FakeDavClientFactory *mFactory;
    Notifier *mNotifier;
    SyncOrchestrator *mOrchestrator;
};

void tst_SyncOrchestrator::initTestCase()
{
    qRegisterMetaType<Notifier::ChangeType>("Notifier::ChangeType");
}

void tst_SyncOrchestrator::init()
{
    mStorage = SqlStorage::open(QStringLiteral(":memory:"));
    QVERIFY(mStorage);
    mServer = new FakeDavServer;
    CalendarInfo work;
    work.path = WORK_PATH;
    work.displayName = QStringLiteral("Work");
    work.color = QStringLiteral("#FF0000FF");
    mServer->calendars << work;
    mFactory = new FakeDavClientFactory(mServer);
    mNotifier = new Notifier;
    mOrchestrator = new SyncOrchestrator(USER_ID, mStorage, mFactory, mNotifier, QStringLiteral("example.com"));

    ServerConnection connection;
    connection.userId = USER_ID;
    connection.url = SERVER;
    connection.username = QStringLiteral("jane");
    connection.password = QStringLiteral("secret");
    QVERIFY(mStorage->updateServerConnection(connection));
}

void tst_SyncOrchestrator::cleanup()
{
    delete mOrchestrator;
    delete mNotifier;
    delete mFactory;
    delete mServer;
    delete mStorage;
}

qint64 tst_SyncOrchestrator::createWorkCalendar()
{
    Calendar calendar;
    calendar.userId = USER_ID;
    calendar.name = QStringLiteral("Work");
    calendar.url = WORK_PATH;
    return mStorage->createCalendar(&calendar) ? calendar.id : 0;
}

CalendarEventRecord tst_SyncOrchestrator::createLocalEvent(qint64 calendarId, const QString &uid,
                                                           const QString &title)
{
    CalendarEventRecord event;
    event.uid = uid;
    event.calendarId = calendarId;
    event.title = title;
    event.startDate = QDateTime(QDate(2024, 3, 1), QTime(9, 0), Qt::UTC);
    event.endDate = QDateTime(QDate(2024, 3, 1), QTime(10, 0), Qt::UTC);
    mStorage->createEvent(&event);
    return event;
}

bool tst_SyncOrchestrator::runPass(const SyncOptions &options, int *minorErrorCode)
{
    QSignalSpy finished(mOrchestrator, SIGNAL(finished(int,QString)));
    if (!mOrchestrator->syncNow(options)) {
        return false;
    }
    if (!finished.wait(5000)) {
        return false;
    }
    if (minorErrorCode) {
        *minorErrorCode = finished.first().at(0).toInt();
    }
    return !mOrchestrator->isRunning();
}

void tst_SyncOrchestrator::noServerConnection()
{
    SyncOrchestrator orchestrator(42, mStorage, mFactory, mNotifier);
    QVERIFY(!orchestrator.syncNow());
    QVERIFY(!orchestrator.isRunning());
    QCOMPARE(mFactory->createdCount, 0);
}

void tst_SyncOrchestrator::uploadsLocalEvent()
{
    const qint64 calendarId = createWorkCalendar();
    const CalendarEventRecord local = createLocalEvent(calendarId, QStringLiteral("local-1@example.com"),
                                                       QStringLiteral("Planning"));

    int code = -1;
    QVERIFY(runPass(SyncOptions(), &code));
    QCOMPARE(code, int(Buteo::SyncResults::NO_ERROR));
    QCOMPARE(mFactory->lastUsername, QStringLiteral("jane"));

    const QString uri = WORK_URL + QStringLiteral("local-1@example.com.ics");
    QCOMPARE(mServer->puts, QStringList() << uri);
    QVERIFY(mServer->putEtags.first().isEmpty());
    // the server returned an etag for a new object, so no second pull
    QCOMPARE(mServer->fetchedPaths, QStringList() << WORK_URL);

    bool ok = false;
    const CalendarEventRecord stored = mStorage->event(local.id, &ok);
    QCOMPARE(stored.syncStatus, CalendarEventRecord::Synced);
    QCOMPARE(stored.etag, QStringLiteral("\"etag-1\""));
    QCOMPARE(stored.url, uri);
    QVERIFY(stored.rawData.contains(QStringLiteral("SUMMARY:Planning")));
    QVERIFY(stored.lastSyncAttempt.isValid());

    const ServerConnection connection = mStorage->serverConnection(USER_ID, &ok);
    QCOMPARE(connection.status, ServerConnection::Connected);
    QVERIFY(connection.lastSync.isValid());
    QVERIFY(!mStorage->calendar(calendarId, &ok).syncToken.isEmpty());
}

void tst_SyncOrchestrator::pullCreatesCalendarAndEvents()
{
    mServer->addObject(WORK_URL, WORK_URL + QStringLiteral("remote-1.ics"), QStringLiteral("\"r1\""),
                       eventData(QStringLiteral("remote-1@example.com"), QStringLiteral("Standup")));
    QSignalSpy changes(mNotifier, SIGNAL(changed(qint64,qint64,Notifier::ChangeType)));

    int code = -1;
    QVERIFY(runPass(SyncOptions(), &code));
    QCOMPARE(code, int(Buteo::SyncResults::NO_ERROR));

    bool ok = false;
    const QList<Calendar> calendars = mStorage->calendars(USER_ID, &ok);
    QCOMPARE(calendars.count(), 1);
    QCOMPARE(calendars.first().name, QStringLiteral("Work"));
    QCOMPARE(calendars.first().url, WORK_PATH);
    QCOMPARE(calendars.first().color, QStringLiteral("#FF0000"));

    const CalendarEventRecord event = mStorage->eventByUid(calendars.first().id,
                                                           QStringLiteral("remote-1@example.com"), &ok);
    QVERIFY(event.id > 0);
    QCOMPARE(event.title, QStringLiteral("Standup"));
    QCOMPARE(event.etag, QStringLiteral("\"r1\""));
    QCOMPARE(event.syncStatus, CalendarEventRecord::Synced);
    QVERIFY(mServer->puts.isEmpty());

    QCOMPARE(changes.count(), 2);
    QCOMPARE(changes.at(0).at(2).value<Notifier::ChangeType>(), Notifier::CalendarCreated);
    QCOMPARE(changes.at(1).at(2).value<Notifier::ChangeType>(), Notifier::EventCreated);

    // a second pass matches the calendar and skips the unchanged event
    changes.clear();
    QVERIFY(runPass());
    QCOMPARE(mStorage->calendars(USER_ID, &ok).count(), 1);
    QCOMPARE(changes.count(), 0);
}

void tst_SyncOrchestrator::remoteChangeOverwritesSyncedEvent()
{
    const qint64 calendarId = createWorkCalendar();
    CalendarEventRecord local = createLocalEvent(calendarId, QStringLiteral("remote-1@example.com"),
                                                 QStringLiteral("Old"));
    local.etag = QStringLiteral("\"r1\"");
    local.url = WORK_URL + QStringLiteral("remote-1.ics");
    local.syncStatus = CalendarEventRecord::Synced;
    QVERIFY(mStorage->updateEvent(&local));

    mServer->addObject(WORK_URL, local.url, QStringLiteral("\"r2\""),
                       eventData(local.uid, QStringLiteral("New")));
    QVERIFY(runPass());

    bool ok = false;
    const CalendarEventRecord stored = mStorage->event(local.id, &ok);
    QCOMPARE(stored.title, QStringLiteral("New"));
    QCOMPARE(stored.etag, QStringLiteral("\"r2\""));
    QCOMPARE(stored.syncStatus, CalendarEventRecord::Synced);
    QVERIFY(mServer->puts.isEmpty());
}

void tst_SyncOrchestrator::pendingEditSurvivesPull()
{
    const qint64 calendarId = createWorkCalendar();
    CalendarEventRecord local = createLocalEvent(calendarId, QStringLiteral("remote-1@example.com"),
                                                 QStringLiteral("Local title"));
    local.etag = QStringLiteral("\"r1\"");
    local.url = WORK_URL + QStringLiteral("remote-1.ics");
    local.syncStatus = CalendarEventRecord::Pending;
    QVERIFY(mStorage->updateEvent(&local));

    mServer->addObject(WORK_URL, local.url, QStringLiteral("\"r2\""),
                       eventData(local.uid, QStringLiteral("Server title")));
    QVERIFY(runPass());

    // the update is sent against the etag seen by the pull
    QCOMPARE(mServer->puts, QStringList() << local.url);
    QCOMPARE(mServer->putEtags, QStringList() << QStringLiteral("\"r2\""));
    // an update is followed by a second pull
    QCOMPARE(mServer->fetchedPaths.count(), 2);

    bool ok = false;
    const CalendarEventRecord stored = mStorage->event(local.id, &ok);
    QCOMPARE(stored.title, QStringLiteral("Local title"));
    QCOMPARE(stored.syncStatus, CalendarEventRecord::Synced);
    QCOMPARE(stored.etag, QStringLiteral("\"etag-1\""));
    QVERIFY(mServer->object(local.url).iCalData.contains(QStringLiteral("SUMMARY:Local title")));
}

void tst_SyncOrchestrator::preserveLocalEvents()
{
    const qint64 calendarId = createWorkCalendar();
    CalendarEventRecord local = createLocalEvent(calendarId, QStringLiteral("remote-1@example.com"),
                                                 QStringLiteral("Local title"));
    mServer->addObject(WORK_URL, WORK_URL + QStringLiteral("remote-1.ics"), QStringLiteral("\"r1\""),
                       eventData(local.uid, QStringLiteral("Server title")));
    mServer->putResults.insert(WORK_URL + QStringLiteral("remote-1.ics"), Buteo::SyncResults::INTERNAL_ERROR);

    SyncOptions options;
    options.preserveLocalEvents = true;
    QVERIFY(runPass(options));

    bool ok = false;
    const CalendarEventRecord stored = mStorage->event(local.id, &ok);
    QCOMPARE(stored.title, QStringLiteral("Local title"));
    QCOMPARE(stored.etag, QStringLiteral("\"r1\""));
    QCOMPARE(stored.url, WORK_URL + QStringLiteral("remote-1.ics"));
    QCOMPARE(stored.syncStatus, CalendarEventRecord::Error);
}

void tst_SyncOrchestrator::loginFailure()
{
    createLocalEvent(createWorkCalendar(), QStringLiteral("local-1@example.com"), QStringLiteral("Planning"));
    mServer->loginResult = Buteo::SyncResults::AUTHENTICATION_FAILURE;

    int code = -1;
    QVERIFY(runPass(SyncOptions(), &code));
    QCOMPARE(code, int(Buteo::SyncResults::AUTHENTICATION_FAILURE));
    QVERIFY(mServer->fetchedPaths.isEmpty());
    QVERIFY(mServer->puts.isEmpty());

    bool ok = false;
    QCOMPARE(mStorage->serverConnection(USER_ID, &ok).status, ServerConnection::Error);
}

void tst_SyncOrchestrator::calendarListingFailure()
{
    mServer->calendarsResult = Buteo::SyncResults::INTERNAL_ERROR;

    int code = -1;
    QVERIFY(runPass(SyncOptions(), &code));
    QCOMPARE(code, int(Buteo::SyncResults::CONNECTION_ERROR));

    bool ok = false;
    QCOMPARE(mStorage->serverConnection(USER_ID, &ok).status, ServerConnection::Error);
    QVERIFY(mStorage->calendars(USER_ID, &ok).isEmpty());
}

void tst_SyncOrchestrator::uploadFailureMarksEvent()
{
    const qint64 calendarId = createWorkCalendar();
    const CalendarEventRecord failing = createLocalEvent(calendarId, QStringLiteral("failing@example.com"),
                                                         QStringLiteral("Failing"));
    const CalendarEventRecord working = createLocalEvent(calendarId, QStringLiteral("working@example.com"),
                                                         QStringLiteral("Working"));
    mServer->putResults.insert(WORK_URL + QStringLiteral("failing@example.com.ics"),
                               Buteo::SyncResults::INTERNAL_ERROR);

    int code = -1;
    QVERIFY(runPass(SyncOptions(), &code));
    QCOMPARE(code, int(Buteo::SyncResults::NO_ERROR));

    bool ok = false;
    QCOMPARE(mStorage->event(failing.id, &ok).syncStatus, CalendarEventRecord::Error);
    QCOMPARE(mStorage->event(working.id, &ok).syncStatus, CalendarEventRecord::Synced);

    // failed uploads are retried on the next pass
    mServer->putResults.clear();
    mServer->puts.clear();
    QVERIFY(runPass());
    QCOMPARE(mServer->puts, QStringList() << WORK_URL + QStringLiteral("failing@example.com.ics"));
    QCOMPARE(mStorage->event(failing.id, &ok).syncStatus, CalendarEventRecord::Synced);
}

void tst_SyncOrchestrator::unknownCalendar()
{
    SyncOptions options;
    options.calendarId = 4711;

    int code = -1;
    QVERIFY(runPass(options, &code));
    QCOMPARE(code, int(Buteo::SyncResults::INTERNAL_ERROR));
    QVERIFY(mServer->fetchedPaths.isEmpty());
}

void tst_SyncOrchestrator::singleCalendarPass()
{
    const qint64 calendarId = createWorkCalendar();
    Calendar other;
    other.userId = USER_ID;
    other.name = QStringLiteral("Other");
    other.url = QStringLiteral("/calendars/jane/other/");
    QVERIFY(mStorage->createCalendar(&other));

    SyncOptions options;
    options.calendarId = calendarId;
    options.forceRefresh = true;
    QVERIFY(runPass(options));
    QCOMPARE(mServer->fetchedPaths, QStringList() << WORK_URL);
}

void tst_SyncOrchestrator::localOnlyCalendarIsNotUploaded()
{
    Calendar personal;
    personal.userId = USER_ID;
    personal.name = QStringLiteral("Personal");
    QVERIFY(mStorage->createCalendar(&personal));
    const CalendarEventRecord local = createLocalEvent(personal.id, QStringLiteral("private@example.com"),
                                                       QStringLiteral("Dentist"));

    SyncOptions options;
    options.calendarId = personal.id;
    options.forceRefresh = true;
    int code = -1;
    QVERIFY(runPass(options, &code));
    QCOMPARE(code, int(Buteo::SyncResults::NO_ERROR));

    QVERIFY(mServer->fetchedPaths.isEmpty());
    QVERIFY(mServer->puts.isEmpty());
    bool ok = false;
    const CalendarEventRecord stored = mStorage->event(local.id, &ok);
    QVERIFY(ok);
    QCOMPARE(stored.syncStatus, CalendarEventRecord::Local);
    QVERIFY(stored.url.isEmpty());
    QVERIFY(mStorage->calendar(personal.id, &ok).syncToken.isEmpty());
}

void tst_SyncOrchestrator::preserveLocalDeletes()
{
    createWorkCalendar();
    const QString href = WORK_URL + QStringLiteral("deleted.ics");
    mServer->addObject(WORK_URL, href, QStringLiteral("\"d1\""),
                       eventData(QStringLiteral("deleted@example.com"), QStringLiteral("Gone")));

    SyncOptions options;
    options.forceRefresh = true;
    options.preserveLocalDeletes = true;
    QVERIFY(runPass(options));

    QCOMPARE(mServer->deletes, QStringList() << href);
    QVERIFY(mServer->objects.value(WORK_URL).isEmpty());
    bool ok = false;
    const QList<Calendar> calendars = mStorage->calendars(USER_ID, &ok);
    QVERIFY(mStorage->events(calendars.first().id, &ok).isEmpty());
}

void tst_SyncOrchestrator::secondRequestWhileRunning()
{
    QSignalSpy finished(mOrchestrator, SIGNAL(finished(int,QString)));
    QVERIFY(mOrchestrator->syncNow());
    QVERIFY(mOrchestrator->isRunning());
    QVERIFY(mOrchestrator->syncNow());
    QCOMPARE(mFactory->createdCount, 1);

    QVERIFY(finished.wait(5000));
    QTest::qWait(50);
    QCOMPARE(finished.count(), 1);
    QCOMPARE(mServer->loginCount, 1);
}

QTEST_MAIN(tst_SyncOrchestrator)
#include "tst_syncorchestrator.moc"
