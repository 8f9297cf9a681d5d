/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2014 Jolla Ltd. and/or its subsidiary(-ies).
 * Copyright (C) 2026 The caldav-sync contributors.
 *
 * Contributors: Bea Lam <bea.lam@jollamobile.com>
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
#include "sqlstorage.h"

#include <LogMacros.h>

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlError>
#include <QSqlRecord>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDir>
#include <QFileInfo>

static const char *createServerConnectionsTable =
        "\n CREATE TABLE IF NOT EXISTS ServerConnections ("
        "\n userId INTEGER PRIMARY KEY,"
        "\n url TEXT NOT NULL,"
        "\n username TEXT,"
        "\n password TEXT,"
        "\n syncInterval INTEGER NOT NULL DEFAULT 300,"
        "\n autoSync INTEGER NOT NULL DEFAULT 1,"
        "\n status TEXT NOT NULL DEFAULT 'pending',"
        "\n lastSync TEXT);";

static const char *createCalendarsTable =
        "\n CREATE TABLE IF NOT EXISTS Calendars ("
        "\n id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "\n userId INTEGER NOT NULL,"
        "\n name TEXT NOT NULL,"
        "\n color TEXT,"
        "\n url TEXT,"
        "\n syncToken TEXT,"
        "\n enabled INTEGER NOT NULL DEFAULT 1);";

static const char *createEventsTable =
        "\n CREATE TABLE IF NOT EXISTS Events ("
        "\n id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "\n uid TEXT NOT NULL,"
        "\n calendarId INTEGER NOT NULL,"
        "\n title TEXT,"
        "\n description TEXT,"
        "\n location TEXT,"
        "\n startDate TEXT,"
        "\n endDate TEXT,"
        "\n allDay INTEGER NOT NULL DEFAULT 0,"
        "\n timezone TEXT,"
        "\n recurrenceRule TEXT,"
        "\n attendees TEXT,"
        "\n resources TEXT,"
        "\n etag TEXT,"
        "\n url TEXT,"
        "\n rawData TEXT,"
        "\n syncStatus TEXT NOT NULL DEFAULT 'local',"
        "\n lastSyncAttempt TEXT,"
        "\n revision INTEGER NOT NULL DEFAULT 0);";

static const char *createEventsUidIndex =
        "\n CREATE INDEX IF NOT EXISTS EventsUidIndex ON Events (calendarId, uid);";

static const char *createSessionsTable =
        "\n CREATE TABLE IF NOT EXISTS Sessions ("
        "\n userId INTEGER PRIMARY KEY,"
        "\n active INTEGER NOT NULL DEFAULT 0);";

static const char *eventColumns =
        "id, uid, calendarId, title, description, location, startDate, endDate, allDay, timezone,"
        " recurrenceRule, attendees, resources, etag, url, rawData, syncStatus, lastSyncAttempt, revision";

static bool createDatabase(QSqlDatabase *database)
{
    static const char *createStatements[] = { createServerConnectionsTable, createCalendarsTable,
                                              createEventsTable, createEventsUidIndex, createSessionsTable };
    static const int createStatementsCount = 5;
    for (int i=0; i<createStatementsCount; ++i) {
        QSqlQuery query(*database);
        if (!query.exec(QLatin1String(createStatements[i]))) {
            LOG_CRITICAL(QString("Database creation failed: %1\n%2")
                    .arg(query.lastError().text())
                    .arg(createStatements[i]));
            return false;
        }
    }
    return true;
}

static QSqlDatabase openDatabase(const QString &databaseFile)
{
    static int connectionCount = 0;
    const QString connectionName = QStringLiteral("caldav-sync-%1").arg(++connectionCount);

    if (databaseFile != QStringLiteral(":memory:")) {
        QDir databaseDir = QFileInfo(databaseFile).absoluteDir();
        if (!databaseDir.exists() && !databaseDir.mkpath(QStringLiteral("."))) {
            LOG_CRITICAL("Cannot load database, cannot create database directory:" << databaseDir.path());
            return QSqlDatabase();
        }
    }

    QSqlDatabase database = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName);
    database.setDatabaseName(databaseFile);
    if (!database.open()) {
        LOG_CRITICAL("Cannot open database" << databaseFile << "error:" << database.lastError().text());
        return QSqlDatabase();
    }
    if (!createDatabase(&database)) {
        LOG_CRITICAL("Cannot load database, cannot create tables in:" << databaseFile);
        database.close();
        return QSqlDatabase();
    }
    LOG_DEBUG("Opened database:" << databaseFile);
    return database;
}

static QString dateTimeToString(const QDateTime &dt)
{
    return dt.isValid() ? dt.toUTC().toString(Qt::ISODate) : QString();
}

static QDateTime dateTimeFromString(const QString &value)
{
    if (value.isEmpty()) {
        return QDateTime();
    }
    QDateTime dt = QDateTime::fromString(value, Qt::ISODate);
    return dt.toUTC();
}

static QString attendeesToJson(const QList<Attendee> &attendees)
{
    QJsonArray array;
    Q_FOREACH (const Attendee &attendee, attendees) {
        QJsonObject object;
        object.insert(QStringLiteral("email"), attendee.email);
        if (!attendee.name.isEmpty()) object.insert(QStringLiteral("name"), attendee.name);
        if (!attendee.role.isEmpty()) object.insert(QStringLiteral("role"), attendee.role);
        if (!attendee.status.isEmpty()) object.insert(QStringLiteral("status"), attendee.status);
        if (!attendee.scheduleStatus.isEmpty()) object.insert(QStringLiteral("scheduleStatus"), attendee.scheduleStatus);
        array.append(object);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

static QList<Attendee> attendeesFromJson(const QString &json)
{
    QList<Attendee> ret;
    Q_FOREACH (const QJsonValue &value, QJsonDocument::fromJson(json.toUtf8()).array()) {
        const QJsonObject object = value.toObject();
        Attendee attendee;
        attendee.email = object.value(QStringLiteral("email")).toString();
        attendee.name = object.value(QStringLiteral("name")).toString();
        attendee.role = object.value(QStringLiteral("role")).toString();
        attendee.status = object.value(QStringLiteral("status")).toString();
        attendee.scheduleStatus = object.value(QStringLiteral("scheduleStatus")).toString();
        ret.append(attendee);
    }
    return ret;
}

static QString resourcesToJson(const QList<Resource> &resources)
{
    QJsonArray array;
    Q_FOREACH (const Resource &resource, resources) {
        QJsonObject object;
        object.insert(QStringLiteral("name"), resource.name);
        object.insert(QStringLiteral("adminEmail"), resource.adminEmail);
        if (!resource.type.isEmpty()) object.insert(QStringLiteral("type"), resource.type);
        array.append(object);
    }
    return QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact));
}

static QList<Resource> resourcesFromJson(const QString &json)
{
    QList<Resource> ret;
    Q_FOREACH (const QJsonValue &value, QJsonDocument::fromJson(json.toUtf8()).array()) {
        const QJsonObject object = value.toObject();
        Resource resource;
        resource.name = object.value(QStringLiteral("name")).toString();
        resource.adminEmail = object.value(QStringLiteral("adminEmail")).toString();
        resource.type = object.value(QStringLiteral("type")).toString();
        ret.append(resource);
    }
    return ret;
}

static CalendarEventRecord eventFromQuery(const QSqlQuery &query)
{
    CalendarEventRecord event;
    event.id = query.value(0).toLongLong();
    event.uid = query.value(1).toString();
    event.calendarId = query.value(2).toLongLong();
    event.title = query.value(3).toString();
    event.description = query.value(4).toString();
    event.location = query.value(5).toString();
    event.startDate = dateTimeFromString(query.value(6).toString());
    event.endDate = dateTimeFromString(query.value(7).toString());
    event.allDay = query.value(8).toBool();
    event.timezone = query.value(9).toString();
    event.recurrenceRule = query.value(10).toString();
    event.attendees = attendeesFromJson(query.value(11).toString());
    event.resources = resourcesFromJson(query.value(12).toString());
    event.etag = query.value(13).toString();
    event.url = query.value(14).toString();
    event.rawData = query.value(15).toString();
    event.syncStatus = CalendarEventRecord::syncStatusFromString(query.value(16).toString());
    event.lastSyncAttempt = dateTimeFromString(query.value(17).toString());
    event.revision = query.value(18).toInt();
    return event;
}

static void bindEventContent(QSqlQuery *query, const CalendarEventRecord &event)
{
    query->bindValue(QStringLiteral(":uid"), event.uid);
    query->bindValue(QStringLiteral(":calendarId"), event.calendarId);
    query->bindValue(QStringLiteral(":title"), event.title);
    query->bindValue(QStringLiteral(":description"), event.description);
    query->bindValue(QStringLiteral(":location"), event.location);
    query->bindValue(QStringLiteral(":startDate"), dateTimeToString(event.startDate));
    query->bindValue(QStringLiteral(":endDate"), dateTimeToString(event.endDate));
    query->bindValue(QStringLiteral(":allDay"), event.allDay ? 1 : 0);
    query->bindValue(QStringLiteral(":timezone"), event.timezone);
    query->bindValue(QStringLiteral(":recurrenceRule"), event.recurrenceRule);
    query->bindValue(QStringLiteral(":attendees"), attendeesToJson(event.attendees));
    query->bindValue(QStringLiteral(":resources"), resourcesToJson(event.resources));
    query->bindValue(QStringLiteral(":etag"), event.etag);
    query->bindValue(QStringLiteral(":url"), event.url);
    query->bindValue(QStringLiteral(":rawData"), event.rawData);
    query->bindValue(QStringLiteral(":syncStatus"), CalendarEventRecord::syncStatusToString(event.syncStatus));
    query->bindValue(QStringLiteral(":lastSyncAttempt"), dateTimeToString(event.lastSyncAttempt));
    query->bindValue(QStringLiteral(":revision"), event.revision);
}

static Calendar calendarFromQuery(const QSqlQuery &query)
{
    Calendar calendar;
    calendar.id = query.value(0).toLongLong();
    calendar.userId = query.value(1).toLongLong();
    calendar.name = query.value(2).toString();
    calendar.color = query.value(3).toString();
    calendar.url = query.value(4).toString();
    calendar.syncToken = query.value(5).toString();
    calendar.enabled = query.value(6).toBool();
    return calendar;
}

static bool execQuery(QSqlQuery *query)
{
    if (!query->exec()) {
        LOG_CRITICAL("SQL query failed:" << query->executedQuery() << "Error:" << query->lastError().text());
        return false;
    }
    return true;
}


SqlStorage::SqlStorage(const QSqlDatabase &db)
    : mDatabase(db)
{
}

SqlStorage::~SqlStorage()
{
    const QString connectionName = mDatabase.connectionName();
    mDatabase.close();
    mDatabase = QSqlDatabase();
    QSqlDatabase::removeDatabase(connectionName);
}

SqlStorage *SqlStorage::open(const QString &databaseFile)
{
    QSqlDatabase database = openDatabase(databaseFile);
    if (!database.isOpen()) {
        return 0;
    }
    return new SqlStorage(database);
}

bool SqlStorage::isOpen() const
{
    return mDatabase.isOpen();
}

QList<Calendar> SqlStorage::calendars(qint64 userId, bool *ok)
{
    QList<Calendar> ret;
    *ok = false;
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return ret;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("SELECT id, userId, name, color, url, syncToken, enabled FROM Calendars"
                                 " WHERE userId = :userId ORDER BY id"));
    query.bindValue(QStringLiteral(":userId"), userId);
    if (!execQuery(&query)) {
        return ret;
    }
    while (query.next()) {
        ret << calendarFromQuery(query);
    }
    *ok = true;
    return ret;
}

Calendar SqlStorage::calendar(qint64 calendarId, bool *ok)
{
    *ok = false;
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return Calendar();
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("SELECT id, userId, name, color, url, syncToken, enabled FROM Calendars"
                                 " WHERE id = :id"));
    query.bindValue(QStringLiteral(":id"), calendarId);
    if (!execQuery(&query)) {
        return Calendar();
    }
    *ok = true;
    return query.next() ? calendarFromQuery(query) : Calendar();
}

bool SqlStorage::createCalendar(Calendar *calendar)
{
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return false;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("INSERT INTO Calendars (userId, name, color, url, syncToken, enabled)"
                                 " VALUES (:userId, :name, :color, :url, :syncToken, :enabled)"));
    query.bindValue(QStringLiteral(":userId"), calendar->userId);
    query.bindValue(QStringLiteral(":name"), calendar->name);
    query.bindValue(QStringLiteral(":color"), calendar->color);
    query.bindValue(QStringLiteral(":url"), calendar->url);
    query.bindValue(QStringLiteral(":syncToken"), calendar->syncToken);
    query.bindValue(QStringLiteral(":enabled"), calendar->enabled ? 1 : 0);
    if (!execQuery(&query)) {
        return false;
    }
    calendar->id = query.lastInsertId().toLongLong();
    return true;
}

bool SqlStorage::updateCalendar(const Calendar &calendar)
{
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return false;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("UPDATE Calendars SET name = :name, color = :color, url = :url,"
                                 " syncToken = :syncToken, enabled = :enabled WHERE id = :id"));
    query.bindValue(QStringLiteral(":name"), calendar.name);
    query.bindValue(QStringLiteral(":color"), calendar.color);
    query.bindValue(QStringLiteral(":url"), calendar.url);
    query.bindValue(QStringLiteral(":syncToken"), calendar.syncToken);
    query.bindValue(QStringLiteral(":enabled"), calendar.enabled ? 1 : 0);
    query.bindValue(QStringLiteral(":id"), calendar.id);
    return execQuery(&query);
}

QList<CalendarEventRecord> SqlStorage::selectEvents(const QString &where, const QVariantList &values, bool *ok)
{
    QList<CalendarEventRecord> ret;
    *ok = false;
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return ret;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("SELECT %1 FROM Events WHERE %2 ORDER BY id").arg(QLatin1String(eventColumns)).arg(where));
    Q_FOREACH (const QVariant &value, values) {
        query.addBindValue(value);
    }
    if (!execQuery(&query)) {
        return ret;
    }
    while (query.next()) {
        ret << eventFromQuery(query);
    }
    *ok = true;
    return ret;
}

QList<CalendarEventRecord> SqlStorage::events(qint64 calendarId, bool *ok)
{
    return selectEvents(QStringLiteral("calendarId = ?"), QVariantList() << calendarId, ok);
}

CalendarEventRecord SqlStorage::eventByUid(qint64 calendarId, const QString &uid, bool *ok)
{
    return selectEvents(QStringLiteral("calendarId = ? AND uid = ?"),
                        QVariantList() << calendarId << uid, ok).value(0);
}

CalendarEventRecord SqlStorage::event(qint64 eventId, bool *ok)
{
    return selectEvents(QStringLiteral("id = ?"), QVariantList() << eventId, ok).value(0);
}

bool SqlStorage::createEvent(CalendarEventRecord *event)
{
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return false;
    }
    event->revision = 1;
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("INSERT INTO Events (uid, calendarId, title, description, location,"
                                 " startDate, endDate, allDay, timezone, recurrenceRule, attendees, resources,"
                                 " etag, url, rawData, syncStatus, lastSyncAttempt, revision)"
                                 " VALUES (:uid, :calendarId, :title, :description, :location,"
                                 " :startDate, :endDate, :allDay, :timezone, :recurrenceRule, :attendees, :resources,"
                                 " :etag, :url, :rawData, :syncStatus, :lastSyncAttempt, :revision)"));
    bindEventContent(&query, *event);
    if (!execQuery(&query)) {
        return false;
    }
    event->id = query.lastInsertId().toLongLong();
    return true;
}

bool SqlStorage::updateEvent(CalendarEventRecord *event)
{
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return false;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("UPDATE Events SET uid = :uid, calendarId = :calendarId, title = :title,"
                                 " description = :description, location = :location, startDate = :startDate,"
                                 " endDate = :endDate, allDay = :allDay, timezone = :timezone,"
                                 " recurrenceRule = :recurrenceRule, attendees = :attendees, resources = :resources,"
                                 " etag = :etag, url = :url, rawData = :rawData, syncStatus = :syncStatus,"
                                 " lastSyncAttempt = :lastSyncAttempt, revision = :revision"
                                 " WHERE id = :id"));
    CalendarEventRecord updated = *event;
    ++updated.revision;
    bindEventContent(&query, updated);
    query.bindValue(QStringLiteral(":id"), event->id);
    if (!execQuery(&query)) {
        return false;
    }
    if (query.numRowsAffected() == 0) {
        LOG_WARNING("No event with id" << event->id << "to update");
        return false;
    }
    event->revision = updated.revision;
    return true;
}

bool SqlStorage::updateEventSyncState(const CalendarEventRecord &event, int expectedRevision)
{
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return false;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("UPDATE Events SET etag = :etag, url = :url, rawData = :rawData,"
                                 " lastSyncAttempt = :lastSyncAttempt,"
                                 " syncStatus = CASE WHEN revision = :revision THEN :syncStatus ELSE syncStatus END"
                                 " WHERE id = :id"));
    query.bindValue(QStringLiteral(":etag"), event.etag);
    query.bindValue(QStringLiteral(":url"), event.url);
    query.bindValue(QStringLiteral(":rawData"), event.rawData);
    query.bindValue(QStringLiteral(":lastSyncAttempt"), dateTimeToString(event.lastSyncAttempt));
    query.bindValue(QStringLiteral(":revision"), expectedRevision);
    query.bindValue(QStringLiteral(":syncStatus"), CalendarEventRecord::syncStatusToString(event.syncStatus));
    query.bindValue(QStringLiteral(":id"), event.id);
    return execQuery(&query);
}

bool SqlStorage::deleteEvent(qint64 eventId)
{
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return false;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("DELETE FROM Events WHERE id = :id"));
    query.bindValue(QStringLiteral(":id"), eventId);
    return execQuery(&query);
}

ServerConnection SqlStorage::serverConnection(qint64 userId, bool *ok)
{
    *ok = false;
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return ServerConnection();
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("SELECT userId, url, username, password, syncInterval, autoSync, status, lastSync"
                                 " FROM ServerConnections WHERE userId = :userId"));
    query.bindValue(QStringLiteral(":userId"), userId);
    if (!execQuery(&query)) {
        return ServerConnection();
    }
    *ok = true;
    ServerConnection connection;
    if (query.next()) {
        connection.userId = query.value(0).toLongLong();
        connection.url = query.value(1).toString();
        connection.username = query.value(2).toString();
        connection.password = query.value(3).toString();
        connection.syncInterval = query.value(4).toInt();
        connection.autoSync = query.value(5).toBool();
        connection.status = ServerConnection::statusFromString(query.value(6).toString());
        connection.lastSync = dateTimeFromString(query.value(7).toString());
    }
    return connection;
}

bool SqlStorage::updateServerConnection(const ServerConnection &connection)
{
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return false;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO ServerConnections"
                                 " (userId, url, username, password, syncInterval, autoSync, status, lastSync)"
                                 " VALUES (:userId, :url, :username, :password, :syncInterval, :autoSync, :status, :lastSync)"));
    query.bindValue(QStringLiteral(":userId"), connection.userId);
    query.bindValue(QStringLiteral(":url"), connection.url);
    query.bindValue(QStringLiteral(":username"), connection.username);
    query.bindValue(QStringLiteral(":password"), connection.password);
    query.bindValue(QStringLiteral(":syncInterval"), connection.syncInterval);
    query.bindValue(QStringLiteral(":autoSync"), connection.autoSync ? 1 : 0);
    query.bindValue(QStringLiteral(":status"), ServerConnection::statusToString(connection.status));
    query.bindValue(QStringLiteral(":lastSync"), dateTimeToString(connection.lastSync));
    return execQuery(&query);
}

QList<qint64> SqlStorage::userIdsWithServerConnection(bool *ok)
{
    QList<qint64> ret;
    *ok = false;
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return ret;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("SELECT userId FROM ServerConnections ORDER BY userId"));
    if (!execQuery(&query)) {
        return ret;
    }
    while (query.next()) {
        ret << query.value(0).toLongLong();
    }
    *ok = true;
    return ret;
}

bool SqlStorage::setSessionActive(qint64 userId, bool active)
{
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return false;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("INSERT OR REPLACE INTO Sessions (userId, active) VALUES (:userId, :active)"));
    query.bindValue(QStringLiteral(":userId"), userId);
    query.bindValue(QStringLiteral(":active"), active ? 1 : 0);
    return execQuery(&query);
}

QList<qint64> SqlStorage::activeSessionUserIds(bool *ok)
{
    QList<qint64> ret;
    *ok = false;
    if (!mDatabase.isOpen()) {
        LOG_CRITICAL("Database is not open!");
        return ret;
    }
    QSqlQuery query(mDatabase);
    query.prepare(QStringLiteral("SELECT userId FROM Sessions WHERE active = 1 ORDER BY userId"));
    if (!execQuery(&query)) {
        return ret;
    }
    while (query.next()) {
        ret << query.value(0).toLongLong();
    }
    *ok = true;
    return ret;
}
