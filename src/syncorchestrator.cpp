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

#include "syncorchestrator.h"
#include "icsserializer.h"
#include "notifier.h"
#include "storage.h"

#include <QUrl>

#include <SyncResults.h>
#include <LogMacros.h>

namespace {
    QString withoutTrailingSlash(const QString &url)
    {
        QString ret = url;
        while (ret.endsWith(QChar('/'))) {
            ret.chop(1);
        }
        return ret;
    }

    QString calendarName(const CalendarInfo &info)
    {
        if (!info.displayName.isEmpty()) {
            return info.displayName;
        }
        const QStringList segments = withoutTrailingSlash(info.path).split(QChar('/'), QString::SkipEmptyParts);
        return segments.isEmpty() ? info.path : QUrl::fromPercentEncoding(segments.last().toUtf8());
    }

    QString calendarColor(const QString &serverColor)
    {
        // some servers report #RRGGBBAA
        if (serverColor.length() == 9 && serverColor.startsWith(QChar('#'))) {
            return serverColor.left(7);
        }
        return serverColor.isEmpty() ? Calendar().color : serverColor;
    }
}

SyncOrchestrator::SyncOrchestrator(qint64 userId, Storage *storage, DavClientFactory *clientFactory,
                                   Notifier *notifier, const QString &uidDomain, QObject *parent)
    : QObject(parent)
    , mUserId(userId)
    , mStorage(storage)
    , mClientFactory(clientFactory)
    , mNotifier(notifier)
    , mParser(0, uidDomain)
    , mFollowUpPull(false)
    , mFollowUpNeeded(false)
    , mRunning(false)
{
}

SyncOrchestrator::~SyncOrchestrator()
{
    delete mClient.data();
}

bool SyncOrchestrator::isRunning() const
{
    return mRunning;
}

qint64 SyncOrchestrator::userId() const
{
    return mUserId;
}

bool SyncOrchestrator::syncNow(const SyncOptions &options)
{
    FUNCTION_CALL_TRACE;

    if (mRunning) {
        LOG_DEBUG("Sync already in progress for user" << mUserId);
        return true;
    }

    bool ok = false;
    ServerConnection connection = mStorage->serverConnection(mUserId, &ok);
    if (!ok || !connection.isValid()) {
        LOG_WARNING("No server connection for user" << mUserId);
        return false;
    }

    LOG_DEBUG("Starting sync for user" << mUserId << "calendar" << options.calendarId
              << "forced" << options.forceRefresh);
    mRunning = true;
    mOptions = options;
    mConnection = connection;
    mPendingCalendars.clear();
    mUploads.clear();
    mDeletes.clear();

    delete mClient.data();
    mClient = mClientFactory->createClient(mConnection, this);
    connect(mClient.data(), SIGNAL(loginFinished(int,QString)),
            this, SLOT(loginFinished(int,QString)));
    connect(mClient.data(), SIGNAL(calendarsFetched(int,QString,QList<CalendarInfo>)),
            this, SLOT(calendarsFetched(int,QString,QList<CalendarInfo>)));
    connect(mClient.data(), SIGNAL(calendarObjectsFetched(QString,int,QString,QList<Reader::CalendarResource>)),
            this, SLOT(calendarObjectsFetched(QString,int,QString,QList<Reader::CalendarResource>)));
    connect(mClient.data(), SIGNAL(putFinished(QString,int,QString,QString)),
            this, SLOT(putFinished(QString,int,QString,QString)));
    connect(mClient.data(), SIGNAL(deleteFinished(QString,int,QString)),
            this, SLOT(deleteFinished(QString,int,QString)));
    mClient->login();
    return true;
}

void SyncOrchestrator::loginFinished(int minorErrorCode, const QString &message)
{
    FUNCTION_CALL_TRACE;

    if (minorErrorCode != Buteo::SyncResults::NO_ERROR) {
        LOG_CRITICAL("Login failed for user" << mUserId << ":" << message);
        mConnection.status = ServerConnection::Error;
        if (!mStorage->updateServerConnection(mConnection)) {
            LOG_WARNING("Unable to store connection status for user" << mUserId);
        }
        emitFinished(minorErrorCode, message);
        return;
    }

    if (mOptions.calendarId > 0) {
        resolveCalendarFromId();
    } else {
        mClient->fetchCalendars();
    }
}

void SyncOrchestrator::resolveCalendarFromId()
{
    bool ok = false;
    Calendar calendar = mStorage->calendar(mOptions.calendarId, &ok);
    if (!ok) {
        emitFinished(Buteo::SyncResults::DATABASE_FAILURE,
                     QString("Unable to load calendar %1").arg(mOptions.calendarId));
        return;
    }
    if (calendar.id == 0 || calendar.userId != mUserId) {
        emitFinished(Buteo::SyncResults::INTERNAL_ERROR,
                     QString("Unknown calendar %1").arg(mOptions.calendarId));
        return;
    }
    if (calendar.url.isEmpty()) {
        LOG_DEBUG("Calendar" << calendar.name << "has no remote url, skipping");
    } else {
        mPendingCalendars.append(calendar);
    }
    syncNextCalendar();
}

void SyncOrchestrator::calendarsFetched(int minorErrorCode, const QString &message,
                                        const QList<CalendarInfo> &calendars)
{
    FUNCTION_CALL_TRACE;

    if (minorErrorCode != Buteo::SyncResults::NO_ERROR) {
        LOG_CRITICAL("Unable to list calendars for user" << mUserId << ":" << message);
        mConnection.status = ServerConnection::Error;
        if (!mStorage->updateServerConnection(mConnection)) {
            LOG_WARNING("Unable to store connection status for user" << mUserId);
        }
        emitFinished(Buteo::SyncResults::CONNECTION_ERROR, message);
        return;
    }

    reconcileCalendars(calendars);
    if (mRunning) {
        syncNextCalendar();
    }
}

void SyncOrchestrator::reconcileCalendars(const QList<CalendarInfo> &remoteCalendars)
{
    bool ok = false;
    QList<Calendar> localCalendars = mStorage->calendars(mUserId, &ok);
    if (!ok) {
        emitFinished(Buteo::SyncResults::DATABASE_FAILURE, QStringLiteral("Unable to load calendars"));
        return;
    }

    QSet<qint64> matched;
    Q_FOREACH (const CalendarInfo &remote, remoteCalendars) {
        const QString remoteUrl = withoutTrailingSlash(absoluteUrl(remote.path));
        const QString name = calendarName(remote);

        int index = -1;
        for (int i = 0; i < localCalendars.count() && index < 0; ++i) {
            const Calendar &local = localCalendars[i];
            if (!local.url.isEmpty() && !matched.contains(local.id)
                    && withoutTrailingSlash(absoluteUrl(local.url)) == remoteUrl) {
                index = i;
            }
        }
        for (int i = 0; i < localCalendars.count() && index < 0; ++i) {
            if (!matched.contains(localCalendars[i].id) && localCalendars[i].name == name) {
                index = i;
            }
        }

        Calendar calendar;
        if (index < 0) {
            calendar.userId = mUserId;
            calendar.name = name;
            calendar.color = calendarColor(remote.color);
            calendar.url = remote.path;
            if (!mStorage->createCalendar(&calendar)) {
                LOG_WARNING("Unable to create local calendar for" << remote.path);
                continue;
            }
            LOG_DEBUG("Created local calendar" << calendar.id << "for" << remote.path);
            mNotifier->notify(mUserId, calendar.id, Notifier::CalendarCreated);
        } else {
            calendar = localCalendars[index];
            if (calendar.name != name || calendar.url != remote.path) {
                calendar.name = name;
                calendar.url = remote.path;
                if (!mStorage->updateCalendar(calendar)) {
                    LOG_WARNING("Unable to update local calendar" << calendar.id);
                    continue;
                }
                mNotifier->notify(mUserId, calendar.id, Notifier::CalendarUpdated);
            }
        }
        matched.insert(calendar.id);

        if (calendar.enabled) {
            mPendingCalendars.append(calendar);
        } else {
            LOG_DEBUG("Skipping disabled calendar" << calendar.name);
        }
    }
}

void SyncOrchestrator::syncNextCalendar()
{
    FUNCTION_CALL_TRACE;

    if (mPendingCalendars.isEmpty()) {
        mConnection.status = ServerConnection::Connected;
        mConnection.lastSync = QDateTime::currentDateTimeUtc();
        if (!mStorage->updateServerConnection(mConnection)) {
            LOG_WARNING("Unable to store connection status for user" << mUserId);
        }
        emitFinished(Buteo::SyncResults::NO_ERROR, QString());
        return;
    }

    mCurrentCalendar = mPendingCalendars.takeFirst();
    mCurrentPath = collectionUrl(mCurrentCalendar);
    mFollowUpPull = false;
    mFollowUpNeeded = false;
    mUploads.clear();
    mDeletes.clear();
    LOG_DEBUG("Syncing calendar" << mCurrentCalendar.name << "at" << mCurrentPath);
    mClient->fetchCalendarObjects(mCurrentPath);
}

void SyncOrchestrator::calendarObjectsFetched(const QString &calendarPath, int minorErrorCode,
                                              const QString &message,
                                              const QList<Reader::CalendarResource> &resources)
{
    FUNCTION_CALL_TRACE;

    if (!mRunning || calendarPath != mCurrentPath) {
        LOG_DEBUG("Ignoring calendar objects of" << calendarPath);
        return;
    }
    if (minorErrorCode != Buteo::SyncResults::NO_ERROR) {
        LOG_WARNING("Unable to fetch calendar objects of" << calendarPath << ":" << message
                    << "- skipping calendar");
        syncNextCalendar();
        return;
    }

    pullCalendarObjects(resources);
    if (mFollowUpPull) {
        finishCalendar();
    } else {
        pushLocalEvents();
    }
}

void SyncOrchestrator::pullCalendarObjects(const QList<Reader::CalendarResource> &resources)
{
    FUNCTION_CALL_TRACE;

    Q_FOREACH (const Reader::CalendarResource &resource, resources) {
        if (resource.iCalData.trimmed().isEmpty()) {
            continue;
        }
        CalendarEventRecord remote;
        remote.calendarId = mCurrentCalendar.id;
        if (!mParser.parse(resource.iCalData, &remote, resource.etag, resource.href)) {
            LOG_WARNING("Dropping unparseable calendar object" << resource.href);
            continue;
        }

        bool ok = false;
        CalendarEventRecord local = mStorage->eventByUid(mCurrentCalendar.id, remote.uid, &ok);
        if (!ok) {
            LOG_WARNING("Unable to look up local event" << remote.uid);
            continue;
        }

        if (local.id == 0) {
            if (mOptions.preserveLocalDeletes && !mFollowUpPull) {
                LOG_DEBUG("Event" << remote.uid << "was deleted locally, deleting" << resource.href);
                if (!mDeletes.contains(resource.href)) {
                    mDeletes.insert(resource.href);
                    mClient->deleteCalendarObject(resource.href, resource.etag);
                }
                continue;
            }
            if (!mStorage->createEvent(&remote)) {
                LOG_WARNING("Unable to store remote event" << remote.uid);
                continue;
            }
            mNotifier->notify(mUserId, remote.id, Notifier::EventCreated);
            continue;
        }

        const bool keepLocal = local.syncStatus == CalendarEventRecord::Pending
                || (mOptions.preserveLocalEvents && (local.syncStatus == CalendarEventRecord::Local
                                                     || local.syncStatus == CalendarEventRecord::Error));
        if (keepLocal) {
            if (local.etag != remote.etag || local.url.isEmpty()) {
                LOG_DEBUG("Keeping local changes of" << local.uid << ", refreshing etag only");
                local.etag = remote.etag;
                if (local.url.isEmpty()) {
                    local.url = remote.url;
                }
                if (!mStorage->updateEventSyncState(local, local.revision)) {
                    LOG_WARNING("Unable to refresh etag of" << local.uid);
                }
            }
            continue;
        }

        if (local.syncStatus == CalendarEventRecord::Synced && local.etag == remote.etag
                && !remote.etag.isEmpty()) {
            // unchanged since the last pull
            continue;
        }

        remote.id = local.id;
        remote.calendarId = local.calendarId;
        remote.revision = local.revision;
        if (!mStorage->updateEvent(&remote)) {
            LOG_WARNING("Unable to update local event" << remote.uid);
            continue;
        }
        mNotifier->notify(mUserId, remote.id, Notifier::EventUpdated);
    }
}

void SyncOrchestrator::pushLocalEvents()
{
    FUNCTION_CALL_TRACE;

    bool ok = false;
    const QList<CalendarEventRecord> events = mStorage->events(mCurrentCalendar.id, &ok);
    if (!ok) {
        LOG_WARNING("Unable to load local events of calendar" << mCurrentCalendar.id);
    }

    // pending modifications first, then retries of failed uploads, then additions
    QList<CalendarEventRecord> outgoing;
    Q_FOREACH (const CalendarEventRecord &event, events) {
        if (event.syncStatus == CalendarEventRecord::Pending) {
            outgoing.append(event);
        }
    }
    Q_FOREACH (const CalendarEventRecord &event, events) {
        if (event.syncStatus == CalendarEventRecord::Error) {
            outgoing.append(event);
        }
    }
    Q_FOREACH (const CalendarEventRecord &event, events) {
        if (event.syncStatus == CalendarEventRecord::Local) {
            outgoing.append(event);
        }
    }

    Q_FOREACH (const CalendarEventRecord &event, outgoing) {
        Upload upload;
        upload.eventId = event.id;
        upload.revision = event.revision;
        upload.ics = IcsSerializer::generateICalEvent(event, mConnection.username);
        upload.previousEtag = event.etag;
        upload.isUpdate = event.hasRemoteObject();

        const QString uri = upload.isUpdate ? event.url : mCurrentPath + event.uid + QStringLiteral(".ics");
        if (mUploads.contains(uri)) {
            LOG_WARNING("Already uploading" << uri << ", skipping event" << event.id);
            continue;
        }
        LOG_DEBUG((upload.isUpdate ? "Updating" : "Creating") << "remote event" << event.uid << "at" << uri);
        mUploads.insert(uri, upload);
        mClient->putCalendarObject(uri, upload.ics, upload.isUpdate ? event.etag : QString());
    }

    if (mUploads.isEmpty() && mDeletes.isEmpty()) {
        calendarRequestsFinished();
    }
}

void SyncOrchestrator::putFinished(const QString &uri, int minorErrorCode, const QString &message,
                                   const QString &etag)
{
    FUNCTION_CALL_TRACE;

    if (!mRunning || !mUploads.contains(uri)) {
        return;
    }
    const Upload upload = mUploads.take(uri);

    if (minorErrorCode != Buteo::SyncResults::NO_ERROR) {
        LOG_WARNING("Upload of" << uri << "failed:" << message);
        markUploadFailed(upload);
    } else {
        bool ok = false;
        CalendarEventRecord event = mStorage->event(upload.eventId, &ok);
        if (ok && event.id != 0) {
            event.etag = etag.isEmpty() ? upload.previousEtag : etag;
            event.url = uri;
            event.rawData = upload.ics;
            event.syncStatus = CalendarEventRecord::Synced;
            event.lastSyncAttempt = QDateTime::currentDateTimeUtc();
            if (!mStorage->updateEventSyncState(event, upload.revision)) {
                LOG_WARNING("Unable to store sync state of" << event.uid);
            } else {
                mNotifier->notify(mUserId, event.id, Notifier::EventUpdated);
            }
        } else {
            LOG_DEBUG("Uploaded event" << upload.eventId << "no longer exists locally");
        }
        // reconcile with what the server stored, and fetch etags the server did not return
        if (upload.isUpdate || etag.isEmpty()) {
            mFollowUpNeeded = true;
        }
    }

    if (mUploads.isEmpty() && mDeletes.isEmpty()) {
        calendarRequestsFinished();
    }
}

void SyncOrchestrator::markUploadFailed(const Upload &upload)
{
    bool ok = false;
    CalendarEventRecord event = mStorage->event(upload.eventId, &ok);
    if (!ok || event.id == 0) {
        return;
    }
    event.syncStatus = CalendarEventRecord::Error;
    event.lastSyncAttempt = QDateTime::currentDateTimeUtc();
    if (!mStorage->updateEventSyncState(event, upload.revision)) {
        LOG_WARNING("Unable to mark event" << event.uid << "as failed");
    }
}

void SyncOrchestrator::deleteFinished(const QString &uri, int minorErrorCode, const QString &message)
{
    FUNCTION_CALL_TRACE;

    if (!mRunning || !mDeletes.remove(uri)) {
        return;
    }
    if (minorErrorCode != Buteo::SyncResults::NO_ERROR) {
        LOG_WARNING("Deletion of" << uri << "failed:" << message);
    }
    if (mUploads.isEmpty() && mDeletes.isEmpty()) {
        calendarRequestsFinished();
    }
}

void SyncOrchestrator::calendarRequestsFinished()
{
    if (mFollowUpNeeded) {
        LOG_DEBUG("Pulling" << mCurrentPath << "again after upload");
        mFollowUpNeeded = false;
        mFollowUpPull = true;
        mClient->fetchCalendarObjects(mCurrentPath);
        return;
    }
    finishCalendar();
}

void SyncOrchestrator::finishCalendar()
{
    bool ok = false;
    Calendar calendar = mStorage->calendar(mCurrentCalendar.id, &ok);
    if (ok && calendar.id != 0) {
        calendar.syncToken = QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
        if (!mStorage->updateCalendar(calendar)) {
            LOG_WARNING("Unable to store sync token of calendar" << calendar.id);
        }
    }
    syncNextCalendar();
}

void SyncOrchestrator::emitFinished(int minorErrorCode, const QString &message)
{
    FUNCTION_CALL_TRACE;

    if (!mRunning) {
        return;
    }
    mRunning = false;
    mPendingCalendars.clear();
    mUploads.clear();
    mDeletes.clear();
    if (mClient) {
        QObject::disconnect(mClient.data(), 0, this, 0);
        mClient->deleteLater();
        mClient = 0;
    }

    LOG_DEBUG("Sync for user" << mUserId << "finished with" << minorErrorCode << message);
    emit finished(minorErrorCode, message);
}

QString SyncOrchestrator::absoluteUrl(const QString &path) const
{
    return QUrl(mConnection.url).resolved(QUrl(path)).toString();
}

QString SyncOrchestrator::collectionUrl(const Calendar &calendar) const
{
    QString url = absoluteUrl(calendar.url);
    if (!url.endsWith(QChar('/'))) {
        url += QChar('/');
    }
    return url;
}
