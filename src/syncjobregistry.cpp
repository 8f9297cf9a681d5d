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

#include "syncjobregistry.h"
#include "storage.h"
#include "ticker.h"

#include <QSet>

#include <LogMacros.h>

SyncJobRegistry::SyncJob::SyncJob()
    : userId(0)
    , interval(300)
    , ticker(0)
    , orchestrator(0)
    , stopRequested(false)
    , autoSync(true)
    , sessionCount(0)
    , hasQueuedPass(false)
{
}

SyncJobRegistry::SyncJobRegistry(Storage *storage, DavClientFactory *clientFactory, Scheduler *scheduler,
                                 Notifier *notifier, const QString &uidDomain, QObject *parent)
    : QObject(parent)
    , mStorage(storage)
    , mClientFactory(clientFactory)
    , mScheduler(scheduler)
    , mNotifier(notifier)
    , mUidDomain(uidDomain)
    , mDefaultSyncInterval(300)
    , mGlobalTicker(0)
{
}

SyncJobRegistry::~SyncJobRegistry()
{
    FUNCTION_CALL_TRACE;

    shutdownAll();
    Q_FOREACH (SyncJob *job, mJobs) {
        destroyJob(job);
    }
    mJobs.clear();
}

void SyncJobRegistry::setDefaultSyncInterval(int seconds)
{
    if (seconds > 0) {
        mDefaultSyncInterval = seconds;
    }
}

int SyncJobRegistry::defaultSyncInterval() const
{
    return mDefaultSyncInterval;
}

SyncJobRegistry::SyncJob *SyncJobRegistry::createJob(const ServerConnection &connection)
{
    SyncJob *job = new SyncJob;
    job->userId = connection.userId;
    job->interval = connection.syncInterval > 0 ? connection.syncInterval : mDefaultSyncInterval;
    job->autoSync = connection.autoSync;
    job->lastSync = connection.lastSync;
    job->sessionCount = 1;

    job->ticker = mScheduler->createTicker(this);
    connect(job->ticker, SIGNAL(tick()), this, SLOT(jobTick()));

    job->orchestrator = new SyncOrchestrator(job->userId, mStorage, mClientFactory, mNotifier, mUidDomain, this);
    connect(job->orchestrator, SIGNAL(finished(int,QString)), this, SLOT(passFinished(int,QString)));

    mJobs.insert(job->userId, job);
    if (!mStorage->setSessionActive(job->userId, true)) {
        LOG_WARNING("Unable to mark session of user" << job->userId << "as active");
    }
    if (job->autoSync) {
        armTicker(job);
    }
    LOG_DEBUG("Created sync job for user" << job->userId << "with interval" << job->interval);
    return job;
}

void SyncJobRegistry::destroyJob(SyncJob *job)
{
    job->ticker->stop();
    delete job->ticker;

    // a running pass finishes on its own
    QObject::disconnect(job->orchestrator, 0, this, 0);
    if (job->orchestrator->isRunning()) {
        connect(job->orchestrator, SIGNAL(finished(int,QString)), job->orchestrator, SLOT(deleteLater()));
    } else {
        job->orchestrator->deleteLater();
    }
    delete job;
}

void SyncJobRegistry::armTicker(SyncJob *job)
{
    job->stopRequested = false;
    job->ticker->stop();
    job->ticker->start(job->interval * 1000);
}

bool SyncJobRegistry::runPass(SyncJob *job, const SyncOptions &options)
{
    if (!job->orchestrator->syncNow(options)) {
        LOG_WARNING("Unable to start sync for user" << job->userId);
        return false;
    }
    return true;
}

bool SyncJobRegistry::setupSyncForUser(qint64 userId, const ServerConnection &connection)
{
    FUNCTION_CALL_TRACE;

    SyncJob *job = mJobs.value(userId);
    if (job) {
        job->sessionCount++;
        LOG_DEBUG("User" << userId << "now has" << job->sessionCount << "active sessions");
        return true;
    }

    if (!connection.isValid() || connection.userId != userId) {
        LOG_WARNING("Invalid server connection for user" << userId);
        return false;
    }
    if (!mStorage->updateServerConnection(connection)) {
        LOG_WARNING("Unable to store server connection for user" << userId);
        return false;
    }

    job = createJob(connection);
    SyncOptions options;
    options.forceRefresh = true;
    runPass(job, options);
    return true;
}

bool SyncJobRegistry::handleUserLogout(qint64 userId)
{
    FUNCTION_CALL_TRACE;

    SyncJob *job = mJobs.value(userId);
    if (!job) {
        return false;
    }

    job->sessionCount = qMax(0, job->sessionCount - 1);
    LOG_DEBUG("User" << userId << "logged out," << job->sessionCount << "sessions remaining");
    if (job->sessionCount == 0) {
        mJobs.remove(userId);
        destroyJob(job);
        if (!mStorage->setSessionActive(userId, false)) {
            LOG_WARNING("Unable to mark session of user" << userId << "as inactive");
        }
    }
    return true;
}

bool SyncJobRegistry::startSync(qint64 userId)
{
    SyncJob *job = mJobs.value(userId);
    if (!job) {
        LOG_DEBUG("No sync job for user" << userId);
        return false;
    }
    LOG_DEBUG("Starting sync job for user" << userId << "with interval" << job->interval);
    armTicker(job);
    return true;
}

bool SyncJobRegistry::stopSync(qint64 userId)
{
    SyncJob *job = mJobs.value(userId);
    if (!job) {
        LOG_DEBUG("No sync job for user" << userId);
        return false;
    }
    LOG_DEBUG("Stopping sync job for user" << userId);
    job->stopRequested = true;
    job->ticker->stop();
    return true;
}

bool SyncJobRegistry::syncNow(qint64 userId, const SyncOptions &options)
{
    FUNCTION_CALL_TRACE;

    SyncJob *job = mJobs.value(userId);
    if (!job) {
        bool ok = false;
        ServerConnection connection = mStorage->serverConnection(userId, &ok);
        if (!ok || !connection.isValid()) {
            LOG_DEBUG("Cannot create sync job: no server connection for user" << userId);
            return false;
        }
        job = createJob(connection);
    }

    if (job->orchestrator->isRunning()) {
        if (options.forceRefresh) {
            LOG_DEBUG("Sync in progress for user" << userId << ", queueing forced pass");
            if (job->hasQueuedPass) {
                // one queued pass has to cover every request made meanwhile
                SyncOptions &queued = job->queuedOptions;
                if (queued.calendarId != options.calendarId) {
                    queued.calendarId = 0;
                }
                queued.preserveLocalEvents = queued.preserveLocalEvents || options.preserveLocalEvents;
                queued.preserveLocalDeletes = queued.preserveLocalDeletes || options.preserveLocalDeletes;
            } else {
                job->hasQueuedPass = true;
                job->queuedOptions = options;
            }
        } else {
            LOG_DEBUG("Sync already in progress for user" << userId);
        }
        return true;
    }
    return runPass(job, options);
}

SyncStatus SyncJobRegistry::getSyncStatus(qint64 userId) const
{
    SyncStatus status;
    status.interval = mDefaultSyncInterval;
    const SyncJob *job = mJobs.value(userId);
    if (!job) {
        return status;
    }
    status.configured = true;
    status.syncing = job->ticker->isActive();
    status.lastSync = job->lastSync;
    status.interval = job->interval;
    status.inProgress = job->orchestrator->isRunning();
    status.autoSync = job->autoSync;
    return status;
}

Buteo::SyncResults SyncJobRegistry::syncResults(qint64 userId) const
{
    const SyncJob *job = mJobs.value(userId);
    return job ? job->results : Buteo::SyncResults();
}

bool SyncJobRegistry::hasJob(qint64 userId) const
{
    return mJobs.contains(userId);
}

int SyncJobRegistry::sessionCount(qint64 userId) const
{
    const SyncJob *job = mJobs.value(userId);
    return job ? job->sessionCount : 0;
}

bool SyncJobRegistry::updateSyncInterval(qint64 userId, int seconds)
{
    FUNCTION_CALL_TRACE;

    SyncJob *job = mJobs.value(userId);
    if (!job || seconds <= 0) {
        return false;
    }

    bool ok = false;
    ServerConnection connection = mStorage->serverConnection(userId, &ok);
    if (ok && connection.isValid()) {
        connection.syncInterval = seconds;
        if (!mStorage->updateServerConnection(connection)) {
            LOG_WARNING("Unable to store sync interval for user" << userId);
        }
    }

    LOG_DEBUG("Updating sync interval for user" << userId << "to" << seconds << "seconds");
    job->interval = seconds;
    if (job->ticker->isActive() && job->autoSync) {
        armTicker(job);
    }
    return true;
}

bool SyncJobRegistry::updateAutoSync(qint64 userId, bool enabled)
{
    FUNCTION_CALL_TRACE;

    SyncJob *job = mJobs.value(userId);
    if (!job) {
        return false;
    }

    job->autoSync = enabled;
    if (enabled) {
        armTicker(job);
    } else {
        job->stopRequested = true;
        job->ticker->stop();
    }

    bool ok = false;
    ServerConnection connection = mStorage->serverConnection(userId, &ok);
    if (ok && connection.isValid()) {
        connection.autoSync = enabled;
        if (!mStorage->updateServerConnection(connection)) {
            LOG_WARNING("Unable to store auto sync setting for user" << userId);
        }
    }
    return true;
}

void SyncJobRegistry::startGlobalSync(int intervalSeconds)
{
    if (!mGlobalTicker) {
        mGlobalTicker = mScheduler->createTicker(this);
        connect(mGlobalTicker, SIGNAL(tick()), this, SLOT(globalTick()));
    }
    LOG_DEBUG("Starting global sync every" << intervalSeconds << "seconds");
    mGlobalTicker->start(intervalSeconds * 1000);
}

void SyncJobRegistry::globalTick()
{
    FUNCTION_CALL_TRACE;

    bool ok = false;
    const QList<qint64> activeUsers = mStorage->activeSessionUserIds(&ok);
    if (!ok) {
        LOG_WARNING("Unable to list active sessions");
        return;
    }
    const QSet<qint64> active = activeUsers.toSet();

    Q_FOREACH (qint64 userId, mJobs.keys()) {
        if (!active.contains(userId)) {
            LOG_DEBUG("Removing sync job of inactive user" << userId);
            destroyJob(mJobs.take(userId));
        }
    }

    const QList<qint64> connectedUsers = mStorage->userIdsWithServerConnection(&ok);
    if (!ok) {
        LOG_WARNING("Unable to list server connections");
        return;
    }
    Q_FOREACH (qint64 userId, connectedUsers) {
        if (!active.contains(userId)) {
            continue;
        }
        SyncJob *job = mJobs.value(userId);
        if (job && (job->orchestrator->isRunning() || job->stopRequested)) {
            continue;
        }
        syncNow(userId);
    }
}

void SyncJobRegistry::jobTick()
{
    Ticker *ticker = qobject_cast<Ticker *>(sender());
    Q_FOREACH (SyncJob *job, mJobs) {
        if (job->ticker != ticker) {
            continue;
        }
        if (job->stopRequested || job->orchestrator->isRunning()) {
            return;
        }
        runPass(job, SyncOptions());
        return;
    }
}

void SyncJobRegistry::passFinished(int minorErrorCode, const QString &message)
{
    SyncOrchestrator *orchestrator = qobject_cast<SyncOrchestrator *>(sender());
    if (!orchestrator) {
        return;
    }
    const qint64 userId = orchestrator->userId();
    SyncJob *job = mJobs.value(userId);
    if (!job) {
        return;
    }

    const bool success = minorErrorCode == Buteo::SyncResults::NO_ERROR;
    if (success) {
        job->lastSync = QDateTime::currentDateTimeUtc();
        job->results = Buteo::SyncResults(job->lastSync,
                                          Buteo::SyncResults::SYNC_RESULT_SUCCESS,
                                          Buteo::SyncResults::NO_ERROR);
    } else {
        LOG_CRITICAL("CalDAV sync failed for user" << userId << ":" << minorErrorCode << message);
        job->results = Buteo::SyncResults(job->lastSync,       // don't change the last sync time
                                          Buteo::SyncResults::SYNC_RESULT_FAILED,
                                          minorErrorCode);
    }
    emit syncFinished(userId, success);

    // the signal may have torn down the job
    job = mJobs.value(userId);
    if (job && job->hasQueuedPass) {
        job->hasQueuedPass = false;
        LOG_DEBUG("Starting queued sync pass for user" << userId);
        runPass(job, job->queuedOptions);
    }
}

void SyncJobRegistry::shutdownAll()
{
    FUNCTION_CALL_TRACE;

    if (mGlobalTicker) {
        mGlobalTicker->stop();
    }
    Q_FOREACH (SyncJob *job, mJobs) {
        job->stopRequested = true;
        job->ticker->stop();
        job->hasQueuedPass = false;
    }
    LOG_DEBUG("Shut down" << mJobs.count() << "sync jobs");
}
