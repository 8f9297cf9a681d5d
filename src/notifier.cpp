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

#include "notifier.h"

#include <LogMacros.h>

Notifier::Notifier(QObject *parent)
    : QObject(parent)
{
}

void Notifier::notify(qint64 userId, qint64 id, ChangeType changeType)
{
    LOG_DEBUG("Change for user" << userId << ":" << changeTypeToString(changeType) << id);
    emit changed(userId, id, changeType);
}

QString Notifier::changeTypeToString(ChangeType changeType)
{
    switch (changeType) {
    case EventCreated:
        return QStringLiteral("created");
    case EventUpdated:
        return QStringLiteral("updated");
    case EventDeleted:
        return QStringLiteral("deleted");
    case CalendarCreated:
        return QStringLiteral("calendar-created");
    case CalendarUpdated:
        return QStringLiteral("calendar-updated");
    }
    return QString();
}
