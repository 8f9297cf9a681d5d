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

#ifndef NOTIFIER_H
#define NOTIFIER_H

#include "caldavsync-global.h"

#include <QObject>

// Fire-and-forget change notifications for the host application.
class CALDAVSYNCSHARED_EXPORT Notifier : public QObject
{
    Q_OBJECT

public:
    enum ChangeType {
        EventCreated,
        EventUpdated,
        EventDeleted,
        CalendarCreated,
        CalendarUpdated
    };
    Q_ENUM(ChangeType)

    explicit Notifier(QObject *parent = 0);

    void notify(qint64 userId, qint64 id, ChangeType changeType);

    static QString changeTypeToString(ChangeType changeType);

Q_SIGNALS:
    void changed(qint64 userId, qint64 id, Notifier::ChangeType changeType);
};

#endif // NOTIFIER_H
