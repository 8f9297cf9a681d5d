/*
 * This file is part of caldav-sync package
 *
 * Copyright (C) 2013 Jolla Ltd. and/or its subsidiary(-ies).
 * Copyright (C) 2026 The caldav-sync contributors.
 *
 * Contributors: Mani Chandrasekar <maninc@gmail.com>
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


#ifndef DELETE_H
#define DELETE_H

#include "request.h"

class QNetworkAccessManager;
class Settings;

class Delete : public Request
{
    Q_OBJECT

public:
    explicit Delete(QNetworkAccessManager *manager, Settings *settings, QObject *parent = 0);

    void deleteCalendarObject(const QString &href, const QString &eTag = QString());

    QString href() const;

private:
    virtual void handleReply(QNetworkReply *reply, const QByteArray &data);

    QString mHref;
};

#endif // DELETE_H
