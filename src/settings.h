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

#ifndef SETTINGS_H
#define SETTINGS_H

#include "caldavsync-global.h"

#include <QString>
#include <QUrl>

struct ServerConnection;

// Server address and credentials used by the network requests.
class CALDAVSYNCSHARED_EXPORT Settings
{
public:
    Settings();

    static Settings fromConnection(const ServerConnection &connection);

    void setUsername(const QString &username);
    QString username() const;

    void setPassword(const QString &password);
    QString password() const;

    void setIgnoreSSLErrors(bool ignore);
    bool ignoreSSLErrors() const;

    void setServerAddress(const QString &serverAddress);
    QString serverAddress() const;

    // path component of the server address, without a trailing slash
    QString serverPath() const;

    // absolute url for path; a path that is already absolute is returned unchanged
    QUrl resolve(const QString &path) const;

private:
    QString     mUsername;
    QString     mPassword;
    QString     mServerAddress;
    bool        mIgnoreSSLErrors;
};

#endif // SETTINGS_H
