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

#include "settings.h"
#include "eventrecord.h"

Settings::Settings()
    : mIgnoreSSLErrors(false)
{
}

Settings Settings::fromConnection(const ServerConnection &connection)
{
    Settings settings;
    settings.setServerAddress(connection.url);
    settings.setUsername(connection.username);
    settings.setPassword(connection.password);
    return settings;
}

bool Settings::ignoreSSLErrors() const
{
    return mIgnoreSSLErrors;
}

void Settings::setIgnoreSSLErrors(bool ignore)
{
    mIgnoreSSLErrors = ignore;
}

QString Settings::password() const
{
    return mPassword;
}

void Settings::setPassword(const QString & password)
{
    mPassword = password;
}

QString Settings::username() const
{
    return mUsername;
}

void Settings::setUsername(const QString & username)
{
    mUsername = username;
}

void Settings::setServerAddress(const QString &serverAddress)
{
    mServerAddress = serverAddress;
}

QString Settings::serverAddress() const
{
    return mServerAddress;
}

QString Settings::serverPath() const
{
    QString path = QUrl(mServerAddress).path();
    while (path.endsWith('/')) {
        path.chop(1);
    }
    return path;
}

QUrl Settings::resolve(const QString &path) const
{
    QUrl url(path);
    if (url.isRelative()) {
        url = QUrl(mServerAddress).resolved(QUrl(path));
    }
    return url;
}
