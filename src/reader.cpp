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

#include "reader.h"

#include <QUrl>
#include <QXmlStreamReader>

#include <LogMacros.h>

Reader::Reader()
    : mReader(0)
{
}

Reader::~Reader()
{
    delete mReader;
}

bool Reader::read(const QByteArray &data)
{
    delete mReader;
    mReader = new QXmlStreamReader(data);
    mResults.clear();
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "multistatus") {
            readMultiStatus();
        } else {
            mReader->skipCurrentElement();
        }
    }
    if (mReader->hasError()) {
        LOG_WARNING("Malformed multistatus response:" << mReader->errorString());
        return false;
    }
    return true;
}

QList<Reader::CalendarResource> Reader::results() const
{
    return mResults;
}

void Reader::readMultiStatus()
{
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "response") {
            readResponse();
        } else {
            mReader->skipCurrentElement();
        }
    }
}

void Reader::readResponse()
{
    CalendarResource resource;
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "href") {
            resource.href = QUrl::fromPercentEncoding(mReader->readElementText().trimmed().toLatin1());
        } else if (mReader->name() == "propstat") {
            readPropStat(&resource);
        } else if (mReader->name() == "status") {
            resource.status = mReader->readElementText();
        } else {
            mReader->skipCurrentElement();
        }
    }
    if (resource.href.isEmpty()) {
        LOG_WARNING("Ignoring received calendar object data, is missing href value");
        return;
    }
    mResults.append(resource);
}

void Reader::readPropStat(CalendarResource *resource)
{
    CalendarResource found;
    QString status;
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "prop") {
            readProp(&found);
        } else if (mReader->name() == "status") {
            status = mReader->readElementText();
        } else {
            mReader->skipCurrentElement();
        }
    }
    // properties reported as missing (404 propstat) are ignored
    if (!status.isEmpty() && !status.contains(QStringLiteral(" 200"))) {
        return;
    }
    resource->status = status;
    if (!found.etag.isEmpty()) resource->etag = found.etag;
    if (!found.iCalData.isEmpty()) resource->iCalData = found.iCalData;
    if (!found.displayName.isEmpty()) resource->displayName = found.displayName;
    if (!found.color.isEmpty()) resource->color = found.color;
    if (!found.principalHref.isEmpty()) resource->principalHref = found.principalHref;
    if (!found.calendarHomeHref.isEmpty()) resource->calendarHomeHref = found.calendarHomeHref;
    resource->isCalendar |= found.isCalendar;
}

void Reader::readProp(CalendarResource *resource)
{
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "getetag") {
            resource->etag = mReader->readElementText();
        } else if (mReader->name() == "calendar-data") {
            resource->iCalData = mReader->readElementText();
        } else if (mReader->name() == "displayname") {
            resource->displayName = mReader->readElementText().trimmed();
        } else if (mReader->name() == "calendar-color") {
            resource->color = mReader->readElementText().trimmed();
        } else if (mReader->name() == "current-user-principal") {
            resource->principalHref = readHref();
        } else if (mReader->name() == "calendar-home-set") {
            resource->calendarHomeHref = readHref();
        } else if (mReader->name() == "resourcetype") {
            while (mReader->readNextStartElement()) {
                if (mReader->name() == "calendar") {
                    resource->isCalendar = true;
                }
                mReader->skipCurrentElement();
            }
        } else {
            mReader->skipCurrentElement();
        }
    }
}

QString Reader::readHref()
{
    QString href;
    while (mReader->readNextStartElement()) {
        if (mReader->name() == "href") {
            href = QUrl::fromPercentEncoding(mReader->readElementText().trimmed().toLatin1());
        } else {
            mReader->skipCurrentElement();
        }
    }
    return href;
}
