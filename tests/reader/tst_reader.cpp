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

#include "reader.h"

class tst_Reader : public QObject
{
    Q_OBJECT

private slots:
    void calendarObjects();
    void collections();
    void principal();
    void missingPropertiesIgnored();
    void malformed();
};

void tst_Reader::calendarObjects()
{
    const QByteArray data =
            "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
            "<d:multistatus xmlns:d=\"DAV:\" xmlns:cal=\"urn:ietf:params:xml:ns:caldav\">"
            "<d:response>"
            "<d:href>/calendars/jane/work/event%201.ics</d:href>"
            "<d:propstat>"
            "<d:prop>"
            "<d:getetag>\"abc123\"</d:getetag>"
            "<cal:calendar-data>BEGIN:VCALENDAR\nEND:VCALENDAR\n</cal:calendar-data>"
            "</d:prop>"
            "<d:status>HTTP/1.1 200 OK</d:status>"
            "</d:propstat>"
            "</d:response>"
            "<d:response>"
            "<d:propstat><d:prop><d:getetag>\"orphan\"</d:getetag></d:prop></d:propstat>"
            "</d:response>"
            "</d:multistatus>";

    Reader reader;
    QVERIFY(reader.read(data));
    const QList<Reader::CalendarResource> results = reader.results();
    QCOMPARE(results.count(), 1);
    QCOMPARE(results.first().href, QStringLiteral("/calendars/jane/work/event 1.ics"));
    QCOMPARE(results.first().etag, QStringLiteral("\"abc123\""));
    QCOMPARE(results.first().iCalData, QStringLiteral("BEGIN:VCALENDAR\nEND:VCALENDAR\n"));
    QCOMPARE(results.first().status, QStringLiteral("HTTP/1.1 200 OK"));
    QVERIFY(!results.first().isCalendar);
}

void tst_Reader::collections()
{
    const QByteArray data =
            "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
            "<multistatus xmlns=\"DAV:\" xmlns:A=\"http://apple.com/ns/ical/\" "
            "xmlns:C=\"urn:ietf:params:xml:ns:caldav\">"
            "<response>"
            "<href>/calendars/jane/</href>"
            "<propstat><prop><resourcetype><collection/></resourcetype></prop>"
            "<status>HTTP/1.1 200 OK</status></propstat>"
            "</response>"
            "<response>"
            "<href>/calendars/jane/work/</href>"
            "<propstat><prop>"
            "<resourcetype><collection/><C:calendar/></resourcetype>"
            "<displayname> Work </displayname>"
            "<A:calendar-color>#FF0000FF</A:calendar-color>"
            "</prop><status>HTTP/1.1 200 OK</status></propstat>"
            "</response>"
            "</multistatus>";

    Reader reader;
    QVERIFY(reader.read(data));
    const QList<Reader::CalendarResource> results = reader.results();
    QCOMPARE(results.count(), 2);
    QVERIFY(!results.at(0).isCalendar);
    QVERIFY(results.at(1).isCalendar);
    QCOMPARE(results.at(1).href, QStringLiteral("/calendars/jane/work/"));
    QCOMPARE(results.at(1).displayName, QStringLiteral("Work"));
    QCOMPARE(results.at(1).color, QStringLiteral("#FF0000FF"));
}

void tst_Reader::principal()
{
    const QByteArray data =
            "<d:multistatus xmlns:d=\"DAV:\" xmlns:c=\"urn:ietf:params:xml:ns:caldav\">"
            "<d:response><d:href>/</d:href>"
            "<d:propstat><d:prop>"
            "<d:current-user-principal><d:href>/principals/users/jane%40example.com/</d:href>"
            "</d:current-user-principal>"
            "<c:calendar-home-set><d:href>/calendars/jane/</d:href></c:calendar-home-set>"
            "</d:prop><d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
            "</d:response>"
            "</d:multistatus>";

    Reader reader;
    QVERIFY(reader.read(data));
    QCOMPARE(reader.results().count(), 1);
    QCOMPARE(reader.results().first().principalHref, QStringLiteral("/principals/users/jane@example.com/"));
    QCOMPARE(reader.results().first().calendarHomeHref, QStringLiteral("/calendars/jane/"));
}

void tst_Reader::missingPropertiesIgnored()
{
    const QByteArray data =
            "<d:multistatus xmlns:d=\"DAV:\" xmlns:a=\"http://apple.com/ns/ical/\">"
            "<d:response><d:href>/calendars/jane/home/</d:href>"
            "<d:propstat><d:prop><d:displayname>Home</d:displayname></d:prop>"
            "<d:status>HTTP/1.1 200 OK</d:status></d:propstat>"
            "<d:propstat><d:prop><a:calendar-color>#00FF00</a:calendar-color></d:prop>"
            "<d:status>HTTP/1.1 404 Not Found</d:status></d:propstat>"
            "</d:response>"
            "</d:multistatus>";

    Reader reader;
    QVERIFY(reader.read(data));
    QCOMPARE(reader.results().count(), 1);
    QCOMPARE(reader.results().first().displayName, QStringLiteral("Home"));
    QVERIFY(reader.results().first().color.isEmpty());
    QCOMPARE(reader.results().first().status, QStringLiteral("HTTP/1.1 200 OK"));
}

void tst_Reader::malformed()
{
    Reader reader;
    QVERIFY(!reader.read("<d:multistatus xmlns:d=\"DAV:\"><d:response><d:href>/x</d:href>"));
}

QTEST_MAIN(tst_Reader)
#include "tst_reader.moc"
