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

#include "icsparser.h"
#include "icscomponentreader.h"
#include "icsserializer.h"

namespace {
    // Rejects everything, so that the parser has to fall back to scanning properties.
    class RejectingReader : public IcsComponentReader
    {
    public:
        RejectingReader(int *calls) : mCalls(calls) {}

        virtual bool read(const QString &, ParsedComponent *)
        {
            ++(*mCalls);
            return false;
        }

    private:
        int *mCalls;
    };

    QString calendar(const QString &eventLines)
    {
        QString ret = QStringLiteral("BEGIN:VCALENDAR\r\n"
                                     "VERSION:2.0\r\n"
                                     "PRODID:-//Example Corp//Test//EN\r\n"
                                     "BEGIN:VEVENT\r\n");
        ret += eventLines;
        ret += QStringLiteral("END:VEVENT\r\n"
                              "END:VCALENDAR\r\n");
        return ret;
    }
}

class tst_IcsParser : public QObject
{
    Q_OBJECT

private slots:
    void parseWellFormed();
    void allDayFromMidnightStart();
    void allDayFromDateValue();
    void timedWithoutEnd();
    void corruptedRecurrenceRule();
    void recurrenceRuleWithScheduleStatus();
    void fallsBackToPropertyScan();
    void scannedTextIsUnescaped();
    void timezoneFromTzid();
    void missingUidAndSummary();
    void summaryWithoutDates();
    void rejectsUnusableData();
    void keepsLocalIdentity();
    void resourceHeuristics();
    void scanParticipants();
};

void tst_IcsParser::parseWellFormed()
{
    const QString ics = calendar(QStringLiteral(
            "UID:abc-123@example.com\r\n"
            "DTSTAMP:20240101T000000Z\r\n"
            "DTSTART:20240115T100000Z\r\n"
            "DTEND:20240115T110000Z\r\n"
            "SUMMARY:Planning\r\n"
            "LOCATION:Floor 4\r\n"
            "DESCRIPTION:Quarterly planning\r\n"
            "ATTENDEE;CN=Alice;ROLE=REQ-PARTICIPANT;PARTSTAT=ACCEPTED:mailto:alice@example.com\r\n"
            "ATTENDEE;CN=Board Room;CUTYPE=RESOURCE;ROLE=NON-PARTICIPANT;X-RESOURCE-TYPE=Meeting:"
            "mailto:boardroom@example.com\r\n"));

    IcsParser parser;
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record, QStringLiteral("\"etag-1\""), QStringLiteral("/cal/abc.ics")));

    QCOMPARE(record.uid, QStringLiteral("abc-123@example.com"));
    QCOMPARE(record.title, QStringLiteral("Planning"));
    QCOMPARE(record.location, QStringLiteral("Floor 4"));
    QCOMPARE(record.description, QStringLiteral("Quarterly planning"));
    QCOMPARE(record.startDate, QDateTime(QDate(2024, 1, 15), QTime(10, 0), Qt::UTC));
    QCOMPARE(record.endDate, QDateTime(QDate(2024, 1, 15), QTime(11, 0), Qt::UTC));
    QVERIFY(!record.allDay);
    QCOMPARE(record.timezone, QStringLiteral("UTC"));
    QVERIFY(record.recurrenceRule.isEmpty());
    QCOMPARE(record.etag, QStringLiteral("\"etag-1\""));
    QCOMPARE(record.url, QStringLiteral("/cal/abc.ics"));
    QCOMPARE(record.syncStatus, CalendarEventRecord::Synced);
    QVERIFY(record.rawData.contains(QStringLiteral("UID:abc-123@example.com")));

    QCOMPARE(record.attendees.count(), 1);
    QCOMPARE(record.attendees.first().email, QStringLiteral("alice@example.com"));
    QCOMPARE(record.attendees.first().name, QStringLiteral("Alice"));
    QCOMPARE(record.attendees.first().status, QStringLiteral("ACCEPTED"));
    QCOMPARE(record.resources.count(), 1);
    QCOMPARE(record.resources.first().adminEmail, QStringLiteral("boardroom@example.com"));
    QCOMPARE(record.resources.first().name, QStringLiteral("Board Room"));
    QCOMPARE(record.resources.first().type, QStringLiteral("Meeting"));
}

void tst_IcsParser::allDayFromMidnightStart()
{
    const QString ics = calendar(QStringLiteral(
            "UID:midnight@example.com\r\n"
            "DTSTART:20240115T000000Z\r\n"
            "DTEND:20240116T000000Z\r\n"
            "SUMMARY:Holiday\r\n"));

    IcsParser parser;
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QVERIFY(record.allDay);
    QCOMPARE(record.startDate, QDateTime(QDate(2024, 1, 15), QTime(0, 0), Qt::UTC));
    QCOMPARE(record.endDate, QDateTime(QDate(2024, 1, 16), QTime(0, 0), Qt::UTC));
}

void tst_IcsParser::allDayFromDateValue()
{
    const QString ics = calendar(QStringLiteral(
            "UID:date@example.com\r\n"
            "DTSTART;VALUE=DATE:20240301\r\n"
            "SUMMARY:Conference\r\n"));

    IcsParser parser;
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QVERIFY(record.allDay);
    QCOMPARE(record.startDate, QDateTime(QDate(2024, 3, 1), QTime(0, 0), Qt::UTC));
    QCOMPARE(record.endDate, QDateTime(QDate(2024, 3, 2), QTime(0, 0), Qt::UTC));
}

void tst_IcsParser::timedWithoutEnd()
{
    const QString ics = calendar(QStringLiteral(
            "UID:noend@example.com\r\n"
            "DTSTART:20240115T143000Z\r\n"
            "SUMMARY:Call\r\n"));

    IcsParser parser;
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QVERIFY(!record.allDay);
    QCOMPARE(record.endDate, record.startDate.addSecs(3600));
}

void tst_IcsParser::corruptedRecurrenceRule()
{
    const QString ics = calendar(QStringLiteral(
            "UID:evil@example.com\r\n"
            "DTSTART:20240115T100000Z\r\n"
            "DTEND:20240115T110000Z\r\n"
            "SUMMARY:Standup\r\n"
            "RRULE:FREQ=WEEKLY;BYDAY=MO:mailto:evil@x.com\r\n"));

    IcsParser parser;
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QCOMPARE(record.recurrenceRule, QStringLiteral("FREQ=WEEKLY;BYDAY=MO"));

    IcsParser scanningParser(new PropertyScanComponentReader);
    CalendarEventRecord scanned;
    QVERIFY(scanningParser.parse(ics, &scanned));
    QCOMPARE(scanned.recurrenceRule, QStringLiteral("FREQ=WEEKLY;BYDAY=MO"));
}

void tst_IcsParser::recurrenceRuleWithScheduleStatus()
{
    const QString ics = calendar(QStringLiteral(
            "UID:leak@example.com\r\n"
            "DTSTART:20240115T100000Z\r\n"
            "SUMMARY:Review\r\n"
            "RRULE:FREQ=DAILY;COUNT=5;SCHEDULE-STATUS=3.7:mailto:bob@example.com\r\n"));

    IcsParser parser(new PropertyScanComponentReader);
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QCOMPARE(record.recurrenceRule, QStringLiteral("FREQ=DAILY;COUNT=5"));
    QCOMPARE(record.attendees.count(), 1);
    QCOMPARE(record.attendees.first().email, QStringLiteral("bob@example.com"));
    QCOMPARE(record.attendees.first().scheduleStatus, QStringLiteral("3.7"));
}

void tst_IcsParser::fallsBackToPropertyScan()
{
    const QString ics = calendar(QStringLiteral(
            "UID:fallback@example.com\r\n"
            "DTSTART:20240115T100000Z\r\n"
            "DTEND:20240115T113000Z\r\n"
            "SUMMARY:Rejected by the parser\r\n"
            "RRULE:FREQ=WEEKLY;CN=Projector;CUTYPE=RESOURCE:mailto:projector@example.com\r\n"));

    int calls = 0;
    IcsParser parser(new RejectingReader(&calls));
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QCOMPARE(calls, 2);
    QCOMPARE(record.title, QStringLiteral("Rejected by the parser"));
    QCOMPARE(record.startDate, QDateTime(QDate(2024, 1, 15), QTime(10, 0), Qt::UTC));
    QCOMPARE(record.endDate, QDateTime(QDate(2024, 1, 15), QTime(11, 30), Qt::UTC));
    QCOMPARE(record.recurrenceRule, QStringLiteral("FREQ=WEEKLY"));
    QCOMPARE(record.attendees.count(), 0);
    QCOMPARE(record.resources.count(), 1);
    QCOMPARE(record.resources.first().adminEmail, QStringLiteral("projector@example.com"));
}

void tst_IcsParser::scannedTextIsUnescaped()
{
    const QString ics = calendar(QStringLiteral(
            "UID:escaped@example.com\r\n"
            "DTSTART:20240115T100000Z\r\n"
            "DTEND:20240115T110000Z\r\n"
            "SUMMARY:Lunch\\, then review\r\n"
            "LOCATION:Room 4\\; east wing\r\n"
            "DESCRIPTION:Agenda:\\nC:\\\\share\r\n"));

    IcsParser parser(new PropertyScanComponentReader);
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QCOMPARE(record.title, QStringLiteral("Lunch, then review"));
    QCOMPARE(record.location, QStringLiteral("Room 4; east wing"));
    QCOMPARE(record.description, QStringLiteral("Agenda:\nC:\\share"));
    // escaped exactly once on the way back out
    QCOMPARE(IcsSerializer::escapeText(record.title), QStringLiteral("Lunch\\, then review"));
}

void tst_IcsParser::timezoneFromTzid()
{
    const QString ics = calendar(QStringLiteral(
            "UID:tz@example.com\r\n"
            "DTSTART;TZID=Europe/Berlin:20240115T100000\r\n"
            "DTEND;TZID=Europe/Berlin:20240115T110000\r\n"
            "SUMMARY:Berlin\r\n"));

    IcsParser parser(new PropertyScanComponentReader);
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QCOMPARE(record.timezone, QStringLiteral("Europe/Berlin"));
    QCOMPARE(record.startDate, QDateTime(QDate(2024, 1, 15), QTime(9, 0), Qt::UTC));
}

void tst_IcsParser::missingUidAndSummary()
{
    const QString ics = calendar(QStringLiteral(
            "DTSTART:20240115T100000Z\r\n"
            "DTEND:20240115T110000Z\r\n"));

    IcsParser parser(new PropertyScanComponentReader, QStringLiteral("calendar.example.org"));
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QCOMPARE(record.title, QStringLiteral("Untitled Event"));
    QVERIFY(record.uid.endsWith(QStringLiteral("@calendar.example.org")));
    QVERIFY(record.uid.length() > QStringLiteral("@calendar.example.org").length());
}

void tst_IcsParser::summaryWithoutDates()
{
    const QString ics = calendar(QStringLiteral(
            "UID:nodates@example.com\r\n"
            "SUMMARY:Someday\r\n"));

    IcsParser parser(new PropertyScanComponentReader);
    CalendarEventRecord record;
    QVERIFY(parser.parse(ics, &record));
    QCOMPARE(record.title, QStringLiteral("Someday"));
    QVERIFY(record.startDate.isValid());
    QCOMPARE(record.startDate.time().minute(), 0);
    QCOMPARE(record.endDate, record.startDate.addSecs(3600));
}

void tst_IcsParser::rejectsUnusableData()
{
    IcsParser parser(new PropertyScanComponentReader);
    CalendarEventRecord record;
    QVERIFY(!parser.parse(QStringLiteral("BEGIN:VCALENDAR\r\nVERSION:2.0\r\nEND:VCALENDAR\r\n"), &record));
    QVERIFY(!parser.parse(calendar(QStringLiteral("UID:empty@example.com\r\n")), &record));
}

void tst_IcsParser::keepsLocalIdentity()
{
    const QString ics = calendar(QStringLiteral(
            "UID:identity@example.com\r\n"
            "DTSTART:20240115T100000Z\r\n"
            "SUMMARY:Identity\r\n"));

    IcsParser parser(new PropertyScanComponentReader);
    CalendarEventRecord record;
    record.id = 5;
    record.calendarId = 2;
    record.revision = 3;
    record.title = QStringLiteral("Old title");
    QVERIFY(parser.parse(ics, &record));
    QCOMPARE(record.id, qint64(5));
    QCOMPARE(record.calendarId, qint64(2));
    QCOMPARE(record.revision, 3);
    QCOMPARE(record.title, QStringLiteral("Identity"));
}

void tst_IcsParser::resourceHeuristics()
{
    QVERIFY(IcsParser::looksLikeResource(QStringLiteral("ROOM"), QString(), QString(), QString()));
    QVERIFY(IcsParser::looksLikeResource(QString(), QStringLiteral("NON-PARTICIPANT"), QString(), QString()));
    QVERIFY(IcsParser::looksLikeResource(QString(), QString(), QStringLiteral("Conference Room B"), QString()));
    QVERIFY(IcsParser::looksLikeResource(QString(), QString(), QString(), QStringLiteral("projector@example.com")));
    QVERIFY(!IcsParser::looksLikeResource(QStringLiteral("INDIVIDUAL"), QStringLiteral("REQ-PARTICIPANT"),
                                          QStringLiteral("Bob"), QStringLiteral("bob@example.com")));
}

void tst_IcsParser::scanParticipants()
{
    const QString ics = calendar(QStringLiteral(
            "ATTENDEE;CN=\"Doe, Jane\";PARTSTAT=TENTATIVE;SCHEDULE-STATUS=2.0:mailto:jane@example.com\r\n"
            "ATTENDEE;CN=Beamer;CUTYPE=RESOURCE;RESOURCE-TYPE=Projector\r\n"
            " :mailto:beamer@example.com\r\n"
            "ATTENDEE:invalid\r\n"));

    const QList<Participant> participants = IcsParser::scanParticipants(ics);
    QCOMPARE(participants.count(), 2);
    QVERIFY(!participants.at(0).isResource());
    QCOMPARE(participants.at(0).attendee().name, QStringLiteral("Doe, Jane"));
    QCOMPARE(participants.at(0).attendee().status, QStringLiteral("TENTATIVE"));
    QCOMPARE(participants.at(0).attendee().scheduleStatus, QStringLiteral("2.0"));
    QVERIFY(participants.at(1).isResource());
    QCOMPARE(participants.at(1).resource().name, QStringLiteral("Beamer"));
    QCOMPARE(participants.at(1).resource().type, QStringLiteral("Projector"));
    QCOMPARE(participants.at(1).email(), QStringLiteral("beamer@example.com"));
}

QTEST_MAIN(tst_IcsParser)
#include "tst_icsparser.moc"
