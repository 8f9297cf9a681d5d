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

#include "icsserializer.h"
#include "icsrepair.h"
#include "rrulesanitizer.h"

#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <LogMacros.h>

namespace {
    const QString PRODID = QStringLiteral("PRODID:-//CalDAV Client//NONSGML v1.0//EN");
    const QString DEFAULT_DOMAIN = QStringLiteral("caldavclient.local");

    QString formatDateTime(const QDateTime &dt)
    {
        return dt.toUTC().toString(QStringLiteral("yyyyMMddTHHmmss")) + QChar('Z');
    }

    QString dateLine(const QString &name, const QDateTime &dt, bool allDay)
    {
        if (allDay) {
            return name + QStringLiteral(";VALUE=DATE:") + dt.toUTC().date().toString(QStringLiteral("yyyyMMdd"));
        }
        return name + QChar(':') + formatDateTime(dt);
    }

    QString propertyName(const QString &line)
    {
        int end = 0;
        while (end < line.length() && line[end] != QChar(';') && line[end] != QChar(':')) {
            ++end;
        }
        return line.left(end).trimmed().toUpper();
    }

    QString propertyValue(const QString &line)
    {
        bool quoted = false;
        for (int i = 0; i < line.length(); ++i) {
            if (line[i] == QChar('"')) {
                quoted = !quoted;
            } else if (line[i] == QChar(':') && !quoted) {
                return line.mid(i + 1);
            }
        }
        return QString();
    }

    QString organizerAddress(const QString &username)
    {
        if (username.contains(QChar('@'))) {
            return username;
        }
        return username + QChar('@') + DEFAULT_DOMAIN;
    }

    QString attendeeAddress(const QString &line)
    {
        static const QRegularExpression mailto(QStringLiteral("mailto:([^;,\\s]+)"),
                                               QRegularExpression::CaseInsensitiveOption);
        QRegularExpressionMatch match = mailto.match(line);
        return match.hasMatch() ? match.captured(1).toLower() : QString();
    }

    QString quoteParameter(const QString &value)
    {
        if (value.contains(QChar(':')) || value.contains(QChar(';')) || value.contains(QChar(','))) {
            QString unquoted = value;
            unquoted.remove(QChar('"'));
            return QChar('"') + unquoted + QChar('"');
        }
        return value;
    }

    QStringList participantLines(const CalendarEventRecord &record)
    {
        QStringList ret;
        Q_FOREACH (const Attendee &attendee, record.attendees) {
            if (!attendee.email.isEmpty()) {
                ret.append(IcsSerializer::attendeeLine(attendee));
            }
        }
        Q_FOREACH (const Resource &resource, record.resources) {
            if (!resource.adminEmail.isEmpty()) {
                ret.append(IcsSerializer::resourceLine(resource));
            }
        }
        return ret;
    }

    // Converts the "pattern=Weekly;interval=2;occurrences=5" form some clients write.
    QString convertPatternRule(const QString &value)
    {
        static const QRegularExpression pattern(QStringLiteral("pattern=(Daily|Weekly|Monthly|Yearly)"),
                                                QRegularExpression::CaseInsensitiveOption);
        static const QRegularExpression interval(QStringLiteral("interval=(\\d+)"),
                                                 QRegularExpression::CaseInsensitiveOption);
        static const QRegularExpression count(QStringLiteral("occurrences=(\\d+)"),
                                              QRegularExpression::CaseInsensitiveOption);
        static const QRegularExpression until(QStringLiteral("endDate=([^;]+)"),
                                              QRegularExpression::CaseInsensitiveOption);

        QRegularExpressionMatch match = pattern.match(value);
        if (!match.hasMatch()) {
            return QString();
        }
        QString rule = QStringLiteral("FREQ=") + match.captured(1).toUpper();
        match = interval.match(value);
        if (match.hasMatch()) {
            rule += QStringLiteral(";INTERVAL=") + match.captured(1);
        }
        match = count.match(value);
        if (match.hasMatch()) {
            rule += QStringLiteral(";COUNT=") + match.captured(1);
        }
        match = until.match(value);
        if (match.hasMatch()) {
            QString date = match.captured(1);
            date.remove(QChar('-'));
            date.remove(QChar(':'));
            rule += QStringLiteral(";UNTIL=") + date;
        }
        return rule;
    }

    QString foldAll(const QStringList &lines)
    {
        QStringList folded;
        Q_FOREACH (const QString &line, lines) {
            folded.append(IcsSerializer::foldLine(line));
        }
        return IcsRepair::joinLines(folded);
    }

    QString newCalendarData(const CalendarEventRecord &record, const QString &username,
                            const QDateTime &now)
    {
        QStringList lines;
        lines << QStringLiteral("BEGIN:VCALENDAR")
              << QStringLiteral("VERSION:2.0")
              << PRODID
              << QStringLiteral("CALSCALE:GREGORIAN")
              << QStringLiteral("BEGIN:VEVENT")
              << QStringLiteral("UID:") + record.uid
              << QStringLiteral("SUMMARY:") + IcsSerializer::escapeText(
                         record.title.isEmpty() ? QStringLiteral("Untitled Event") : record.title)
              << dateLine(QStringLiteral("DTSTART"), record.startDate, record.allDay)
              << dateLine(QStringLiteral("DTEND"), record.endDate, record.allDay);
        if (!record.description.isEmpty()) {
            lines << QStringLiteral("DESCRIPTION:") + IcsSerializer::escapeText(record.description);
        }
        if (!record.location.isEmpty()) {
            lines << QStringLiteral("LOCATION:") + IcsSerializer::escapeText(record.location);
        }
        lines << QStringLiteral("DTSTAMP:") + formatDateTime(now)
              << QStringLiteral("CREATED:") + formatDateTime(now)
              << QStringLiteral("LAST-MODIFIED:") + formatDateTime(now)
              << QStringLiteral("SEQUENCE:0");
        const QString rrule = RRuleSanitizer::sanitize(record.recurrenceRule);
        if (!rrule.isEmpty()) {
            lines << QStringLiteral("RRULE:") + rrule;
        }
        if (!username.isEmpty()) {
            lines << QStringLiteral("ORGANIZER;CN=") + quoteParameter(username)
                     + QStringLiteral(":mailto:") + organizerAddress(username);
        }
        lines << participantLines(record);
        lines << QStringLiteral("END:VEVENT")
              << QStringLiteral("END:VCALENDAR");
        return foldAll(lines);
    }

    QString substituteIntoTemplate(const CalendarEventRecord &record, const QDateTime &now, int sequence)
    {
        const QStringList input = IcsRepair::lines(IcsRepair::unfoldContinuationLines(record.rawData));
        const QString title = record.title.isEmpty() ? QStringLiteral("Untitled Event") : record.title;
        const QString rrule = RRuleSanitizer::sanitize(record.recurrenceRule);

        QStringList lines;
        bool inEvent = false;
        bool eventDone = false;
        int nested = 0;
        QSet<QString> seen;
        Q_FOREACH (const QString &line, input) {
            if (line.trimmed().isEmpty()) {
                continue;
            }
            if (!inEvent) {
                if (!eventDone && line.compare(QStringLiteral("BEGIN:VEVENT"), Qt::CaseInsensitive) == 0) {
                    inEvent = true;
                }
                lines.append(line);
                continue;
            }

            const QString name = propertyName(line);
            if (name == QStringLiteral("BEGIN")) {
                ++nested;
            } else if (name == QStringLiteral("END") && nested > 0) {
                --nested;
                lines.append(line);
                continue;
            }
            if (nested > 0) {
                lines.append(line);
                continue;
            }

            if (name == QStringLiteral("END")) {
                if (!seen.contains(QStringLiteral("SUMMARY"))) {
                    lines.append(QStringLiteral("SUMMARY:") + IcsSerializer::escapeText(title));
                }
                if (!seen.contains(QStringLiteral("DTSTART"))) {
                    lines.append(dateLine(QStringLiteral("DTSTART"), record.startDate, record.allDay));
                }
                if (!seen.contains(QStringLiteral("DTEND"))) {
                    lines.append(dateLine(QStringLiteral("DTEND"), record.endDate, record.allDay));
                }
                if (!seen.contains(QStringLiteral("LOCATION")) && !record.location.isEmpty()) {
                    lines.append(QStringLiteral("LOCATION:") + IcsSerializer::escapeText(record.location));
                }
                if (!seen.contains(QStringLiteral("DESCRIPTION")) && !record.description.isEmpty()) {
                    lines.append(QStringLiteral("DESCRIPTION:") + IcsSerializer::escapeText(record.description));
                }
                if (!seen.contains(QStringLiteral("RRULE")) && !rrule.isEmpty()) {
                    lines.append(QStringLiteral("RRULE:") + rrule);
                }
                if (!seen.contains(QStringLiteral("DTSTAMP"))) {
                    lines.append(QStringLiteral("DTSTAMP:") + formatDateTime(now));
                }
                if (!seen.contains(QStringLiteral("SEQUENCE"))) {
                    lines.append(QStringLiteral("SEQUENCE:") + QString::number(sequence));
                }
                if (!seen.contains(QStringLiteral("LAST-MODIFIED"))) {
                    lines.append(QStringLiteral("LAST-MODIFIED:") + formatDateTime(now));
                }
                lines << participantLines(record);
                lines.append(line);
                inEvent = false;
                eventDone = true;
                continue;
            }

            // only the first occurrence of a property is substituted
            const bool first = !seen.contains(name);
            seen.insert(name);
            if (name == QStringLiteral("SUMMARY")) {
                if (first) {
                    lines.append(QStringLiteral("SUMMARY:") + IcsSerializer::escapeText(title));
                }
            } else if (name == QStringLiteral("DTSTART") || name == QStringLiteral("DTEND")) {
                if (first) {
                    lines.append(dateLine(name, name == QStringLiteral("DTSTART") ? record.startDate
                                                                                 : record.endDate,
                                          record.allDay));
                }
            } else if (name == QStringLiteral("DURATION")) {
                // replaced by DTEND
                seen.remove(name);
            } else if (name == QStringLiteral("LOCATION")) {
                if (first && !record.location.isEmpty()) {
                    lines.append(QStringLiteral("LOCATION:") + IcsSerializer::escapeText(record.location));
                }
            } else if (name == QStringLiteral("DESCRIPTION")) {
                if (first && !record.description.isEmpty()) {
                    lines.append(QStringLiteral("DESCRIPTION:") + IcsSerializer::escapeText(record.description));
                }
            } else if (name == QStringLiteral("SEQUENCE")) {
                if (first) {
                    lines.append(QStringLiteral("SEQUENCE:") + QString::number(sequence));
                }
            } else if (name == QStringLiteral("DTSTAMP") || name == QStringLiteral("LAST-MODIFIED")) {
                if (first) {
                    lines.append(name + QChar(':') + formatDateTime(now));
                }
            } else if (name == QStringLiteral("RRULE")) {
                if (first && !rrule.isEmpty()) {
                    lines.append(QStringLiteral("RRULE:") + rrule);
                }
            } else if (name == QStringLiteral("ATTENDEE")) {
                // rebuilt from the record before END:VEVENT
            } else {
                lines.append(line);
            }
        }

        if (!eventDone) {
            return QString();
        }
        return foldAll(lines);
    }
}

QString IcsSerializer::escapeText(const QString &text)
{
    QString ret = text;
    ret.replace(QChar('\\'), QStringLiteral("\\\\"));
    ret.replace(QChar(';'), QStringLiteral("\\;"));
    ret.replace(QChar(','), QStringLiteral("\\,"));
    ret.replace(QStringLiteral("\r\n"), QStringLiteral("\\n"));
    ret.replace(QChar('\n'), QStringLiteral("\\n"));
    return ret;
}

QString IcsSerializer::foldLine(const QString &line)
{
    // 75 octets per physical line, the leading space of a continuation included
    const int limit = 75;
    QString ret;
    int octets = 0;
    for (int i = 0; i < line.length(); ++i) {
        QString unit(line[i]);
        if (line[i].isHighSurrogate() && i + 1 < line.length()) {
            unit.append(line[++i]);
        }
        const int length = unit.toUtf8().size();
        if (octets + length > limit) {
            ret.append(QStringLiteral("\r\n "));
            octets = 1;
        }
        ret.append(unit);
        octets += length;
    }
    return ret;
}

int IcsSerializer::sequenceOf(const QString &icsData)
{
    static const QRegularExpression sequence(QStringLiteral("^SEQUENCE:\\s*(\\d+)"),
                                             QRegularExpression::MultilineOption
                                             | QRegularExpression::CaseInsensitiveOption);
    QRegularExpressionMatch match = sequence.match(icsData);
    return match.hasMatch() ? match.captured(1).toInt() : -1;
}

QString IcsSerializer::attendeeLine(const Attendee &attendee)
{
    QString line = QStringLiteral("ATTENDEE");
    if (!attendee.name.isEmpty()) {
        line += QStringLiteral(";CN=") + quoteParameter(attendee.name);
    }
    line += QStringLiteral(";ROLE=")
            + (attendee.role.isEmpty() ? QStringLiteral("REQ-PARTICIPANT") : attendee.role);
    line += QStringLiteral(";PARTSTAT=")
            + (attendee.status.isEmpty() ? QStringLiteral("NEEDS-ACTION") : attendee.status);
    return line + QStringLiteral(":mailto:") + attendee.email;
}

QString IcsSerializer::resourceLine(const Resource &resource)
{
    QString line = QStringLiteral("ATTENDEE;CN=")
            + quoteParameter(resource.name.isEmpty() ? resource.adminEmail : resource.name)
            + QStringLiteral(";CUTYPE=RESOURCE;ROLE=NON-PARTICIPANT");
    if (!resource.type.isEmpty()) {
        line += QStringLiteral(";X-RESOURCE-TYPE=") + quoteParameter(resource.type);
    }
    return line + QStringLiteral(":mailto:") + resource.adminEmail;
}

QString IcsSerializer::generateICalEvent(const CalendarEventRecord &record, const QString &username,
                                         const QDateTime &timestamp)
{
    FUNCTION_CALL_TRACE;

    const QDateTime now = timestamp.isValid() ? timestamp.toUTC() : QDateTime::currentDateTimeUtc();
    if (!record.rawData.isEmpty()) {
        int sequence = qMax(0, sequenceOf(record.rawData));
        if (record.hasRemoteObject() && record.syncStatus != CalendarEventRecord::Synced) {
            ++sequence;
        }
        const QString ret = substituteIntoTemplate(record, now, sequence);
        if (!ret.isEmpty()) {
            return ret;
        }
        LOG_WARNING("Stored iCal data of" << record.uid << "has no VEVENT, generating new data");
    }
    return newCalendarData(record, username, now);
}

QString IcsSerializer::transformIcsForCancellation(const QString &originalIcs,
                                                   const CalendarEventRecord &record,
                                                   const QDateTime &timestamp)
{
    FUNCTION_CALL_TRACE;

    const QDateTime now = timestamp.isValid() ? timestamp.toUTC() : QDateTime::currentDateTimeUtc();
    const QStringList input = IcsRepair::lines(IcsRepair::run(IcsRepair::preCleanPipeline(), originalIcs));

    QString uid;
    QString summary;
    QString dtStart;
    QString dtEnd;
    QString organizer;
    QString created;
    QStringList attendees;
    QStringList extensions;
    QStringList timezones;
    int sequence = -1;

    bool inEvent = false;
    bool inTimezone = false;
    bool eventDone = false;
    int nested = 0;
    Q_FOREACH (const QString &line, input) {
        const QString name = propertyName(line);
        if (inTimezone) {
            timezones.append(line);
            if (name == QStringLiteral("END")
                    && propertyValue(line).trimmed().compare(QStringLiteral("VTIMEZONE"), Qt::CaseInsensitive) == 0) {
                inTimezone = false;
            }
            continue;
        }
        if (!inEvent) {
            if (name == QStringLiteral("BEGIN")) {
                const QString component = propertyValue(line).trimmed().toUpper();
                if (component == QStringLiteral("VTIMEZONE")) {
                    inTimezone = true;
                    timezones.append(line);
                } else if (component == QStringLiteral("VEVENT") && !eventDone) {
                    inEvent = true;
                }
            }
            continue;
        }
        if (name == QStringLiteral("BEGIN")) {
            ++nested;
            continue;
        }
        if (name == QStringLiteral("END")) {
            if (nested > 0) {
                --nested;
            } else {
                inEvent = false;
                eventDone = true;
            }
            continue;
        }
        if (nested > 0) {
            continue;
        }

        if (name == QStringLiteral("UID") && uid.isEmpty()) {
            uid = propertyValue(line).trimmed();
        } else if (name == QStringLiteral("SUMMARY") && summary.isEmpty()) {
            summary = propertyValue(line).trimmed();
        } else if (name == QStringLiteral("DTSTART") && dtStart.isEmpty()) {
            dtStart = line;
        } else if (name == QStringLiteral("DTEND") && dtEnd.isEmpty()) {
            dtEnd = line;
        } else if (name == QStringLiteral("ORGANIZER") && organizer.isEmpty()) {
            organizer = line;
        } else if (name == QStringLiteral("CREATED") && created.isEmpty()) {
            created = line;
        } else if (name == QStringLiteral("SEQUENCE") && sequence < 0) {
            static const QRegularExpression digits(QStringLiteral("^\\s*(\\d+)"));
            QRegularExpressionMatch match = digits.match(propertyValue(line));
            sequence = match.hasMatch() ? match.captured(1).toInt() : 0;
        } else if (name == QStringLiteral("ATTENDEE")) {
            if (!attendeeAddress(line).isEmpty()) {
                attendees.append(line);
            }
        } else if (name.startsWith(QStringLiteral("X-"))) {
            extensions.append(line);
        }
    }

    if (uid.isEmpty()) {
        uid = record.uid;
        LOG_WARNING("Original iCal data has no UID, using" << uid);
    }
    if (summary.isEmpty()) {
        summary = escapeText(record.title.isEmpty() ? QStringLiteral("Untitled Event") : record.title);
    }
    if (sequence < 0) {
        sequence = record.rawData.isEmpty() ? 0 : qMax(0, sequenceOf(record.rawData));
    }
    if (attendees.isEmpty()) {
        attendees = participantLines(record);
    }

    QStringList lines;
    lines << QStringLiteral("BEGIN:VCALENDAR")
          << QStringLiteral("VERSION:2.0")
          << PRODID
          << QStringLiteral("CALSCALE:GREGORIAN")
          << QStringLiteral("METHOD:CANCEL");
    lines << timezones;
    lines << QStringLiteral("BEGIN:VEVENT")
          << QStringLiteral("UID:") + uid
          << QStringLiteral("DTSTAMP:") + formatDateTime(now)
          << QStringLiteral("SEQUENCE:") + QString::number(sequence + 1)
          << QStringLiteral("STATUS:CANCELLED")
          << QStringLiteral("SUMMARY:")
             + (summary.startsWith(QStringLiteral("CANCELLED: ")) ? summary : QStringLiteral("CANCELLED: ") + summary);
    lines << (dtStart.isEmpty() ? dateLine(QStringLiteral("DTSTART"), record.startDate, record.allDay) : dtStart);
    lines << (dtEnd.isEmpty() ? dateLine(QStringLiteral("DTEND"), record.endDate, record.allDay) : dtEnd);
    if (!organizer.isEmpty()) {
        lines << organizer;
    }
    lines << attendees;
    if (!created.isEmpty()) {
        lines << created;
    }
    lines << extensions;
    lines << QStringLiteral("END:VEVENT")
          << QStringLiteral("END:VCALENDAR");
    return foldAll(lines);
}

QString IcsSerializer::sanitizeAndFormatIcs(const QString &icsData, const FormatOptions &options)
{
    FUNCTION_CALL_TRACE;

    static const QRegularExpression scheduleStatus(QStringLiteral(";SCHEDULE-STATUS=([^;:]*)"),
                                                   QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression validScheduleStatus(QStringLiteral("^\\d+\\.\\d+$"));
    static const QRegularExpression htmlTag(QStringLiteral("<[^>]*>"));

    const QStringList input = IcsRepair::lines(IcsRepair::run(IcsRepair::preCleanPipeline(), icsData));
    QStringList lines;
    QSet<QString> seenAttendees;
    bool inEvent = false;
    bool hasMethod = false;
    bool hasCalScale = false;
    bool hasStatus = false;
    bool hasSequence = false;
    bool inputHasMethod = false;
    bool inputHasCalScale = false;
    Q_FOREACH (const QString &line, input) {
        inputHasMethod |= propertyName(line) == QStringLiteral("METHOD");
        inputHasCalScale |= propertyName(line) == QStringLiteral("CALSCALE");
    }

    Q_FOREACH (const QString &original, input) {
        QString line = original;
        const QString name = propertyName(line);

        if (name == QStringLiteral("BEGIN")
                && propertyValue(line).trimmed().compare(QStringLiteral("VEVENT"), Qt::CaseInsensitive) == 0) {
            inEvent = true;
        } else if (name == QStringLiteral("END")
                   && propertyValue(line).trimmed().compare(QStringLiteral("VEVENT"), Qt::CaseInsensitive) == 0) {
            if (!hasStatus && !options.status.isEmpty()) {
                lines.append(QStringLiteral("STATUS:") + options.status);
            }
            if (!hasSequence && options.sequence >= 0) {
                lines.append(QStringLiteral("SEQUENCE:") + QString::number(options.sequence));
            }
            hasStatus = false;
            hasSequence = false;
            inEvent = false;
        } else if (name == QStringLiteral("METHOD")) {
            hasMethod = true;
            if (!options.method.isEmpty()) {
                line = QStringLiteral("METHOD:") + options.method;
            }
        } else if (name == QStringLiteral("CALSCALE")) {
            hasCalScale = true;
        } else if (inEvent && name == QStringLiteral("STATUS")) {
            hasStatus = true;
            if (!options.status.isEmpty()) {
                line = QStringLiteral("STATUS:") + options.status;
            }
        } else if (inEvent && name == QStringLiteral("SEQUENCE")) {
            hasSequence = true;
            if (options.sequence >= 0) {
                line = QStringLiteral("SEQUENCE:") + QString::number(options.sequence);
            } else {
                static const QRegularExpression digits(QStringLiteral("^\\s*(\\d+)"));
                QRegularExpressionMatch match = digits.match(propertyValue(line));
                const QString fixed = QStringLiteral("SEQUENCE:") + (match.hasMatch() ? match.captured(1)
                                                                                    : QStringLiteral("0"));
                if (fixed != line) {
                    LOG_DEBUG("Fixed corrupt SEQUENCE value:" << line);
                }
                line = fixed;
            }
        } else if (inEvent && name == QStringLiteral("ORGANIZER") && !options.organizer.isEmpty()) {
            line = QStringLiteral("ORGANIZER:mailto:") + options.organizer;
        } else if (inEvent && name == QStringLiteral("RRULE")) {
            QString value = propertyValue(line);
            if (value.contains(QStringLiteral("pattern="), Qt::CaseInsensitive)) {
                value = convertPatternRule(value);
            }
            const QString rule = RRuleSanitizer::sanitize(value);
            if (rule.isEmpty()) {
                LOG_WARNING("Dropping unrecoverable recurrence rule:" << line);
                continue;
            }
            line = QStringLiteral("RRULE:") + rule;
        } else if (inEvent && name == QStringLiteral("DESCRIPTION")) {
            QString value = propertyValue(line);
            if (htmlTag.match(value).hasMatch()) {
                value.remove(htmlTag);
                line = QStringLiteral("DESCRIPTION:") + value;
            }
        } else if (inEvent && name == QStringLiteral("ATTENDEE")) {
            QString value = propertyValue(line).trimmed();
            if (value.isEmpty() || value.compare(QStringLiteral("mailto:"), Qt::CaseInsensitive) == 0) {
                continue;
            }
            if (!value.startsWith(QStringLiteral("mailto:"), Qt::CaseInsensitive)) {
                line = line.left(line.length() - propertyValue(line).length()) + QStringLiteral("mailto:") + value;
            }
            QRegularExpressionMatch status = scheduleStatus.match(line);
            if (status.hasMatch() && !validScheduleStatus.match(status.captured(1).trimmed()).hasMatch()) {
                line.replace(status.capturedStart(), status.capturedLength(),
                             QStringLiteral(";SCHEDULE-STATUS=1.2"));
            }
            const QString address = attendeeAddress(line);
            if (!address.isEmpty()) {
                if (seenAttendees.contains(address) && !options.preserveAttendees) {
                    continue;
                }
                seenAttendees.insert(address);
            }
        }

        lines.append(line);

        if (name == QStringLiteral("VERSION") && !options.method.isEmpty() && !inputHasMethod && !hasMethod) {
            lines.append(QStringLiteral("METHOD:") + options.method);
            hasMethod = true;
        } else if (name == QStringLiteral("PRODID") && !inputHasCalScale && !hasCalScale) {
            lines.append(QStringLiteral("CALSCALE:GREGORIAN"));
            hasCalScale = true;
        }
    }

    if (!hasMethod && !options.method.isEmpty()) {
        // no VERSION line to anchor on
        int index = lines.indexOf(QStringLiteral("BEGIN:VCALENDAR"));
        lines.insert(index + 1, QStringLiteral("METHOD:") + options.method);
    }
    return foldAll(lines);
}
