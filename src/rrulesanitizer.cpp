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

#include "rrulesanitizer.h"

#include <QRegularExpression>
#include <QSet>
#include <QStringList>

#include <LogMacros.h>

namespace {
    const QStringList &allowedParameters()
    {
        static const QStringList params = QStringList()
                << QStringLiteral("FREQ") << QStringLiteral("INTERVAL") << QStringLiteral("COUNT")
                << QStringLiteral("UNTIL") << QStringLiteral("BYDAY") << QStringLiteral("BYMONTHDAY")
                << QStringLiteral("BYMONTH") << QStringLiteral("WKST") << QStringLiteral("BYSETPOS");
        return params;
    }

    bool isValidFrequency(const QString &freq)
    {
        static const QStringList frequencies = QStringList()
                << QStringLiteral("SECONDLY") << QStringLiteral("MINUTELY") << QStringLiteral("HOURLY")
                << QStringLiteral("DAILY") << QStringLiteral("WEEKLY") << QStringLiteral("MONTHLY")
                << QStringLiteral("YEARLY");
        return frequencies.contains(freq);
    }

    bool isValidValue(const QString &name, const QString &value)
    {
        if (value.isEmpty()) {
            return false;
        }
        if (name == QStringLiteral("FREQ")) {
            return isValidFrequency(value);
        }
        if (name == QStringLiteral("INTERVAL") || name == QStringLiteral("COUNT")) {
            bool ok = false;
            int number = value.toInt(&ok);
            return ok && number > 0;
        }
        if (name == QStringLiteral("UNTIL")) {
            static const QRegularExpression untilFormat(QStringLiteral("^\\d{8}(T\\d{6}Z?)?$"));
            return untilFormat.match(value).hasMatch();
        }
        return true;
    }

    // The FREQ value that can still be read from a corrupted rule, if any.
    QString recoverFrequency(const QString &rule)
    {
        static const QRegularExpression freqToken(QStringLiteral("FREQ=([A-Z]+)"),
                                                  QRegularExpression::CaseInsensitiveOption);
        QRegularExpressionMatch match = freqToken.match(rule);
        if (match.hasMatch() && isValidFrequency(match.captured(1).toUpper())) {
            return match.captured(1).toUpper();
        }
        return QString();
    }
}

QString RRuleSanitizer::sanitize(const QString &rrule)
{
    QString rule = rrule.trimmed();
    if (rule.startsWith(QStringLiteral("RRULE:"), Qt::CaseInsensitive)) {
        rule = rule.mid(6).trimmed();
    }
    if (rule.isEmpty()) {
        return QString();
    }
    const bool mentionsFrequency = rule.contains(QStringLiteral("FREQ"), Qt::CaseInsensitive);

    // e.g. "FREQ=WEEKLY;BYDAY=MO;user@example.comProjector": an attendee address
    // glued to a resource type.  Only the frequency can be trusted in that case.
    static const QRegularExpression gluedResource(
            QStringLiteral("@[A-Za-z0-9.-]+\\.[a-z]{2,}[A-Z][A-Za-z]*"));
    if (gluedResource.match(rule).hasMatch()) {
        QString freq = recoverFrequency(rule);
        LOG_WARNING("Recovering frequency from corrupted recurrence rule:" << rrule);
        if (!freq.isEmpty()) {
            return QStringLiteral("FREQ=") + freq;
        }
        return mentionsFrequency ? QStringLiteral("FREQ=DAILY") : QString();
    }

    // anything after a colon (typically "mailto:...") does not belong to the rule
    int colon = rule.indexOf(QChar(':'));
    if (colon >= 0) {
        rule.truncate(colon);
    }

    QString freq;
    QStringList params;
    QSet<QString> seen;
    Q_FOREACH (const QString &param, rule.split(QChar(';'), QString::SkipEmptyParts)) {
        int eq = param.indexOf(QChar('='));
        if (eq <= 0) {
            continue;
        }
        const QString name = param.left(eq).trimmed().toUpper();
        const QString value = param.mid(eq + 1).trimmed();
        if (!allowedParameters().contains(name) || seen.contains(name)) {
            continue;
        }
        if (!isValidValue(name, name == QStringLiteral("FREQ") ? value.toUpper() : value)) {
            continue;
        }
        seen.insert(name);
        if (name == QStringLiteral("FREQ")) {
            freq = value.toUpper();
        } else {
            params.append(name + QChar('=') + value);
        }
    }

    if (freq.isEmpty()) {
        if (!mentionsFrequency) {
            return QString();
        }
        freq = QStringLiteral("DAILY");
    }
    params.prepend(QStringLiteral("FREQ=") + freq);
    return params.join(QChar(';'));
}

bool RRuleSanitizer::isValid(const QString &rrule)
{
    return rrule.startsWith(QStringLiteral("FREQ=")) && sanitize(rrule) == rrule;
}
