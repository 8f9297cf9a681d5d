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

#ifndef RRULESANITIZER_H
#define RRULESANITIZER_H

#include "caldavsync-global.h"

#include <QString>

class CALDAVSYNCSHARED_EXPORT RRuleSanitizer
{
public:
    // Returns a recurrence rule value (without the "RRULE:" prefix) that only
    // contains recognized parameters, or an empty string if no FREQ can be
    // recovered from the input.  Clean input is returned unchanged.
    static QString sanitize(const QString &rrule);

    static bool isValid(const QString &rrule);

private:
    RRuleSanitizer();
};

#endif // RRULESANITIZER_H
