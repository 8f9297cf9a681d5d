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

#include "ticker.h"

#include <QTimer>

TimerTicker::TimerTicker(QObject *parent)
    : Ticker(parent)
    , mTimer(new QTimer(this))
{
    connect(mTimer, SIGNAL(timeout()), this, SIGNAL(tick()));
}

void TimerTicker::start(int intervalMs)
{
    mTimer->start(intervalMs);
}

void TimerTicker::stop()
{
    mTimer->stop();
}

bool TimerTicker::isActive() const
{
    return mTimer->isActive();
}

int TimerTicker::interval() const
{
    return mTimer->interval();
}

Ticker *TimerScheduler::createTicker(QObject *parent)
{
    return new TimerTicker(parent);
}
