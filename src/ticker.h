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

#ifndef TICKER_H
#define TICKER_H

#include "caldavsync-global.h"

#include <QObject>

class QTimer;

// A periodic trigger.  Stopping the ticker is the only way to cancel it.
class CALDAVSYNCSHARED_EXPORT Ticker : public QObject
{
    Q_OBJECT

public:
    explicit Ticker(QObject *parent = 0) : QObject(parent) {}
    virtual ~Ticker() {}

    virtual void start(int intervalMs) = 0;
    virtual void stop() = 0;
    virtual bool isActive() const = 0;
    virtual int interval() const = 0;

Q_SIGNALS:
    void tick();
};

class CALDAVSYNCSHARED_EXPORT TimerTicker : public Ticker
{
    Q_OBJECT

public:
    explicit TimerTicker(QObject *parent = 0);

    virtual void start(int intervalMs);
    virtual void stop();
    virtual bool isActive() const;
    virtual int interval() const;

private:
    QTimer *mTimer;
};

class CALDAVSYNCSHARED_EXPORT Scheduler
{
public:
    virtual ~Scheduler() {}

    // the caller owns the returned ticker unless parent is set
    virtual Ticker *createTicker(QObject *parent = 0) = 0;
};

class CALDAVSYNCSHARED_EXPORT TimerScheduler : public Scheduler
{
public:
    virtual Ticker *createTicker(QObject *parent = 0);
};

#endif // TICKER_H
