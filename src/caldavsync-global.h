/*
 * This file is part of caldav-sync package
 *
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

#ifndef CALDAVSYNC_GLOBAL_H
#define CALDAVSYNC_GLOBAL_H

#include <QtCore/qglobal.h>

#if defined(CALDAVSYNC_LIBRARY)
#  define CALDAVSYNCSHARED_EXPORT Q_DECL_EXPORT
#else
#  define CALDAVSYNCSHARED_EXPORT Q_DECL_IMPORT
#endif

#endif // CALDAVSYNC_GLOBAL_H
