/*
 * This file is part of caldavserver package
 *
 * Copyright (C) 2025 caldavserver contributors
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
 */

#ifndef STORAGE_H
#define STORAGE_H

#include <QString>
#include <QStringList>
#include <QList>

#include "caldavexport.h"
#include "davtypes.h"
#include "filter.h"

namespace CalDav {

/* Backend capability the server calls into. Implementations must be
   safe to call from concurrent requests. */
class CALDAV_EXPORT Storage
{
public:
    enum Status {
        NoError,
        NotFound,
        InvalidInput,
        PermissionDenied,
        Conflict,
        Unavailable
    };

    virtual ~Storage() {}

    virtual Status getUser(const QString &userId, User *user) = 0;
    virtual Status authUser(const QString &username, const QString &password,
                            QString *userId) = 0;

    virtual Status getUserCalendars(const QString &userId, QList<Calendar> *calendars) = 0;
    virtual Status getCalendar(const QString &userId, const QString &calendarId,
                               Calendar *calendar) = 0;
    // Sets path, etag and ctag of the given calendar.
    virtual Status createCalendar(const QString &userId, Calendar *calendar) = 0;

    virtual Status getObject(const QString &userId, const QString &calendarId,
                             const QString &objectId, CalendarObject *object) = 0;
    // Paths are encoded like request paths, without the server prefix.
    virtual Status getObjectPathsInCollection(const QString &userId, const QString &calendarId,
                                              QStringList *paths) = 0;
    // May return a superset of the matching objects, callers filter again.
    virtual Status getObjectByFilter(const QString &userId, const QString &calendarId,
                                     const Filter &filter, QList<CalendarObject> *objects) = 0;
    // Creates or replaces the object, returns its new etag.
    virtual Status updateObject(const QString &userId, const QString &calendarId,
                                CalendarObject *object, QString *etag) = 0;
    virtual Status deleteObject(const QString &userId, const QString &calendarId,
                                const QString &objectId) = 0;

    static QString statusMessage(Status status);
};
}

#endif
