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

#ifndef MEMORYSTORAGE_H
#define MEMORYSTORAGE_H

#include <QMap>
#include <QMutex>

#include "caldavexport.h"
#include "storage.h"

namespace CalDav {

class CALDAV_EXPORT MemoryStorage : public Storage
{
public:
    MemoryStorage();
    ~MemoryStorage();

    // Also creates the user's home, without any calendar.
    bool registerUser(const QString &userId, const QString &password,
                      const QString &displayName = QString());

    Status getUser(const QString &userId, User *user) override;
    Status authUser(const QString &username, const QString &password,
                    QString *userId) override;

    Status getUserCalendars(const QString &userId, QList<Calendar> *calendars) override;
    Status getCalendar(const QString &userId, const QString &calendarId,
                       Calendar *calendar) override;
    Status createCalendar(const QString &userId, Calendar *calendar) override;

    Status getObject(const QString &userId, const QString &calendarId,
                     const QString &objectId, CalendarObject *object) override;
    Status getObjectPathsInCollection(const QString &userId, const QString &calendarId,
                                      QStringList *paths) override;
    Status getObjectByFilter(const QString &userId, const QString &calendarId,
                             const Filter &filter, QList<CalendarObject> *objects) override;
    Status updateObject(const QString &userId, const QString &calendarId,
                        CalendarObject *object, QString *etag) override;
    Status deleteObject(const QString &userId, const QString &calendarId,
                        const QString &objectId) override;

private:
    struct StoredCalendar {
        Calendar calendar;
        QMap<QString, CalendarObject> objects;
    };
    struct StoredUser {
        User user;
        QString password;
        QMap<QString, StoredCalendar> calendars;
    };

    StoredCalendar *findCalendar(const QString &userId, const QString &calendarId);
    void touch(StoredCalendar *stored);

    QMutex mMutex;
    QMap<QString, StoredUser> mUsers;
    quint64 mRevision = 0;
};
}

#endif
