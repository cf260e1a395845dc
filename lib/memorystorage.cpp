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

#include "memorystorage.h"
#include "matcher.h"
#include "incidencehandler.h"
#include "pathcodec.h"
#include "logging_p.h"

#include <QMutexLocker>
#include <QCryptographicHash>

using namespace CalDav;

namespace {
    QString quotedDigest(const QByteArray &data)
    {
        return QStringLiteral("\"%1\"").arg(QString::fromLatin1(
            QCryptographicHash::hash(data, QCryptographicHash::Md5).toHex()));
    }

    // Storage paths carry encoded segments and no prefix.
    QString calendarPath(const QString &userId, const QString &calendarId)
    {
        return PathCodec().href(Resource(Resource::Collection, userId, calendarId));
    }

    QString objectPath(const QString &userId, const QString &calendarId, const QString &objectId)
    {
        return PathCodec().href(Resource(Resource::Object, userId, calendarId, objectId));
    }

    // Incidences cache recurrence state, so a stored object and the
    // copies handed out never share them.
    CalendarObject detached(const CalendarObject &object)
    {
        CalendarObject copy = object;
        copy.incidences.clear();
        for (const KCalendarCore::Incidence::Ptr &incidence : object.incidences)
            copy.incidences.append(KCalendarCore::Incidence::Ptr(incidence->clone()));
        return copy;
    }
}

MemoryStorage::MemoryStorage()
{
}

MemoryStorage::~MemoryStorage()
{
}

bool MemoryStorage::registerUser(const QString &userId, const QString &password,
                                 const QString &displayName)
{
    QMutexLocker locker(&mMutex);
    if (userId.isEmpty() || mUsers.contains(userId)) {
        qCWarning(lcCalDav) << "Cannot register user" << userId;
        return false;
    }

    StoredUser stored;
    stored.user.id = userId;
    stored.user.displayName = displayName.isEmpty() ? userId : displayName;
    stored.user.userAddress = QStringLiteral("mailto:%1@example.com").arg(userId);
    stored.user.preferredColor = QStringLiteral("#4285F4");
    stored.user.preferredTimezone = QStringLiteral("UTC");
    stored.password = password;
    mUsers.insert(userId, stored);
    qCDebug(lcCalDav) << "Registered user" << userId;
    return true;
}

MemoryStorage::StoredCalendar *MemoryStorage::findCalendar(const QString &userId, const QString &calendarId)
{
    QMap<QString, StoredUser>::iterator user = mUsers.find(userId);
    if (user == mUsers.end())
        return nullptr;
    QMap<QString, StoredCalendar>::iterator calendar = user->calendars.find(calendarId);
    if (calendar == user->calendars.end())
        return nullptr;
    return &calendar.value();
}

void MemoryStorage::touch(StoredCalendar *stored)
{
    stored->calendar.ctag = QString::number(++mRevision);
    stored->calendar.lastModified = QDateTime::currentDateTimeUtc();
}

Storage::Status MemoryStorage::getUser(const QString &userId, User *user)
{
    QMutexLocker locker(&mMutex);
    QMap<QString, StoredUser>::const_iterator it = mUsers.constFind(userId);
    if (it == mUsers.constEnd())
        return NotFound;
    if (user)
        *user = it->user;
    return NoError;
}

Storage::Status MemoryStorage::authUser(const QString &username, const QString &password,
                                        QString *userId)
{
    QMutexLocker locker(&mMutex);
    QMap<QString, StoredUser>::const_iterator it = mUsers.constFind(username);
    if (it == mUsers.constEnd() || it->password != password)
        return PermissionDenied;
    if (userId)
        *userId = username;
    return NoError;
}

Storage::Status MemoryStorage::getUserCalendars(const QString &userId, QList<Calendar> *calendars)
{
    QMutexLocker locker(&mMutex);
    QMap<QString, StoredUser>::const_iterator it = mUsers.constFind(userId);
    if (it == mUsers.constEnd())
        return NotFound;
    if (calendars) {
        calendars->clear();
        for (const StoredCalendar &stored : it->calendars)
            calendars->append(stored.calendar);
    }
    return NoError;
}

Storage::Status MemoryStorage::getCalendar(const QString &userId, const QString &calendarId,
                                           Calendar *calendar)
{
    QMutexLocker locker(&mMutex);
    const StoredCalendar *stored = findCalendar(userId, calendarId);
    if (!stored)
        return NotFound;
    if (calendar)
        *calendar = stored->calendar;
    return NoError;
}

Storage::Status MemoryStorage::createCalendar(const QString &userId, Calendar *calendar)
{
    if (!calendar || calendar->id.isEmpty())
        return InvalidInput;

    QMutexLocker locker(&mMutex);
    QMap<QString, StoredUser>::iterator user = mUsers.find(userId);
    if (user == mUsers.end())
        return NotFound;
    if (user->calendars.contains(calendar->id))
        return Conflict;

    calendar->path = calendarPath(userId, calendar->id);
    calendar->etag = quotedDigest((calendar->displayName + calendar->description
                                   + calendar->color + calendar->timezone).toUtf8());
    StoredCalendar stored;
    stored.calendar = *calendar;
    touch(&stored);
    *calendar = stored.calendar;
    user->calendars.insert(calendar->id, stored);
    qCDebug(lcCalDav) << "Created calendar" << calendar->path;
    return NoError;
}

Storage::Status MemoryStorage::getObject(const QString &userId, const QString &calendarId,
                                         const QString &objectId, CalendarObject *object)
{
    QMutexLocker locker(&mMutex);
    const StoredCalendar *stored = findCalendar(userId, calendarId);
    if (!stored)
        return NotFound;
    QMap<QString, CalendarObject>::const_iterator it = stored->objects.constFind(objectId);
    if (it == stored->objects.constEnd())
        return NotFound;
    if (object)
        *object = detached(it.value());
    return NoError;
}

Storage::Status MemoryStorage::getObjectPathsInCollection(const QString &userId, const QString &calendarId,
                                                          QStringList *paths)
{
    QMutexLocker locker(&mMutex);
    const StoredCalendar *stored = findCalendar(userId, calendarId);
    if (!stored)
        return NotFound;
    if (paths) {
        paths->clear();
        for (const CalendarObject &object : stored->objects)
            paths->append(object.path);
    }
    return NoError;
}

Storage::Status MemoryStorage::getObjectByFilter(const QString &userId, const QString &calendarId,
                                                 const Filter &filter, QList<CalendarObject> *objects)
{
    QMutexLocker locker(&mMutex);
    const StoredCalendar *stored = findCalendar(userId, calendarId);
    if (!stored)
        return NotFound;
    if (objects) {
        objects->clear();
        for (const CalendarObject &object : stored->objects) {
            if (Matcher::matches(filter, object))
                objects->append(detached(object));
        }
    }
    return NoError;
}

Storage::Status MemoryStorage::updateObject(const QString &userId, const QString &calendarId,
                                            CalendarObject *object, QString *etag)
{
    if (!object || object->id.isEmpty() || object->incidences.isEmpty())
        return InvalidInput;

    const QString ics = IncidenceHandler::toIcs(object->incidences);
    if (ics.isEmpty())
        return InvalidInput;

    QMutexLocker locker(&mMutex);
    StoredCalendar *stored = findCalendar(userId, calendarId);
    if (!stored)
        return NotFound;
    if (stored->calendar.readOnly)
        return PermissionDenied;

    object->path = objectPath(userId, calendarId, object->id);
    object->etag = quotedDigest(ics.toUtf8());
    object->lastModified = QDateTime::currentDateTimeUtc();
    stored->objects.insert(object->id, detached(*object));
    touch(stored);
    if (etag)
        *etag = object->etag;
    qCDebug(lcCalDav) << "Stored object" << object->path << object->etag;
    return NoError;
}

Storage::Status MemoryStorage::deleteObject(const QString &userId, const QString &calendarId,
                                            const QString &objectId)
{
    QMutexLocker locker(&mMutex);
    StoredCalendar *stored = findCalendar(userId, calendarId);
    if (!stored)
        return NotFound;
    if (stored->calendar.readOnly)
        return PermissionDenied;
    if (!stored->objects.remove(objectId))
        return NotFound;
    touch(stored);
    return NoError;
}
