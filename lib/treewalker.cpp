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

#include "treewalker.h"
#include "logging_p.h"

using namespace CalDav;

const int TreeWalker::INFINITE_DEPTH;

TreeWalker::TreeWalker(Storage *storage, const CancellationToken *token)
    : mStorage(storage)
    , mToken(token)
{
}

bool TreeWalker::hasError() const
{
    return mError != NoError;
}

TreeWalker::Error TreeWalker::error() const
{
    return mError;
}

QString TreeWalker::errorMessage() const
{
    return mErrorMessage;
}

bool TreeWalker::fail(Error error, const QString &message)
{
    mError = error;
    mErrorMessage = message;
    qCWarning(lcCalDav) << "Resource expansion failed:" << message;
    return false;
}

bool TreeWalker::fetchChildren(int depth, const Resource &parent, QList<Resource> *children)
{
    mError = NoError;
    mErrorMessage.clear();

    QList<Resource> found;
    if (!expand(depth, parent, &found))
        return false;
    children->append(found);
    return true;
}

bool TreeWalker::expand(int depth, const Resource &parent, QList<Resource> *children)
{
    if (depth <= 0)
        return true;
    if (mToken && mToken->isCancelled())
        return fail(Cancelled, QStringLiteral("request cancelled"));

    switch (parent.type) {
    case Resource::Collection: {
        QStringList paths;
        const Storage::Status status = mStorage->getObjectPathsInCollection(parent.userId, parent.calendarId, &paths);
        if (status != Storage::NoError) {
            return fail(StorageError, QStringLiteral("cannot list objects in %1: %2")
                        .arg(parent.calendarId, Storage::statusMessage(status)));
        }
        // Storage paths are encoded and carry no prefix.
        const PathCodec storageCodec;
        for (const QString &path : paths) {
            Resource resource;
            QString errorMessage;
            if (!storageCodec.parsePath(path, &resource, &errorMessage))
                return fail(PathError, errorMessage);
            if (resource.type != Resource::Object
                || resource.userId != parent.userId
                || resource.calendarId != parent.calendarId) {
                return fail(PathError, QStringLiteral("object path %1 is outside of %2")
                            .arg(path, parent.calendarId));
            }
            resource.uri.clear();
            children->append(resource);
            if (!expand(depth - 1, resource, children))
                return false;
        }
        break;
    }
    case Resource::HomeSet: {
        QList<Calendar> calendars;
        const Storage::Status status = mStorage->getUserCalendars(parent.userId, &calendars);
        if (status != Storage::NoError) {
            return fail(StorageError, QStringLiteral("cannot list calendars of %1: %2")
                        .arg(parent.userId, Storage::statusMessage(status)));
        }
        for (const Calendar &calendar : calendars) {
            const Resource resource(Resource::Collection, parent.userId, calendar.id);
            children->append(resource);
            if (!expand(depth - 1, resource, children))
                return false;
        }
        break;
    }
    default:
        // Objects and principals are leaves.
        break;
    }
    return true;
}
