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

#include "pathcodec.h"
#include "logging_p.h"

#include <QUrl>
#include <QStringList>

namespace {
    const QString CAL_SEGMENT = QStringLiteral("cal");

    QString normalizedPrefix(const QString &prefix)
    {
        QString result = prefix.trimmed();
        while (result.endsWith(QLatin1Char('/')))
            result.chop(1);
        if (!result.isEmpty() && !result.startsWith(QLatin1Char('/')))
            result.prepend(QLatin1Char('/'));
        return result;
    }

    void setError(QString *errorMessage, const QString &message)
    {
        if (errorMessage)
            *errorMessage = message;
    }

    QString encodeSegment(const QString &segment)
    {
        return QString::fromLatin1(QUrl::toPercentEncoding(segment, QByteArray("@.~-_+")));
    }
}

using namespace CalDav;

PathCodec::PathCodec(const QString &prefix)
    : mPrefix(normalizedPrefix(prefix))
{
}

QString PathCodec::prefix() const
{
    return mPrefix;
}

bool PathCodec::parsePath(const QString &path, Resource *resource, QString *errorMessage) const
{
    QString relative = path;
    int query = relative.indexOf(QLatin1Char('?'));
    if (query >= 0)
        relative.truncate(query);
    if (!relative.startsWith(QLatin1Char('/')))
        relative.prepend(QLatin1Char('/'));
    if (!mPrefix.isEmpty()
        && (relative == mPrefix
            || relative.startsWith(mPrefix + QLatin1Char('/')))) {
        relative = relative.mid(mPrefix.length());
    }

    QStringList segments;
    for (const QString &segment : relative.split(QLatin1Char('/'), QString::SkipEmptyParts)) {
        segments.append(QUrl::fromPercentEncoding(segment.toUtf8()));
    }

    Resource parsed;
    switch (segments.count()) {
    case 0:
        parsed.type = Resource::ServiceRoot;
        break;
    case 1:
        parsed.type = Resource::Principal;
        parsed.userId = segments[0];
        break;
    case 2:
    case 3:
    case 4:
        if (segments[1] != CAL_SEGMENT) {
            setError(errorMessage, QStringLiteral("invalid path: expected '/<userid>/%1', got '%2'")
                     .arg(CAL_SEGMENT, path));
            return false;
        }
        parsed.userId = segments[0];
        if (segments.count() == 2) {
            parsed.type = Resource::HomeSet;
        } else if (segments.count() == 3) {
            parsed.type = Resource::Collection;
            parsed.calendarId = segments[2];
        } else {
            parsed.type = Resource::Object;
            parsed.calendarId = segments[2];
            parsed.objectId = segments[3];
        }
        break;
    default:
        setError(errorMessage, QStringLiteral("invalid path: too many segments (%1)")
                 .arg(segments.count()));
        return false;
    }
    parsed.uri = path;

    if (resource)
        *resource = parsed;
    return true;
}

bool PathCodec::encodePath(const Resource &resource, QString *path, QString *errorMessage) const
{
    QString result;
    switch (resource.type) {
    case Resource::ServiceRoot:
        result = mPrefix + QLatin1Char('/');
        break;
    case Resource::Principal:
        if (resource.userId.isEmpty()) {
            setError(errorMessage, QStringLiteral("invalid resource: principal must have a UserID"));
            return false;
        }
        result = QStringLiteral("%1/%2/").arg(mPrefix, encodeSegment(resource.userId));
        break;
    case Resource::HomeSet:
        if (resource.userId.isEmpty()) {
            setError(errorMessage, QStringLiteral("invalid resource: home set must have a UserID"));
            return false;
        }
        result = QStringLiteral("%1/%2/%3/").arg(mPrefix, encodeSegment(resource.userId), CAL_SEGMENT);
        break;
    case Resource::Collection:
        if (resource.userId.isEmpty() || resource.calendarId.isEmpty()) {
            setError(errorMessage, QStringLiteral("invalid resource: collection must have UserID and CalendarID"));
            return false;
        }
        result = QStringLiteral("%1/%2/%3/%4/").arg(mPrefix, encodeSegment(resource.userId),
                                                    CAL_SEGMENT, encodeSegment(resource.calendarId));
        break;
    case Resource::Object:
        if (resource.userId.isEmpty() || resource.calendarId.isEmpty() || resource.objectId.isEmpty()) {
            setError(errorMessage, QStringLiteral("invalid resource: object must have UserID, CalendarID, and ObjectID"));
            return false;
        }
        result = QStringLiteral("%1/%2/%3/%4/%5").arg(mPrefix, encodeSegment(resource.userId),
                                                      CAL_SEGMENT, encodeSegment(resource.calendarId),
                                                      encodeSegment(resource.objectId));
        break;
    default:
        setError(errorMessage, QStringLiteral("invalid resource: unknown resource type"));
        return false;
    }

    if (path)
        *path = result;
    return true;
}

QString PathCodec::href(const Resource &resource) const
{
    QString path, errorMessage;
    if (!encodePath(resource, &path, &errorMessage)) {
        qCWarning(lcCalDav) << "Cannot encode path for" << Resource::typeName(resource.type)
                            << "resource:" << errorMessage;
        return QString();
    }
    return path;
}
