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

#ifndef HANDLER_H
#define HANDLER_H

#include <QString>
#include <QByteArray>
#include <QList>
#include <QPair>
#include <QDomDocument>

#include "caldavexport.h"
#include "davtypes.h"
#include "pathcodec.h"
#include "settings.h"
#include "storage.h"
#include "properties.h"
#include "cancellation.h"

namespace CalDav {

struct PropertyRequest;
struct ReportRequest;
typedef QList<QPair<QByteArray, QByteArray> > HeaderList;

struct CALDAV_EXPORT Request {
    QByteArray method;
    // Path and query string, percent-encoded as received.
    QString path;
    HeaderList headers;
    QByteArray body;
    const CancellationToken *token = nullptr;

    // Case-insensitive lookup, returns the first occurrence.
    QByteArray header(const QByteArray &name) const;
    bool hasHeader(const QByteArray &name) const;
    void setHeader(const QByteArray &name, const QByteArray &value);
};

struct CALDAV_EXPORT Reply {
    int status = 200;
    HeaderList headers;
    QByteArray body;

    QByteArray header(const QByteArray &name) const;
    void setHeader(const QByteArray &name, const QByteArray &value);

    static QByteArray reasonPhrase(int status);
};

/* Implements the CalDAV methods on top of a Storage. One instance
   serves any number of requests, possibly concurrently, as long as the
   storage is thread-safe. */
class CALDAV_EXPORT Handler
{
public:
    Handler(Storage *storage, const Settings &settings);

    Reply handle(const Request &request);

    const Settings &settings() const;

private:
    Reply handleOptions(const Resource &resource);
    Reply handlePropfind(const Request &request, const Resource &resource);
    Reply handleReport(const Request &request, const Resource &resource);
    Reply handleGet(const Request &request, const Resource &resource, bool withBody);
    Reply handlePut(const Request &request, const Resource &resource);
    Reply handleDelete(const Request &request, const Resource &resource);
    Reply handleMkCalendar(const Request &request, const Resource &resource);

    Reply calendarQuery(const Request &request, const Resource &resource,
                        const ReportRequest &report);
    Reply calendarMultiget(const Request &request, const Resource &resource,
                           const ReportRequest &report);

    int authenticate(const Request &request, QString *userId);
    bool checkExists(const Resource &resource, Reply *failure);
    bool render(const Resource &resource, const PropertyRequest &properties,
                const CalendarObject *preloaded, QDomDocument *document);

    Reply multistatus(const QList<QDomDocument> &documents);
    Reply error(int status, const QString &message = QString()) const;
    Reply storageError(Storage::Status status, const QString &what) const;

    Storage *mStorage;
    Settings mSettings;
    PathCodec mCodec;
};
}

#endif
