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

#include "handler.h"
#include "davrequest.h"
#include "incidencehandler.h"
#include "matcher.h"
#include "multistatus.h"
#include "resolver.h"
#include "treewalker.h"
#include "logging_p.h"

#include <QRegularExpression>
#include <QStringList>

using namespace CalDav;

namespace {
    const QByteArray DAV_CAPABILITIES("1, 3, calendar-access");
    const QByteArray ALLOWED_METHODS("OPTIONS, GET, HEAD, PUT, DELETE, PROPFIND, REPORT, MKCALENDAR, MKCOL");
    const QByteArray XML_CONTENT_TYPE("application/xml; charset=utf-8");
    const QByteArray ICS_CONTENT_TYPE("text/calendar; charset=utf-8");
    const QString WELL_KNOWN_PATH = QStringLiteral("/.well-known/caldav");

    QByteArray findHeader(const HeaderList &headers, const QByteArray &name)
    {
        for (const QPair<QByteArray, QByteArray> &header : headers) {
            if (qstricmp(header.first.constData(), name.constData()) == 0)
                return header.second;
        }
        return QByteArray();
    }

    void replaceHeader(HeaderList *headers, const QByteArray &name, const QByteArray &value)
    {
        for (QPair<QByteArray, QByteArray> &header : *headers) {
            if (qstricmp(header.first.constData(), name.constData()) == 0) {
                header.second = value;
                return;
            }
        }
        headers->append(qMakePair(name, value));
    }

    // Matches an If-Match or If-None-Match list against an etag.
    bool etagListMatches(const QByteArray &list, const QString &etag)
    {
        const QList<QByteArray> tags = list.split(',');
        for (const QByteArray &tag : tags) {
            const QByteArray trimmed = tag.trimmed();
            if (trimmed == "*")
                return true;
            QByteArray weakless = trimmed;
            if (weakless.startsWith("W/"))
                weakless = weakless.mid(2);
            if (!etag.isEmpty() && QString::fromUtf8(weakless) == etag)
                return true;
        }
        return false;
    }

    QString debuggingString(const QByteArray &firstLine, const HeaderList &headers, const QByteArray &data)
    {
        QStringList text;
        text += "---------------------------------------------------------------------";
        text += QString::fromLatin1(firstLine);
        for (const QPair<QByteArray, QByteArray> &header : headers) {
            if (qstricmp(header.first.constData(), "Authorization") == 0)
                text += QString::fromLatin1(header.first) + " : <hidden>";
            else
                text += QString::fromLatin1(header.first + " : " + header.second);
        }
        text += "Data:";
        text += QString::fromUtf8(data);
        text += "---------------------------------------------------------------------\n";
        return text.join(QLatin1String("\n"));
    }

    void debugLines(const QString &text)
    {
        const QStringList lines = text.split('\n', QString::SkipEmptyParts);
        for (QString line : lines) {
            qCDebug(lcCalDavProtocol) << line.replace('\r', ' ');
        }
    }

    bool parseDepth(const QByteArray &value, int *depth)
    {
        const QByteArray trimmed = value.trimmed().toLower();
        if (trimmed.isEmpty() || trimmed == "infinity") {
            *depth = TreeWalker::INFINITE_DEPTH;
        } else if (trimmed == "0") {
            *depth = 0;
        } else if (trimmed == "1") {
            *depth = 1;
        } else {
            return false;
        }
        return true;
    }
}

QByteArray Request::header(const QByteArray &name) const
{
    return findHeader(headers, name);
}

bool Request::hasHeader(const QByteArray &name) const
{
    for (const QPair<QByteArray, QByteArray> &header : headers) {
        if (qstricmp(header.first.constData(), name.constData()) == 0)
            return true;
    }
    return false;
}

void Request::setHeader(const QByteArray &name, const QByteArray &value)
{
    replaceHeader(&headers, name, value);
}

QByteArray Reply::header(const QByteArray &name) const
{
    return findHeader(headers, name);
}

void Reply::setHeader(const QByteArray &name, const QByteArray &value)
{
    replaceHeader(&headers, name, value);
}

QByteArray Reply::reasonPhrase(int status)
{
    switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 207: return "Multi-Status";
    case 301: return "Moved Permanently";
    case 304: return "Not Modified";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 412: return "Precondition Failed";
    case 413: return "Payload Too Large";
    case 415: return "Unsupported Media Type";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 503: return "Service Unavailable";
    default: break;
    }
    return "Unknown";
}

Handler::Handler(Storage *storage, const Settings &settings)
    : mStorage(storage)
    , mSettings(settings)
    , mCodec(settings.pathPrefix())
{
}

const Settings &Handler::settings() const
{
    return mSettings;
}

Reply Handler::error(int status, const QString &message) const
{
    Reply reply;
    reply.status = status;
    reply.setHeader("Content-Type", "text/plain; charset=utf-8");
    reply.body = message.isEmpty() ? Reply::reasonPhrase(status) : message.toUtf8();
    if (status == 405)
        reply.setHeader("Allow", ALLOWED_METHODS);
    return reply;
}

Reply Handler::storageError(Storage::Status status, const QString &what) const
{
    const QString message = QStringLiteral("%1: %2").arg(what, Storage::statusMessage(status));
    switch (status) {
    case Storage::NotFound:
        return error(404, message);
    case Storage::InvalidInput:
        return error(400, message);
    case Storage::PermissionDenied:
        return error(403, message);
    case Storage::Conflict:
        return error(409, message);
    case Storage::Unavailable:
        return error(503, message);
    default:
        break;
    }
    qCWarning(lcCalDav) << "Storage failure," << message;
    return error(500, message);
}

Reply Handler::handle(const Request &request)
{
    debugLines(debuggingString(request.method + ' ' + request.path.toUtf8(), request.headers, request.body));

    Reply reply;
    QString path = request.path;
    const int query = path.indexOf(QLatin1Char('?'));
    if (query >= 0)
        path.truncate(query);

    if (request.token && request.token->isCancelled()) {
        reply = error(503, QStringLiteral("request cancelled"));
    } else if (path == WELL_KNOWN_PATH || path == WELL_KNOWN_PATH + QLatin1Char('/')) {
        reply.status = 301;
        reply.setHeader("Location", (mCodec.prefix() + QLatin1Char('/')).toUtf8());
    } else {
        QString userId;
        const int authStatus = authenticate(request, &userId);
        Resource resource;
        QString parseError;
        if (authStatus != 200) {
            reply = error(authStatus);
            if (authStatus == 401) {
                reply.setHeader("WWW-Authenticate",
                                QStringLiteral("Basic realm=\"%1\"").arg(mSettings.realm()).toUtf8());
            }
        } else if (!mCodec.parsePath(path, &resource, &parseError)) {
            qCDebug(lcCalDav) << "Cannot resolve" << path << parseError;
            reply = error(404, parseError);
        } else {
            if (resource.type == Resource::ServiceRoot)
                resource.userId = userId;

            const QByteArray method = request.method.toUpper();
            if (resource.userId != userId) {
                qCDebug(lcCalDav) << userId << "is not allowed to access" << path;
                reply = error(403, QStringLiteral("access to resources of another user"));
            } else if (method == "OPTIONS") {
                reply = handleOptions(resource);
            } else if (method == "PROPFIND") {
                reply = handlePropfind(request, resource);
            } else if (method == "REPORT") {
                reply = handleReport(request, resource);
            } else if (method == "GET") {
                reply = handleGet(request, resource, true);
            } else if (method == "HEAD") {
                reply = handleGet(request, resource, false);
            } else if (method == "PUT") {
                reply = handlePut(request, resource);
            } else if (method == "DELETE") {
                reply = handleDelete(request, resource);
            } else if (method == "MKCALENDAR" || method == "MKCOL") {
                reply = handleMkCalendar(request, resource);
            } else {
                qCDebug(lcCalDav) << "Method not allowed:" << request.method;
                reply = error(405);
            }
        }
    }

    if (reply.header("DAV").isEmpty())
        reply.setHeader("DAV", DAV_CAPABILITIES);
    debugLines(debuggingString("HTTP/1.1 " + QByteArray::number(reply.status) + ' '
                               + Reply::reasonPhrase(reply.status),
                               reply.headers, reply.body));
    return reply;
}

int Handler::authenticate(const Request &request, QString *userId)
{
    const QByteArray authorization = request.header("Authorization").trimmed();
    if (authorization.isEmpty())
        return 401;

    if (!authorization.toLower().startsWith("basic ")) {
        qCWarning(lcCalDav) << "Invalid Authorization header format";
        return 400;
    }
    const QByteArray encoded = authorization.mid(6).trimmed();
    static const QRegularExpression base64(QStringLiteral("^[A-Za-z0-9+/]*={0,2}$"));
    if (!base64.match(QString::fromLatin1(encoded)).hasMatch() || encoded.size() % 4 != 0) {
        qCWarning(lcCalDav) << "Invalid base64 credentials";
        return 400;
    }
    const QString credentials = QString::fromUtf8(QByteArray::fromBase64(encoded));
    const int colon = credentials.indexOf(QLatin1Char(':'));
    if (colon < 0) {
        qCWarning(lcCalDav) << "Invalid format for decoded credentials";
        return 400;
    }
    const QString username = credentials.left(colon);
    const QString password = credentials.mid(colon + 1);
    if (username.isEmpty())
        return 401;

    const Storage::Status status = mStorage->authUser(username, password, userId);
    switch (status) {
    case Storage::NoError:
        return 200;
    case Storage::NotFound:
    case Storage::PermissionDenied:
        qCDebug(lcCalDav) << "Authentication failed for user" << username;
        return 401;
    case Storage::Unavailable:
        return 503;
    default:
        qCWarning(lcCalDav) << "Cannot authenticate" << username << Storage::statusMessage(status);
        return 500;
    }
}

bool Handler::checkExists(const Resource &resource, Reply *failure)
{
    Storage::Status status = Storage::NoError;
    switch (resource.type) {
    case Resource::ServiceRoot:
        break;
    case Resource::Principal:
    case Resource::HomeSet:
        status = mStorage->getUser(resource.userId, nullptr);
        break;
    case Resource::Collection:
        status = mStorage->getCalendar(resource.userId, resource.calendarId, nullptr);
        break;
    case Resource::Object:
        status = mStorage->getObject(resource.userId, resource.calendarId, resource.objectId, nullptr);
        break;
    default:
        status = Storage::NotFound;
        break;
    }
    if (status == Storage::NoError)
        return true;
    *failure = storageError(status, QStringLiteral("cannot find %1").arg(Resource::typeName(resource.type)));
    return false;
}

bool Handler::render(const Resource &resource, const PropertyRequest &properties,
                     const CalendarObject *preloaded, QDomDocument *document)
{
    ResolverEnvironment env(mStorage, mSettings, resource, preloaded);
    QString href;
    if (!env.resourceHref(&href))
        return false;

    if (properties.kind == PropertyRequest::PropName) {
        *document = MultistatusBuilder::buildNames(href, PropertyResolver::names(resource.type));
    } else {
        PropertyMap map = properties.emptyMap();
        PropertyResolver::resolve(env, &map);
        *document = MultistatusBuilder::build(href, map);
    }
    return true;
}

Reply Handler::multistatus(const QList<QDomDocument> &documents)
{
    QDomDocument merged;
    QString errorMessage;
    if (documents.isEmpty()) {
        merged = MultistatusBuilder::buildEmpty();
    } else if (!MultistatusMerger::merge(documents, &merged, &errorMessage)) {
        return error(500, errorMessage);
    }

    Reply reply;
    reply.status = 207;
    reply.setHeader("Content-Type", XML_CONTENT_TYPE);
    reply.body = merged.toByteArray(1);
    return reply;
}

Reply Handler::handleOptions(const Resource &resource)
{
    Q_UNUSED(resource)
    Reply reply;
    reply.status = 200;
    reply.setHeader("Allow", ALLOWED_METHODS);
    reply.setHeader("DAV", DAV_CAPABILITIES);
    return reply;
}

Reply Handler::handlePropfind(const Request &request, const Resource &resource)
{
    int depth = 0;
    if (!parseDepth(request.header("Depth"), &depth))
        return error(400, QStringLiteral("invalid Depth header"));

    PropertyRequest properties;
    QString errorMessage;
    if (!PropertyRequest::fromData(request.body, &properties, &errorMessage))
        return error(400, errorMessage);

    Reply failure;
    if (!checkExists(resource, &failure))
        return failure;

    QList<Resource> resources;
    resources.append(resource);
    TreeWalker walker(mStorage, request.token);
    if (!walker.fetchChildren(depth, resource, &resources)) {
        if (walker.error() == TreeWalker::Cancelled)
            return error(503, walker.errorMessage());
        return error(500, walker.errorMessage());
    }

    QList<QDomDocument> documents;
    for (const Resource &child : resources) {
        if (request.token && request.token->isCancelled())
            return error(503, QStringLiteral("request cancelled"));
        QDomDocument document;
        if (!render(child, properties, nullptr, &document))
            return error(500, QStringLiteral("cannot encode href of %1").arg(Resource::typeName(child.type)));
        documents.append(document);
    }
    qCDebug(lcCalDav) << "PROPFIND depth" << depth << "on" << request.path
                      << "returns" << documents.size() << "responses";
    return multistatus(documents);
}

Reply Handler::handleReport(const Request &request, const Resource &resource)
{
    ReportRequest report;
    QString errorMessage;
    if (!ReportRequest::fromData(request.body, &report, &errorMessage))
        return error(400, errorMessage);

    switch (report.kind) {
    case ReportRequest::CalendarQuery:
        return calendarQuery(request, resource, report);
    case ReportRequest::CalendarMultiget:
        return calendarMultiget(request, resource, report);
    default:
        break;
    }
    qCDebug(lcCalDav) << "Unsupported report" << report.name;
    return error(403, QStringLiteral("unsupported report: %1").arg(report.name));
}

Reply Handler::calendarQuery(const Request &request, const Resource &resource,
                             const ReportRequest &report)
{
    if (!report.filter.isNull()
        && report.filter.component.compare(QStringLiteral("VCALENDAR"), Qt::CaseInsensitive) != 0) {
        return error(400, QStringLiteral("calendar-query filter must start with a VCALENDAR comp-filter"));
    }

    QList<CalendarObject> candidates;
    if (resource.type == Resource::Collection) {
        const Storage::Status status = mStorage->getObjectByFilter(resource.userId, resource.calendarId,
                                                                   report.filter, &candidates);
        if (status != Storage::NoError)
            return storageError(status, QStringLiteral("cannot query %1").arg(resource.calendarId));
    } else if (resource.type == Resource::Object) {
        CalendarObject object;
        const Storage::Status status = mStorage->getObject(resource.userId, resource.calendarId,
                                                           resource.objectId, &object);
        if (status != Storage::NoError)
            return storageError(status, QStringLiteral("cannot query %1").arg(resource.objectId));
        candidates.append(object);
    } else {
        return error(403, QStringLiteral("calendar-query needs a calendar collection or object"));
    }

    QList<QDomDocument> documents;
    for (const CalendarObject &object : candidates) {
        if (request.token && request.token->isCancelled())
            return error(503, QStringLiteral("request cancelled"));
        if (!Matcher::matches(report.filter, object))
            continue;
        Resource target(Resource::Object, resource.userId, resource.calendarId, object.id);
        QDomDocument document;
        if (!render(target, report.properties, &object, &document))
            return error(500, QStringLiteral("cannot encode href of %1").arg(object.id));
        documents.append(document);
    }
    qCDebug(lcCalDav) << "calendar-query matched" << documents.size() << "of" << candidates.size() << "objects";
    return multistatus(documents);
}

Reply Handler::calendarMultiget(const Request &request, const Resource &resource,
                                const ReportRequest &report)
{
    if (resource.type != Resource::Collection && resource.type != Resource::Object)
        return error(403, QStringLiteral("calendar-multiget needs a calendar collection or object"));
    if (report.hrefs.isEmpty())
        return error(400, QStringLiteral("calendar-multiget without href"));

    QList<QDomDocument> documents;
    for (const QString &href : report.hrefs) {
        if (request.token && request.token->isCancelled())
            return error(503, QStringLiteral("request cancelled"));

        Resource target;
        if (!mCodec.parsePath(href, &target) || target.type != Resource::Object
            || target.userId != resource.userId) {
            documents.append(MultistatusBuilder::buildStatus(href, 404));
            continue;
        }
        CalendarObject object;
        const Storage::Status status = mStorage->getObject(target.userId, target.calendarId,
                                                           target.objectId, &object);
        if (status == Storage::NotFound) {
            documents.append(MultistatusBuilder::buildStatus(href, 404));
            continue;
        } else if (status != Storage::NoError) {
            documents.append(MultistatusBuilder::buildStatus(href, 500));
            continue;
        }
        QDomDocument document;
        if (!render(target, report.properties, &object, &document))
            return error(500, QStringLiteral("cannot encode href of %1").arg(href));
        documents.append(document);
    }
    return multistatus(documents);
}

Reply Handler::handleGet(const Request &request, const Resource &resource, bool withBody)
{
    if (resource.type != Resource::Object)
        return error(405, QStringLiteral("GET is only supported on calendar objects"));

    CalendarObject object;
    const Storage::Status status = mStorage->getObject(resource.userId, resource.calendarId,
                                                       resource.objectId, &object);
    if (status != Storage::NoError)
        return storageError(status, QStringLiteral("cannot get %1").arg(resource.objectId));

    Reply reply;
    reply.setHeader("ETag", object.etag.toUtf8());
    if (object.lastModified.isValid())
        reply.setHeader("Last-Modified", DateTimeProperty::toHttpDate(object.lastModified).toLatin1());

    const QByteArray ifNoneMatch = request.header("If-None-Match");
    if (!ifNoneMatch.isEmpty() && etagListMatches(ifNoneMatch, object.etag)) {
        reply.status = 304;
        return reply;
    }

    const QByteArray ics = IncidenceHandler::toIcs(object.incidences).toUtf8();
    if (ics.isEmpty())
        return error(500, QStringLiteral("cannot encode %1").arg(resource.objectId));

    reply.status = 200;
    reply.setHeader("Content-Type", ICS_CONTENT_TYPE);
    if (withBody)
        reply.body = ics;
    else
        reply.setHeader("Content-Length", QByteArray::number(ics.size()));
    return reply;
}

Reply Handler::handlePut(const Request &request, const Resource &resource)
{
    if (resource.type != Resource::Object)
        return error(405, QStringLiteral("PUT is only supported on calendar objects"));

    const QByteArray contentType = request.header("Content-Type").split(';').first().trimmed().toLower();
    if (contentType != "text/calendar")
        return error(415, QStringLiteral("expected text/calendar, got %1").arg(QString::fromLatin1(contentType)));
    if (request.body.size() > mSettings.maxResourceSize())
        return error(403, QStringLiteral("calendar object exceeds max-resource-size"));

    KCalendarCore::Incidence::List incidences;
    QString errorMessage;
    if (!IncidenceHandler::fromIcs(QString::fromUtf8(request.body), &incidences, &errorMessage))
        return error(400, errorMessage);

    Calendar calendar;
    Storage::Status status = mStorage->getCalendar(resource.userId, resource.calendarId, &calendar);
    if (status == Storage::NotFound)
        return error(409, QStringLiteral("calendar %1 does not exist").arg(resource.calendarId));
    if (status != Storage::NoError)
        return storageError(status, QStringLiteral("cannot get %1").arg(resource.calendarId));

    for (const KCalendarCore::Incidence::Ptr &incidence : incidences) {
        const QString component = componentName(*incidence);
        if (!calendar.supports(component))
            return error(403, QStringLiteral("calendar does not support %1").arg(component));
    }
    if (calendar.readOnly)
        return error(403, QStringLiteral("calendar %1 is read-only").arg(resource.calendarId));

    CalendarObject existing;
    status = mStorage->getObject(resource.userId, resource.calendarId, resource.objectId, &existing);
    if (status != Storage::NoError && status != Storage::NotFound)
        return storageError(status, QStringLiteral("cannot check %1").arg(resource.objectId));
    const bool exists = status == Storage::NoError;

    const QByteArray ifMatch = request.header("If-Match");
    if (!ifMatch.isEmpty() && (!exists || !etagListMatches(ifMatch, existing.etag)))
        return error(412, QStringLiteral("If-Match precondition failed"));
    const QByteArray ifNoneMatch = request.header("If-None-Match");
    if (!ifNoneMatch.isEmpty() && exists && etagListMatches(ifNoneMatch, existing.etag))
        return error(412, QStringLiteral("If-None-Match precondition failed"));

    CalendarObject object;
    object.id = resource.objectId;
    object.incidences = incidences;
    QString etag;
    status = mStorage->updateObject(resource.userId, resource.calendarId, &object, &etag);
    if (status != Storage::NoError)
        return storageError(status, QStringLiteral("cannot store %1").arg(resource.objectId));

    Reply reply;
    reply.status = exists ? 204 : 201;
    reply.setHeader("ETag", etag.toUtf8());
    if (!exists)
        reply.setHeader("Location", mCodec.href(resource).toUtf8());
    qCDebug(lcCalDav) << (exists ? "Updated" : "Created") << object.path << etag;
    return reply;
}

Reply Handler::handleDelete(const Request &request, const Resource &resource)
{
    if (resource.type != Resource::Object)
        return error(405, QStringLiteral("DELETE is only supported on calendar objects"));

    CalendarObject existing;
    Storage::Status status = mStorage->getObject(resource.userId, resource.calendarId,
                                                 resource.objectId, &existing);
    if (status != Storage::NoError)
        return storageError(status, QStringLiteral("cannot get %1").arg(resource.objectId));

    const QByteArray ifMatch = request.header("If-Match");
    if (!ifMatch.isEmpty() && !etagListMatches(ifMatch, existing.etag))
        return error(412, QStringLiteral("If-Match precondition failed"));

    status = mStorage->deleteObject(resource.userId, resource.calendarId, resource.objectId);
    if (status != Storage::NoError)
        return storageError(status, QStringLiteral("cannot delete %1").arg(resource.objectId));

    Reply reply;
    reply.status = 204;
    return reply;
}

Reply Handler::handleMkCalendar(const Request &request, const Resource &resource)
{
    if (resource.type != Resource::Collection)
        return error(405, QStringLiteral("MKCALENDAR can only create a calendar collection"));

    MkCalendarRequest mk;
    QString errorMessage;
    if (!MkCalendarRequest::fromData(request.body, &mk, &errorMessage))
        return error(400, errorMessage);

    Storage::Status status = mStorage->getCalendar(resource.userId, resource.calendarId, nullptr);
    if (status == Storage::NoError)
        return error(405, QStringLiteral("calendar %1 already exists").arg(resource.calendarId));
    if (status != Storage::NotFound)
        return storageError(status, QStringLiteral("cannot check %1").arg(resource.calendarId));

    Calendar calendar = mk.calendar;
    calendar.id = resource.calendarId;
    status = mStorage->createCalendar(resource.userId, &calendar);
    if (status == Storage::Conflict)
        return error(405, QStringLiteral("calendar %1 already exists").arg(resource.calendarId));
    if (status != Storage::NoError)
        return storageError(status, QStringLiteral("cannot create %1").arg(resource.calendarId));

    Reply reply;
    reply.status = 201;
    reply.setHeader("Location", mCodec.href(resource).toUtf8());
    return reply;
}
