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

#include "httpserver.h"
#include "logging.h"

#include <QTcpServer>
#include <QTcpSocket>
#include <QRunnable>
#include <QMetaObject>

Q_LOGGING_CATEGORY(lcCalDavd, "caldav.daemon", QtWarningMsg)

using namespace CalDav;

namespace {
    const qint64 MAX_HEADER_SIZE = 64 * 1024;
    const qint64 MAX_BODY_SIZE = 64 * 1024 * 1024;

    // The server outlives its jobs, connections may not. Replies are
    // posted to the server, which looks the connection up by id.
    class HandlerJob : public QRunnable
    {
    public:
        HandlerJob(Handler *handler, HttpServer *server, quint64 connectionId,
                   const Request &request, const QSharedPointer<CancellationToken> &token)
            : mHandler(handler)
            , mServer(server)
            , mConnectionId(connectionId)
            , mRequest(request)
            , mToken(token)
        {
        }

        void run() override
        {
            const Reply reply = mHandler->handle(mRequest);
            if (mToken->isCancelled())
                return;
            QMetaObject::invokeMethod(mServer, "deliverReply", Qt::QueuedConnection,
                                      Q_ARG(quint64, mConnectionId),
                                      Q_ARG(CalDav::Reply, reply));
        }

    private:
        Handler *mHandler;
        HttpServer *mServer;
        quint64 mConnectionId;
        Request mRequest;
        QSharedPointer<CancellationToken> mToken;
    };
}

HttpServer::HttpServer(Handler *handler, QObject *parent)
    : QObject(parent)
    , mHandler(handler)
    , mServer(new QTcpServer(this))
{
    qRegisterMetaType<CalDav::Reply>();
    connect(mServer, &QTcpServer::newConnection, this, &HttpServer::newConnection);
}

HttpServer::~HttpServer()
{
    mServer->close();
    for (HttpConnection *connection : mConnections)
        delete connection;
    mConnections.clear();
    mPool.waitForDone();
}

bool HttpServer::listen(const QHostAddress &address, quint16 port)
{
    if (!mServer->listen(address, port)) {
        qCWarning(lcCalDavd) << "Cannot listen on" << address.toString() << port << ":" << mServer->errorString();
        return false;
    }
    qCInfo(lcCalDavd) << "Listening on" << mServer->serverAddress().toString() << mServer->serverPort();
    return true;
}

void HttpServer::close()
{
    mServer->close();
}

QHostAddress HttpServer::serverAddress() const
{
    return mServer->serverAddress();
}

quint16 HttpServer::serverPort() const
{
    return mServer->serverPort();
}

QString HttpServer::errorString() const
{
    return mServer->errorString();
}

void HttpServer::newConnection()
{
    while (mServer->hasPendingConnections()) {
        QTcpSocket *socket = mServer->nextPendingConnection();
        qCDebug(lcCalDavd) << "New connection from" << socket->peerAddress().toString();
        HttpConnection *connection = new HttpConnection(socket, ++mNextConnectionId, this);
        mConnections.insert(connection->id(), connection);
        connect(connection, &HttpConnection::closed, this, &HttpServer::connectionClosed);
    }
}

void HttpServer::connectionClosed()
{
    HttpConnection *connection = qobject_cast<HttpConnection *>(sender());
    if (!connection)
        return;
    mConnections.remove(connection->id());
    connection->deleteLater();
}

void HttpServer::startJob(quint64 connectionId, const Request &request,
                          const QSharedPointer<CancellationToken> &token)
{
    mPool.start(new HandlerJob(mHandler, this, connectionId, request, token));
}

void HttpServer::deliverReply(quint64 connectionId, const Reply &reply)
{
    HttpConnection *connection = mConnections.value(connectionId);
    if (!connection) {
        qCDebug(lcCalDavd) << "Dropping reply for closed connection" << connectionId;
        return;
    }
    connection->sendReply(reply);
}

HttpConnection::HttpConnection(QTcpSocket *socket, quint64 id, HttpServer *server)
    : QObject(server)
    , mSocket(socket)
    , mId(id)
    , mServer(server)
{
    mSocket->setParent(this);
    connect(mSocket, &QTcpSocket::readyRead, this, &HttpConnection::readClient);
    connect(mSocket, &QTcpSocket::disconnected, this, &HttpConnection::socketDisconnected);
}

HttpConnection::~HttpConnection()
{
    if (mToken)
        mToken->cancel();
}

quint64 HttpConnection::id() const
{
    return mId;
}

void HttpConnection::reset()
{
    mState = ReadingHeaders;
    mRequest = Request();
    mContentLength = 0;
    mToken.clear();
}

void HttpConnection::socketDisconnected()
{
    if (mToken) {
        qCDebug(lcCalDavd) << "Client went away, cancelling" << mRequest.method << mRequest.path;
        mToken->cancel();
    }
    emit closed();
}

bool HttpConnection::parseHead(const QByteArray &head)
{
    const QList<QByteArray> lines = head.split('\n');
    const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
    if (requestLine.size() != 3 || !requestLine.at(2).startsWith("HTTP/1."))
        return false;

    mRequest.method = requestLine.at(0);
    mRequest.path = QString::fromUtf8(requestLine.at(1));
    mKeepAlive = requestLine.at(2) == "HTTP/1.1";
    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        if (line.isEmpty())
            continue;
        const int colon = line.indexOf(':');
        if (colon <= 0)
            return false;
        mRequest.headers.append(qMakePair(line.left(colon).trimmed(), line.mid(colon + 1).trimmed()));
    }

    const QByteArray connection = mRequest.header("Connection").toLower();
    if (connection == "close")
        mKeepAlive = false;
    else if (connection == "keep-alive")
        mKeepAlive = true;

    bool ok = true;
    const QByteArray length = mRequest.header("Content-Length");
    mContentLength = length.isEmpty() ? 0 : length.toLongLong(&ok);
    return ok && mContentLength >= 0;
}

void HttpConnection::readClient()
{
    mBuffer += mSocket->readAll();

    if (mState == ReadingHeaders) {
        const int end = mBuffer.indexOf("\r\n\r\n");
        if (end < 0) {
            if (mBuffer.size() > MAX_HEADER_SIZE)
                sendError(431);
            return;
        }
        const QByteArray head = mBuffer.left(end);
        mBuffer.remove(0, end + 4);
        if (!parseHead(head)) {
            sendError(400);
            return;
        }
        if (!mRequest.header("Transfer-Encoding").isEmpty()) {
            sendError(501);
            return;
        }
        if (mContentLength > MAX_BODY_SIZE) {
            sendError(413);
            return;
        }
        mState = ReadingBody;
    }

    if (mState == ReadingBody) {
        if (mBuffer.size() < mContentLength)
            return;
        mRequest.body = mBuffer.left(mContentLength);
        mBuffer.remove(0, mContentLength);
        dispatch();
    }
}

void HttpConnection::dispatch()
{
    mState = Processing;
    mToken = QSharedPointer<CancellationToken>(new CancellationToken);
    mRequest.token = mToken.data();
    mServer->startJob(mId, mRequest, mToken);
}

void HttpConnection::sendError(int status)
{
    Reply reply;
    reply.status = status;
    reply.body = Reply::reasonPhrase(status);
    reply.setHeader("Content-Type", "text/plain; charset=utf-8");
    mKeepAlive = false;
    sendReply(reply);
}

void HttpConnection::sendReply(const Reply &reply)
{
    QByteArray data = "HTTP/1.1 " + QByteArray::number(reply.status) + ' '
        + Reply::reasonPhrase(reply.status) + "\r\n";
    for (const QPair<QByteArray, QByteArray> &header : reply.headers)
        data += header.first + ": " + header.second + "\r\n";
    if (reply.header("Content-Length").isEmpty())
        data += "Content-Length: " + QByteArray::number(reply.body.size()) + "\r\n";
    if (!mKeepAlive)
        data += "Connection: close\r\n";
    data += "\r\n";
    if (mRequest.method.toUpper() != "HEAD")
        data += reply.body;
    mSocket->write(data);

    const bool keepAlive = mKeepAlive;
    reset();
    if (!keepAlive) {
        mBuffer.clear();
        mSocket->disconnectFromHost();
    } else if (!mBuffer.isEmpty()) {
        readClient();
    }
}
