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

#ifndef HTTPSERVER_H
#define HTTPSERVER_H

#include <QObject>
#include <QHostAddress>
#include <QHash>
#include <QSharedPointer>
#include <QThreadPool>

#include "handler.h"

class QTcpServer;
class QTcpSocket;

namespace CalDav {

class HttpConnection;

/* HTTP/1.1 front end of a Handler. Requests are parsed on the
   thread owning the server and handled on a thread pool, one request
   at a time per connection. */
class HttpServer : public QObject
{
    Q_OBJECT

public:
    HttpServer(Handler *handler, QObject *parent = nullptr);
    ~HttpServer();

    bool listen(const QHostAddress &address, quint16 port);
    void close();

    QHostAddress serverAddress() const;
    quint16 serverPort() const;
    QString errorString() const;

    // Handles the request on the pool, the reply goes back to the
    // connection with the given id if it is still open.
    void startJob(quint64 connectionId, const Request &request,
                  const QSharedPointer<CancellationToken> &token);

private Q_SLOTS:
    void newConnection();
    void connectionClosed();
    void deliverReply(quint64 connectionId, const CalDav::Reply &reply);

private:
    Handler *mHandler;
    QTcpServer *mServer;
    QThreadPool mPool;
    QHash<quint64, HttpConnection *> mConnections;
    quint64 mNextConnectionId = 0;
};

class HttpConnection : public QObject
{
    Q_OBJECT

public:
    HttpConnection(QTcpSocket *socket, quint64 id, HttpServer *server);
    ~HttpConnection();

    quint64 id() const;
    void sendReply(const CalDav::Reply &reply);

Q_SIGNALS:
    void closed();

private Q_SLOTS:
    void readClient();
    void socketDisconnected();

private:
    enum State {
        ReadingHeaders,
        ReadingBody,
        Processing
    };

    bool parseHead(const QByteArray &head);
    void dispatch();
    void sendError(int status);
    void reset();

    QTcpSocket *mSocket;
    quint64 mId;
    HttpServer *mServer;
    QSharedPointer<CancellationToken> mToken;
    State mState = ReadingHeaders;
    QByteArray mBuffer;
    Request mRequest;
    qint64 mContentLength = 0;
    bool mKeepAlive = true;
};
}

Q_DECLARE_METATYPE(CalDav::Reply)

#endif // HTTPSERVER_H
