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

#include <QtTest>
#include <QObject>
#include <QTcpSocket>
#include <QThread>

#include <memorystorage.h>
#include <handler.h>
#include <settings.h>

#include "httpserver.h"

using namespace CalDav;

namespace {
const QByteArray WELL_KNOWN_REQUEST("GET /.well-known/caldav HTTP/1.1\r\nHost: localhost\r\n\r\n");

class SlowStorage : public MemoryStorage
{
public:
    Status authUser(const QString &username, const QString &password, QString *userId) override
    {
        QThread::msleep(300);
        return MemoryStorage::authUser(username, password, userId);
    }
};

class Client
{
public:
    explicit Client(quint16 port)
    {
        QObject::connect(&mSocket, &QTcpSocket::readyRead, [this]() { mReceived += mSocket.readAll(); });
        mSocket.connectToHost(QHostAddress::LocalHost, port);
    }

    QTcpSocket mSocket;
    QByteArray mReceived;
};
}

class tst_HttpServer : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void pipelinedRequests();
    void malformedRequestLine();
    void clientLeavesDuringRequest();

private:
    SlowStorage *mStorage = nullptr;
    Handler *mHandler = nullptr;
    HttpServer *mServer = nullptr;
};

void tst_HttpServer::init()
{
    mStorage = new SlowStorage;
    QVERIFY(mStorage->registerUser(QStringLiteral("alice"), QStringLiteral("pw")));
    Settings settings;
    settings.setPathPrefix(QStringLiteral("/dav"));
    mHandler = new Handler(mStorage, settings);
    mServer = new HttpServer(mHandler);
    QVERIFY(mServer->listen(QHostAddress::LocalHost, 0));
}

void tst_HttpServer::cleanup()
{
    delete mServer;
    mServer = nullptr;
    delete mHandler;
    mHandler = nullptr;
    delete mStorage;
    mStorage = nullptr;
}

void tst_HttpServer::pipelinedRequests()
{
    Client client(mServer->serverPort());
    QTRY_COMPARE(client.mSocket.state(), QAbstractSocket::ConnectedState);
    client.mSocket.write(WELL_KNOWN_REQUEST + WELL_KNOWN_REQUEST);

    QTRY_COMPARE(client.mReceived.count("HTTP/1.1 301 Moved Permanently\r\n"), 2);
    QVERIFY(client.mReceived.contains("Location: /dav/\r\n"));
    QCOMPARE(client.mSocket.state(), QAbstractSocket::ConnectedState);
}

void tst_HttpServer::malformedRequestLine()
{
    Client client(mServer->serverPort());
    QTRY_COMPARE(client.mSocket.state(), QAbstractSocket::ConnectedState);
    client.mSocket.write("NONSENSE\r\n\r\n");

    QTRY_VERIFY(client.mReceived.startsWith("HTTP/1.1 400 "));
    QVERIFY(client.mReceived.contains("Connection: close\r\n"));
    QTRY_COMPARE(client.mSocket.state(), QAbstractSocket::UnconnectedState);
}

void tst_HttpServer::clientLeavesDuringRequest()
{
    Client leaving(mServer->serverPort());
    QTRY_COMPARE(leaving.mSocket.state(), QAbstractSocket::ConnectedState);
    leaving.mSocket.write("PROPFIND /dav/alice/cal/ HTTP/1.1\r\n"
                          "Authorization: Basic " + QByteArray("alice:pw").toBase64() + "\r\n"
                          "Depth: 0\r\n\r\n");
    QTRY_COMPARE(leaving.mSocket.bytesToWrite(), qint64(0));
    leaving.mSocket.abort();

    Client staying(mServer->serverPort());
    QTRY_COMPARE(staying.mSocket.state(), QAbstractSocket::ConnectedState);
    staying.mSocket.write(WELL_KNOWN_REQUEST);
    QTRY_VERIFY(staying.mReceived.startsWith("HTTP/1.1 301 "));

    // Give the abandoned request time to finish on the pool.
    QTest::qWait(500);
    staying.mReceived.clear();
    staying.mSocket.write(WELL_KNOWN_REQUEST);
    QTRY_VERIFY(staying.mReceived.startsWith("HTTP/1.1 301 "));
    QVERIFY(leaving.mReceived.isEmpty());
}

QTEST_MAIN(tst_HttpServer)
#include "tst_httpserver.moc"
