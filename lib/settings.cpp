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

#include "settings.h"
#include "logging_p.h"

#include <QFileInfo>
#include <QSettings>

using namespace CalDav;

Settings::Settings()
    : mRealm(QStringLiteral("CalDAV"))
    , mListenAddress(QHostAddress::LocalHost)
    , mPort(8080)
    , mMaxResourceSize(10485760)
    , mMinDateTime(QDateTime::fromMSecsSinceEpoch(0, Qt::UTC))
    , mMaxDateTime(QDate(9999, 12, 31), QTime(23, 59, 59), Qt::UTC)
    , mMaxInstances(100000)
    , mMaxAttendeesPerInstance(100)
{
}

void Settings::setPathPrefix(const QString &prefix)
{
    mPathPrefix = prefix;
}

QString Settings::pathPrefix() const
{
    return mPathPrefix;
}

void Settings::setRealm(const QString &realm)
{
    mRealm = realm;
}

QString Settings::realm() const
{
    return mRealm;
}

void Settings::setListenAddress(const QHostAddress &address)
{
    mListenAddress = address;
}

QHostAddress Settings::listenAddress() const
{
    return mListenAddress;
}

void Settings::setPort(quint16 port)
{
    mPort = port;
}

quint16 Settings::port() const
{
    return mPort;
}

void Settings::setMaxResourceSize(qint64 size)
{
    mMaxResourceSize = size;
}

qint64 Settings::maxResourceSize() const
{
    return mMaxResourceSize;
}

void Settings::setMinDateTime(const QDateTime &dateTime)
{
    mMinDateTime = dateTime;
}

QDateTime Settings::minDateTime() const
{
    return mMinDateTime;
}

void Settings::setMaxDateTime(const QDateTime &dateTime)
{
    mMaxDateTime = dateTime;
}

QDateTime Settings::maxDateTime() const
{
    return mMaxDateTime;
}

void Settings::setMaxInstances(int count)
{
    mMaxInstances = count;
}

int Settings::maxInstances() const
{
    return mMaxInstances;
}

void Settings::setMaxAttendeesPerInstance(int count)
{
    mMaxAttendeesPerInstance = count;
}

int Settings::maxAttendeesPerInstance() const
{
    return mMaxAttendeesPerInstance;
}

bool Settings::load(const QString &fileName, QString *errorMessage)
{
    if (!QFileInfo(fileName).isReadable()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("cannot read configuration file %1").arg(fileName);
        return false;
    }

    QSettings file(fileName, QSettings::IniFormat);
    if (file.status() != QSettings::NoError) {
        if (errorMessage)
            *errorMessage = QStringLiteral("malformed configuration file %1").arg(fileName);
        return false;
    }

    file.beginGroup(QStringLiteral("server"));
    mPathPrefix = file.value(QStringLiteral("prefix"), mPathPrefix).toString();
    mRealm = file.value(QStringLiteral("realm"), mRealm).toString();
    if (file.contains(QStringLiteral("address"))) {
        QHostAddress address;
        if (!address.setAddress(file.value(QStringLiteral("address")).toString())) {
            if (errorMessage)
                *errorMessage = QStringLiteral("invalid listen address in %1").arg(fileName);
            return false;
        }
        mListenAddress = address;
    }
    bool ok = true;
    const uint port = file.value(QStringLiteral("port"), mPort).toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        if (errorMessage)
            *errorMessage = QStringLiteral("invalid port in %1").arg(fileName);
        return false;
    }
    mPort = port;
    mMaxResourceSize = file.value(QStringLiteral("max-resource-size"), mMaxResourceSize).toLongLong();
    mMaxInstances = file.value(QStringLiteral("max-instances"), mMaxInstances).toInt();
    mMaxAttendeesPerInstance = file.value(QStringLiteral("max-attendees-per-instance"),
                                          mMaxAttendeesPerInstance).toInt();
    file.endGroup();

    qCDebug(lcCalDav) << "Loaded settings from" << fileName;
    return true;
}
