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

#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include <handler.h>
#include <memorystorage.h>
#include <settings.h>

#include "httpserver.h"

static bool seedUser(CalDav::MemoryStorage *storage, const QString &userId,
                     const QString &password, const QString &calendarId)
{
    if (!storage->registerUser(userId, password))
        return false;
    if (calendarId.isEmpty())
        return true;

    CalDav::Calendar calendar;
    calendar.id = calendarId;
    calendar.displayName = calendarId;
    calendar.color = QStringLiteral("#4285F4");
    calendar.supportedComponents = QStringList() << QStringLiteral("VEVENT")
                                                 << QStringLiteral("VTODO")
                                                 << QStringLiteral("VJOURNAL");
    const CalDav::Storage::Status status = storage->createCalendar(userId, &calendar);
    if (status != CalDav::Storage::NoError) {
        qWarning() << "cannot create calendar" << calendarId << "for" << userId
                   << CalDav::Storage::statusMessage(status);
        return false;
    }
    return true;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("caldavd");

    QCommandLineParser parser;
    parser.setApplicationDescription("Standalone CalDAV server keeping calendars in memory.");
    parser.addHelpOption();

    parser.addOption(QCommandLineOption(QStringList() << "c" << "config",
                                        "read settings and users from an INI file.", "file"));
    parser.addOption(QCommandLineOption(QStringList() << "a" << "address",
                                        "address to listen on (default is localhost).", "address"));
    parser.addOption(QCommandLineOption(QStringList() << "p" << "port",
                                        "port to listen on (default is 8080).", "port"));
    parser.addOption(QCommandLineOption(QStringList() << "P" << "prefix",
                                        "path prefix of all DAV resources (like /caldav).", "path"));
    parser.addOption(QCommandLineOption(QStringList() << "r" << "realm",
                                        "realm announced for Basic authentication.", "realm"));
    parser.addOption(QCommandLineOption(QStringList() << "u" << "user",
                                        "register a user, can be repeated.", "id:password"));
    parser.addOption(QCommandLineOption(QStringList() << "C" << "calendar",
                                        "calendar created for every user (default is 'default', empty for none).",
                                        "id", QStringLiteral("default")));
    parser.addOption(QCommandLineOption(QStringList() << "v" << "verbose",
                                        "log requests and replies."));

    parser.process(app);

    if (parser.isSet("verbose")) {
        QLoggingCategory::setFilterRules(QStringLiteral("caldav.*.debug=true"));
    }

    CalDav::Settings settings;
    QStringList users;
    if (parser.isSet("config")) {
        QString errorMessage;
        if (!settings.load(parser.value("config"), &errorMessage)) {
            qWarning() << "cannot load configuration:" << errorMessage;
            return 1;
        }
        QSettings ini(parser.value("config"), QSettings::IniFormat);
        ini.beginGroup(QStringLiteral("users"));
        for (const QString &key : ini.childKeys())
            users.append(key + QLatin1Char(':') + ini.value(key).toString());
        ini.endGroup();
    }

    if (parser.isSet("address")) {
        QHostAddress address;
        if (!address.setAddress(parser.value("address"))) {
            qWarning() << "invalid listen address" << parser.value("address");
            return 1;
        }
        settings.setListenAddress(address);
    }
    if (parser.isSet("port")) {
        bool ok = false;
        const uint port = parser.value("port").toUInt(&ok);
        if (!ok || port > 65535) {
            qWarning() << "invalid port" << parser.value("port");
            return 1;
        }
        settings.setPort(quint16(port));
    }
    if (parser.isSet("prefix"))
        settings.setPathPrefix(parser.value("prefix"));
    if (parser.isSet("realm"))
        settings.setRealm(parser.value("realm"));
    users += parser.values("user");

    CalDav::MemoryStorage storage;
    for (const QString &user : users) {
        const int colon = user.indexOf(QLatin1Char(':'));
        if (colon <= 0) {
            qWarning() << "wrong user format. Awaited id:password.";
            return 1;
        }
        if (!seedUser(&storage, user.left(colon), user.mid(colon + 1), parser.value("calendar"))) {
            qWarning() << "cannot register user" << user.left(colon);
            return 1;
        }
    }
    if (users.isEmpty())
        qWarning() << "no user registered, every request will be rejected.";

    CalDav::Handler handler(&storage, settings);
    CalDav::HttpServer server(&handler);
    if (!server.listen(settings.listenAddress(), settings.port())) {
        qWarning() << "cannot start server:" << server.errorString();
        return 1;
    }

    QTextStream(stdout) << "CalDAV server listening on http://"
                        << server.serverAddress().toString() << ':' << server.serverPort()
                        << settings.pathPrefix() << "/" << endl;
    return app.exec();
}
