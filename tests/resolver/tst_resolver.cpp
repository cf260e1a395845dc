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

#include <KCalendarCore/Event>

#include <resolver.h>
#include <memorystorage.h>

using namespace CalDav;

namespace {
class CountingStorage : public MemoryStorage
{
public:
    Status getUser(const QString &userId, User *user) override
    {
        ++userCalls;
        return failUser ? Unavailable : MemoryStorage::getUser(userId, user);
    }

    Status getCalendar(const QString &userId, const QString &calendarId, Calendar *calendar) override
    {
        ++calendarCalls;
        return failCalendar ? Unavailable : MemoryStorage::getCalendar(userId, calendarId, calendar);
    }

    Status getObject(const QString &userId, const QString &calendarId,
                     const QString &objectId, CalendarObject *object) override
    {
        ++objectCalls;
        return MemoryStorage::getObject(userId, calendarId, objectId, object);
    }

    int userCalls = 0;
    int calendarCalls = 0;
    int objectCalls = 0;
    bool failUser = false;
    bool failCalendar = false;
};

PropertyMap request(const QStringList &names)
{
    PropertyMap map;
    for (const QString &name : names)
        map.insert(name, PropertyResult());
    return map;
}

QString textOf(const PropertyResult &result)
{
    if (!result.isOk())
        return QString();
    return result.property().staticCast<TextProperty>()->value();
}
}

class tst_Resolver : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void serviceRoot();
    void principal();
    void homeSet();
    void collection();
    void readOnlyCollection();
    void objectWithPreload();
    void unknownNamesAreNotFound();
    void storageFailureIsIsolated();
    void missingCalendarIsNotFound();
    void environmentMemoizes();
    void propertyNames();

private:
    CountingStorage *mStorage = nullptr;
    Settings mSettings;
};

void tst_Resolver::init()
{
    mStorage = new CountingStorage;
    mSettings = Settings();
    mSettings.setPathPrefix(QStringLiteral("/dav"));

    QVERIFY(mStorage->registerUser(QStringLiteral("alice"), QStringLiteral("secret"), QStringLiteral("Alice")));
    Calendar work;
    work.id = QStringLiteral("work");
    work.displayName = QStringLiteral("Work");
    work.description = QStringLiteral("Office");
    work.color = QStringLiteral("#FF0000");
    QCOMPARE(mStorage->createCalendar(QStringLiteral("alice"), &work), Storage::NoError);
}

void tst_Resolver::cleanup()
{
    delete mStorage;
    mStorage = nullptr;
}

void tst_Resolver::serviceRoot()
{
    ResolverEnvironment env(mStorage, mSettings, Resource(Resource::ServiceRoot, QStringLiteral("alice")));
    PropertyMap map = request(QStringList() << QStringLiteral("displayname")
                                            << QStringLiteral("current-user-principal")
                                            << QStringLiteral("calendar-home-set")
                                            << QStringLiteral("current-user-privilege-set"));
    PropertyResolver::resolve(env, &map);

    QCOMPARE(textOf(map.value(QStringLiteral("displayname"))), QStringLiteral("CalDAV Service Root"));
    QCOMPARE(map.value(QStringLiteral("current-user-principal")).property().staticCast<HrefProperty>()->href(),
             QStringLiteral("/dav/alice/"));
    QCOMPARE(map.value(QStringLiteral("calendar-home-set")).property().staticCast<HrefProperty>()->href(),
             QStringLiteral("/dav/alice/cal/"));
    QCOMPARE(map.value(QStringLiteral("current-user-privilege-set")).property()
             .staticCast<PrivilegeSetProperty>()->privileges(),
             QStringList() << QStringLiteral("read") << QStringLiteral("read-acl")
                           << QStringLiteral("read-current-user-privilege-set"));
}

void tst_Resolver::principal()
{
    ResolverEnvironment env(mStorage, mSettings, Resource(Resource::Principal, QStringLiteral("alice")));
    PropertyMap map = request(QStringList() << QStringLiteral("displayname")
                                            << QStringLiteral("resourcetype")
                                            << QStringLiteral("calendar-user-address-set")
                                            << QStringLiteral("calendar-color")
                                            << QStringLiteral("timezone")
                                            << QStringLiteral("acl"));
    PropertyResolver::resolve(env, &map);

    QCOMPARE(textOf(map.value(QStringLiteral("displayname"))), QStringLiteral("Alice"));
    QCOMPARE(map.value(QStringLiteral("resourcetype")).property().staticCast<ResourceTypeProperty>()->kind(),
             ResourceTypeProperty::Principal);
    QCOMPARE(map.value(QStringLiteral("calendar-user-address-set")).property()
             .staticCast<HrefListProperty>()->hrefs(),
             QStringList() << QStringLiteral("mailto:alice@example.com"));
    QCOMPARE(textOf(map.value(QStringLiteral("calendar-color"))), QStringLiteral("#4285F4"));
    QCOMPARE(textOf(map.value(QStringLiteral("timezone"))), QStringLiteral("UTC"));

    const QList<AclProperty::Ace> aces = map.value(QStringLiteral("acl")).property()
        .staticCast<AclProperty>()->aces();
    QCOMPARE(aces.count(), 1);
    QCOMPARE(aces.first().principal, QStringLiteral("/dav/alice/"));
    QCOMPARE(aces.first().grant, QStringList() << QStringLiteral("read") << QStringLiteral("write"));
}

void tst_Resolver::homeSet()
{
    ResolverEnvironment env(mStorage, mSettings, Resource(Resource::HomeSet, QStringLiteral("alice")));
    PropertyMap map = request(QStringList() << QStringLiteral("displayname")
                                            << QStringLiteral("resourcetype")
                                            << QStringLiteral("supported-calendar-component-set")
                                            << QStringLiteral("max-resource-size")
                                            << QStringLiteral("schedule-inbox-url"));
    PropertyResolver::resolve(env, &map);

    QCOMPARE(textOf(map.value(QStringLiteral("displayname"))), QStringLiteral("Calendar Home"));
    QCOMPARE(map.value(QStringLiteral("resourcetype")).property().staticCast<ResourceTypeProperty>()->kind(),
             ResourceTypeProperty::HomeSet);
    QCOMPARE(map.value(QStringLiteral("supported-calendar-component-set")).property()
             .staticCast<ComponentSetProperty>()->components().count(), 4);
    QCOMPARE(map.value(QStringLiteral("max-resource-size")).property().staticCast<IntegerProperty>()->value(),
             mSettings.maxResourceSize());
    QCOMPARE(map.value(QStringLiteral("schedule-inbox-url")).error(), PropertyResult::NotFound);
}

void tst_Resolver::collection()
{
    ResolverEnvironment env(mStorage, mSettings,
                            Resource(Resource::Collection, QStringLiteral("alice"), QStringLiteral("work")));
    PropertyMap map = request(QStringList() << QStringLiteral("displayname")
                                            << QStringLiteral("calendar-description")
                                            << QStringLiteral("getctag")
                                            << QStringLiteral("getetag")
                                            << QStringLiteral("calendar-color")
                                            << QStringLiteral("color")
                                            << QStringLiteral("calendar-timezone")
                                            << QStringLiteral("current-user-privilege-set"));
    PropertyResolver::resolve(env, &map);

    QCOMPARE(textOf(map.value(QStringLiteral("displayname"))), QStringLiteral("Work"));
    QCOMPARE(textOf(map.value(QStringLiteral("calendar-description"))), QStringLiteral("Office"));
    QVERIFY(!textOf(map.value(QStringLiteral("getctag"))).isEmpty());
    QVERIFY(textOf(map.value(QStringLiteral("getetag"))).startsWith(QLatin1Char('"')));
    QCOMPARE(textOf(map.value(QStringLiteral("calendar-color"))), QStringLiteral("#FF0000"));
    QCOMPARE(textOf(map.value(QStringLiteral("color"))), QStringLiteral("#FF0000"));
    // No timezone was set on the calendar.
    QCOMPARE(map.value(QStringLiteral("calendar-timezone")).error(), PropertyResult::NotFound);
    QCOMPARE(map.value(QStringLiteral("current-user-privilege-set")).property()
             .staticCast<PrivilegeSetProperty>()->privileges(),
             QStringList() << QStringLiteral("read") << QStringLiteral("write"));
}

void tst_Resolver::readOnlyCollection()
{
    Calendar holidays;
    holidays.id = QStringLiteral("holidays");
    holidays.readOnly = true;
    QCOMPARE(mStorage->createCalendar(QStringLiteral("alice"), &holidays), Storage::NoError);

    ResolverEnvironment env(mStorage, mSettings,
                            Resource(Resource::Collection, QStringLiteral("alice"), QStringLiteral("holidays")));
    PropertyMap map = request(QStringList() << QStringLiteral("current-user-privilege-set"));
    PropertyResolver::resolve(env, &map);
    QCOMPARE(map.value(QStringLiteral("current-user-privilege-set")).property()
             .staticCast<PrivilegeSetProperty>()->privileges(),
             QStringList() << QStringLiteral("read"));
}

void tst_Resolver::objectWithPreload()
{
    KCalendarCore::Event::Ptr event(new KCalendarCore::Event);
    event->setUid(QStringLiteral("standup"));
    event->setSummary(QStringLiteral("Standup"));
    event->setDtStart(QDateTime(QDate(2024, 1, 15), QTime(9, 0), Qt::UTC));

    CalendarObject object;
    object.id = QStringLiteral("standup.ics");
    object.etag = QStringLiteral("\"preloaded\"");
    object.lastModified = QDateTime(QDate(2024, 1, 10), QTime(8, 0), Qt::UTC);
    object.incidences.append(event);

    ResolverEnvironment env(mStorage, mSettings,
                            Resource(Resource::Object, QStringLiteral("alice"),
                                     QStringLiteral("work"), QStringLiteral("standup.ics")),
                            &object);
    PropertyMap map = request(QStringList() << QStringLiteral("getetag")
                                            << QStringLiteral("getcontenttype")
                                            << QStringLiteral("getlastmodified")
                                            << QStringLiteral("calendar-data")
                                            << QStringLiteral("resourcetype"));
    PropertyResolver::resolve(env, &map);

    QCOMPARE(mStorage->objectCalls, 0);
    QCOMPARE(textOf(map.value(QStringLiteral("getetag"))), QStringLiteral("\"preloaded\""));
    QCOMPARE(textOf(map.value(QStringLiteral("getcontenttype"))), QStringLiteral("text/calendar"));
    QCOMPARE(map.value(QStringLiteral("getlastmodified")).property().staticCast<DateTimeProperty>()->value(),
             object.lastModified);
    const QString ics = textOf(map.value(QStringLiteral("calendar-data")));
    QVERIFY(ics.contains(QStringLiteral("BEGIN:VEVENT")));
    QVERIFY(ics.contains(QStringLiteral("UID:standup")));
    QCOMPARE(map.value(QStringLiteral("resourcetype")).property().staticCast<ResourceTypeProperty>()->kind(),
             ResourceTypeProperty::CalendarObject);

    QString href;
    QVERIFY(env.resourceHref(&href));
    QCOMPARE(href, QStringLiteral("/dav/alice/cal/work/standup.ics"));
}

void tst_Resolver::unknownNamesAreNotFound()
{
    ResolverEnvironment env(mStorage, mSettings, Resource(Resource::Principal, QStringLiteral("alice")));
    PropertyMap map = request(QStringList() << QStringLiteral("getctag") << QStringLiteral("calendar-data"));
    PropertyResolver::resolve(env, &map);
    QCOMPARE(map.value(QStringLiteral("getctag")).error(), PropertyResult::NotFound);
    QCOMPARE(map.value(QStringLiteral("calendar-data")).error(), PropertyResult::NotFound);
}

void tst_Resolver::storageFailureIsIsolated()
{
    mStorage->failCalendar = true;
    ResolverEnvironment env(mStorage, mSettings,
                            Resource(Resource::Collection, QStringLiteral("alice"), QStringLiteral("work")));
    PropertyMap map = request(QStringList() << QStringLiteral("displayname")
                                            << QStringLiteral("getctag")
                                            << QStringLiteral("resourcetype")
                                            << QStringLiteral("current-user-principal")
                                            << QStringLiteral("calendar-user-address-set"));
    PropertyResolver::resolve(env, &map);

    QCOMPARE(map.value(QStringLiteral("displayname")).error(), PropertyResult::Internal);
    QCOMPARE(map.value(QStringLiteral("getctag")).error(), PropertyResult::Internal);
    QVERIFY(map.value(QStringLiteral("resourcetype")).isOk());
    QVERIFY(map.value(QStringLiteral("current-user-principal")).isOk());
    QVERIFY(map.value(QStringLiteral("calendar-user-address-set")).isOk());
}

void tst_Resolver::missingCalendarIsNotFound()
{
    ResolverEnvironment env(mStorage, mSettings,
                            Resource(Resource::Collection, QStringLiteral("alice"), QStringLiteral("missing")));
    PropertyMap map = request(QStringList() << QStringLiteral("displayname") << QStringLiteral("getctag"));
    PropertyResolver::resolve(env, &map);
    QCOMPARE(map.value(QStringLiteral("displayname")).error(), PropertyResult::NotFound);
    QCOMPARE(map.value(QStringLiteral("getctag")).error(), PropertyResult::NotFound);
}

void tst_Resolver::environmentMemoizes()
{
    ResolverEnvironment env(mStorage, mSettings,
                            Resource(Resource::Collection, QStringLiteral("alice"), QStringLiteral("work")));
    PropertyMap map = request(QStringList() << QStringLiteral("displayname")
                                            << QStringLiteral("getctag")
                                            << QStringLiteral("getetag")
                                            << QStringLiteral("calendar-color")
                                            << QStringLiteral("acl")
                                            << QStringLiteral("calendar-user-address-set"));
    PropertyResolver::resolve(env, &map);
    QCOMPARE(mStorage->calendarCalls, 1);
    QCOMPARE(mStorage->userCalls, 1);

    // Failures are remembered too.
    mStorage->failUser = true;
    ResolverEnvironment failing(mStorage, mSettings, Resource(Resource::Principal, QStringLiteral("alice")));
    QCOMPARE(failing.user(nullptr), Storage::Unavailable);
    mStorage->failUser = false;
    QCOMPARE(failing.user(nullptr), Storage::Unavailable);
    QCOMPARE(mStorage->userCalls, 2);
}

void tst_Resolver::propertyNames()
{
    const QStringList collection = PropertyResolver::names(Resource::Collection);
    QVERIFY(collection.contains(QStringLiteral("getctag")));
    QVERIFY(collection.contains(QStringLiteral("supported-calendar-component-set")));
    QVERIFY(!collection.contains(QStringLiteral("schedule-inbox-url")));
    QVERIFY(!collection.contains(QStringLiteral("calendar-data")));
    QStringList sorted = collection;
    sorted.sort();
    QCOMPARE(collection, sorted);

    for (const QString &name : PropertyResolver::names(Resource::Object))
        QVERIFY2(PropertyCatalog::contains(name), qPrintable(name));
    QVERIFY(PropertyResolver::names(Resource::Unknown).isEmpty());
}

QTEST_MAIN(tst_Resolver)
#include "tst_resolver.moc"
