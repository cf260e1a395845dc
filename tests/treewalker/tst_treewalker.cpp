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

#include <treewalker.h>
#include <memorystorage.h>

using namespace CalDav;

namespace {
class BrokenStorage : public MemoryStorage
{
public:
    Status getUserCalendars(const QString &, QList<Calendar> *) override
    {
        return Unavailable;
    }
};

class StrayStorage : public MemoryStorage
{
public:
    Status getObjectPathsInCollection(const QString &, const QString &, QStringList *paths) override
    {
        *paths = QStringList() << QStringLiteral("/alice/cal/other/event1.ics");
        return NoError;
    }
};

CalendarObject makeEvent(const QString &id)
{
    KCalendarCore::Event::Ptr event(new KCalendarCore::Event);
    event->setUid(id);
    event->setSummary(id);
    event->setDtStart(QDateTime(QDate(2024, 3, 1), QTime(10, 0), Qt::UTC));
    event->setDtEnd(QDateTime(QDate(2024, 3, 1), QTime(11, 0), Qt::UTC));

    CalendarObject object;
    object.id = id + QStringLiteral(".ics");
    object.incidences.append(event);
    return object;
}
}

class tst_TreeWalker : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void depth_data();
    void depth();
    void homeSetSubtreeOrder();
    void leavesHaveNoChildren();
    void childrenCarryNoUri();
    void cancelled();
    void storageFailure();
    void missingCollection();
    void reservedCharacters_data();
    void reservedCharacters();
    void foreignObjectPath();

private:
    MemoryStorage *mStorage = nullptr;
    PathCodec mCodec = PathCodec(QStringLiteral("/dav"));
};

void tst_TreeWalker::init()
{
    mStorage = new MemoryStorage;
    QVERIFY(mStorage->registerUser(QStringLiteral("alice"), QStringLiteral("pw")));

    Calendar work;
    work.id = QStringLiteral("work");
    QCOMPARE(mStorage->createCalendar(QStringLiteral("alice"), &work), Storage::NoError);

    for (const QString &id : QStringList() << QStringLiteral("event1") << QStringLiteral("event2")) {
        CalendarObject object = makeEvent(id);
        QCOMPARE(mStorage->updateObject(QStringLiteral("alice"), QStringLiteral("work"), &object, nullptr),
                 Storage::NoError);
    }
}

void tst_TreeWalker::cleanup()
{
    delete mStorage;
    mStorage = nullptr;
}

void tst_TreeWalker::depth_data()
{
    QTest::addColumn<int>("type");
    QTest::addColumn<int>("depth");
    QTest::addColumn<int>("count");

    QTest::newRow("home set, depth 0") << int(Resource::HomeSet) << 0 << 0;
    QTest::newRow("home set, depth 1") << int(Resource::HomeSet) << 1 << 1;
    QTest::newRow("home set, depth 2") << int(Resource::HomeSet) << 2 << 3;
    QTest::newRow("home set, infinity") << int(Resource::HomeSet) << int(TreeWalker::INFINITE_DEPTH) << 3;
    QTest::newRow("collection, depth 0") << int(Resource::Collection) << 0 << 0;
    QTest::newRow("collection, depth 1") << int(Resource::Collection) << 1 << 2;
    QTest::newRow("collection, infinity") << int(Resource::Collection) << int(TreeWalker::INFINITE_DEPTH) << 2;
}

void tst_TreeWalker::depth()
{
    QFETCH(int, type);
    QFETCH(int, depth);
    QFETCH(int, count);

    const Resource parent(Resource::Type(type), QStringLiteral("alice"), QStringLiteral("work"));
    TreeWalker walker(mStorage);
    QList<Resource> children;
    QVERIFY(walker.fetchChildren(depth, parent, &children));
    QVERIFY(!walker.hasError());
    QCOMPARE(children.count(), count);
}

void tst_TreeWalker::homeSetSubtreeOrder()
{
    Calendar personal;
    personal.id = QStringLiteral("personal");
    QCOMPARE(mStorage->createCalendar(QStringLiteral("alice"), &personal), Storage::NoError);

    TreeWalker walker(mStorage);
    QList<Resource> children;
    QVERIFY(walker.fetchChildren(TreeWalker::INFINITE_DEPTH,
                                 Resource(Resource::HomeSet, QStringLiteral("alice")), &children));

    QList<Resource> expected;
    expected << Resource(Resource::Collection, QStringLiteral("alice"), QStringLiteral("personal"))
             << Resource(Resource::Collection, QStringLiteral("alice"), QStringLiteral("work"))
             << Resource(Resource::Object, QStringLiteral("alice"), QStringLiteral("work"), QStringLiteral("event1.ics"))
             << Resource(Resource::Object, QStringLiteral("alice"), QStringLiteral("work"), QStringLiteral("event2.ics"));
    QCOMPARE(children.count(), expected.count());
    for (int i = 0; i < expected.count(); ++i)
        QVERIFY2(children.at(i) == expected.at(i), qPrintable(QString::number(i)));
}

void tst_TreeWalker::leavesHaveNoChildren()
{
    TreeWalker walker(mStorage);
    QList<Resource> children;
    QVERIFY(walker.fetchChildren(TreeWalker::INFINITE_DEPTH,
                                 Resource(Resource::Object, QStringLiteral("alice"),
                                          QStringLiteral("work"), QStringLiteral("event1.ics")),
                                 &children));
    QVERIFY(children.isEmpty());
    QVERIFY(walker.fetchChildren(TreeWalker::INFINITE_DEPTH,
                                 Resource(Resource::Principal, QStringLiteral("alice")), &children));
    QVERIFY(children.isEmpty());
}

void tst_TreeWalker::childrenCarryNoUri()
{
    TreeWalker walker(mStorage);
    QList<Resource> children;
    QVERIFY(walker.fetchChildren(TreeWalker::INFINITE_DEPTH,
                                 Resource(Resource::HomeSet, QStringLiteral("alice")), &children));
    for (const Resource &child : children) {
        QVERIFY(child.uri.isEmpty());
        QCOMPARE(child.userId, QStringLiteral("alice"));
        QVERIFY(!mCodec.href(child).isEmpty());
    }
    QCOMPARE(mCodec.href(children.last()), QStringLiteral("/dav/alice/cal/work/event2.ics"));
}

void tst_TreeWalker::cancelled()
{
    CancellationToken token;
    token.cancel();
    TreeWalker walker(mStorage, &token);
    QList<Resource> children;
    QVERIFY(!walker.fetchChildren(1, Resource(Resource::HomeSet, QStringLiteral("alice")), &children));
    QCOMPARE(walker.error(), TreeWalker::Cancelled);
    QVERIFY(children.isEmpty());

    // Depth 0 has nothing to expand, so nothing to cancel.
    QVERIFY(walker.fetchChildren(0, Resource(Resource::HomeSet, QStringLiteral("alice")), &children));
    QCOMPARE(walker.error(), TreeWalker::NoError);
}

void tst_TreeWalker::storageFailure()
{
    BrokenStorage storage;
    TreeWalker walker(&storage);
    QList<Resource> children;
    QVERIFY(!walker.fetchChildren(1, Resource(Resource::HomeSet, QStringLiteral("alice")), &children));
    QCOMPARE(walker.error(), TreeWalker::StorageError);
    QVERIFY(walker.errorMessage().contains(QStringLiteral("alice")));
}

void tst_TreeWalker::missingCollection()
{
    TreeWalker walker(mStorage);
    QList<Resource> children;
    QVERIFY(!walker.fetchChildren(1, Resource(Resource::Collection, QStringLiteral("alice"),
                                              QStringLiteral("missing")), &children));
    QCOMPARE(walker.error(), TreeWalker::StorageError);
    QVERIFY(children.isEmpty());
}

void tst_TreeWalker::reservedCharacters_data()
{
    QTest::addColumn<QString>("user");
    QTest::addColumn<QString>("calendar");
    QTest::addColumn<QString>("object");
    QTest::addColumn<QString>("href");

    QTest::newRow("slash in object id")
        << QStringLiteral("alice") << QStringLiteral("work") << QStringLiteral("a/b.ics")
        << QStringLiteral("/dav/alice/cal/work/a%2Fb.ics");
    QTest::newRow("query in object id")
        << QStringLiteral("alice") << QStringLiteral("work") << QStringLiteral("ev?1.ics")
        << QStringLiteral("/dav/alice/cal/work/ev%3F1.ics");
    QTest::newRow("spaces in calendar id")
        << QStringLiteral("alice") << QStringLiteral("home & garden") << QStringLiteral("event1.ics")
        << QStringLiteral("/dav/alice/cal/home%20%26%20garden/event1.ics");
    QTest::newRow("user named like the prefix")
        << QStringLiteral("dav") << QStringLiteral("work") << QStringLiteral("event1.ics")
        << QStringLiteral("/dav/dav/cal/work/event1.ics");
}

void tst_TreeWalker::reservedCharacters()
{
    QFETCH(QString, user);
    QFETCH(QString, calendar);
    QFETCH(QString, object);
    QFETCH(QString, href);

    if (user != QStringLiteral("alice"))
        QVERIFY(mStorage->registerUser(user, QStringLiteral("pw")));
    Calendar target;
    target.id = calendar;
    if (user != QStringLiteral("alice") || calendar != QStringLiteral("work"))
        QCOMPARE(mStorage->createCalendar(user, &target), Storage::NoError);

    CalendarObject stored = makeEvent(QStringLiteral("reserved"));
    stored.id = object;
    QCOMPARE(mStorage->updateObject(user, calendar, &stored, nullptr), Storage::NoError);

    TreeWalker walker(mStorage);
    QList<Resource> children;
    QVERIFY2(walker.fetchChildren(TreeWalker::INFINITE_DEPTH, Resource(Resource::HomeSet, user), &children),
             qPrintable(walker.errorMessage()));

    const Resource expected(Resource::Object, user, calendar, object);
    bool found = false;
    for (const Resource &child : children) {
        if (child == expected) {
            found = true;
            QCOMPARE(mCodec.href(child), href);
        }
    }
    QVERIFY(found);
}

void tst_TreeWalker::foreignObjectPath()
{
    StrayStorage storage;
    QVERIFY(storage.registerUser(QStringLiteral("alice"), QStringLiteral("pw")));
    TreeWalker walker(&storage);
    QList<Resource> children;
    QVERIFY(!walker.fetchChildren(1, Resource(Resource::Collection, QStringLiteral("alice"),
                                              QStringLiteral("work")), &children));
    QCOMPARE(walker.error(), TreeWalker::PathError);
    QVERIFY(children.isEmpty());
}

QTEST_MAIN(tst_TreeWalker)
#include "tst_treewalker.moc"
