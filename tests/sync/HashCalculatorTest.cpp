#include <QtTest/QtTest>

#include "TestSupport.hpp"
#include "planner/sync/HashCalculator.hpp"

using planner::data::Entity;
using planner::data::Group;
using planner::data::Task;
using planner::data::User;
using planner::sync::HashCalculator;
using planner::testing::at;
using planner::testing::makeTask;

class HashCalculatorTest : public QObject
{
    Q_OBJECT

private slots:
    void taskEncodingIsStable();
    void taskHashIsSha256Hex();
    void idSetsAreSorted();
    void setHashIgnoresInputOrder();
    void setHashTracksContent();
    void emptySetHasFixedHash();
};

void HashCalculatorTest::taskEncodingIsStable()
{
    const Task task = makeTask(1, QStringLiteral("A"), at(2024, 3, 10, 8, 0));
    QCOMPARE(HashCalculator::encodeTask(task), QStringLiteral("1|A||one_time||||2024-03-10T08:00:00||true|false||0"));
}

void HashCalculatorTest::taskHashIsSha256Hex()
{
    const Task task = makeTask(1, QStringLiteral("A"), at(2024, 3, 10, 8, 0));
    QCOMPARE(HashCalculator::taskHash(task),
             QStringLiteral("89779a2664be0e061ba9dc72b669f12a9402c30f5796b0de16aab5ba2b72beab"));
}

void HashCalculatorTest::idSetsAreSorted()
{
    Task task = makeTask(1, QStringLiteral("A"), at(2024, 3, 10, 8, 0));
    task.assignedUserIds = {12, 3, 7};
    QVERIFY(HashCalculator::encodeTask(task).contains(QStringLiteral("|3,7,12|")));

    Group first;
    first.id = 2;
    first.name = QStringLiteral("Flat");
    first.memberIds = {4, 1};
    Group second = first;
    second.memberIds = {1, 4};
    QCOMPARE(HashCalculator::groupHash(first), HashCalculator::groupHash(second));
}

void HashCalculatorTest::setHashIgnoresInputOrder()
{
    const Entity a = makeTask(1, QStringLiteral("A"), at(2024, 3, 10, 8, 0));
    const Entity b = makeTask(2, QStringLiteral("B"), at(2024, 3, 11, 8, 0));
    QCOMPARE(HashCalculator::setHash({a, b}), HashCalculator::setHash({b, a}));
}

void HashCalculatorTest::setHashTracksContent()
{
    Task task = makeTask(1, QStringLiteral("A"), at(2024, 3, 10, 8, 0));
    const QString before = HashCalculator::setHash({task});
    task.completed = true;
    QVERIFY(HashCalculator::setHash({task}) != before);

    User user;
    user.id = 3;
    user.name = QStringLiteral("Ana");
    user.status = QStringLiteral("active");
    const QString active = HashCalculator::setHash({user});
    user.status = QStringLiteral("inactive");
    QVERIFY(HashCalculator::setHash({user}) != active);
}

void HashCalculatorTest::emptySetHasFixedHash()
{
    QCOMPARE(HashCalculator::setHash({}),
             QStringLiteral("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}

QTEST_GUILESS_MAIN(HashCalculatorTest)
#include "HashCalculatorTest.moc"
