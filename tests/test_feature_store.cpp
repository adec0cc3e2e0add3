#include <QTest>
#include <QCoreApplication>

#include "feature_store.h"
#include "test_support.h"

#include <QtConcurrent/QtConcurrentRun>

using namespace geocore;
using namespace geocore::testing;

class TestFeatureStore : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // Scenario: road, river and a feature without geometry
    void testFeaturesInExtent();
    void testFilterByAttribute();
    void testExtent();

    // Mutation
    void testAddNullRejected();
    void testAddSameInstanceTwiceRejected();
    void testEqualIdsCoexist();
    void testRemove();
    void testAtAndReplace();
    void testIndexOutOfRange();
    void testClear();
    void testConstructFromList();

    // Queries
    void testFeatureByIdFindsEveryAddedFeature();
    void testFeatureByIdMissing();
    void testExtentOfEmptyStore();
    void testExtentIgnoresFeaturesWithoutGeometry();
    void testExtentRecomputedAfterRemoval();
    void testFeaturesInExtentMatchesOracle();
    void testFilterByAttributeIsTypeSensitive();
    void testFilterByGeometryType();
    void testFilterNullPredicateRejected();
    void testViewIsLazyAndRestartable();
    void testIteratorOutlivesView();
    void testConcurrentReaders();

private:
    FeatureStore* m_store = nullptr;
    FeaturePtr m_f1;
    FeaturePtr m_f2;
    FeaturePtr m_f3;
};

void TestFeatureStore::initTestCase()
{
    qDebug() << "========== Feature Store Test Suite ==========";
}

void TestFeatureStore::cleanupTestCase()
{
    qDebug() << "========== Tests Complete ==========";
}

void TestFeatureStore::init()
{
    m_store = new FeatureStore;

    m_f1 = FeaturePtr::create(AttributeValue("f1"), BoxGeometry::point(0, 0),
                              AttributeTable::create({{"kind", "road"}}));
    m_f2 = FeaturePtr::create(AttributeValue("f2"), BoxGeometry::point(10, 10),
                              AttributeTable::create({{"kind", "river"}}));
    m_f3 = FeaturePtr::create(AttributeValue("f3"));

    m_store->add(m_f1);
    m_store->add(m_f2);
    m_store->add(m_f3);
}

void TestFeatureStore::cleanup()
{
    delete m_store;
    m_store = nullptr;
    m_f1.reset();
    m_f2.reset();
    m_f3.reset();
}

// =============================================================================
// Scenario
// =============================================================================

void TestFeatureStore::testFeaturesInExtent()
{
    QList<FeaturePtr> found = m_store->featuresInExtent(Envelope(-1, -1, 1, 1)).toList();
    QCOMPARE(found, QList<FeaturePtr>({m_f1}));
}

void TestFeatureStore::testFilterByAttribute()
{
    QList<FeaturePtr> found = m_store->filterByAttribute("kind", "river").toList();
    QCOMPARE(found, QList<FeaturePtr>({m_f2}));
}

void TestFeatureStore::testExtent()
{
    std::optional<Envelope> extent = m_store->extent();
    QVERIFY(extent.has_value());
    QCOMPARE(*extent, Envelope(0, 0, 10, 10));
}

// =============================================================================
// Mutation
// =============================================================================

void TestFeatureStore::testAddNullRejected()
{
    try {
        m_store->add(FeaturePtr());
        QFAIL("adding null should throw");
    } catch (const Error& e) {
        QCOMPARE(e.code(), ErrorCode::InvalidArgument);
    }
    QCOMPARE(m_store->count(), 3);
}

void TestFeatureStore::testAddSameInstanceTwiceRejected()
{
    QVERIFY_THROWS_EXCEPTION(Error, m_store->add(m_f1));
    QCOMPARE(m_store->count(), 3);
}

void TestFeatureStore::testEqualIdsCoexist()
{
    FeaturePtr twin = m_f1->copy();
    m_store->add(twin);

    QCOMPARE(m_store->count(), 4);
    QCOMPARE(m_store->featureById(AttributeValue("f1")), m_f1);
    QCOMPARE(m_store->filterByAttribute("kind", "road").count(), 2);
}

void TestFeatureStore::testRemove()
{
    QVERIFY(m_store->remove(m_f2));
    QVERIFY(!m_store->remove(m_f2));
    QCOMPARE(m_store->toList(), QList<FeaturePtr>({m_f1, m_f3}));

    // Removing frees the instance for a later add
    m_store->add(m_f2);
    QCOMPARE(m_store->count(), 3);
}

void TestFeatureStore::testAtAndReplace()
{
    QCOMPARE(m_store->at(1), m_f2);

    FeaturePtr replacement = FeaturePtr::create(AttributeValue("f4"), BoxGeometry::point(5, 5));
    m_store->replace(1, replacement);

    QCOMPARE(m_store->at(1), replacement);
    QVERIFY(m_store->featureById(AttributeValue("f2")).isNull());

    // The replaced instance may come back
    m_store->add(m_f2);
    QCOMPARE(m_store->count(), 4);

    QVERIFY_THROWS_EXCEPTION(Error, m_store->replace(0, m_f3));
    QVERIFY_THROWS_EXCEPTION(Error, m_store->replace(0, FeaturePtr()));
}

void TestFeatureStore::testIndexOutOfRange()
{
    QVERIFY_THROWS_EXCEPTION(Error, m_store->at(3));
    QVERIFY_THROWS_EXCEPTION(Error, m_store->at(-1));
    QVERIFY_THROWS_EXCEPTION(Error, m_store->replace(7, FeaturePtr::create()));
}

void TestFeatureStore::testClear()
{
    m_store->clear();
    QVERIFY(m_store->isEmpty());
    m_store->add(m_f1);
    QCOMPARE(m_store->count(), 1);
}

void TestFeatureStore::testConstructFromList()
{
    FeatureStore copy({m_f3, m_f1});
    QCOMPARE(copy.toList(), QList<FeaturePtr>({m_f3, m_f1}));

    int visited = 0;
    for (const FeaturePtr& feature : copy) {
        QVERIFY(feature);
        ++visited;
    }
    QCOMPARE(visited, 2);

    const QList<FeaturePtr> withNull{m_f1, FeaturePtr()};
    QVERIFY_THROWS_EXCEPTION(Error, FeatureStore{withNull});
}

// =============================================================================
// Queries
// =============================================================================

void TestFeatureStore::testFeatureByIdFindsEveryAddedFeature()
{
    FeatureStore store;
    QList<FeaturePtr> features;
    for (int i = 0; i < 20; ++i) {
        features.append(FeaturePtr::create(BoxGeometry::point(i, i)));
        store.add(features.last());
    }

    for (const FeaturePtr& feature : features) {
        QCOMPARE(store.featureById(feature->id()), feature);
    }
}

void TestFeatureStore::testFeatureByIdMissing()
{
    QVERIFY(m_store->featureById(AttributeValue("nope")).isNull());
    QVERIFY(m_store->featureById(AttributeValue()).isNull());
}

void TestFeatureStore::testExtentOfEmptyStore()
{
    FeatureStore store;
    QVERIFY(!store.extent().has_value());
}

void TestFeatureStore::testExtentIgnoresFeaturesWithoutGeometry()
{
    FeatureStore store;
    store.add(FeaturePtr::create());
    QVERIFY(!store.extent().has_value());

    store.add(FeaturePtr::create(BoxGeometry::polygon(-2, -3, 4, 5)));
    QCOMPARE(*store.extent(), Envelope(-2, -3, 4, 5));
}

void TestFeatureStore::testExtentRecomputedAfterRemoval()
{
    m_store->remove(m_f2);
    QCOMPARE(*m_store->extent(), Envelope::fromPoint(0, 0));
}

void TestFeatureStore::testFeaturesInExtentMatchesOracle()
{
    FeatureStore store;
    QList<FeaturePtr> features;
    for (int x = 0; x < 6; ++x) {
        for (int y = 0; y < 6; ++y) {
            features.append(FeaturePtr::create(BoxGeometry::polygon(x * 3, y * 3, x * 3 + 2, y * 3 + 2)));
            store.add(features.last());
        }
    }
    store.add(FeaturePtr::create());

    const QList<Envelope> queries = {
        Envelope(0, 0, 1, 1),
        Envelope(2, 2, 3, 3),       // touches corners of four boxes
        Envelope(2.5, 0, 2.9, 20),  // falls in a gap column
        Envelope(-10, -10, 100, 100),
        Envelope(100, 100, 200, 200),
    };

    for (const Envelope& query : queries) {
        QList<FeaturePtr> expected;
        for (const FeaturePtr& feature : features) {
            const Envelope box = *feature->boundingBox();
            const bool overlaps = box.minX() <= query.maxX() && query.minX() <= box.maxX()
                               && box.minY() <= query.maxY() && query.minY() <= box.maxY();
            if (overlaps) {
                expected.append(feature);
            }
        }
        QCOMPARE(store.featuresInExtent(query).toList(), expected);
    }
}

void TestFeatureStore::testFilterByAttributeIsTypeSensitive()
{
    FeatureStore store;
    auto a = FeaturePtr::create(AttributeValue(1), nullptr, AttributeTable::create({{"lanes", 2}}));
    auto b = FeaturePtr::create(AttributeValue(2), nullptr, AttributeTable::create({{"lanes", "2"}}));
    store.add(a);
    store.add(b);

    QCOMPARE(store.filterByAttribute("lanes", 2).toList(), QList<FeaturePtr>({a}));
    QVERIFY(store.filterByAttribute("width", AttributeValue()).isEmpty());
}

void TestFeatureStore::testFilterByGeometryType()
{
    auto polygon = FeaturePtr::create(BoxGeometry::polygon(0, 0, 1, 1));
    m_store->add(polygon);

    QCOMPARE(m_store->filterByGeometryType(GeometryType::Point).toList(),
             QList<FeaturePtr>({m_f1, m_f2}));
    QCOMPARE(m_store->filterByGeometryType(GeometryType::Polygon).toList(),
             QList<FeaturePtr>({polygon}));
}

void TestFeatureStore::testFilterNullPredicateRejected()
{
    QVERIFY_THROWS_EXCEPTION(Error, m_store->filter(FeatureView::Predicate()));
}

void TestFeatureStore::testViewIsLazyAndRestartable()
{
    int evaluated = 0;
    FeatureView view = m_store->filter([&evaluated](const Feature& feature) {
        ++evaluated;
        return feature.hasGeometry();
    });
    QCOMPARE(evaluated, 0);

    QCOMPARE(view.first(), m_f1);
    QCOMPARE(evaluated, 1);

    QCOMPARE(view.count(), 2);
    QCOMPARE(view.count(), 2);
}

void TestFeatureStore::testIteratorOutlivesView()
{
    // The view is a temporary; the iterator keeps its predicate alive
    FeatureView::const_iterator it = m_store->featuresInExtent(Envelope(5, 5, 20, 20)).begin();
    QCOMPARE(*it, m_f2);

    ++it;
    QVERIFY(it == m_store->featuresInExtent(Envelope(5, 5, 20, 20)).end());
}

void TestFeatureStore::testConcurrentReaders()
{
    FeatureStore store;
    for (int i = 0; i < 200; ++i) {
        store.add(FeaturePtr::create(BoxGeometry::point(i, 0),
                                     AttributeTable::create({{"even", i % 2 == 0}})));
    }

    QList<QFuture<int>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.append(QtConcurrent::run([&store]() {
            return store.filterByAttribute("even", true).count()
                 + store.featuresInExtent(Envelope(0, -1, 49, 1)).count();
        }));
    }

    for (QFuture<int>& future : futures) {
        QCOMPARE(future.result(), 150);
    }
}

QTEST_GUILESS_MAIN(TestFeatureStore)
#include "test_feature_store.moc"
