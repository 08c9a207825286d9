#include <QTest>
#include "core/topology/RouteClassifier.hpp"
#include "TestDoubles.hpp"

using testing::makeDevice;
using testing::makeRoute;

class TestRouteClassifier : public QObject {
    Q_OBJECT

private slots:
    void noOutputRouteIsUnknown()
    {
        pwa::DeviceInfo device;
        device.id = 3;
        device.routes.append(makeRoute("Input", 9, "mic"));

        QVERIFY(!pwa::highestPriorityOutputRoute(device).has_value());
        QVERIFY(!pwa::isPublicDevice(device));
        QVERIFY(!pwa::isPrivateDevice(device));
        QCOMPARE(pwa::classifyDevice(device), pwa::DeviceCategory::Unknown);
    }

    void emptyRouteListIsUnknown()
    {
        pwa::DeviceInfo device;
        QCOMPARE(pwa::classifyDevice(device), pwa::DeviceCategory::Unknown);
    }

    void shortInfoListIsUnknown()
    {
        pwa::DeviceInfo device = makeDevice(1, "headphones");
        device.routes[0].info = QJsonArray{1, "port.type"};

        QVERIFY(pwa::routeProperties(device.routes.first()).isEmpty());
        QVERIFY(!pwa::dominantPortType(device).has_value());
        QVERIFY(!pwa::isPrivateDevice(device));
        QCOMPARE(pwa::classifyDevice(device), pwa::DeviceCategory::Unknown);
    }

    void missingPortTypeIsUnknown()
    {
        pwa::DeviceInfo device = makeDevice(1, "headphones");
        device.routes[0].info = QJsonArray{1, "port.availability", "yes"};

        QVERIFY(!pwa::dominantPortType(device).has_value());
        QCOMPARE(pwa::classifyDevice(device), pwa::DeviceCategory::Unknown);
    }

    void highestPriorityOutputWins()
    {
        pwa::DeviceInfo device;
        device.id = 4;
        device.routes.append(makeRoute("Output", 3, "headphones", 0));
        device.routes.append(makeRoute("Output", 7, "hdmi", 1));
        device.routes.append(makeRoute("Output", 1, "headset", 2));

        auto route = pwa::highestPriorityOutputRoute(device);
        QVERIFY(route.has_value());
        QCOMPARE(route->priority, 7);
        QCOMPARE(route->index, 1);
        QCOMPARE(pwa::dominantPortType(device).value(), QString("hdmi"));
        QCOMPARE(pwa::classifyDevice(device), pwa::DeviceCategory::Public);
    }

    void inputRoutesAreIgnored()
    {
        pwa::DeviceInfo device;
        device.routes.append(makeRoute("Input", 100, "hdmi", 0));
        device.routes.append(makeRoute("Output", 2, "headphones", 1));

        QCOMPARE(pwa::dominantPortType(device).value(), QString("headphones"));
        QCOMPARE(pwa::classifyDevice(device), pwa::DeviceCategory::Private);
    }

    void directionIsCaseInsensitive()
    {
        pwa::DeviceInfo device;
        device.routes.append(makeRoute("output", 1, "speaker"));
        QVERIFY(pwa::isPublicDevice(device));

        device.routes[0].direction = "OUTPUT";
        QVERIFY(pwa::isPublicDevice(device));
    }

    void equalPriorityKeepsFirstRoute()
    {
        pwa::DeviceInfo device;
        device.routes.append(makeRoute("Output", 5, "headphones", 0));
        device.routes.append(makeRoute("Output", 5, "speaker", 1));

        QCOMPARE(pwa::highestPriorityOutputRoute(device)->index, 0);
        QCOMPARE(pwa::classifyDevice(device), pwa::DeviceCategory::Private);
    }

    void portTypeMatchIsCaseInsensitiveSubstring()
    {
        QVERIFY(pwa::isPublicDevice(makeDevice(1, "HDMI")));
        QVERIFY(pwa::isPublicDevice(makeDevice(1, "displayport-out")));
        QVERIFY(pwa::isPublicDevice(makeDevice(1, "Speaker")));
        QVERIFY(pwa::isPrivateDevice(makeDevice(1, "Headphones")));
        QVERIFY(pwa::isPrivateDevice(makeDevice(1, "headset-output")));
        QCOMPARE(pwa::classifyDevice(makeDevice(1, "line")), pwa::DeviceCategory::Unknown);
    }

    void ambiguousPortTypeClassifiesPrivate()
    {
        pwa::DeviceInfo device = makeDevice(1, "headset-speaker");

        QVERIFY(pwa::isPrivateDevice(device));
        QVERIFY(pwa::isPublicDevice(device));
        QCOMPARE(pwa::classifyDevice(device), pwa::DeviceCategory::Private);
    }

    void routePropertiesPairsStartAtOne()
    {
        pwa::RouteInfo route;
        route.info = QJsonArray{3, "port.type", "headphones", "port.type", "speaker",
                                "card.profile.device", "4"};

        auto props = pwa::routeProperties(route);
        QCOMPARE(props.value("port.type"), QString("headphones"));
        QCOMPARE(props.value("card.profile.device"), QString("4"));
        QVERIFY(!props.contains("3"));
    }

    void routePropertiesSkipsNonStringPairs()
    {
        pwa::RouteInfo route;
        route.info = QJsonArray{2, "port.type", 7, "port.availability", "no", "dangling"};

        auto props = pwa::routeProperties(route);
        QVERIFY(!props.contains("port.type"));
        QCOMPARE(props.value("port.availability"), QString("no"));
        QCOMPARE(props.size(), 1);
    }

    void keywordTables()
    {
        QVERIFY(pwa::publicKeywords().contains("hdmi"));
        QVERIFY(pwa::publicKeywords().contains("speaker"));
        QVERIFY(pwa::publicKeywords().contains("displayport"));
        QVERIFY(pwa::privateKeywords().contains("headphones"));
        QVERIFY(pwa::privateKeywords().contains("headset"));
        QCOMPARE(QString(pwa::categoryName(pwa::DeviceCategory::Private)), QString("private"));
    }
};

QTEST_MAIN(TestRouteClassifier)
#include "test_route_classifier.moc"
