#include <QtTest/QtTest>
#include <QPainterPath>

#include "annotations/Stroke.h"
#include "annotations/StrokeSmoothing.h"

class TestStrokeSmoothing : public QObject
{
    Q_OBJECT

private slots:
    // Catmull-Rom
    void testCatmullRom_ShortInputReturnedUnchanged();
    void testCatmullRom_SampleCount();
    void testCatmullRom_PassesThroughControlPoints();
    void testCatmullRom_CollinearStaysOnLine();
    void testCatmullRomPoint_Endpoints();

    // Stroke geometry
    void testStroke_ToolMatchesGeometry();
    void testStroke_EndAnchorPerShape();
    void testStroke_BoundingRectIncludesThickness();
    void testArrowHeadLength_MinimumAndScaling();
    void testMakeArrow_ZeroLengthCollapsesHead();
    void testMakeCircle_Radius();
    void testRectanglePath_IsClosed();
};

void TestStrokeSmoothing::testCatmullRom_ShortInputReturnedUnchanged()
{
    const QVector<QPointF> one = { QPointF(1, 1) };
    const QVector<QPointF> two = { QPointF(1, 1), QPointF(5, 5) };

    QCOMPARE(StrokeSmoothing::catmullRom({}), QVector<QPointF>());
    QCOMPARE(StrokeSmoothing::catmullRom(one), one);
    QCOMPARE(StrokeSmoothing::catmullRom(two), two);
}

void TestStrokeSmoothing::testCatmullRom_SampleCount()
{
    const QVector<QPointF> points = {
        QPointF(0, 0), QPointF(10, 10), QPointF(20, 0), QPointF(30, 10)
    };

    QCOMPARE(StrokeSmoothing::catmullRom(points).size(), 3 * 8 + 1);
    QCOMPARE(StrokeSmoothing::catmullRom(points, 4).size(), 3 * 4 + 1);
}

void TestStrokeSmoothing::testCatmullRom_PassesThroughControlPoints()
{
    const QVector<QPointF> points = {
        QPointF(0, 0), QPointF(10, 25), QPointF(30, 5), QPointF(45, 40), QPointF(60, 0)
    };
    const QVector<QPointF> smoothed = StrokeSmoothing::catmullRom(points, 8);

    for (int i = 0; i < points.size(); ++i) {
        QCOMPARE(smoothed[i * 8], points[i]);
    }
}

void TestStrokeSmoothing::testCatmullRom_CollinearStaysOnLine()
{
    const QVector<QPointF> points = {
        QPointF(0, 10), QPointF(10, 10), QPointF(20, 10), QPointF(30, 10)
    };
    const QVector<QPointF> smoothed = StrokeSmoothing::catmullRom(points);

    for (const QPointF& p : smoothed) {
        QVERIFY(qAbs(p.y() - 10.0) < 1e-9);
        QVERIFY(p.x() >= 0.0 && p.x() <= 30.0);
    }
}

void TestStrokeSmoothing::testCatmullRomPoint_Endpoints()
{
    const QPointF p0(0, 0), p1(10, 0), p2(20, 10), p3(30, 10);

    QCOMPARE(StrokeSmoothing::catmullRomPoint(p0, p1, p2, p3, 0.0), p1);
    QCOMPARE(StrokeSmoothing::catmullRomPoint(p0, p1, p2, p3, 1.0), p2);
}

void TestStrokeSmoothing::testStroke_ToolMatchesGeometry()
{
    Stroke stroke;
    stroke.geometry = LineGeometry{ QPointF(0, 0), QPointF(1, 1) };
    QCOMPARE(stroke.tool(), ToolId::Line);

    stroke.geometry = CircleGeometry{ QPointF(5, 5), 3.0 };
    QCOMPARE(stroke.tool(), ToolId::Circle);

    stroke.geometry = FreehandGeometry{};
    QCOMPARE(stroke.tool(), ToolId::Freehand);
}

void TestStrokeSmoothing::testStroke_EndAnchorPerShape()
{
    Stroke stroke;

    stroke.geometry = FreehandGeometry{ { QPointF(0, 0), QPointF(4, 4), QPointF(9, 2) }, {} };
    QCOMPARE(stroke.endAnchor(), QPointF(9, 2));

    stroke.geometry = RectangleGeometry{ QPointF(10, 10), QPointF(40, 30) };
    QCOMPARE(stroke.endAnchor(), QPointF(40, 30));

    stroke.geometry = StrokeGeometryBuilder::makeArrow(QPointF(0, 0), QPointF(100, 0), 4);
    QCOMPARE(stroke.endAnchor(), QPointF(100, 0));

    stroke.geometry = CircleGeometry{ QPointF(50, 50), 20.0 };
    QCOMPARE(stroke.endAnchor(), QPointF(70, 50));
}

void TestStrokeSmoothing::testStroke_BoundingRectIncludesThickness()
{
    Stroke stroke;
    stroke.thickness = 10;
    stroke.geometry = LineGeometry{ QPointF(10, 50), QPointF(110, 50) };

    const QRectF bounds = stroke.boundingRect();
    QVERIFY(bounds.contains(QPointF(10, 50)));
    QVERIFY(bounds.contains(QPointF(110, 50)));
    QVERIFY(bounds.top() <= 45.0);
    QVERIFY(bounds.bottom() >= 55.0);
}

void TestStrokeSmoothing::testArrowHeadLength_MinimumAndScaling()
{
    QCOMPARE(StrokeGeometryBuilder::arrowHeadLength(1), 15.0);
    QCOMPARE(StrokeGeometryBuilder::arrowHeadLength(3), 15.0);
    QCOMPARE(StrokeGeometryBuilder::arrowHeadLength(4), 20.0);
    QCOMPARE(StrokeGeometryBuilder::arrowHeadLength(20), 100.0);
}

void TestStrokeSmoothing::testMakeArrow_ZeroLengthCollapsesHead()
{
    const ArrowGeometry arrow = StrokeGeometryBuilder::makeArrow(QPointF(5, 5), QPointF(5, 5), 4);
    QCOMPARE(arrow.headLeft, QPointF(5, 5));
    QCOMPARE(arrow.headRight, QPointF(5, 5));
}

void TestStrokeSmoothing::testMakeCircle_Radius()
{
    const CircleGeometry circle = StrokeGeometryBuilder::makeCircle(QPointF(0, 0), QPointF(3, 4));
    QCOMPARE(circle.center, QPointF(0, 0));
    QCOMPARE(circle.radius, 5.0);
}

void TestStrokeSmoothing::testRectanglePath_IsClosed()
{
    Stroke stroke;
    stroke.thickness = 2;
    stroke.geometry = RectangleGeometry{ QPointF(40, 40), QPointF(0, 0) };

    const QPainterPath path = stroke.path();
    QVERIFY(!path.isEmpty());
    QCOMPARE(path.boundingRect(), QRectF(0, 0, 40, 40));
}

QTEST_MAIN(TestStrokeSmoothing)
#include "tst_StrokeSmoothing.moc"
