#include <QtTest>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "settings/OverlayConfigStore.h"

using namespace Glowpoint;

/**
 * @brief Unit tests for OverlayConfigStore.
 *
 * Tests the JSON configuration document:
 * - Defaults when the file is missing or malformed
 * - Recursive merge of a partial document over defaults
 * - Range clamping and invalid colors
 * - Save/load and reload on change
 */
class tst_OverlayConfigStore : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Defaults
    void testDefaults();
    void testLoad_MissingFileUsesDefaults();
    void testLoad_MalformedFileUsesDefaults();
    void testLoad_NonObjectDocumentUsesDefaults();

    // Merge
    void testMergeJson_NestedKeysMerged();
    void testLoad_PartialDocumentKeepsDefaults();
    void testLoad_ExtraColorAdded();

    // Validation
    void testFromJson_ClampsRanges();
    void testFromJson_InvalidSpotlightColorFallsBack();
    void testFromJson_InvalidDrawingColorSkipped();

    // Persistence
    void testSave_ThenLoad();
    void testSave_CreatesDirectory();
    void testSetSpotlightEnabled_PersistsAcrossRestart();
    void testSetSpotlightEnabled_UnchangedDoesNotWrite();
    void testWatching_ReloadsOnChange();

private:
    void writeFile(const QByteArray& contents);
    QString configPath() const { return m_dir->filePath("config.json"); }

    QTemporaryDir* m_dir = nullptr;
};

void tst_OverlayConfigStore::init()
{
    m_dir = new QTemporaryDir();
    QVERIFY(m_dir->isValid());
}

void tst_OverlayConfigStore::cleanup()
{
    delete m_dir;
    m_dir = nullptr;
}

void tst_OverlayConfigStore::writeFile(const QByteArray& contents)
{
    QFile file(configPath());
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(contents);
    file.close();
}

// ============================================================================
// Defaults
// ============================================================================

void tst_OverlayConfigStore::testDefaults()
{
    const OverlayConfig config = OverlayConfig::defaults();

    QCOMPARE(config.shortcuts.value("toggle_spotlight"), QString("<ctrl>+<shift>+s"));
    QCOMPARE(config.shortcuts.value("quit"), QString("<ctrl>+<shift>+q"));
    QVERIFY(config.shortcuts.value("undo").isEmpty());
    QCOMPARE(config.spotlight.radius, 80);
    QCOMPARE(config.spotlight.ringRadius, 40);
    QCOMPARE(config.spotlight.opacity, 0.7);
    QCOMPARE(config.drawing.lineWidth, 4);
    QCOMPARE(config.drawing.colors.size(), 4);
    QCOMPARE(config.drawing.colors.value("blue"), QColor("#2196F3"));
}

void tst_OverlayConfigStore::testLoad_MissingFileUsesDefaults()
{
    OverlayConfigStore store(configPath());
    QVERIFY(!store.load());
    QVERIFY(store.config().spotlight == OverlayConfig::defaults().spotlight);
    QCOMPARE(store.config().shortcuts, OverlayConfig::defaults().shortcuts);
}

void tst_OverlayConfigStore::testLoad_MalformedFileUsesDefaults()
{
    writeFile("{ \"spotlight\": { \"radius\": 200, ");

    OverlayConfigStore store(configPath());
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Parse error"));
    QVERIFY(!store.load());
    QCOMPARE(store.config().spotlight.radius, 80);
}

void tst_OverlayConfigStore::testLoad_NonObjectDocumentUsesDefaults()
{
    writeFile("[1, 2, 3]");

    OverlayConfigStore store(configPath());
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Parse error"));
    QVERIFY(!store.load());
    QCOMPARE(store.config().drawing.lineWidth, 4);
}

// ============================================================================
// Merge
// ============================================================================

void tst_OverlayConfigStore::testMergeJson_NestedKeysMerged()
{
    const QJsonObject base = QJsonDocument::fromJson(
        R"({"a": {"x": 1, "y": 2}, "b": 3})").object();
    const QJsonObject loaded = QJsonDocument::fromJson(
        R"({"a": {"y": 20, "z": 30}, "b": {"nested": true}})").object();

    const QJsonObject merged = OverlayConfigStore::mergeJson(base, loaded);
    const QJsonObject a = merged.value("a").toObject();
    QCOMPARE(a.value("x").toInt(), 1);
    QCOMPARE(a.value("y").toInt(), 20);
    QCOMPARE(a.value("z").toInt(), 30);
    QVERIFY(merged.value("b").isObject());
}

void tst_OverlayConfigStore::testLoad_PartialDocumentKeepsDefaults()
{
    writeFile(R"({"spotlight": {"radius": 120}, "shortcuts": {"undo": "<ctrl>+<alt>+z"}})");

    OverlayConfigStore store(configPath());
    QVERIFY(store.load());

    const OverlayConfig& config = store.config();
    QCOMPARE(config.spotlight.radius, 120);
    QCOMPARE(config.spotlight.ringRadius, 40);
    QCOMPARE(config.shortcuts.value("undo"), QString("<ctrl>+<alt>+z"));
    QCOMPARE(config.shortcuts.value("toggle_spotlight"), QString("<ctrl>+<shift>+s"));
    QCOMPARE(config.drawing.colors.size(), 4);
}

void tst_OverlayConfigStore::testLoad_ExtraColorAdded()
{
    writeFile(R"({"drawing": {"colors": {"Purple": "#9C27B0"}}})");

    OverlayConfigStore store(configPath());
    QVERIFY(store.load());
    QCOMPARE(store.config().drawing.colors.size(), 5);
    QCOMPARE(store.config().drawing.colors.value("purple"), QColor("#9C27B0"));
}

// ============================================================================
// Validation
// ============================================================================

void tst_OverlayConfigStore::testFromJson_ClampsRanges()
{
    const QJsonObject json = QJsonDocument::fromJson(R"({
        "spotlight": {"radius": -10, "ring_radius": -4, "opacity": 1.8},
        "drawing": {"line_width": 55}
    })").object();

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("line_width"));
    const OverlayConfig config = OverlayConfigStore::fromJson(json);

    QCOMPARE(config.spotlight.radius, 1);
    QCOMPARE(config.spotlight.ringRadius, 0);
    QCOMPARE(config.spotlight.opacity, 1.0);
    QCOMPARE(config.drawing.lineWidth, 20);
}

void tst_OverlayConfigStore::testFromJson_InvalidSpotlightColorFallsBack()
{
    const QJsonObject json = QJsonDocument::fromJson(
        R"({"spotlight": {"color": "not-a-color"}})").object();

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Invalid color"));
    const OverlayConfig config = OverlayConfigStore::fromJson(json);
    QCOMPARE(config.spotlight.color, OverlayConfig::defaults().spotlight.color);
}

void tst_OverlayConfigStore::testFromJson_InvalidDrawingColorSkipped()
{
    const QJsonObject json = QJsonDocument::fromJson(
        R"({"drawing": {"colors": {"red": "#F44336", "bad": "nope"}}})").object();

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Ignoring invalid color entry"));
    const OverlayConfig config = OverlayConfigStore::fromJson(json);
    QCOMPARE(config.drawing.colors.size(), 1);
    QVERIFY(config.drawing.colors.contains("red"));
}

// ============================================================================
// Persistence
// ============================================================================

void tst_OverlayConfigStore::testSave_ThenLoad()
{
    OverlayConfig config = OverlayConfig::defaults();
    config.spotlight.radius = 95;
    config.spotlight.color = QColor("#00FFAA");
    config.drawing.lineWidth = 9;
    config.shortcuts.insert("redo", "<ctrl>+<alt>+y");

    OverlayConfigStore writer(configPath());
    QVERIFY(writer.save(config));

    OverlayConfigStore reader(configPath());
    QVERIFY(reader.load());
    QVERIFY(reader.config().spotlight == config.spotlight);
    QCOMPARE(reader.config().drawing.lineWidth, 9);
    QCOMPARE(reader.config().shortcuts, config.shortcuts);
    QCOMPARE(reader.config().drawing.toolShortcuts, config.drawing.toolShortcuts);
}

void tst_OverlayConfigStore::testSave_CreatesDirectory()
{
    const QString nested = m_dir->filePath("a/b/config.json");
    OverlayConfigStore store(nested);
    QVERIFY(store.save(OverlayConfig::defaults()));
    QVERIFY(QFile::exists(nested));
}

void tst_OverlayConfigStore::testSetSpotlightEnabled_PersistsAcrossRestart()
{
    OverlayConfigStore store(configPath());
    QVERIFY(store.save(OverlayConfig::defaults()));
    QVERIFY(store.config().spotlight.enabled);

    QVERIFY(store.setSpotlightEnabled(false));
    QVERIFY(!store.config().spotlight.enabled);

    OverlayConfigStore restarted(configPath());
    QVERIFY(restarted.load());
    QVERIFY(!restarted.config().spotlight.enabled);
    QCOMPARE(restarted.config().spotlight.radius, OverlayConfig::defaults().spotlight.radius);
}

void tst_OverlayConfigStore::testSetSpotlightEnabled_UnchangedDoesNotWrite()
{
    OverlayConfigStore store(configPath());
    QVERIFY(store.config().spotlight.enabled);

    QVERIFY(store.setSpotlightEnabled(true));
    QVERIFY(!QFile::exists(configPath()));
}

void tst_OverlayConfigStore::testWatching_ReloadsOnChange()
{
    OverlayConfigStore store(configPath());
    QVERIFY(store.save(OverlayConfig::defaults()));
    store.setWatching(true);
    QVERIFY(store.isWatching());

    QSignalSpy spy(&store, &OverlayConfigStore::configChanged);
    QTest::qWait(100);
    writeFile(R"({"spotlight": {"radius": 33}})");

    QTRY_VERIFY_WITH_TIMEOUT(spy.count() >= 1, 5000);
    QCOMPARE(store.config().spotlight.radius, 33);

    store.setWatching(false);
    QVERIFY(!store.isWatching());
}

QTEST_MAIN(tst_OverlayConfigStore)
#include "tst_OverlayConfigStore.moc"
