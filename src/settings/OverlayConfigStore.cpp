#include "settings/OverlayConfigStore.h"
#include "settings/Settings.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStandardPaths>

namespace Glowpoint {

namespace {

constexpr int kMinLineWidth = 1;
constexpr int kMaxLineWidth = 20;

QJsonObject stringMapToJson(const QMap<QString, QString>& map)
{
    QJsonObject obj;
    for (auto it = map.cbegin(); it != map.cend(); ++it) {
        obj.insert(it.key(), it.value());
    }
    return obj;
}

QColor parseColor(const QJsonValue& value, const QColor& fallback, const QString& key)
{
    const QColor color(value.toString());
    if (!color.isValid()) {
        qWarning() << "OverlayConfigStore: Invalid color for" << key << value << "- using default";
        return fallback;
    }
    return color;
}

} // namespace

OverlayConfigStore::OverlayConfigStore(const QString& path, QObject* parent)
    : QObject(parent)
    , m_path(path.isEmpty() ? defaultConfigPath() : path)
    , m_config(OverlayConfig::defaults())
{
    qRegisterMetaType<Glowpoint::OverlayConfig>();
}

OverlayConfigStore::~OverlayConfigStore() = default;

QString OverlayConfigStore::defaultConfigPath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath(QStringLiteral("config.json"));
}

bool OverlayConfigStore::load()
{
    const OverlayConfig defaults = OverlayConfig::defaults();

    QFile file(m_path);
    if (!file.exists()) {
        qDebug() << "OverlayConfigStore: No config at" << m_path << "- using defaults";
        m_config = defaults;
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "OverlayConfigStore: Cannot read" << m_path << file.errorString();
        m_config = defaults;
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "OverlayConfigStore: Parse error in" << m_path << parseError.errorString();
        m_config = defaults;
        return false;
    }

    m_config = fromJson(mergeJson(toJson(defaults), doc.object()));
    qDebug() << "OverlayConfigStore: Loaded" << m_path;
    return true;
}

bool OverlayConfigStore::save(const OverlayConfig& config)
{
    QDir().mkpath(QFileInfo(m_path).absolutePath());

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "OverlayConfigStore: Cannot write" << m_path << file.errorString();
        return false;
    }
    file.write(QJsonDocument(toJson(config)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "OverlayConfigStore: Failed to commit" << m_path << file.errorString();
        return false;
    }

    m_config = config;
    // QSaveFile replaces the file, which drops it from the watcher
    if (m_watcher) {
        watchPath();
    }
    return true;
}

bool OverlayConfigStore::setSpotlightEnabled(bool enabled)
{
    if (m_config.spotlight.enabled == enabled) {
        return true;
    }

    OverlayConfig next = m_config;
    next.spotlight.enabled = enabled;
    return save(next);
}

void OverlayConfigStore::setWatching(bool enabled)
{
    if (enabled == isWatching()) {
        return;
    }

    if (!enabled) {
        delete m_watcher;
        m_watcher = nullptr;
        return;
    }

    m_watcher = new QFileSystemWatcher(this);
    connect(m_watcher, &QFileSystemWatcher::fileChanged,
            this, &OverlayConfigStore::onFileChanged);
    connect(m_watcher, &QFileSystemWatcher::directoryChanged,
            this, [this](const QString&) {
                if (!m_watcher->files().contains(m_path) && QFile::exists(m_path)) {
                    onFileChanged(m_path);
                }
            });
    watchPath();
}

void OverlayConfigStore::watchPath()
{
    const QString dir = QFileInfo(m_path).absolutePath();
    if (!m_watcher->directories().contains(dir) && QFileInfo::exists(dir)) {
        m_watcher->addPath(dir);
    }
    if (!m_watcher->files().contains(m_path) && QFile::exists(m_path)) {
        m_watcher->addPath(m_path);
    }
}

void OverlayConfigStore::onFileChanged(const QString& path)
{
    qDebug() << "OverlayConfigStore: Config file changed:" << path;
    load();
    watchPath();
    emit configChanged(m_config);
}

QJsonObject OverlayConfigStore::mergeJson(const QJsonObject& base, const QJsonObject& loaded)
{
    QJsonObject result = base;
    for (auto it = loaded.constBegin(); it != loaded.constEnd(); ++it) {
        const QJsonValue existing = result.value(it.key());
        if (existing.isObject() && it.value().isObject()) {
            result.insert(it.key(), mergeJson(existing.toObject(), it.value().toObject()));
        } else {
            result.insert(it.key(), it.value());
        }
    }
    return result;
}

QJsonObject OverlayConfigStore::toJson(const OverlayConfig& config)
{
    QJsonObject spotlight;
    spotlight.insert("enabled", config.spotlight.enabled);
    spotlight.insert("radius", config.spotlight.radius);
    spotlight.insert("ring_radius", config.spotlight.ringRadius);
    spotlight.insert("opacity", config.spotlight.opacity);
    spotlight.insert("color", config.spotlight.color.name(QColor::HexRgb).toUpper());

    QJsonObject colors;
    for (auto it = config.drawing.colors.cbegin(); it != config.drawing.colors.cend(); ++it) {
        colors.insert(it.key(), it.value().name(QColor::HexRgb).toUpper());
    }

    QJsonObject drawing;
    drawing.insert("line_width", config.drawing.lineWidth);
    drawing.insert("colors", colors);
    drawing.insert("tool_shortcuts", stringMapToJson(config.drawing.toolShortcuts));

    QJsonObject root;
    root.insert("shortcuts", stringMapToJson(config.shortcuts));
    root.insert("spotlight", spotlight);
    root.insert("drawing", drawing);
    return root;
}

OverlayConfig OverlayConfigStore::fromJson(const QJsonObject& json)
{
    const OverlayConfig defaults = OverlayConfig::defaults();
    OverlayConfig config;

    const QJsonObject shortcuts = json.value("shortcuts").toObject();
    for (auto it = shortcuts.constBegin(); it != shortcuts.constEnd(); ++it) {
        config.shortcuts.insert(it.key(), it.value().toString());
    }

    const QJsonObject spotlight = json.value("spotlight").toObject();
    const SpotlightConfig& spotDefaults = defaults.spotlight;
    config.spotlight.enabled = spotlight.value("enabled").toBool(spotDefaults.enabled);
    config.spotlight.radius = qMax(1, spotlight.value("radius").toInt(spotDefaults.radius));
    config.spotlight.ringRadius = qMax(0, spotlight.value("ring_radius").toInt(spotDefaults.ringRadius));
    config.spotlight.opacity = qBound(0.0, spotlight.value("opacity").toDouble(spotDefaults.opacity), 1.0);
    config.spotlight.color = spotlight.contains("color")
        ? parseColor(spotlight.value("color"), spotDefaults.color, "spotlight.color")
        : spotDefaults.color;

    const QJsonObject drawing = json.value("drawing").toObject();
    const int lineWidth = drawing.value("line_width").toInt(defaults.drawing.lineWidth);
    if (lineWidth < kMinLineWidth || lineWidth > kMaxLineWidth) {
        qWarning() << "OverlayConfigStore: line_width" << lineWidth << "out of range, clamping";
    }
    config.drawing.lineWidth = qBound(kMinLineWidth, lineWidth, kMaxLineWidth);

    const QJsonObject colors = drawing.value("colors").toObject();
    for (auto it = colors.constBegin(); it != colors.constEnd(); ++it) {
        const QString name = it.key().trimmed().toLower();
        const QColor color(it.value().toString());
        if (name.isEmpty() || !color.isValid()) {
            qWarning() << "OverlayConfigStore: Ignoring invalid color entry" << it.key() << it.value();
            continue;
        }
        config.drawing.colors.insert(name, color);
    }

    const QJsonObject toolShortcuts = drawing.value("tool_shortcuts").toObject();
    for (auto it = toolShortcuts.constBegin(); it != toolShortcuts.constEnd(); ++it) {
        config.drawing.toolShortcuts.insert(it.key(), it.value().toString());
    }

    return config;
}

} // namespace Glowpoint
