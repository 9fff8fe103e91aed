#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>

#include "settings/OverlayConfig.h"

class QFileSystemWatcher;

namespace Glowpoint {

/**
 * @brief Loads, validates, saves and watches the JSON configuration document.
 *
 * The document on disk is merged recursively over the built-in defaults,
 * so a partial file only overrides the keys it names. Read and parse
 * errors are logged and leave the defaults in effect.
 */
class OverlayConfigStore : public QObject
{
    Q_OBJECT

public:
    explicit OverlayConfigStore(const QString& path, QObject* parent = nullptr);
    ~OverlayConfigStore() override;

    static QString defaultConfigPath();

    QString path() const { return m_path; }
    const OverlayConfig& config() const { return m_config; }

    /**
     * @brief Re-read the document from disk.
     * @return false when the file was missing or unreadable; defaults are used.
     */
    bool load();

    /**
     * @brief Write config to disk and make it current.
     */
    bool save(const OverlayConfig& config);

    /**
     * @brief Persist the spotlight on/off state so it survives a restart.
     *
     * Writes only when the value differs from the current document.
     */
    bool setSpotlightEnabled(bool enabled);

    /**
     * @brief Reload automatically when the file changes on disk.
     */
    void setWatching(bool enabled);
    bool isWatching() const { return m_watcher != nullptr; }

    static QJsonObject toJson(const OverlayConfig& config);
    static OverlayConfig fromJson(const QJsonObject& json);

    /**
     * @brief Recursively overlay loaded on top of base.
     *
     * Nested objects are merged key by key; any other value in loaded
     * replaces the value in base.
     */
    static QJsonObject mergeJson(const QJsonObject& base, const QJsonObject& loaded);

signals:
    void configChanged(const Glowpoint::OverlayConfig& config);

private slots:
    void onFileChanged(const QString& path);

private:
    void watchPath();

    QString m_path;
    OverlayConfig m_config;
    QFileSystemWatcher* m_watcher = nullptr;
};

} // namespace Glowpoint

Q_DECLARE_METATYPE(Glowpoint::OverlayConfig)
