#ifndef TOOLREGISTRY_H
#define TOOLREGISTRY_H

#include <QMap>
#include <QVector>
#include <QString>
#include <optional>

#include "ToolId.h"
#include "ToolDefinition.h"

/**
 * @brief Singleton registry for drawing tool definitions.
 *
 * Provides lookup by id and by configuration name.
 */
class ToolRegistry {
public:
    static ToolRegistry& instance();

    /**
     * @brief Get the definition for a specific tool.
     */
    const ToolDefinition& get(ToolId id) const;

    /**
     * @brief Resolve a configuration name ("freehand", "arrow", ...).
     *
     * Matching is case-insensitive. Returns std::nullopt for unknown names.
     */
    std::optional<ToolId> fromConfigKey(const QString& key) const;

    /**
     * @brief All tools in toolbar order.
     */
    QVector<ToolId> tools() const;

    QString displayName(ToolId id) const;

    /**
     * @brief Hint text listing each tool with its shortcut key.
     *
     * @param shortcuts Configured keys keyed by config name; tools without
     *        an entry use their default key.
     */
    QString shortcutHint(const QMap<QString, QString>& shortcuts) const;

private:
    ToolRegistry();
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    void registerTools();
    void registerTool(const ToolDefinition& def);

    QMap<ToolId, ToolDefinition> m_definitions;
    ToolDefinition m_defaultDefinition;
};

#endif // TOOLREGISTRY_H
