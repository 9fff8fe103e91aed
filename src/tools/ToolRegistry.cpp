#include "tools/ToolRegistry.h"

#include <QStringList>

ToolRegistry& ToolRegistry::instance() {
    static ToolRegistry registry;
    return registry;
}

ToolRegistry::ToolRegistry() {
    m_defaultDefinition.id = ToolId::Freehand;
    m_defaultDefinition.configKey = "freehand";
    m_defaultDefinition.displayName = "Freehand";
    m_defaultDefinition.defaultShortcut = "1";
    m_defaultDefinition.isShape = false;

    registerTools();
}

void ToolRegistry::registerTools() {
    registerTool({ ToolId::Freehand, "freehand", "Freehand", "1", false });
    registerTool({ ToolId::Line, "line", "Line", "2", true });
    registerTool({ ToolId::Rectangle, "rectangle", "Rectangle", "3", true });
    registerTool({ ToolId::Arrow, "arrow", "Arrow", "4", true });
    registerTool({ ToolId::Circle, "circle", "Circle", "5", true });
}

void ToolRegistry::registerTool(const ToolDefinition& def) {
    m_definitions[def.id] = def;
}

const ToolDefinition& ToolRegistry::get(ToolId id) const {
    auto it = m_definitions.find(id);
    if (it != m_definitions.end()) {
        return it.value();
    }
    return m_defaultDefinition;
}

std::optional<ToolId> ToolRegistry::fromConfigKey(const QString& key) const {
    const QString normalized = key.trimmed().toLower();
    for (auto it = m_definitions.cbegin(); it != m_definitions.cend(); ++it) {
        if (it.value().configKey == normalized) {
            return it.key();
        }
    }
    return std::nullopt;
}

QVector<ToolId> ToolRegistry::tools() const {
    return QVector<ToolId>(m_definitions.keyBegin(), m_definitions.keyEnd());
}

QString ToolRegistry::displayName(ToolId id) const {
    return get(id).displayName;
}

QString ToolRegistry::shortcutHint(const QMap<QString, QString>& shortcuts) const {
    QStringList parts;
    for (const ToolDefinition& def : m_definitions) {
        const QString key = shortcuts.value(def.configKey, def.defaultShortcut);
        if (key.isEmpty()) {
            continue;
        }
        parts << QString("%1=%2").arg(key.toUpper(), def.displayName);
    }
    return parts.join(' ');
}
