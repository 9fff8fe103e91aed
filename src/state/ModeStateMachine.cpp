#include "state/ModeStateMachine.h"

#include <QDebug>

ModeStateMachine::ModeStateMachine(QObject *parent)
    : QObject(parent)
{
}

ModeStateMachine::~ModeStateMachine() = default;

void ModeStateMachine::setColorCatalog(const QMap<QString, QColor> &colors)
{
    m_colors = colors;

    // A color removed from the catalog cannot stay active
    if (m_mode == Mode::Drawing && !m_colors.contains(m_colorName)) {
        qWarning() << "ModeStateMachine: Active color" << m_colorName << "removed, leaving drawing mode";
        exitDrawing();
    } else if (m_mode == Mode::Drawing) {
        emit drawingColorChanged(m_colorName, drawingColor());
    }
}

void ModeStateMachine::setDefaultThickness(int thickness)
{
    m_defaultThickness = qBound(kMinThickness, thickness, kMaxThickness);
}

void ModeStateMachine::restoreThicknesses(const QMap<QString, int> &thicknesses)
{
    for (auto it = thicknesses.cbegin(); it != thicknesses.cend(); ++it) {
        m_thickness[it.key()] = qBound(kMinThickness, it.value(), kMaxThickness);
    }
}

void ModeStateMachine::restoreTool(ToolId tool)
{
    if (tool != ToolId::Count) {
        m_tool = tool;
    }
}

bool ModeStateMachine::isSpotlightActive() const
{
    if (m_mode == Mode::Drawing) {
        return m_restingMode == Mode::SpotlightOnly;
    }
    return m_mode == Mode::SpotlightOnly;
}

QColor ModeStateMachine::drawingColor() const
{
    return m_colors.value(m_colorName);
}

int ModeStateMachine::thickness() const
{
    return thicknessFor(m_colorName);
}

int ModeStateMachine::thicknessFor(const QString &colorName) const
{
    return m_thickness.value(colorName, m_defaultThickness);
}

bool ModeStateMachine::toggleSpotlight()
{
    if (m_mode == Mode::Drawing) {
        // Drawing stays active; the toggle applies to the mode we return to
        m_restingMode = (m_restingMode == Mode::SpotlightOnly) ? Mode::Idle : Mode::SpotlightOnly;
        qDebug() << "ModeStateMachine: Spotlight" << (isSpotlightActive() ? "on" : "off") << "while drawing";
        emit spotlightChanged(isSpotlightActive());
        return true;
    }

    const Mode next = (m_mode == Mode::SpotlightOnly) ? Mode::Idle : Mode::SpotlightOnly;
    m_restingMode = next;
    setMode(next);
    return true;
}

bool ModeStateMachine::drawColor(const QString &colorName)
{
    const QString name = colorName.trimmed().toLower();
    if (!m_colors.contains(name)) {
        qWarning() << "ModeStateMachine: Unknown color" << colorName;
        return false;
    }

    if (m_mode == Mode::Drawing && m_colorName == name) {
        return exitDrawing();
    }

    m_colorName = name;
    emit drawingColorChanged(m_colorName, drawingColor());

    if (m_mode != Mode::Drawing) {
        m_restingMode = m_mode;
        setMode(Mode::Drawing);
    } else {
        qDebug() << "ModeStateMachine: Drawing color switched to" << m_colorName;
    }
    return true;
}

bool ModeStateMachine::exitDrawing()
{
    if (m_mode != Mode::Drawing) {
        return false;
    }
    setMode(m_restingMode);
    return true;
}

bool ModeStateMachine::setTool(ToolId tool)
{
    if (m_mode != Mode::Drawing) {
        qDebug() << "ModeStateMachine: Ignoring tool change outside drawing mode";
        return false;
    }
    if (tool == ToolId::Count) {
        qWarning() << "ModeStateMachine: Invalid tool";
        return false;
    }
    if (m_tool != tool) {
        m_tool = tool;
        emit toolChanged(m_tool);
    }
    return true;
}

bool ModeStateMachine::adjustThickness(int delta)
{
    if (m_mode != Mode::Drawing) {
        qDebug() << "ModeStateMachine: Ignoring thickness change outside drawing mode";
        return false;
    }

    const int current = thickness();
    const int next = qBound(kMinThickness, current + delta, kMaxThickness);
    if (next != current) {
        m_thickness[m_colorName] = next;
        emit thicknessChanged(m_colorName, next);
    }
    return true;
}

bool ModeStateMachine::acceptsHistoryCommand(bool hasHistory) const
{
    switch (m_mode) {
    case Mode::Drawing:
        return true;
    case Mode::Idle:
        return hasHistory;
    case Mode::SpotlightOnly:
        break;
    }
    return false;
}

void ModeStateMachine::setMode(Mode mode)
{
    if (m_mode == mode) {
        return;
    }
    const Mode previous = m_mode;
    const bool spotlightWasActive = (previous == Mode::SpotlightOnly)
        || (previous == Mode::Drawing && m_restingMode == Mode::SpotlightOnly);
    m_mode = mode;
    qDebug() << "ModeStateMachine: Mode" << previous << "->" << mode
             << (mode == Mode::Drawing ? m_colorName : QString());
    emit modeChanged(m_mode, previous);

    if (spotlightWasActive != isSpotlightActive()) {
        emit spotlightChanged(isSpotlightActive());
    }
}
