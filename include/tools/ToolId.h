#ifndef TOOLID_H
#define TOOLID_H

/**
 * @brief Drawing tool identifier.
 *
 * Every committed stroke is produced by exactly one of these tools.
 */
enum class ToolId {
    Freehand = 0,
    Line,
    Rectangle,
    Arrow,
    Circle,

    Count
};

#endif // TOOLID_H
