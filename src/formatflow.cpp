#include "formatflow.h"

using ScriptFormat::Role;

namespace FormatFlow {

Role initialRole()
{
    return ScriptFormat::Header;
}

Role nextRoleOnCommit(Role currentRole)
{
    switch (currentRole) {
    case ScriptFormat::Header:
        return ScriptFormat::Action;
    case ScriptFormat::Action:
        return ScriptFormat::Action;
    case ScriptFormat::Speaker:
        return ScriptFormat::Dialog;
    case ScriptFormat::Dialog:
        return ScriptFormat::Speaker;
    case ScriptFormat::Directions:
        return ScriptFormat::Dialog;
    case ScriptFormat::ChapterBreak:
        return ScriptFormat::Header;
    default:
        return ScriptFormat::Action;
    }
}

Role nextRoleOnCommit(int currentState, bool documentEmpty)
{
    if (!ScriptFormat::isValidRole(currentState)) {
        return documentEmpty ? ScriptFormat::Header : ScriptFormat::Action;
    }
    return nextRoleOnCommit(static_cast<Role>(currentState));
}

Role nextRoleOnCycle(int currentState, int direction)
{
    const QVector<Role> &order = ScriptFormat::cycleOrder();
    const int index = ScriptFormat::isValidRole(currentState)
        ? order.indexOf(static_cast<Role>(currentState))
        : -1;
    if (index < 0) {
        return ScriptFormat::Action;
    }

    const int count = order.size();
    const int step = direction < 0 ? -1 : 1;
    return order.at((index + step + count) % count);
}

} // namespace FormatFlow
