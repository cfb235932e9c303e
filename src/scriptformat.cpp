#include "scriptformat.h"

namespace ScriptFormat {

bool isValidRole(int state)
{
    return state >= 0 && state < RoleCount;
}

Role roleFromState(int state, Role fallback)
{
    return isValidRole(state) ? static_cast<Role>(state) : fallback;
}

QString tagForRole(Role role)
{
    switch (role) {
    case Header:
        return QStringLiteral("header");
    case Action:
        return QStringLiteral("action");
    case Speaker:
        return QStringLiteral("speaker");
    case Dialog:
        return QStringLiteral("dialog");
    case Directions:
        return QStringLiteral("directions");
    case ChapterBreak:
        return QStringLiteral("chapter-break");
    default:
        return tagForRole(DEFAULT_ROLE);
    }
}

Role roleForTag(const QString &tag, bool *ok)
{
    const QString normalized = tag.trimmed().toLower();
    for (Role role : allRoles()) {
        if (normalized == tagForRole(role)) {
            if (ok) *ok = true;
            return role;
        }
    }
    if (ok) *ok = false;
    return DEFAULT_ROLE;
}

QString displayName(Role role)
{
    switch (role) {
    case Header:
        return QStringLiteral("Scene Heading");
    case Action:
        return QStringLiteral("Action");
    case Speaker:
        return QStringLiteral("Character");
    case Dialog:
        return QStringLiteral("Dialogue");
    case Directions:
        return QStringLiteral("Parenthetical");
    case ChapterBreak:
        return QStringLiteral("Chapter Break");
    default:
        return QString();
    }
}

bool isUppercaseRole(Role role)
{
    return role == Header || role == Speaker || role == ChapterBreak;
}

double textWidthInches(Role role)
{
    // Printable width minus the element's left and right indents.
    switch (role) {
    case Speaker:
        return 3.7;
    case Dialog:
        return 3.5;
    case Directions:
        return 2.5;
    case Header:
    case Action:
    case ChapterBreak:
    default:
        return 6.0;
    }
}

int charactersPerLine(Role role)
{
    return static_cast<int>(textWidthInches(role) * CHARACTERS_PER_INCH);
}

const QVector<Role> &cycleOrder()
{
    static const QVector<Role> order = {Action, Speaker, Dialog, Header, Directions};
    return order;
}

const QVector<Role> &allRoles()
{
    static const QVector<Role> roles = {Header, Action, Speaker, Dialog, Directions, ChapterBreak};
    return roles;
}

} // namespace ScriptFormat
