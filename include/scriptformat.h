#pragma once

#include <QString>
#include <QVector>

namespace ScriptFormat {

enum Role {
    Header = 0,
    Action,
    Speaker,
    Dialog,
    Directions,
    ChapterBreak,
    RoleCount
};

// Used when a tag or stored state cannot be resolved.
constexpr Role DEFAULT_ROLE = Action;

// Courier 12pt prints 10 characters per inch.
constexpr int CHARACTERS_PER_INCH = 10;

bool isValidRole(int state);
Role roleFromState(int state, Role fallback = DEFAULT_ROLE);

QString tagForRole(Role role);
Role roleForTag(const QString &tag, bool *ok = nullptr);
QString displayName(Role role);

bool isUppercaseRole(Role role);
double textWidthInches(Role role);
int charactersPerLine(Role role);

const QVector<Role> &cycleOrder();
const QVector<Role> &allRoles();

} // namespace ScriptFormat
