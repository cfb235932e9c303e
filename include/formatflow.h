#pragma once

#include "scriptformat.h"

namespace FormatFlow {

ScriptFormat::Role initialRole();

// Role given to the line created when a line of the given role is committed.
ScriptFormat::Role nextRoleOnCommit(ScriptFormat::Role currentRole);
// Accepts any stored state; out-of-range values fall back to Header for an
// empty document and Action otherwise.
ScriptFormat::Role nextRoleOnCommit(int currentState, bool documentEmpty);

ScriptFormat::Role nextRoleOnCycle(int currentState, int direction);

} // namespace FormatFlow
