// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace DisplaySwitch {

// Key functions anchoring the interface vtables in the core library

ICommandRunner::~ICommandRunner() = default;

IOptionPicker::~IOptionPicker() = default;

ISessionStore::~ISessionStore() = default;

IProcessInspector::~IProcessInspector() = default;

INotifier::~INotifier() = default;

} // namespace DisplaySwitch
