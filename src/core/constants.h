// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace DisplaySwitch {

/**
 * @brief Built-in scenario names offered by the interactive picker
 *
 * Any other selection is treated as an output name (ad-hoc placement).
 */
namespace Selection {
inline constexpr QLatin1String Internal{"internal"};
inline constexpr QLatin1String Home{"home"};
inline constexpr QLatin1String HomePresent{"home-present"};
inline constexpr QLatin1String Present{"present"};
// Blank row between the scenarios and the per-output entries
inline constexpr QLatin1String Separator{""};
}

/**
 * @brief Prompts shown by the picker
 */
namespace Prompt {
inline constexpr QLatin1String Screen{"screen"};
inline constexpr QLatin1String Config{"config"};
}

/**
 * @brief xrandr flag grammar
 */
namespace XrandrFlag {
inline constexpr QLatin1String Verbose{"--verbose"};
inline constexpr QLatin1String Output{"--output"};
inline constexpr QLatin1String LeftOf{"--left-of"};
inline constexpr QLatin1String Above{"--above"};
inline constexpr QLatin1String RightOf{"--right-of"};
inline constexpr QLatin1String SameAs{"--same-as"};
inline constexpr QLatin1String Auto{"--auto"};
inline constexpr QLatin1String Mode{"--mode"};
inline constexpr QLatin1String Off{"--off"};
inline constexpr QLatin1String Rotate{"--rotate"};
}

/**
 * @brief Fixed values of the display topology engine
 */
namespace Defaults {
// Every DisplayPort connector name starts with this prefix (the eDP panel does not)
inline constexpr QLatin1String DisplayPortPrefix{"DP"};

// Picker exit code meaning "user aborted" (rofi returns 1 on Escape)
constexpr int PickerCancelExitCode = 1;

// Prompt flag passed before the prompt text
inline constexpr QLatin1String PickerPromptFlag{"-p"};

// Session marker file name inside $XDG_RUNTIME_DIR
inline constexpr QLatin1String SessionMarkerFileName{"displayswitch.pid"};

// Grace period between SIGTERM and SIGKILL when a bounded wait expires
constexpr int TerminateGraceMs = 500;

// How long to wait for an external program to start
constexpr int StartTimeoutMs = 5000;

// Interval at which shutdown re-signals a picker while the worker thread drains
constexpr int WorkerStopPollMs = 100;
}

/**
 * @brief Desktop notification constants (org.freedesktop.Notifications)
 */
namespace Notification {
inline constexpr QLatin1String Service{"org.freedesktop.Notifications"};
inline constexpr QLatin1String Path{"/org/freedesktop/Notifications"};
inline constexpr QLatin1String Interface{"org.freedesktop.Notifications"};
inline constexpr QLatin1String AppName{"displayswitch"};
inline constexpr QLatin1String AppIcon{"video-display"};

// Urgency hint values understood by org.freedesktop.Notifications
constexpr uchar UrgencyNormal = 1;
constexpr uchar UrgencyCritical = 2;

// Single-shot runs exit right after notifying, so the call waits for delivery
constexpr int CallTimeoutMs = 2000;
}

} // namespace DisplaySwitch
