// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <KConfigGroup>
#include <QFile>
#include <QMap>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>
#include <memory>

#include "config/settings.h"
#include "core/commandsynthesizer.h"
#include "core/desktopeffects.h"
#include "core/displayswitcher.h"
#include "core/outputinventory.h"
#include "core/presets.h"
#include "core/topologyresolver.h"
#include "fakes.h"

using namespace DisplaySwitch;
using namespace DisplaySwitch::Testing;

namespace {

/**
 * @brief Minimal stand-in for the display tool
 *
 * Keeps per-output geometry, answers "--verbose" with a report and applies
 * "--output" groups the way the real tool positions outputs.
 */
class DisplayToolSimulator
{
public:
    struct State
    {
        QSize preferred{1920, 1080};
        QRect geometry; ///< Invalid while the output is off
    };

    void connect(const QString& name, const QSize& preferred, const QRect& geometry = QRect())
    {
        m_outputs.insert(name, State{preferred, geometry});
        m_order.append(name);
    }

    CommandResult handle(const RecordedCall& call)
    {
        if (call.arguments == QStringList{QStringLiteral("--verbose")}) {
            return okResult(report());
        }
        apply(call.arguments);
        return okResult();
    }

    QString report() const
    {
        QString text = QStringLiteral("Screen 0: minimum 8 x 8, current 0 x 0, maximum 32767 x 32767\n");
        for (const QString& name : m_order) {
            const State& state = m_outputs.value(name);
            text += name + QStringLiteral(" connected");
            if (state.geometry.isValid()) {
                text += QStringLiteral(" %1x%2+%3+%4")
                            .arg(state.geometry.width())
                            .arg(state.geometry.height())
                            .arg(state.geometry.x())
                            .arg(state.geometry.y());
            }
            text += QStringLiteral(" (normal left inverted right x axis y axis)\n");
        }
        return text;
    }

private:
    void apply(const QStringList& args)
    {
        for (int i = 0; i < args.size(); ++i) {
            if (args.at(i) != QLatin1String("--output")) {
                continue;
            }
            const QString name = args.value(++i);
            State& state = m_outputs[name];
            QSize size = state.preferred;
            QString relation;
            QString reference;
            bool off = false;

            while (i + 1 < args.size() && args.at(i + 1) != QLatin1String("--output")) {
                const QString flag = args.at(++i);
                if (flag == QLatin1String("--off")) {
                    off = true;
                } else if (flag == QLatin1String("--mode")) {
                    const QStringList wh = args.value(++i).split(QLatin1Char('x'));
                    size = QSize(wh.value(0).toInt(), wh.value(1).toInt());
                } else if (flag == QLatin1String("--rotate")) {
                    ++i;
                } else if (flag != QLatin1String("--auto")) {
                    relation = flag;
                    reference = args.value(++i);
                }
            }

            if (off) {
                state.geometry = QRect();
                continue;
            }

            const QRect ref = m_outputs.value(reference).geometry;
            QPoint pos = state.geometry.isValid() ? state.geometry.topLeft() : QPoint(0, 0);
            if (relation == QLatin1String("--left-of")) {
                pos = QPoint(ref.x() - size.width(), ref.y());
            } else if (relation == QLatin1String("--right-of")) {
                pos = QPoint(ref.x() + ref.width(), ref.y());
            } else if (relation == QLatin1String("--above")) {
                pos = QPoint(ref.x(), ref.y() - size.height());
            } else if (relation == QLatin1String("--same-as")) {
                pos = ref.topLeft();
            }
            state.geometry = QRect(pos, size);
        }
        normalize();
    }

    // The framebuffer origin is always the top-left corner of the union
    void normalize()
    {
        int minX = 0;
        int minY = 0;
        for (const State& state : std::as_const(m_outputs)) {
            if (state.geometry.isValid()) {
                minX = qMin(minX, state.geometry.x());
                minY = qMin(minY, state.geometry.y());
            }
        }
        for (State& state : m_outputs) {
            if (state.geometry.isValid()) {
                state.geometry.translate(-minX, -minY);
            }
        }
    }

    QMap<QString, State> m_outputs;
    QStringList m_order;
};

OutputList outputsNamed(const QStringList& names)
{
    OutputList outputs;
    for (const QString& name : names) {
        outputs.append(Output::fromName(name));
    }
    return outputs;
}

} // anonymous namespace

/**
 * @brief Unit tests for DisplaySwitcher and DesktopEffects
 *
 * Tests cover:
 * - The option list offered on the first prompt
 * - Full interactive cycles and their side effects
 * - Error reporting for each error kind, and silence on cancellation
 * - Read-back of applied presets from the display tool
 */
class TestDisplaySwitcher : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        m_dir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_dir->isValid());

        const QString configPath = m_dir->filePath(QStringLiteral("displayswitchrc"));
        {
            KSharedConfig::Ptr config = KSharedConfig::openConfig(configPath, KConfig::SimpleConfig);
            KConfigGroup desktop = config->group(QStringLiteral("Desktop"));
            desktop.writeEntry(QStringLiteral("WallpaperScript"), wallpaperScript());
            config->sync();
        }
        m_settings = std::make_unique<Settings>(KSharedConfig::openConfig(configPath, KConfig::SimpleConfig));

        m_runner = std::make_unique<FakeCommandRunner>();
        m_runner->setResult(QStringLiteral("herbstclient"),
                            okResult(QStringLiteral("0: 1920x1080+2560+0 with tag 1 [FOCUS]\n"
                                                    "1: 2560x1440+0+0 with tag 2\n")));
        m_picker = std::make_unique<FakePicker>();
        m_notifier = std::make_unique<FakeNotifier>();

        m_inventory = std::make_unique<OutputInventory>(m_runner.get(), m_settings.get());
        m_resolver = std::make_unique<TopologyResolver>(m_picker.get(), m_settings.get());
        m_synthesizer = std::make_unique<CommandSynthesizer>(m_runner.get(), m_settings.get());
        m_effects = std::make_unique<DesktopEffects>(m_runner.get(), m_settings.get());
        m_switcher = std::make_unique<DisplaySwitcher>(m_inventory.get(), m_picker.get(), m_resolver.get(),
                                                       m_synthesizer.get(), m_effects.get(), m_notifier.get());
    }

    void cleanup()
    {
        m_switcher.reset();
        m_effects.reset();
        m_synthesizer.reset();
        m_resolver.reset();
        m_inventory.reset();
        m_notifier.reset();
        m_picker.reset();
        m_runner.reset();
        m_settings.reset();
        m_dir.reset();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Option list
    // ═══════════════════════════════════════════════════════════════════════════

    void testOptionsWithPanelOnly()
    {
        QCOMPARE(DisplaySwitcher::selectionOptions(outputsNamed({QStringLiteral("eDP-1")})),
                 QStringList{QStringLiteral("internal")});
    }

    void testOptionsWithExternalOutputs()
    {
        const OutputList outputs = outputsNamed(
            {QStringLiteral("eDP-1"), QStringLiteral("HDMI-1"), QStringLiteral("DP-1-2"), QStringLiteral("VGA-1")});
        const QStringList expected{QStringLiteral("internal"),     QStringLiteral("home"),
                                   QStringLiteral("home-present"), QStringLiteral("present"),
                                   QString(),                      QStringLiteral("hdmi"),
                                   QStringLiteral("dp_dock_2"),    QStringLiteral("VGA-1")};
        QCOMPARE(DisplaySwitcher::selectionOptions(outputs), expected);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Cycles
    // ═══════════════════════════════════════════════════════════════════════════

    void testInteractiveHomeCycle()
    {
        DisplayToolSimulator tool;
        tool.connect(QStringLiteral("eDP-1"), QSize(1920, 1080), QRect(0, 0, 1920, 1080));
        tool.connect(QStringLiteral("DP-2"), QSize(3840, 2160));
        tool.connect(QStringLiteral("DP-1-2"), QSize(2560, 1440));
        m_runner->setHandler(QStringLiteral("xrandr"), [&tool](const RecordedCall& call) {
            return tool.handle(call);
        });
        m_picker->answers.append(PickerResult::selected(QStringLiteral("home")));

        const CycleResult result = m_switcher->runInteractive();

        QCOMPARE(result.outcome, Outcome::Applied);
        QCOMPARE(result.selection, QStringLiteral("home"));
        QCOMPARE(result.batch.size(), 3);
        QCOMPARE(m_picker->prompts, QStringList{QStringLiteral("screen")});
        QCOMPARE(m_picker->offered.first(),
                 DisplaySwitcher::selectionOptions(outputsNamed(
                     {QStringLiteral("eDP-1"), QStringLiteral("DP-2"), QStringLiteral("DP-1-2")})));

        const QList<RecordedCall> xrandr = m_runner->callsTo(QStringLiteral("xrandr"));
        QCOMPARE(xrandr.size(), 2);
        QCOMPARE(xrandr.at(1).arguments, CommandSynthesizer::arguments(result.batch));

        // Window manager refreshed, one panel per monitor
        const QList<RecordedCall> wm = m_runner->callsTo(QStringLiteral("herbstclient"));
        QCOMPARE(wm.size(), 3);
        QCOMPARE(wm.at(0).arguments, QStringList{QStringLiteral("detect_monitors")});
        QCOMPARE(wm.at(1).arguments, QStringList({QStringLiteral("emit_hook"), QStringLiteral("quit_panel")}));
        QCOMPARE(wm.at(2).arguments, QStringList{QStringLiteral("list_monitors")});
        QCOMPARE(m_runner->detached.size(), 2);
        QCOMPARE(m_runner->detached.at(0).program, QStringLiteral("barpyrus"));
        QCOMPARE(m_runner->detached.at(0).arguments, QStringList{QStringLiteral("0")});
        QCOMPARE(m_runner->detached.at(1).arguments, QStringList{QStringLiteral("1")});

        // Not presenting
        QCOMPARE(m_runner->callsTo(QStringLiteral("dunstctl")).first().arguments,
                 QStringList({QStringLiteral("set-paused"), QStringLiteral("false")}));
        QCOMPARE(m_runner->callsTo(QStringLiteral("xset")).first().arguments,
                 QStringList({QStringLiteral("s"), QStringLiteral("default")}));

        QVERIFY(m_notifier->errors.isEmpty());
        QVERIFY(m_notifier->warnings.isEmpty());
    }

    void testInternalOnlyStillRunsSideEffects()
    {
        const CycleResult result =
            m_switcher->applySelection(QStringLiteral("internal"), outputsNamed({QStringLiteral("eDP-1")}));

        QCOMPARE(result.outcome, Outcome::Applied);
        QVERIFY(result.batch.isEmpty());
        QVERIFY(m_runner->callsTo(QStringLiteral("xrandr")).isEmpty());
        QCOMPARE(m_runner->callsTo(QStringLiteral("herbstclient")).size(), 3);
        QCOMPARE(m_runner->callsTo(QStringLiteral("dunstctl")).first().arguments,
                 QStringList({QStringLiteral("set-paused"), QStringLiteral("false")}));
        QCOMPARE(m_runner->callsTo(QStringLiteral("xset")).first().arguments,
                 QStringList({QStringLiteral("s"), QStringLiteral("default")}));
    }

    void testPresentationModeEnabled_data()
    {
        QTest::addColumn<QString>("selection");
        QTest::newRow("present") << QStringLiteral("present");
        QTest::newRow("home-present") << QStringLiteral("home-present");
    }

    void testPresentationModeEnabled()
    {
        QFETCH(QString, selection);
        m_picker->answers.append(PickerResult::selected(QStringLiteral("same")));

        const CycleResult result = m_switcher->applySelection(
            selection, outputsNamed({QStringLiteral("eDP-1"), QStringLiteral("HDMI-1"), QStringLiteral("DP-2")}));

        QCOMPARE(result.outcome, Outcome::Applied);
        QCOMPARE(m_runner->callsTo(QStringLiteral("dunstctl")).first().arguments,
                 QStringList({QStringLiteral("set-paused"), QStringLiteral("true")}));
        QCOMPARE(m_runner->callsTo(QStringLiteral("xset")).first().arguments,
                 QStringList({QStringLiteral("s"), QStringLiteral("off")}));
    }

    void testWallpaperRestoredWhenScriptExists()
    {
        QFile script(wallpaperScript());
        QVERIFY(script.open(QIODevice::WriteOnly));
        script.write("#!/bin/sh\n");
        script.close();

        m_switcher->applySelection(QStringLiteral("internal"), outputsNamed({QStringLiteral("eDP-1")}));
        QCOMPARE(m_runner->callsTo(wallpaperScript()).size(), 1);
    }

    void testWallpaperSkippedWithoutScript()
    {
        m_switcher->applySelection(QStringLiteral("internal"), outputsNamed({QStringLiteral("eDP-1")}));
        QVERIFY(m_runner->callsTo(wallpaperScript()).isEmpty());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Errors, warnings and cancellation
    // ═══════════════════════════════════════════════════════════════════════════

    void testQueryErrorNotified()
    {
        m_runner->setResult(QStringLiteral("xrandr"), exitResult(1, QStringLiteral("Can't open display")));

        const CycleResult result = m_switcher->runInteractive();

        QCOMPARE(result.outcome, Outcome::Failed);
        QCOMPARE(result.error, ErrorKind::QueryError);
        QCOMPARE(m_notifier->errors.size(), 1);
        QVERIFY(m_picker->prompts.isEmpty());
    }

    void testCancelledPromptIsSilent()
    {
        DisplayToolSimulator tool;
        tool.connect(QStringLiteral("eDP-1"), QSize(1920, 1080), QRect(0, 0, 1920, 1080));
        m_runner->setHandler(QStringLiteral("xrandr"), [&tool](const RecordedCall& call) {
            return tool.handle(call);
        });

        const CycleResult result = m_switcher->runInteractive();

        QCOMPARE(result.outcome, Outcome::Unchanged);
        QVERIFY(!result.isError());
        QCOMPARE(m_runner->callsTo(QStringLiteral("xrandr")).size(), 1);
        QVERIFY(m_runner->callsTo(QStringLiteral("herbstclient")).isEmpty());
        QVERIFY(m_notifier->errors.isEmpty());
    }

    void testPickerErrorNotified()
    {
        DisplayToolSimulator tool;
        tool.connect(QStringLiteral("eDP-1"), QSize(1920, 1080), QRect(0, 0, 1920, 1080));
        m_runner->setHandler(QStringLiteral("xrandr"), [&tool](const RecordedCall& call) {
            return tool.handle(call);
        });
        m_picker->answers.append(PickerResult::failed(QStringLiteral("rofi returned 65")));

        const CycleResult result = m_switcher->runInteractive();

        QCOMPARE(result.error, ErrorKind::PickerError);
        QCOMPARE(m_notifier->errors, QStringList{QStringLiteral("rofi returned 65")});
    }

    void testAmbiguousTopologyNotified()
    {
        const CycleResult result = m_switcher->applySelection(
            QStringLiteral("present"), outputsNamed({QStringLiteral("eDP-1"), QStringLiteral("HDMI-1")}));

        QCOMPARE(result.error, ErrorKind::TopologyAmbiguous);
        QCOMPARE(m_notifier->errors.size(), 1);
        QVERIFY(m_notifier->errors.first().contains(QStringLiteral("eDP-1, HDMI-1")));
        QVERIFY(m_runner->calls.isEmpty());
    }

    void testApplyErrorSkipsSideEffects()
    {
        m_runner->setResult(QStringLiteral("xrandr"), exitResult(1, QStringLiteral("cannot find crtc for output")));

        const CycleResult result = m_switcher->applySelection(
            QStringLiteral("internal"), outputsNamed({QStringLiteral("eDP-1"), QStringLiteral("DP-2")}));

        QCOMPARE(result.outcome, Outcome::Failed);
        QCOMPARE(result.error, ErrorKind::ApplyError);
        QCOMPARE(m_notifier->errors.size(), 1);
        QVERIFY(m_notifier->errors.first().contains(QStringLiteral("cannot find crtc for output")));
        QVERIFY(m_runner->callsTo(QStringLiteral("herbstclient")).isEmpty());
        QVERIFY(m_runner->callsTo(QStringLiteral("dunstctl")).isEmpty());
    }

    void testWarningNotifiedAndSideEffectsRun()
    {
        m_runner->setResult(QStringLiteral("xrandr"), okResult(QString(), QStringLiteral("warning: no such output")));

        const CycleResult result = m_switcher->applySelection(
            QStringLiteral("internal"), outputsNamed({QStringLiteral("eDP-1"), QStringLiteral("DP-2")}));

        QCOMPARE(result.outcome, Outcome::Applied);
        QCOMPARE(result.warning, QStringLiteral("warning: no such output"));
        QCOMPARE(m_notifier->warnings, QStringList{QStringLiteral("warning: no such output")});
        QVERIFY(m_notifier->errors.isEmpty());
        QCOMPARE(m_runner->callsTo(QStringLiteral("herbstclient")).size(), 3);
    }

    void testSideEffectFailureDoesNotFailCycle()
    {
        m_runner->setResult(QStringLiteral("dunstctl"), exitResult(1, QStringLiteral("dunst not running")));

        const CycleResult result =
            m_switcher->applySelection(QStringLiteral("internal"), outputsNamed({QStringLiteral("eDP-1")}));

        QCOMPARE(result.outcome, Outcome::Applied);
        QVERIFY(m_notifier->errors.isEmpty());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Read-back
    // ═══════════════════════════════════════════════════════════════════════════

    void testPresetReadBack_data()
    {
        QTest::addColumn<QString>("preset");
        for (const QString& label : Presets::labels()) {
            QTest::newRow(qPrintable(label)) << label;
        }
    }

    void testPresetReadBack()
    {
        QFETCH(QString, preset);

        DisplayToolSimulator tool;
        tool.connect(QStringLiteral("eDP-1"), QSize(1920, 1080), QRect(0, 0, 1920, 1080));
        tool.connect(QStringLiteral("DP-2"), QSize(2560, 1440));
        m_runner->setHandler(QStringLiteral("xrandr"), [&tool](const RecordedCall& call) {
            return tool.handle(call);
        });
        m_picker->answers.append(PickerResult::selected(QStringLiteral("dp2")));
        m_picker->answers.append(PickerResult::selected(preset));

        QCOMPARE(m_switcher->runInteractive().outcome, Outcome::Applied);

        const InventoryResult after = m_inventory->listConnectedOutputs();
        QVERIFY(after.isValid());
        QCOMPARE(after.outputs.size(), 2);

        const std::optional<Relation> observed = Outputs::observedRelation(after.outputs.at(1), after.outputs.at(0));
        QVERIFY(observed.has_value());
        QCOMPARE(*observed, Presets::find(preset)->relation);
    }

private:
    QString wallpaperScript() const
    {
        return m_dir->filePath(QStringLiteral("fehbg"));
    }

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<FakeCommandRunner> m_runner;
    std::unique_ptr<FakePicker> m_picker;
    std::unique_ptr<FakeNotifier> m_notifier;
    std::unique_ptr<OutputInventory> m_inventory;
    std::unique_ptr<TopologyResolver> m_resolver;
    std::unique_ptr<CommandSynthesizer> m_synthesizer;
    std::unique_ptr<DesktopEffects> m_effects;
    std::unique_ptr<DisplaySwitcher> m_switcher;
};

QTEST_GUILESS_MAIN(TestDisplaySwitcher)
#include "test_display_switcher.moc"
