// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QProcess>
#include <QTemporaryDir>
#include <QTest>

#include "core/processinspector.h"
#include "core/processrunner.h"
#include "core/sessionstore.h"

using namespace DisplaySwitch;

/**
 * @brief Tests for the real process plumbing: pid file, /proc inspection, QProcess runner
 */
class TestProcessSupport : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════════
    // PidFileSessionStore
    // ═══════════════════════════════════════════════════════════════════════════

    void testClaimAndRelease()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("displayswitch.pid"));
        PidFileSessionStore store(path);

        QVERIFY(!store.currentHolder().has_value());

        QVERIFY(store.claim(1234));
        QCOMPARE(store.currentHolder(), std::optional<qint64>(1234));

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QCOMPARE(file.readAll(), QByteArray("1234"));
        file.close();

        QVERIFY(store.claim(99));
        QCOMPARE(store.currentHolder(), std::optional<qint64>(99));

        store.release();
        QVERIFY(!QFile::exists(path));
        QVERIFY(!store.currentHolder().has_value());

        // Releasing twice is harmless
        store.release();
    }

    void testGarbageMarkerIgnored()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("displayswitch.pid"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("not a pid\n");
        file.close();

        PidFileSessionStore store(path);
        QVERIFY(!store.currentHolder().has_value());
    }

    void testDefaultPathInRuntimeDirectory()
    {
        QVERIFY(PidFileSessionStore::defaultPath().endsWith(QStringLiteral("/displayswitch.pid")));
        PidFileSessionStore store;
        QCOMPARE(store.path(), PidFileSessionStore::defaultPath());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // ProcProcessInspector
    // ═══════════════════════════════════════════════════════════════════════════

    void testInspectOwnProcess()
    {
        ProcProcessInspector inspector;
        const qint64 self = QCoreApplication::applicationPid();

        QVERIFY(inspector.isAlive(self));
        QCOMPARE(inspector.programName(self), QFileInfo(QCoreApplication::applicationFilePath()).fileName());
    }

    void testMissingProcess()
    {
        ProcProcessInspector inspector;
        // Far beyond any pid_max
        const qint64 missing = 0x7ffffff0;
        QVERIFY(!inspector.isAlive(missing));
        QVERIFY(inspector.programName(missing).isEmpty());
        QVERIFY(!inspector.terminate(missing));
        QVERIFY(!inspector.isAlive(0));
    }

    void testTerminateRunningProcess()
    {
        QProcess sleeper;
        sleeper.start(QStringLiteral("sleep"), {QStringLiteral("30")});
        QVERIFY(sleeper.waitForStarted());

        ProcProcessInspector inspector;
        QCOMPARE(inspector.programName(sleeper.processId()), QStringLiteral("sleep"));
        QVERIFY(inspector.terminate(sleeper.processId()));

        QVERIFY(sleeper.waitForFinished(5000));
        QCOMPARE(sleeper.exitStatus(), QProcess::CrashExit);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // ProcessCommandRunner
    // ═══════════════════════════════════════════════════════════════════════════

    void testRunPassesInputAndCollectsOutput()
    {
        ProcessCommandRunner runner;
        qint64 startedPid = 0;

        const CommandResult result = runner.run(
            QStringLiteral("sh"), {QStringLiteral("-c"), QStringLiteral("cat; echo oops >&2; exit 3")},
            QByteArray("home\nleft"), 5000, [&startedPid](qint64 pid) {
                startedPid = pid;
            });

        QVERIFY(result.started);
        QVERIFY(!result.timedOut);
        QVERIFY(!result.crashed);
        QCOMPARE(result.exitCode, 3);
        QCOMPARE(result.standardOutput, QStringLiteral("home\nleft"));
        QCOMPARE(result.standardError, QStringLiteral("oops\n"));
        QVERIFY(!result.succeeded());
        QVERIFY(startedPid > 0);
    }

    void testRunTimeoutTerminates()
    {
        ProcessCommandRunner runner;
        const CommandResult result = runner.run(QStringLiteral("sleep"), {QStringLiteral("30")}, QByteArray(), 200);
        QVERIFY(result.started);
        QVERIFY(result.timedOut);
        QVERIFY(!result.succeeded());
    }

    void testRunMissingProgram()
    {
        ProcessCommandRunner runner;
        const CommandResult result =
            runner.run(QStringLiteral("/nonexistent/displayswitch-no-such-tool"), {}, QByteArray(), 1000);
        QVERIFY(!result.started);
        QVERIFY(!result.errorString.isEmpty());
        // Callers name the program themselves
        QVERIFY(!result.errorString.contains(QStringLiteral("displayswitch-no-such-tool")));
    }
};

QTEST_GUILESS_MAIN(TestProcessSupport)
#include "test_process_support.moc"
