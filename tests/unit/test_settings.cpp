// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <KConfigGroup>
#include <KSharedConfig>
#include <QFile>
#include <QRegularExpression>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include "config/settings.h"

using namespace PaneSync;

/**
 * @brief Unit tests for Settings persistence and validation
 *
 * Tests cover:
 * - Defaults when the config file is empty
 * - Out-of-range values from setters and from disk are clamped
 * - An empty chat region marker falls back to the default
 * - save() followed by a fresh load() round-trips every setting
 * - reset() restores defaults and notifies
 */
class TestSettings : public QObject
{
    Q_OBJECT

private:
    KSharedConfig::Ptr openConfig() const
    {
        return KSharedConfig::openConfig(m_dir.filePath(QStringLiteral("panesyncrc")), KConfig::SimpleConfig);
    }

private Q_SLOTS:

    void init()
    {
        QVERIFY(m_dir.isValid());
        QFile::remove(m_dir.filePath(QStringLiteral("panesyncrc")));
    }

    void test_defaults()
    {
        Settings settings(openConfig());
        QVERIFY(settings.syncEnabled());
        QCOMPARE(settings.handshakeGraceMs(), 200);
        QCOMPARE(settings.pollIntervalMs(), 50);
        QCOMPARE(settings.chatRegionMarker(), QStringLiteral("chat-panel"));
        QVERIFY(settings.usePlasmaOsd());
    }

    void test_setters_clampOutOfRange()
    {
        Settings settings(openConfig());
        QSignalSpy changed(&settings, &Settings::pollIntervalMsChanged);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("PollIntervalMs out of range")));
        settings.setPollIntervalMs(1);
        QCOMPARE(settings.pollIntervalMs(), 10);
        QCOMPARE(changed.count(), 1);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("HandshakeGraceMs out of range")));
        settings.setHandshakeGraceMs(60000);
        QCOMPARE(settings.handshakeGraceMs(), 5000);
    }

    void test_emptyMarker_fallsBackToDefault()
    {
        Settings settings(openConfig());
        settings.setChatRegionMarker(QStringLiteral("assistant-pane"));
        QCOMPARE(settings.chatRegionMarker(), QStringLiteral("assistant-pane"));

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Empty chat region marker")));
        settings.setChatRegionMarker(QStringLiteral("   "));
        QCOMPARE(settings.chatRegionMarker(), QStringLiteral("chat-panel"));
    }

    void test_saveAndReload()
    {
        {
            Settings settings(openConfig());
            settings.setSyncEnabled(false);
            settings.setHandshakeGraceMs(350);
            settings.setPollIntervalMs(25);
            settings.setChatRegionMarker(QStringLiteral("assistant-pane"));
            settings.setUsePlasmaOsd(false);
            settings.save();
        }

        Settings reloaded(openConfig());
        QVERIFY(!reloaded.syncEnabled());
        QCOMPARE(reloaded.handshakeGraceMs(), 350);
        QCOMPARE(reloaded.pollIntervalMs(), 25);
        QCOMPARE(reloaded.chatRegionMarker(), QStringLiteral("assistant-pane"));
        QVERIFY(!reloaded.usePlasmaOsd());
    }

    void test_invalidValuesOnDisk_clamped()
    {
        {
            KSharedConfig::Ptr config = openConfig();
            KConfigGroup dragDrop = config->group(QStringLiteral("DragDrop"));
            dragDrop.writeEntry(QStringLiteral("PollIntervalMs"), 5000);
            KConfigGroup sync = config->group(QStringLiteral("Sync"));
            sync.writeEntry(QStringLiteral("HandshakeGraceMs"), -20);
            QVERIFY(config->sync());
        }

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Invalid handshake grace")));
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Invalid drag poll interval")));
        Settings settings(openConfig());

        QCOMPARE(settings.pollIntervalMs(), 1000);
        QCOMPARE(settings.handshakeGraceMs(), 0);
    }

    void test_reset_restoresDefaults()
    {
        Settings settings(openConfig());
        settings.setPollIntervalMs(100);
        settings.setSyncEnabled(false);
        QSignalSpy changed(&settings, &Settings::settingsChanged);

        settings.reset();

        QCOMPARE(settings.pollIntervalMs(), 50);
        QVERIFY(settings.syncEnabled());
        QCOMPARE(changed.count(), 2);
    }

private:
    QTemporaryDir m_dir;
};

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
