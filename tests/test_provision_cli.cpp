#include <QtTest/QtTest>

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <stdexcept>

#include "cli/ProvisionCli.hpp"
#include "common/config.hpp"
#include "provision/provisioning_pipeline.hpp"
#include "report/ReportGenerator.hpp"
#include "test_fakes.hpp"

class ProvisionCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanup();

    void testDefaultsSurviveEmptyCommandLine();
    void testFlagsOverrideConfig();
    void testConfigFromEnvironment();
    void testHelpAndVersion();
    void testRejectedInput_data();
    void testRejectedInput();
    void testUnsupportedHostStopsBeforeAnyCommand();
    void testEscapedErrorBecomesInternalErrorExit();

private:
    QTemporaryDir m_tempDir;

    QString writeFile(const QString &name, const QByteArray &content);
};

void ProvisionCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

void ProvisionCliTests::cleanup()
{
    qunsetenv("HOSTPREP_CONFIG");
    qunsetenv("HOSTPREP_OS_RELEASE");
    qunsetenv("HOSTPREP_OUTPUT_DIR");
}

QString ProvisionCliTests::writeFile(const QString &name, const QByteArray &content)
{
    const QString path = m_tempDir.path() + "/" + name;
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

void ProvisionCliTests::testDefaultsSurviveEmptyCommandLine()
{
    hostprep::ProvisionCli cli;
    auto config = hostprep::defaultConfig();
    QCOMPARE(cli.parseArguments({QStringLiteral("hostprep")}, config), -1);
    QVERIFY(config.requirePrivileges);
    QVERIFY(!config.assumeYes);
    QVERIFY(!config.declineOptional);
    QCOMPARE(config.requiredPackages.size(), size_t(11));
}

void ProvisionCliTests::testFlagsOverrideConfig()
{
    const QString configPath = writeFile(QStringLiteral("cli.json"), R"({
        "outputDir": "/srv/from-file",
        "attemptTimeoutSeconds": 120,
        "optionalPackages": ["tlp"]
    })");

    hostprep::ProvisionCli cli;
    auto config = hostprep::defaultConfig();
    const QStringList args = {QStringLiteral("hostprep"),
                              QStringLiteral("--config"), configPath,
                              QStringLiteral("--output-dir"), QStringLiteral("/srv/from-flag"),
                              QStringLiteral("--attempt-timeout"), QStringLiteral("30"),
                              QStringLiteral("--dotfiles-repo"), QStringLiteral("https://example.com/d.git"),
                              QStringLiteral("--yes"),
                              QStringLiteral("--upgrade"),
                              QStringLiteral("--no-root-check"),
                              QStringLiteral("--trace")};
    QCOMPARE(cli.parseArguments(args, config), -1);

    QCOMPARE(QString::fromStdString(config.outputDir), QStringLiteral("/srv/from-flag"));
    QVERIFY(config.attemptTimeout == std::chrono::seconds(30));
    QCOMPARE(config.optionalPackages.size(), size_t(1));
    QCOMPARE(QString::fromStdString(config.dotfilesRepository),
             QStringLiteral("https://example.com/d.git"));
    QVERIFY(config.assumeYes);
    QVERIFY(config.upgradeSystem);
    QVERIFY(!config.requirePrivileges);
    QVERIFY(config.traceEnabled);
}

void ProvisionCliTests::testConfigFromEnvironment()
{
    const QString configPath = writeFile(QStringLiteral("env.json"),
                                         R"({"outputDir": "/srv/from-file"})");
    qputenv("HOSTPREP_CONFIG", configPath.toUtf8());
    qputenv("HOSTPREP_OUTPUT_DIR", "/srv/from-env");

    hostprep::ProvisionCli cli;
    auto config = hostprep::defaultConfig();
    QCOMPARE(cli.parseArguments({QStringLiteral("hostprep")}, config), -1);
    // Environment wins over the file.
    QCOMPARE(QString::fromStdString(config.outputDir), QStringLiteral("/srv/from-env"));
}

void ProvisionCliTests::testHelpAndVersion()
{
    hostprep::ProvisionCli cli;
    auto config = hostprep::defaultConfig();
    QCOMPARE(cli.parseArguments({QStringLiteral("hostprep"), QStringLiteral("--help")}, config),
             hostprep::kExitSuccess);
    QCOMPARE(cli.parseArguments({QStringLiteral("hostprep"), QStringLiteral("--version")}, config),
             hostprep::kExitSuccess);
}

void ProvisionCliTests::testRejectedInput_data()
{
    QTest::addColumn<QStringList>("args");

    QTest::newRow("unknown-option") << QStringList{QStringLiteral("hostprep"),
                                                   QStringLiteral("--frobnicate")};
    QTest::newRow("positional") << QStringList{QStringLiteral("hostprep"), QStringLiteral("extra")};
    QTest::newRow("yes-and-no-optional") << QStringList{QStringLiteral("hostprep"),
                                                        QStringLiteral("-y"),
                                                        QStringLiteral("--no-optional")};
    QTest::newRow("bad-timeout") << QStringList{QStringLiteral("hostprep"),
                                                QStringLiteral("--attempt-timeout"),
                                                QStringLiteral("-5")};
    QTest::newRow("timeout-over-a-day") << QStringList{QStringLiteral("hostprep"),
                                                       QStringLiteral("--attempt-timeout"),
                                                       QStringLiteral("90000")};
    QTest::newRow("missing-config") << QStringList{QStringLiteral("hostprep"),
                                                   QStringLiteral("--config"),
                                                   QStringLiteral("/nonexistent/hostprep.json")};
}

void ProvisionCliTests::testRejectedInput()
{
    QFETCH(QStringList, args);

    hostprep::ProvisionCli cli;
    auto config = hostprep::defaultConfig();
    QCOMPARE(cli.parseArguments(args, config), hostprep::kExitFatalPrecondition);
}

void ProvisionCliTests::testUnsupportedHostStopsBeforeAnyCommand()
{
    const QString release = writeFile(QStringLiteral("os-release-arch"),
                                      "NAME=\"Arch Linux\"\nID=arch\n");
    const QString outputDir = m_tempDir.path() + "/run-out";
    qputenv("HOSTPREP_OS_RELEASE", release.toUtf8());

    QByteArray arg0("hostprep");
    QByteArray arg1("--no-root-check");
    QByteArray arg2("--output-dir");
    QByteArray arg3 = outputDir.toUtf8();
    char *argv[] = {arg0.data(), arg1.data(), arg2.data(), arg3.data()};

    hostprep::ProvisionCli cli;
    QCOMPARE(cli.run(4, argv), hostprep::kExitFatalPrecondition);

    const QStringList logs = QDir(outputDir).entryList({QStringLiteral("hostprep-*.log")}, QDir::Files);
    QCOMPARE(logs.size(), 1);
    const QStringList reports =
        QDir(outputDir).entryList({QStringLiteral("hostprep-report-*")}, QDir::Files);
    QVERIFY(reports.isEmpty());
}

void ProvisionCliTests::testEscapedErrorBecomesInternalErrorExit()
{
    const QString release = writeFile(QStringLiteral("os-release-ubuntu"),
                                      "NAME=\"Ubuntu\"\nID=ubuntu\nID_LIKE=debian\n");
    const QString outputDir = m_tempDir.path() + "/escaped-out";

    auto config = hostprep::defaultConfig();
    config.osReleasePath = release.toStdString();
    config.outputDir = outputDir.toStdString();
    config.requirePrivileges = false;
    config.retryDelay = std::chrono::milliseconds(0);
    const auto paths = hostprep::artifactPathsFor(outputDir, QDateTime::currentDateTimeUtc());

    hostprep::testing::ScriptedProcessRunner runner;
    hostprep::testing::ScriptedPrompter prompter(true);
    prompter.onAsk = [](const std::string &) {
        throw std::runtime_error("terminal went away");
    };
    hostprep::testing::FakeDotfilesCloner cloner;
    hostprep::ProvisioningPipeline pipeline(config, paths, runner, prompter, cloner);
    pipeline.setSleepFunction([](std::chrono::milliseconds) {});
    pipeline.setProgramLookup([](const std::string &) { return true; });

    hostprep::ProvisionCli cli;
    QCOMPARE(cli.runPipeline(pipeline), hostprep::kExitInternalError);
    QVERIFY(QFile::exists(QString::fromStdString(paths.reportPath)));
    QVERIFY(QFile::exists(QString::fromStdString(paths.jsonReportPath)));
}

QTEST_MAIN(ProvisionCliTests)
#include "test_provision_cli.moc"
