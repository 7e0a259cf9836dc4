#include <QtTest/QtTest>

#include <QDir>
#include <QElapsedTimer>
#include <QTemporaryDir>

#include "common/interrupt.hpp"
#include "common/process_utils.hpp"

class ProcessUtilsTests : public QObject
{
    Q_OBJECT
private slots:
    void cleanup();

    void testSuccessfulCommand();
    void testNonZeroExit();
    void testStderrIsDiagnostic();
    void testMissingProgram();
    void testTimeoutStopsChild();
    void testInterruptStopsChild();
    void testWorkingDirectoryAndEnvironment();
    void testRequestFor();
};

void ProcessUtilsTests::cleanup()
{
    hostprep::clearInterrupt();
}

void ProcessUtilsTests::testSuccessfulCommand()
{
    hostprep::QProcessRunner runner;
    hostprep::ProcessRequest request;
    request.program = QStringLiteral("sh");
    request.arguments = {QStringLiteral("-c"), QStringLiteral("echo hello")};

    const auto result = runner.run(request);
    QVERIFY(result.started);
    QVERIFY(result.succeeded());
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(QString::fromStdString(result.standardOutput), QStringLiteral("hello"));
}

void ProcessUtilsTests::testNonZeroExit()
{
    hostprep::QProcessRunner runner;
    hostprep::ProcessRequest request;
    request.program = QStringLiteral("false");

    const auto result = runner.run(request);
    QVERIFY(result.started);
    QVERIFY(!result.succeeded());
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.errorText().empty());
}

void ProcessUtilsTests::testStderrIsDiagnostic()
{
    hostprep::QProcessRunner runner;
    hostprep::ProcessRequest request;
    request.program = QStringLiteral("sh");
    request.arguments = {QStringLiteral("-c"),
                         QStringLiteral("echo progress; echo 'E: Unable to locate package' >&2; exit 3")};

    const auto result = runner.run(request);
    QVERIFY(!result.succeeded());
    QCOMPARE(result.exitCode, 3);
    QCOMPARE(QString::fromStdString(result.errorText()),
             QStringLiteral("E: Unable to locate package"));
}

void ProcessUtilsTests::testMissingProgram()
{
    hostprep::QProcessRunner runner;
    hostprep::ProcessRequest request;
    request.program = QStringLiteral("hostprep-no-such-program");

    const auto result = runner.run(request);
    QVERIFY(!result.started);
    QVERIFY(!result.succeeded());
    QVERIFY(!result.errorText().empty());
    QVERIFY(!hostprep::isProgramAvailable("hostprep-no-such-program"));
    QVERIFY(hostprep::isProgramAvailable("sh"));
}

void ProcessUtilsTests::testTimeoutStopsChild()
{
    hostprep::QProcessRunner runner;
    hostprep::ProcessRequest request;
    request.program = QStringLiteral("sleep");
    request.arguments = {QStringLiteral("5")};
    request.timeout = std::chrono::milliseconds(300);

    QElapsedTimer timer;
    timer.start();
    const auto result = runner.run(request);
    QVERIFY(result.timedOut);
    QVERIFY(!result.succeeded());
    QVERIFY(timer.elapsed() < 4500);
    QVERIFY(QString::fromStdString(result.errorText()).startsWith(QStringLiteral("timed out")));
}

void ProcessUtilsTests::testInterruptStopsChild()
{
    hostprep::requestInterrupt();

    hostprep::QProcessRunner runner;
    hostprep::ProcessRequest request;
    request.program = QStringLiteral("sleep");
    request.arguments = {QStringLiteral("5")};

    QElapsedTimer timer;
    timer.start();
    const auto result = runner.run(request);
    QVERIFY(result.interrupted);
    QVERIFY(!result.succeeded());
    QVERIFY(timer.elapsed() < 4500);
    QCOMPARE(QString::fromStdString(result.errorText()), QStringLiteral("interrupted by signal"));
}

void ProcessUtilsTests::testWorkingDirectoryAndEnvironment()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    hostprep::QProcessRunner runner;
    hostprep::ProcessRequest request;
    request.program = QStringLiteral("sh");
    request.arguments = {QStringLiteral("-c"), QStringLiteral("pwd -P; printf %s \"$HOSTPREP_MARKER\"")};
    request.workingDirectory = dir.path();
    request.environment = {QStringLiteral("HOSTPREP_MARKER=marker-value")};

    const auto result = runner.run(request);
    QVERIFY(result.succeeded());
    const QStringList lines = QString::fromStdString(result.standardOutput).split('\n');
    QCOMPARE(lines.size(), 2);
    QCOMPARE(lines.at(0), QDir(dir.path()).canonicalPath());
    QCOMPARE(lines.at(1), QStringLiteral("marker-value"));
}

void ProcessUtilsTests::testRequestFor()
{
    const hostprep::CommandTemplate install{"apt", {"install", "-y"}};
    const auto request = hostprep::requestFor(install, {"git"}, std::chrono::seconds(5));
    QCOMPARE(request.program, QStringLiteral("apt"));
    QCOMPARE(request.arguments,
             QStringList({QStringLiteral("install"), QStringLiteral("-y"), QStringLiteral("git")}));
    QVERIFY(request.timeout == std::chrono::milliseconds(5000));
    QCOMPARE(QString::fromStdString(hostprep::describeCommand(install, {"git"})),
             QStringLiteral("apt install -y git"));
}

QTEST_MAIN(ProcessUtilsTests)
#include "test_process_utils.moc"
