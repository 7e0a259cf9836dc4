#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();

    void testLogEventWrites();
    void testDebugNeedsTrace();
    void testCorrelationScope();
    void testAppendsAcrossInit();

private:
    QTemporaryDir m_tempDir;

    QList<nlohmann::json> readLines(const QString &path) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
}

QList<nlohmann::json> LoggingTests::readLines(const QString &path) const
{
    QList<nlohmann::json> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.append(nlohmann::json::parse(line.toStdString()));
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    const QString logPath = m_tempDir.path() + "/logs/hostprep-test.log";
    hostprep::logging::initLogging(QStringLiteral("hostprep-test"), logPath, false);
    QCOMPARE(hostprep::logging::currentLogFilePath(), logPath);

    hostprep::logging::logEvent(hostprep::logging::LogLevel::Info,
                                QStringLiteral("hostprep-test"),
                                QStringLiteral("Test"),
                                QStringLiteral("testLogEventWrites"),
                                QStringLiteral("test_log"),
                                QStringLiteral("unit_test"),
                                QStringLiteral("direct_call"),
                                hostprep::logging::defaultWho(),
                                QStringLiteral("corr-1"),
                                nlohmann::json{{"key", "value"}});

    const auto lines = readLines(logPath);
    QCOMPARE(lines.size(), 1);
    const auto &parsed = lines.first();
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugNeedsTrace()
{
    const QString quietPath = m_tempDir.path() + "/quiet.log";
    hostprep::logging::initLogging(QStringLiteral("hostprep-test"), quietPath, false);
    QVERIFY(!hostprep::logging::isTraceEnabled());
    HPLOG_DEBUG(QStringLiteral("Test"), QStringLiteral("testDebugNeedsTrace"),
                QStringLiteral("hidden"), QString(), QString(), QString(), QString(),
                nlohmann::json::object());
    QVERIFY(readLines(quietPath).isEmpty());

    const QString tracePath = m_tempDir.path() + "/trace.log";
    hostprep::logging::initLogging(QStringLiteral("hostprep-test"), tracePath, true);
    QVERIFY(hostprep::logging::isTraceEnabled());
    HPLOG_DEBUG(QStringLiteral("Test"), QStringLiteral("testDebugNeedsTrace"),
                QStringLiteral("shown"), QString(), QString(), QString(), QString(),
                nlohmann::json::object());
    const auto lines = readLines(tracePath);
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines.first().value("what", "")), QStringLiteral("shown"));
}

void LoggingTests::testCorrelationScope()
{
    hostprep::logging::setCorrelationId(QStringLiteral("outer"));
    {
        const hostprep::logging::CorrelationScope scope(QStringLiteral("pkg:git"));
        QCOMPARE(hostprep::logging::currentCorrelationId(), QStringLiteral("pkg:git"));
    }
    QCOMPARE(hostprep::logging::currentCorrelationId(), QStringLiteral("outer"));
    hostprep::logging::setCorrelationId(QString());
}

void LoggingTests::testAppendsAcrossInit()
{
    const QString logPath = m_tempDir.path() + "/append.log";
    for (int i = 0; i < 2; ++i) {
        hostprep::logging::initLogging(QStringLiteral("hostprep-test"), logPath, false);
        HPLOG_INFO(QStringLiteral("Test"), QStringLiteral("testAppendsAcrossInit"),
                   QStringLiteral("line"), QString(), QString(), QString(), QString(),
                   (nlohmann::json{{"i", i}}));
    }
    const auto lines = readLines(logPath);
    QCOMPARE(lines.size(), 2);
    QCOMPARE(lines.at(0)["context"].value("i", -1), 0);
    QCOMPARE(lines.at(1)["context"].value("i", -1), 1);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
