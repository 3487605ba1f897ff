#include <QtTest/QtTest>

#include "core/sidecar/diagnostic_log.h"
#include "core/sidecar/launch_outcome.h"
#include "sidecar_test_utils.h"

#include <QDateTime>
#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QTimeZone>

namespace {

QDateTime fixedTimestamp()
{
    return QDateTime(QDate(2026, 3, 14), QTime(9, 26, 53, 589), QTimeZone::utc());
}

} // namespace

class TestDiagnosticLog : public QObject {
    Q_OBJECT

private slots:
    void testFormatsSuccessEntry();
    void testFormatsFailureEntryWithCause();
    void testFormatsMissingPath();
    void testEscapesQuotesAndNewlines();
    void testQuoteLogValue();
    void testFailureWithoutCauseIsNotSuccess();
    void testOutcomeJson();
    void testAppendCreatesDirectoryAndFile();
    void testAppendNeverTruncates();
    void testAppendFailsQuietlyWhenDirectoryCannotBeCreated();
    void testAppendFailsForEmptyPath();
};

void TestDiagnosticLog::testFormatsSuccessEntry()
{
    const QString entry = fo::DiagnosticLog::formatEntry(
        fixedTimestamp(),
        QStringLiteral("/opt/fo/file-organizer-backend"),
        fo::LaunchOutcome::succeeded(4242));
    QCOMPARE(entry,
             QStringLiteral("2026-03-14T09:26:53.589Z sidecar spawn: "
                            "path=\"/opt/fo/file-organizer-backend\" result=ok pid=4242"));
}

void TestDiagnosticLog::testFormatsFailureEntryWithCause()
{
    const QString entry = fo::DiagnosticLog::formatEntry(
        fixedTimestamp(),
        QStringLiteral("/opt/fo/file-organizer-backend"),
        fo::LaunchOutcome::failed(fo::LaunchFailure::ExecutableNotFound,
                                  QStringLiteral("No such file or directory")));
    QVERIFY(entry.contains(QStringLiteral("result=error cause=not_found")));
    QVERIFY(entry.endsWith(QStringLiteral("message=\"No such file or directory\"")));
}

void TestDiagnosticLog::testFormatsMissingPath()
{
    const QString entry = fo::DiagnosticLog::formatEntry(
        fixedTimestamp(),
        std::nullopt,
        fo::LaunchOutcome::failed(fo::LaunchFailure::DirectoryUnresolved,
                                  QStringLiteral("could not resolve directory")));
    QVERIFY(entry.contains(QStringLiteral(" path=<none> ")));
    QVERIFY(entry.contains(QStringLiteral("cause=directory_unresolved")));
}

void TestDiagnosticLog::testEscapesQuotesAndNewlines()
{
    const QString entry = fo::DiagnosticLog::formatEntry(
        fixedTimestamp(),
        QStringLiteral("/tmp/odd \"dir\"/backend"),
        fo::LaunchOutcome::failed(fo::LaunchFailure::SpawnFailed,
                                  QStringLiteral("line one\nline two")));
    QVERIFY(!entry.contains(QLatin1Char('\n')));
    QVERIFY(entry.contains(QStringLiteral("path=\"/tmp/odd \\\"dir\\\"/backend\"")));
    QVERIFY(entry.contains(QStringLiteral("message=\"line one\\nline two\"")));
}

void TestDiagnosticLog::testQuoteLogValue()
{
    QCOMPARE(fo::quoteLogValue(QString()), QStringLiteral("\"\""));
    QCOMPARE(fo::quoteLogValue(QStringLiteral("C:\\apps\\fo")),
             QStringLiteral("\"C:\\\\apps\\\\fo\""));
    QCOMPARE(fo::quoteLogValue(QStringLiteral("a\r\nb")), QStringLiteral("\"a\\r\\nb\""));
}

void TestDiagnosticLog::testFailureWithoutCauseIsNotSuccess()
{
    const fo::LaunchOutcome outcome =
        fo::LaunchOutcome::failed(fo::LaunchFailure::None, QStringLiteral("odd"));
    QVERIFY(!outcome.isSuccess());
    QCOMPARE(outcome.failure(), fo::LaunchFailure::SpawnFailed);
}

void TestDiagnosticLog::testOutcomeJson()
{
    const QJsonObject ok = fo::LaunchOutcome::succeeded(77).toJson();
    QVERIFY(ok.value(QStringLiteral("success")).toBool());
    QCOMPARE(ok.value(QStringLiteral("cause")).toString(), QStringLiteral("none"));
    QCOMPARE(ok.value(QStringLiteral("pid")).toInteger(), static_cast<qint64>(77));

    const QJsonObject denied = fo::LaunchOutcome::failed(
        fo::LaunchFailure::PermissionDenied, QStringLiteral("Permission denied")).toJson();
    QVERIFY(!denied.value(QStringLiteral("success")).toBool());
    QCOMPARE(denied.value(QStringLiteral("cause")).toString(),
             QStringLiteral("permission_denied"));
    QCOMPARE(denied.value(QStringLiteral("message")).toString(),
             QStringLiteral("Permission denied"));
}

void TestDiagnosticLog::testAppendCreatesDirectoryAndFile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString logPath = tempDir.path() + QStringLiteral("/app-data/nested/sidecar.log");
    const fo::DiagnosticLog log(logPath);
    QVERIFY(log.appendLine(QStringLiteral("first")));

    QVERIFY(QFile::exists(logPath));
    QCOMPARE(fo::test::readLogLines(logPath), QStringList{QStringLiteral("first")});
}

void TestDiagnosticLog::testAppendNeverTruncates()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    const QString logPath = tempDir.path() + QStringLiteral("/sidecar.log");
    QVERIFY(fo::test::writePlainFile(logPath, "from a previous run\n"));

    const fo::DiagnosticLog log(logPath);
    QVERIFY(log.appendLine(QStringLiteral("second")));
    QVERIFY(log.appendLine(QStringLiteral("third")));

    const QStringList expected = {
        QStringLiteral("from a previous run"),
        QStringLiteral("second"),
        QStringLiteral("third"),
    };
    QCOMPARE(fo::test::readLogLines(logPath), expected);
}

void TestDiagnosticLog::testAppendFailsQuietlyWhenDirectoryCannotBeCreated()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());

    // A regular file where the log directory should be.
    const QString blocker = tempDir.path() + QStringLiteral("/not-a-directory");
    QVERIFY(fo::test::writePlainFile(blocker, "x"));

    const fo::DiagnosticLog log(blocker + QStringLiteral("/logs/sidecar.log"));
    QVERIFY(!log.appendLine(QStringLiteral("lost")));
}

void TestDiagnosticLog::testAppendFailsForEmptyPath()
{
    const fo::DiagnosticLog log{QString()};
    QVERIFY(!log.appendLine(QStringLiteral("lost")));
}

QTEST_MAIN(TestDiagnosticLog)
#include "test_diagnostic_log.moc"
