#include "core/CsvRecordSink.h"
#include <QtCore/QFile>
#include <QtCore/QTemporaryDir>
#include <gtest/gtest.h>
namespace {
QList<QByteArray> readLines(const QString& path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) return {};
    QList<QByteArray> lines = f.readAll().split('\n');
    if (!lines.isEmpty() && lines.last().isEmpty()) lines.removeLast();
    return lines;
}
}
TEST(CsvRecordSinkTest, FormatsMeasuredRow) {
    nf::FrequencyRecord r;
    r.frequencyMhz = 915.125;
    r.samples = 3;
    r.average = -110.0;
    r.minimum = -112.0;
    r.maximum = -108.0;
    r.stdev = 1.6329931618554521;
    EXPECT_EQ(nf::CsvRecordSink::formatRow(r), QByteArray("915.125,3,-110,-112,-108,1.632993162\n"));
}
TEST(CsvRecordSinkTest, EmptyCellsWithoutSamples) {
    nf::FrequencyRecord r;
    r.frequencyMhz = 927.875;
    EXPECT_EQ(nf::CsvRecordSink::formatRow(r), QByteArray("927.875,0,,,,\n"));
}
TEST(CsvRecordSinkTest, EachAppendIsOnDisk) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("scan.csv"));
    nf::CsvRecordSink sink;
    ASSERT_TRUE(sink.open(path));
    EXPECT_EQ(readLines(path).size(), 1);
    nf::FrequencyRecord r;
    r.frequencyMhz = 915.0;
    ASSERT_TRUE(sink.append(r));
    const QList<QByteArray> lines = readLines(path);
    ASSERT_EQ(lines.size(), 2);
    EXPECT_EQ(lines[0] + '\n', nf::CsvRecordSink::header());
    EXPECT_EQ(lines[1], QByteArray("915,0,,,,"));
}
TEST(CsvRecordSinkTest, OpenTruncatesExistingFile) {
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("scan.csv"));
    {
        QFile f(path);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
        f.write("stale\nrows\nhere\n");
    }
    nf::CsvRecordSink sink;
    ASSERT_TRUE(sink.open(path));
    EXPECT_EQ(readLines(path).size(), 1);
}
TEST(CsvRecordSinkTest, FailuresAreReported) {
    QTemporaryDir dir;
    nf::CsvRecordSink sink;
    EXPECT_FALSE(sink.open(dir.filePath(QStringLiteral("missing/dir/scan.csv"))));
    EXPECT_FALSE(sink.errorString().isEmpty());
    EXPECT_FALSE(sink.append(nf::FrequencyRecord{}));
}
TEST(CsvRecordSinkTest, BeginCreatesConfiguredFileOnce) {
    QTemporaryDir dir;
    const QString path = dir.filePath(QStringLiteral("scan.csv"));
    nf::CsvRecordSink sink(path);
    EXPECT_FALSE(sink.isOpen());
    EXPECT_FALSE(QFile::exists(path));
    ASSERT_TRUE(sink.begin());
    ASSERT_TRUE(sink.append(nf::FrequencyRecord{}));
    ASSERT_TRUE(sink.begin());
    EXPECT_EQ(readLines(path).size(), 2);
    EXPECT_EQ(sink.path(), path);
}
TEST(CsvRecordSinkTest, BeginWithoutPathFails) {
    nf::CsvRecordSink sink;
    EXPECT_FALSE(sink.begin());
    EXPECT_FALSE(sink.errorString().isEmpty());
}
