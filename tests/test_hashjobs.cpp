/**
 * @file test_hashjobs.cpp
 * @brief Unit tests for the cooperative hashing jobs
 */

#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "DuplicateScanWorker.h"
#include "HashJobs.h"
#include "TestUtils.h"

using TestUtils::patternBytes;
using TestUtils::writeFile;

class HashJobsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
    }

    QTemporaryDir dir;
    ContentHasher hasher;
};

/**
 * @test OnlyCandidatesAreFullyHashed
 * @brief Files with unique sizes never reach the full-hash phase.
 */
TEST_F(HashJobsTest, OnlyCandidatesAreFullyHashed)
{
    const QString a = writeFile(dir.path(), "a.jpg", patternBytes(100, 1));
    const QString b = writeFile(dir.path(), "b.jpg", patternBytes(200, 2));
    const QString c = writeFile(dir.path(), "c.jpg", patternBytes(300, 3));
    const QString d = writeFile(dir.path(), "d.jpg", patternBytes(400, 4));
    const QString e = writeFile(dir.path(), "e.jpg", patternBytes(400, 4));

    TwoPhaseDuplicateJob job(hasher, {a, b, c, d, e});
    while (!job.atEnd()) {
        job.step();
    }

    EXPECT_EQ(job.phase(), JobPhase::Done);
    EXPECT_EQ(job.candidateCount(), 2);
    EXPECT_EQ(job.candidates(), QStringList({d, e}));
    EXPECT_EQ(job.fullHashes().size(), 2);
    ASSERT_EQ(job.groups().size(), 1);
    EXPECT_EQ(job.groups().at(0).files, QStringList({d, e}));
}

/**
 * @test FullHashSeparatesQuickHashCollisions
 * @brief Same size, first and last chunk but different middle bytes: both are candidates, neither is a duplicate.
 */
TEST_F(HashJobsTest, FullHashSeparatesQuickHashCollisions)
{
    const int chunk = static_cast<int>(hasher.chunkSize());
    QByteArray content = patternBytes(chunk * 3 + 512, 11);
    const QString left = writeFile(dir.path(), "left.jpg", content);
    content[chunk + chunk / 2] = static_cast<char>(content.at(chunk + chunk / 2) ^ 0x01);
    const QString right = writeFile(dir.path(), "right.jpg", content);

    TwoPhaseDuplicateJob job(hasher, {left, right});
    while (!job.atEnd()) {
        job.step();
    }

    EXPECT_EQ(job.candidateCount(), 2);
    ASSERT_EQ(job.fullHashes().size(), 2);
    EXPECT_NE(job.fullHashes().at(0).hash, job.fullHashes().at(1).hash);
    EXPECT_TRUE(job.groups().isEmpty());
}

TEST_F(HashJobsTest, RepeatedPathsAreSearchedOnce)
{
    const QString a = writeFile(dir.path(), "a.jpg", patternBytes(256, 1));
    const QString b = writeFile(dir.path(), "b.jpg", patternBytes(256, 2));

    TwoPhaseDuplicateJob job(hasher, {a, b, a, dir.path() + "/./b.jpg"});
    EXPECT_EQ(job.fileCount(), 2);
    int quickSteps = 0;
    while (!job.atEnd()) {
        if (job.step().phase == JobPhase::QuickScan) {
            quickSteps += 1;
        }
    }
    EXPECT_EQ(quickSteps, 2);
    EXPECT_EQ(job.candidateCount(), 0);
    EXPECT_TRUE(job.groups().isEmpty());
}

/**
 * @test ProgressRunsThroughBothPhases
 * @brief Quick scan reports every file, full hash reports every candidate, counts never go back.
 */
TEST_F(HashJobsTest, ProgressRunsThroughBothPhases)
{
    QStringList paths;
    for (int i = 0; i < 4; ++i) {
        paths.append(writeFile(dir.path(), QStringLiteral("same%1.jpg").arg(i), patternBytes(512, 42)));
    }
    paths.append(writeFile(dir.path(), "other.jpg", patternBytes(64, 5)));

    TwoPhaseDuplicateJob job(hasher, paths);
    QVector<JobProgress> steps;
    while (!job.atEnd()) {
        steps.append(job.step());
    }

    ASSERT_EQ(steps.size(), 5 + 4);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(steps.at(i).phase, JobPhase::QuickScan);
        EXPECT_EQ(steps.at(i).completed, i + 1);
        EXPECT_EQ(steps.at(i).total, 5);
        EXPECT_EQ(steps.at(i).currentPath, paths.at(i));
    }
    for (int i = 5; i < steps.size(); ++i) {
        EXPECT_EQ(steps.at(i).phase, JobPhase::FullHash);
        EXPECT_EQ(steps.at(i).completed, i - 4);
        EXPECT_EQ(steps.at(i).total, 4);
    }
    ASSERT_EQ(job.groups().size(), 1);
    EXPECT_EQ(job.groups().at(0).files.size(), 4);
}

TEST_F(HashJobsTest, EmptyInputIsDoneImmediately)
{
    TwoPhaseDuplicateJob job(hasher, {});
    EXPECT_TRUE(job.atEnd());
    EXPECT_TRUE(job.groups().isEmpty());
    EXPECT_EQ(job.step().phase, JobPhase::Done);
}

/**
 * @test CancelStopsBeforeNextFile
 * @brief After cancel() no further file is processed and no group is produced.
 */
TEST_F(HashJobsTest, CancelStopsBeforeNextFile)
{
    const QString a = writeFile(dir.path(), "a.jpg", "same");
    const QString b = writeFile(dir.path(), "b.jpg", "same");
    const QString c = writeFile(dir.path(), "c.jpg", "same");

    TwoPhaseDuplicateJob job(hasher, {a, b, c});
    job.step();
    job.cancel();

    EXPECT_TRUE(job.isCancelled());
    EXPECT_TRUE(job.atEnd());
    EXPECT_TRUE(job.fullHashes().isEmpty());
    EXPECT_TRUE(job.groups().isEmpty());
}

TEST_F(HashJobsTest, UnreadableFilesAreSkipped)
{
    const QString a = writeFile(dir.path(), "a.jpg", "same");
    const QString b = writeFile(dir.path(), "b.jpg", "same");
    const QString missing = dir.filePath("gone.jpg");

    TwoPhaseDuplicateJob job(hasher, {a, missing, b});
    while (!job.atEnd()) {
        job.step();
    }

    ASSERT_EQ(job.failures().size(), 1);
    EXPECT_EQ(job.failures().at(0).path, missing);
    ASSERT_EQ(job.groups().size(), 1);
    EXPECT_EQ(job.groups().at(0).files, QStringList({a, b}));
}

/**
 * @test EmptyFilesFormAGroup
 * @brief Zero-byte files share the "empty" quick hash and the empty SHA-256.
 */
TEST_F(HashJobsTest, EmptyFilesFormAGroup)
{
    const QString a = writeFile(dir.path(), "a.png", QByteArray());
    const QString b = writeFile(dir.path(), "b.png", QByteArray());

    TwoPhaseDuplicateJob job(hasher, {a, b});
    while (!job.atEnd()) {
        job.step();
    }
    const QVector<DuplicateGroup> groups = job.groups();
    ASSERT_EQ(groups.size(), 1);
    EXPECT_EQ(groups.at(0).fileSize, 0);
}

TEST_F(HashJobsTest, HashBatchJobStepsOneFileAtATime)
{
    const QString a = writeFile(dir.path(), "a.jpg", "a");
    const QString b = writeFile(dir.path(), "b.jpg", "b");

    HashBatchJob job(hasher, {a, b});
    EXPECT_EQ(job.total(), 2);

    const JobProgress first = job.step();
    EXPECT_EQ(first.completed, 1);
    EXPECT_EQ(first.currentPath, a);
    EXPECT_EQ(job.result().results.size(), 1);
    EXPECT_FALSE(job.atEnd());

    job.step();
    EXPECT_TRUE(job.atEnd());
    EXPECT_EQ(job.completed(), 2);
    EXPECT_EQ(job.result().results.size(), 2);

    const JobProgress after = job.step();
    EXPECT_EQ(after.completed, 2);
    EXPECT_EQ(job.result().results.size(), 2);
}

TEST(JobPhaseTest, PhaseNames)
{
    EXPECT_EQ(jobPhaseName(JobPhase::QuickScan), "Quick scan");
    EXPECT_EQ(jobPhaseName(JobPhase::FullHash), "Full hash");
    EXPECT_EQ(jobPhaseName(JobPhase::Done), "Done");
}

/**
 * @test ScanWorkerReportsGroups
 * @brief Run directly, the worker walks both phases and finishes with the duplicate report.
 */
TEST_F(HashJobsTest, ScanWorkerReportsGroups)
{
    const QString a = writeFile(dir.path(), "a.jpg", patternBytes(500, 7));
    const QString b = writeFile(dir.path(), "b.jpg", patternBytes(500, 7));
    const QString c = writeFile(dir.path(), "c.jpg", patternBytes(600, 8));

    DuplicateScanWorker worker(hasher, {a, b, c});
    QStringList phases;
    QVariantMap finished;
    QObject::connect(&worker, &DuplicateScanWorker::progress,
                     [&phases](const QString &phase, int, int, const QString &) {
                         if (phases.isEmpty() || phases.last() != phase) {
                             phases.append(phase);
                         }
                     });
    QObject::connect(&worker, &DuplicateScanWorker::finished, [&finished](const QVariantMap &result) { finished = result; });

    worker.start();

    EXPECT_EQ(phases, QStringList({"Quick scan", "Full hash"}));
    EXPECT_TRUE(finished.value("ok").toBool());
    EXPECT_EQ(finished.value("filesScanned").toInt(), 3);
    EXPECT_EQ(finished.value("candidates").toInt(), 2);
    EXPECT_EQ(finished.value("totalWastedBytes").toLongLong(), 500);
    const QVariantList groups = finished.value("groups").toList();
    ASSERT_EQ(groups.size(), 1);
    EXPECT_EQ(groups.at(0).toMap().value("files").toStringList(), QStringList({a, b}));
}

TEST_F(HashJobsTest, ScanWorkerStopsWhenCancelled)
{
    const QString a = writeFile(dir.path(), "a.jpg", "same");
    const QString b = writeFile(dir.path(), "b.jpg", "same");

    DuplicateScanWorker worker(hasher, {a, b});
    int steps = 0;
    QVariantMap finished;
    QObject::connect(&worker, &DuplicateScanWorker::progress, [&worker, &steps](const QString &, int, int, const QString &) {
        steps += 1;
        worker.cancel();
    });
    QObject::connect(&worker, &DuplicateScanWorker::finished, [&finished](const QVariantMap &result) { finished = result; });

    worker.start();

    EXPECT_EQ(steps, 1);
    EXPECT_FALSE(finished.value("ok").toBool());
    EXPECT_TRUE(finished.value("cancelled").toBool());
    EXPECT_FALSE(finished.contains("groups"));
}
