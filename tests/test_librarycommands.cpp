/**
 * @file test_librarycommands.cpp
 * @brief Unit tests for the LibraryCommands response layer
 */

#include <gtest/gtest.h>

#include <QFileInfo>
#include <QTemporaryDir>

#include <memory>

#include "ContentHasher.h"
#include "DeletionCoordinator.h"
#include "DirectoryScanner.h"
#include "DuplicateGrouper.h"
#include "HashJobs.h"
#include "ImageRepository.h"
#include "LibraryCommands.h"
#include "LibraryDatabase.h"
#include "LibraryIndexer.h"
#include "ScanLock.h"
#include "ScannerPreferences.h"
#include "TestUtils.h"

using TestUtils::FolderTrashBackend;
using TestUtils::patternBytes;
using TestUtils::writeFile;

/**
 * @class LibraryCommandsTest
 * @brief Every service wired the way the application wires them, with a folder trash.
 *
 * No root is selected in SetUp; tests call setRoot() when they need one.
 */
class LibraryCommandsTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(root.isValid());
        ASSERT_TRUE(settingsDir.isValid());
        ASSERT_TRUE(trashDir.isValid());
        OperationError error;
        ASSERT_TRUE(database.open(&error)) << error.message.toStdString();

        preferences = std::make_unique<ScannerPreferences>(settingsDir.filePath("settings.ini"));
        preferences->setWatchEnabled(false);
        scanner = std::make_unique<DirectoryScanner>(*preferences);
        indexer = std::make_unique<LibraryIndexer>(*scanner, hasher, images, grouper);
        commands = std::make_unique<LibraryCommands>(*scanner, hasher, grouper, deletion, *indexer, scans);

        a = writeFile(root.path(), "A.jpg", patternBytes(4096, 1));
        b = writeFile(root.path(), "B.jpg", patternBytes(4096, 1));
        c = writeFile(root.path(), "C.jpg", patternBytes(4096, 2));
    }

    static QString codeOf(const QVariantMap &response)
    {
        return response.value("code").toString();
    }

    QTemporaryDir root;
    QTemporaryDir settingsDir;
    QTemporaryDir trashDir;
    LibraryDatabase database{LibraryDatabase::inMemoryPath()};
    ImageRepository images{database};
    DuplicateGrouper grouper{database};
    ContentHasher hasher;
    FolderTrashBackend trash{trashDir.path()};
    DeletionCoordinator deletion{trash};
    RootScanRegistry scans;
    std::unique_ptr<ScannerPreferences> preferences;
    std::unique_ptr<DirectoryScanner> scanner;
    std::unique_ptr<LibraryIndexer> indexer;
    std::unique_ptr<LibraryCommands> commands;
    QString a;
    QString b;
    QString c;
};

/**
 * @test FirstRootCanBeSelected
 * @brief With no root configured, setRoot succeeds and getRoot reports it.
 */
TEST_F(LibraryCommandsTest, FirstRootCanBeSelected)
{
    const QVariantMap before = commands->getRoot();
    EXPECT_TRUE(before.value("success").toBool());
    EXPECT_FALSE(before.contains("data"));

    const QVariantMap response = commands->setRoot(root.path());
    ASSERT_TRUE(response.value("success").toBool()) << response.value("error").toString().toStdString();
    EXPECT_EQ(response.value("data").toMap().value("path").toString(), root.path());
    EXPECT_TRUE(response.value("data").toMap().value("isValid").toBool());

    EXPECT_EQ(commands->getRoot().value("data").toMap().value("path").toString(), root.path());
    EXPECT_TRUE(commands->clearRoot().value("success").toBool());
    EXPECT_FALSE(commands->getRoot().contains("data"));
}

TEST_F(LibraryCommandsTest, SetRootReportsInvalidDirectory)
{
    const QVariantMap response = commands->setRoot(root.filePath("missing"));
    EXPECT_FALSE(response.value("success").toBool());
    EXPECT_EQ(codeOf(response), "InvalidDirectory");
    EXPECT_EQ(response.value("error").toString(), "Directory does not exist");
}

/**
 * @test PathsOutsideRootAreDenied
 * @brief Hashing, duplicate search and trash operations refuse paths outside the root.
 */
TEST_F(LibraryCommandsTest, PathsOutsideRootAreDenied)
{
    EXPECT_EQ(codeOf(commands->hashFile(a)), "AccessDenied");

    QTemporaryDir outside;
    ASSERT_TRUE(outside.isValid());
    const QString stranger = writeFile(outside.path(), "X.jpg", "x");
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());

    EXPECT_EQ(codeOf(commands->hashFile(stranger)), "AccessDenied");
    EXPECT_EQ(codeOf(commands->hashFiles({a, stranger})), "AccessDenied");
    EXPECT_EQ(codeOf(commands->findDuplicates({a, stranger})), "AccessDenied");
    EXPECT_EQ(codeOf(commands->scanDuplicates(outside.path(), true)), "AccessDenied");
    EXPECT_EQ(codeOf(commands->trashFile(stranger)), "AccessDenied");
    EXPECT_EQ(codeOf(commands->trashDuplicates({a, stranger}, 0)), "AccessDenied");
    EXPECT_EQ(codeOf(commands->canTrash(stranger)), "AccessDenied");
    EXPECT_EQ(codeOf(commands->trashFileInfo(root.filePath("../escape.jpg"))), "AccessDenied");
    EXPECT_TRUE(QFileInfo::exists(stranger));
    EXPECT_TRUE(trash.calls.isEmpty());
}

TEST_F(LibraryCommandsTest, HashFileAndFiles)
{
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());

    const QVariantMap single = commands->hashFile(a);
    ASSERT_TRUE(single.value("success").toBool());
    const QVariantMap data = single.value("data").toMap();
    EXPECT_EQ(data.value("filepath").toString(), a);
    EXPECT_EQ(data.value("algorithm").toString(), "sha256");
    EXPECT_EQ(data.value("filesize").toLongLong(), 4096);
    EXPECT_EQ(data.value("hash").toString().size(), 64);

    EXPECT_EQ(codeOf(commands->hashFile(root.filePath("missing.jpg"))), "FileNotFound");

    const QVariantMap batch = commands->hashFiles({a, root.filePath("missing.jpg"), c});
    ASSERT_TRUE(batch.value("success").toBool());
    EXPECT_EQ(batch.value("data").toMap().value("results").toList().size(), 2);
    EXPECT_EQ(batch.value("data").toMap().value("errors").toList().size(), 1);
}

/**
 * @test ScanDuplicatesReportsGroupsAndProgress
 * @brief The two-phase search over the root finds {A, B} and reports both phases.
 */
TEST_F(LibraryCommandsTest, ScanDuplicatesReportsGroupsAndProgress)
{
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());

    QVector<JobPhase> phases;
    const QVariantMap response = commands->scanDuplicates(root.path(), true, [&phases](const JobProgress &progress) {
        if (phases.isEmpty() || phases.last() != progress.phase) {
            phases.append(progress.phase);
        }
    });
    ASSERT_TRUE(response.value("success").toBool()) << response.value("error").toString().toStdString();

    const QVariantMap data = response.value("data").toMap();
    EXPECT_EQ(data.value("filesScanned").toInt(), 3);
    EXPECT_EQ(data.value("totalGroups").toInt(), 1);
    EXPECT_EQ(data.value("totalWastedBytes").toLongLong(), 4096);
    const QVariantList groups = data.value("groups").toList();
    ASSERT_EQ(groups.size(), 1);
    EXPECT_EQ(groups.at(0).toMap().value("files").toStringList(), QStringList({a, b}));
    EXPECT_EQ(phases, QVector<JobPhase>({JobPhase::QuickScan, JobPhase::FullHash}));
    EXPECT_FALSE(scans.isBusy(root.path()));
}

/**
 * @test ConcurrentScanOfSameRootIsBusy
 * @brief While a scan token is held for the root, duplicate scans and indexing answer Busy.
 */
TEST_F(LibraryCommandsTest, ConcurrentScanOfSameRootIsBusy)
{
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());
    ScanToken running = scans.tryAcquire(root.path());
    ASSERT_TRUE(running.isValid());

    EXPECT_EQ(codeOf(commands->scanDuplicates(root.path(), true)), "Busy");
    EXPECT_EQ(codeOf(commands->findDuplicates({a, b})), "Busy");
    EXPECT_EQ(codeOf(commands->indexLibrary()), "Busy");
    EXPECT_EQ(codeOf(commands->rebuildDuplicates()), "Busy");

    running.release();
    EXPECT_TRUE(commands->scanDuplicates(root.path(), true).value("success").toBool());
}

/**
 * @test ScanOfSubfolderNeedsRootToken
 * @brief Scanning a folder below the root is refused while the root is held, and holds the root itself.
 */
TEST_F(LibraryCommandsTest, ScanOfSubfolderNeedsRootToken)
{
    writeFile(root.path(), "album/D.jpg", patternBytes(4096, 1));
    const QString album = root.filePath("album");
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());

    {
        ScanToken running = scans.tryAcquire(root.path());
        ASSERT_TRUE(running.isValid());
        EXPECT_EQ(codeOf(commands->scanDuplicates(album, true)), "Busy");
    }

    bool rootHeldDuringScan = false;
    const QVariantMap response = commands->scanDuplicates(album, true, [this, &rootHeldDuringScan](const JobProgress &) {
        rootHeldDuringScan = scans.isBusy(root.path());
    });
    ASSERT_TRUE(response.value("success").toBool());
    EXPECT_TRUE(rootHeldDuringScan);
    EXPECT_EQ(response.value("data").toMap().value("filesScanned").toInt(), 1);
    EXPECT_FALSE(scans.isBusy(root.path()));
}

TEST_F(LibraryCommandsTest, FindDuplicatesCountsEachFileOnce)
{
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());
    const QVariantMap response = commands->findDuplicates({c, root.path() + "/./C.jpg", c});
    ASSERT_TRUE(response.value("success").toBool());
    EXPECT_EQ(response.value("data").toMap().value("totalGroups").toInt(), 0);
    EXPECT_EQ(response.value("data").toMap().value("totalWastedBytes").toLongLong(), 0);
}

/**
 * @test TemporaryRootLeavesSavedRoot
 * @brief A root taken for one run grants access without replacing the saved root.
 */
TEST_F(LibraryCommandsTest, TemporaryRootLeavesSavedRoot)
{
    const QVariantMap selected = commands->useTemporaryRoot(root.path());
    ASSERT_TRUE(selected.value("success").toBool());
    EXPECT_EQ(selected.value("data").toMap().value("path").toString(), root.path());
    EXPECT_TRUE(preferences->rootDirectory().isEmpty());
    EXPECT_TRUE(commands->hashFile(a).value("success").toBool());

    EXPECT_EQ(codeOf(commands->useTemporaryRoot(root.filePath("missing"))), "InvalidDirectory");
}

TEST_F(LibraryCommandsTest, FindDuplicatesOverExplicitPaths)
{
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());
    const QVariantMap response = commands->findDuplicates({c, b, a});
    ASSERT_TRUE(response.value("success").toBool());
    const QVariantList groups = response.value("data").toMap().value("groups").toList();
    ASSERT_EQ(groups.size(), 1);
    EXPECT_EQ(groups.at(0).toMap().value("files").toStringList(), QStringList({b, a}));
}

TEST_F(LibraryCommandsTest, ScanDirectoryAndContents)
{
    EXPECT_EQ(codeOf(commands->scanDirectory()), "InvalidDirectory");
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());

    const QVariantMap scan = commands->scanDirectory();
    ASSERT_TRUE(scan.value("success").toBool());
    EXPECT_EQ(scan.value("data").toMap().value("totalFiles").toInt(), 3);
    EXPECT_EQ(scan.value("data").toMap().value("imageFiles").toInt(), 3);

    const QVariantMap contents = commands->getDirectoryContents(root.path());
    ASSERT_TRUE(contents.value("success").toBool());
    EXPECT_EQ(contents.value("data").toList().size(), 3);
    EXPECT_EQ(codeOf(commands->getDirectoryContents(root.filePath("missing"))), "InvalidDirectory");
}

TEST_F(LibraryCommandsTest, WatchingCommands)
{
    EXPECT_EQ(codeOf(commands->startWatching()), "InvalidDirectory");
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());

    EXPECT_TRUE(commands->startWatching().value("success").toBool());
    EXPECT_TRUE(commands->isWatching().value("data").toBool());
    EXPECT_TRUE(commands->stopWatching().value("success").toBool());
    EXPECT_FALSE(commands->isWatching().value("data").toBool());
}

/**
 * @test IndexThenTrashDuplicates
 * @brief Trashing the extra copy removes it from disk and from the stored groups.
 */
TEST_F(LibraryCommandsTest, IndexThenTrashDuplicates)
{
    EXPECT_EQ(codeOf(commands->indexLibrary()), "InvalidDirectory");
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());

    const QVariantMap indexed = commands->indexLibrary();
    ASSERT_TRUE(indexed.value("success").toBool()) << indexed.value("error").toString().toStdString();
    EXPECT_EQ(indexed.value("data").toMap().value("groupsCreated").toInt(), 1);

    const QVariantMap stats = commands->duplicateStats();
    EXPECT_EQ(stats.value("data").toMap().value("totalGroups").toInt(), 1);
    EXPECT_EQ(stats.value("data").toMap().value("potentialSpaceSaved").toLongLong(), 4096);

    const QVariantList groups = commands->duplicateGroups().value("data").toList();
    ASSERT_EQ(groups.size(), 1);
    EXPECT_EQ(groups.at(0).toMap().value("files").toStringList(), QStringList({a, b}));

    EXPECT_EQ(codeOf(commands->trashDuplicates({a, b}, 2)), "InvalidArgument");
    EXPECT_TRUE(trash.calls.isEmpty());

    const QVariantMap trashed = commands->trashDuplicates({a, b}, 0);
    ASSERT_TRUE(trashed.value("success").toBool());
    EXPECT_EQ(trashed.value("data").toMap().value("successful").toStringList(), QStringList({b}));
    EXPECT_TRUE(QFileInfo::exists(a));
    EXPECT_FALSE(QFileInfo::exists(b));

    EXPECT_EQ(commands->duplicateStats().value("data").toMap().value("totalGroups").toInt(), 0);
    EXPECT_EQ(images.count(), 2);
    QString problem;
    EXPECT_TRUE(grouper.verifyCounts(&problem)) << problem.toStdString();
}

TEST_F(LibraryCommandsTest, RebuildDuplicates)
{
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());
    ASSERT_TRUE(commands->indexLibrary().value("success").toBool());

    const QVariantMap rebuilt = commands->rebuildDuplicates();
    ASSERT_TRUE(rebuilt.value("success").toBool());
    EXPECT_EQ(rebuilt.value("data").toMap().value("groupsCreated").toInt(), 1);
    EXPECT_EQ(rebuilt.value("data").toMap().value("itemsCreated").toInt(), 2);
}

TEST_F(LibraryCommandsTest, TrashSingleFilesAndInfo)
{
    ASSERT_TRUE(commands->setRoot(root.path()).value("success").toBool());

    const QVariantMap info = commands->trashFileInfo(c);
    ASSERT_TRUE(info.value("success").toBool());
    EXPECT_EQ(info.value("data").toMap().value("size").toLongLong(), 4096);
    EXPECT_TRUE(commands->canTrash(c).value("data").toMap().value("canTrash").toBool());

    const QVariantMap missing = commands->canTrash(root.filePath("missing.jpg"));
    EXPECT_TRUE(missing.value("success").toBool());
    EXPECT_FALSE(missing.value("data").toMap().value("canTrash").toBool());
    EXPECT_EQ(missing.value("data").toMap().value("reason").toString(), "File not found");

    EXPECT_TRUE(commands->trashFile(c).value("success").toBool());
    EXPECT_EQ(codeOf(commands->trashFile(c)), "FileNotFound");

    const QVariantMap batch = commands->trashFiles({a, root.filePath("missing.jpg")});
    ASSERT_TRUE(batch.value("success").toBool());
    EXPECT_EQ(batch.value("data").toMap().value("successful").toStringList(), QStringList({a}));
    EXPECT_EQ(batch.value("data").toMap().value("failed").toList().size(), 1);
}
