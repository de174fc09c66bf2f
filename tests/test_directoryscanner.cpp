/**
 * @file test_directoryscanner.cpp
 * @brief Unit tests for DirectoryScanner and ScannerPreferences
 *
 * Scanning, listing and root handling run with watching disabled. The
 * watcher tests enable it and wait on the event loop for the queued events.
 */

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <memory>
#include <unistd.h>

#include "DirectoryScanner.h"
#include "ScannerPreferences.h"
#include "TestUtils.h"

using TestUtils::writeFile;

/**
 * @class DirectoryScannerTest
 * @brief Fixture with a scratch root and a private settings file.
 */
class DirectoryScannerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(root.isValid());
        ASSERT_TRUE(settingsDir.isValid());
        preferences = std::make_unique<ScannerPreferences>(settingsDir.filePath("settings.ini"));
        preferences->setWatchEnabled(false);
        scanner = std::make_unique<DirectoryScanner>(*preferences);
    }

    void TearDown() override
    {
        scanner.reset();
    }

    bool hasEvent(WatchEventType type, const QString &path)
    {
        for (const WatchEvent &event : received) {
            if (event.type == type && event.path == path) {
                return true;
            }
        }
        return false;
    }

    bool waitForEvent(WatchEventType type, const QString &path)
    {
        return TestUtils::waitFor([this, type, &path]() {
            received += scanner->events().drain();
            return hasEvent(type, path);
        });
    }

    QTemporaryDir root;
    QTemporaryDir settingsDir;
    std::unique_ptr<ScannerPreferences> preferences;
    std::unique_ptr<DirectoryScanner> scanner;
    QVector<WatchEvent> received;
};

/**
 * @test SetRootWithoutPreviousRoot
 * @brief The first root can be selected when none is configured yet.
 */
TEST_F(DirectoryScannerTest, SetRootWithoutPreviousRoot)
{
    ASSERT_TRUE(scanner->rootDirectory().isEmpty());
    int changed = 0;
    QObject::connect(scanner.get(), &DirectoryScanner::rootDirectoryChanged, [&changed]() { changed += 1; });

    QString reason;
    ASSERT_TRUE(scanner->setRoot(root.path(), &reason)) << reason.toStdString();
    EXPECT_EQ(scanner->rootDirectory(), root.path());
    EXPECT_EQ(changed, 1);

    const RootInfo info = scanner->rootInfo();
    EXPECT_TRUE(info.isValid);
    EXPECT_EQ(info.name, QDir(root.path()).dirName());
    EXPECT_TRUE(info.lastAccessed.isValid());
}

/**
 * @test SetRootOutsidePreviousRoot
 * @brief A new root does not have to lie inside the current one.
 */
TEST_F(DirectoryScannerTest, SetRootOutsidePreviousRoot)
{
    QTemporaryDir other;
    ASSERT_TRUE(other.isValid());
    ASSERT_TRUE(scanner->setRoot(root.path()));
    ASSERT_TRUE(scanner->setRoot(other.path()));
    EXPECT_EQ(scanner->rootDirectory(), other.path());
}

TEST_F(DirectoryScannerTest, SetRootRejectsInvalidPaths)
{
    ASSERT_TRUE(scanner->setRoot(root.path()));
    const QString file = writeFile(root.path(), "a.jpg", "x");

    QString reason;
    EXPECT_FALSE(scanner->setRoot(root.filePath("missing"), &reason));
    EXPECT_EQ(reason, "Directory does not exist");
    EXPECT_FALSE(scanner->setRoot(file, &reason));
    EXPECT_EQ(reason, "Not a directory");
    EXPECT_EQ(scanner->rootDirectory(), root.path());
}

TEST_F(DirectoryScannerTest, RootIsRestoredFromPreferences)
{
    ASSERT_TRUE(scanner->setRoot(root.path()));
    DirectoryScanner restored(*preferences);
    EXPECT_EQ(restored.rootDirectory(), root.path());

    scanner->clearRoot();
    DirectoryScanner cleared(*preferences);
    EXPECT_TRUE(cleared.rootDirectory().isEmpty());
    EXPECT_FALSE(cleared.rootInfo().isValid);
}

/**
 * @test TemporaryRootIsNotSaved
 * @brief A temporary root is used by the scanner but leaves the saved root untouched.
 */
TEST_F(DirectoryScannerTest, TemporaryRootIsNotSaved)
{
    QTemporaryDir other;
    ASSERT_TRUE(other.isValid());
    ASSERT_TRUE(scanner->setRoot(root.path()));

    ASSERT_TRUE(scanner->useTemporaryRoot(other.path()));
    EXPECT_EQ(scanner->rootDirectory(), other.path());
    EXPECT_FALSE(scanner->isWatching());
    EXPECT_EQ(preferences->rootDirectory(), root.path());

    DirectoryScanner restored(*preferences);
    EXPECT_EQ(restored.rootDirectory(), root.path());

    QString reason;
    EXPECT_FALSE(scanner->useTemporaryRoot(other.filePath("missing"), &reason));
    EXPECT_EQ(reason, "Directory does not exist");
    EXPECT_EQ(scanner->rootDirectory(), other.path());
}

/**
 * @test ScanCountsFilesImagesAndDirectories
 * @brief Totals cover every level below the root, excluded folders are skipped entirely.
 */
TEST_F(DirectoryScannerTest, ScanCountsFilesImagesAndDirectories)
{
    writeFile(root.path(), "top.jpg", "1234");
    writeFile(root.path(), "notes.txt", "12");
    writeFile(root.path(), "a/one.png", "123");
    writeFile(root.path(), "a/b/two.gif", "1");
    writeFile(root.path(), "node_modules/pkg/three.jpg", "123456");
    ASSERT_TRUE(scanner->setRoot(root.path()));

    ScanStats stats;
    ASSERT_TRUE(scanner->scan(QString(), true, &stats));
    EXPECT_EQ(stats.totalFiles, 4);
    EXPECT_EQ(stats.imageFiles, 3);
    EXPECT_EQ(stats.totalSize, 10);
    EXPECT_EQ(stats.directories, 2);
    EXPECT_TRUE(stats.lastScanned.isValid());

    const ScanStats stored = scanner->lastScanStats();
    EXPECT_EQ(stored.totalFiles, 4);
    EXPECT_EQ(stored.imageFiles, 3);
}

TEST_F(DirectoryScannerTest, NonRecursiveScanCountsDirectEntries)
{
    writeFile(root.path(), "top.jpg", "1");
    writeFile(root.path(), "a/one.png", "1");

    ScanStats stats;
    ASSERT_TRUE(scanner->scan(root.path(), false, &stats));
    EXPECT_EQ(stats.totalFiles, 1);
    EXPECT_EQ(stats.directories, 1);
}

/**
 * @test ScanDepthLimitsRecursion
 * @brief With depth 1 the walk stops below the first level of folders; depth is clamped to [1, 20].
 */
TEST_F(DirectoryScannerTest, ScanDepthLimitsRecursion)
{
    writeFile(root.path(), "top.jpg", "1");
    writeFile(root.path(), "a/one.jpg", "1");
    writeFile(root.path(), "a/b/two.jpg", "1");

    scanner->setScanDepth(1);
    ScanStats stats;
    ASSERT_TRUE(scanner->scan(root.path(), true, &stats));
    EXPECT_EQ(stats.totalFiles, 2);
    EXPECT_EQ(stats.directories, 2);

    scanner->setScanDepth(0);
    EXPECT_EQ(scanner->scanDepth(), 1);
    scanner->setScanDepth(50);
    EXPECT_EQ(scanner->scanDepth(), 20);
    EXPECT_EQ(preferences->scanDepth(), 20);
}

/**
 * @test ScanSkipsUnreadableDirectory
 * @brief Nine readable files plus one unreadable folder give nine files and no error.
 */
TEST_F(DirectoryScannerTest, ScanSkipsUnreadableDirectory)
{
    if (geteuid() == 0) {
        GTEST_SKIP() << "permissions are not enforced for root";
    }
    for (int i = 0; i < 6; ++i) {
        writeFile(root.path(), QStringLiteral("photo%1.jpg").arg(i), "x");
    }
    for (int i = 0; i < 3; ++i) {
        writeFile(root.path(), QStringLiteral("open/photo%1.jpg").arg(i), "x");
    }
    writeFile(root.path(), "locked/secret.jpg", "x");
    const QString locked = root.filePath("locked");
    ASSERT_TRUE(QFile::setPermissions(locked, QFileDevice::Permissions()));

    ScanStats stats;
    OperationError error;
    const bool ok = scanner->scan(root.path(), true, &stats, &error);
    QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);

    ASSERT_TRUE(ok) << error.message.toStdString();
    EXPECT_EQ(stats.totalFiles, 9);
    EXPECT_EQ(error.code, ErrorCode::None);
}

TEST_F(DirectoryScannerTest, ScanReportsInvalidDirectory)
{
    OperationError noRoot;
    EXPECT_FALSE(scanner->scan(QString(), true, nullptr, &noRoot));
    EXPECT_EQ(noRoot.code, ErrorCode::InvalidDirectory);

    OperationError missing;
    EXPECT_FALSE(scanner->scan(root.filePath("missing"), true, nullptr, &missing));
    EXPECT_EQ(missing.code, ErrorCode::InvalidDirectory);
}

TEST_F(DirectoryScannerTest, DirectoryContentsListsFilesByName)
{
    writeFile(root.path(), "b.JPG", "12");
    writeFile(root.path(), "a.png", "1");
    writeFile(root.path(), "notes.txt", "123");
    writeFile(root.path(), "sub/c.jpg", "1");

    const QVector<FileEntry> entries = scanner->getDirectoryContents(root.path());
    ASSERT_EQ(entries.size(), 3);
    EXPECT_EQ(entries.at(0).name, "a.png");
    EXPECT_EQ(entries.at(1).name, "b.JPG");
    EXPECT_EQ(entries.at(1).extension, ".jpg");
    EXPECT_EQ(entries.at(1).size, 2);
    EXPECT_TRUE(entries.at(1).isImage);
    EXPECT_EQ(entries.at(2).name, "notes.txt");
    EXPECT_FALSE(entries.at(2).isImage);

    OperationError error;
    EXPECT_TRUE(scanner->getDirectoryContents(root.filePath("missing"), &error).isEmpty());
    EXPECT_EQ(error.code, ErrorCode::InvalidDirectory);
}

TEST_F(DirectoryScannerTest, SubdirectoriesSkipHiddenFolders)
{
    ASSERT_TRUE(QDir(root.path()).mkpath("zeta"));
    ASSERT_TRUE(QDir(root.path()).mkpath("alpha"));
    ASSERT_TRUE(QDir(root.path()).mkpath(".cache"));

    const QStringList directories = scanner->getSubdirectories(root.path());
    EXPECT_EQ(directories, QStringList({root.filePath("alpha"), root.filePath("zeta")}));
}

/**
 * @test EnumerateFilesSkipsHiddenAndExcluded
 * @brief Hidden names and exclusion matches never reach the hashing input.
 */
TEST_F(DirectoryScannerTest, EnumerateFilesSkipsHiddenAndExcluded)
{
    const QString a = writeFile(root.path(), "a.jpg", "1");
    writeFile(root.path(), ".hidden.jpg", "1");
    const QString notes = writeFile(root.path(), "notes.txt", "1");
    writeFile(root.path(), "node_modules/b.jpg", "1");
    writeFile(root.path(), ".thumbnails/t.jpg", "1");
    const QString c = writeFile(root.path(), "sub/c.png", "1");

    EXPECT_EQ(scanner->enumerateFiles(root.path(), true), QStringList({a, c}));
    EXPECT_EQ(scanner->enumerateFiles(root.path(), false), QStringList({a}));
    EXPECT_EQ(scanner->enumerateFiles(root.path(), true, false), QStringList({a, notes, c}));

    scanner->setExcludePatterns({"sub", " sub ", ""});
    EXPECT_EQ(scanner->excludePatterns(), QStringList({"sub"}));
    EXPECT_EQ(scanner->enumerateFiles(root.path(), true, false), QStringList({a, root.filePath("node_modules/b.jpg"), notes}));
}

TEST_F(DirectoryScannerTest, RelativeAndFullPaths)
{
    OperationError noRoot;
    EXPECT_TRUE(scanner->fullPath("a.jpg", &noRoot).isEmpty());
    EXPECT_EQ(noRoot.code, ErrorCode::InvalidDirectory);

    ASSERT_TRUE(scanner->setRoot(root.path()));
    EXPECT_EQ(scanner->fullPath("sub/a.jpg"), root.filePath("sub/a.jpg"));
    EXPECT_EQ(scanner->relativePath(root.filePath("sub/a.jpg")), "sub/a.jpg");

    OperationError escape;
    EXPECT_TRUE(scanner->fullPath("../outside.jpg", &escape).isEmpty());
    EXPECT_EQ(escape.code, ErrorCode::AccessDenied);
}

TEST(ScannerPreferencesTest, DefaultsAndPersistence)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString file = dir.filePath("prefs.ini");
    {
        ScannerPreferences preferences(file);
        EXPECT_TRUE(preferences.rootDirectory().isEmpty());
        EXPECT_TRUE(preferences.watchEnabled());
        EXPECT_EQ(preferences.scanDepth(), ScannerPreferences::defaultScanDepth());
        EXPECT_EQ(preferences.excludePatterns(), ScannerPreferences::defaultExcludePatterns());

        preferences.setRootDirectory("/photos");
        preferences.setWatchEnabled(false);
        preferences.setScanDepth(4);
        preferences.setExcludePatterns({"raw", "raw", "  tmp  "});
    }
    ScannerPreferences reopened(file);
    EXPECT_EQ(reopened.rootDirectory(), "/photos");
    EXPECT_GT(reopened.lastAccessed(), 0);
    EXPECT_FALSE(reopened.watchEnabled());
    EXPECT_EQ(reopened.scanDepth(), 4);
    EXPECT_EQ(reopened.excludePatterns(), QStringList({"raw", "tmp"}));

    reopened.setExcludePatterns({});
    EXPECT_TRUE(reopened.excludePatterns().isEmpty());
}

/**
 * @class DirectoryWatchTest
 * @brief Watcher tests; they rely on the platform file watcher delivering events.
 */
class DirectoryWatchTest : public DirectoryScannerTest {
protected:
    void SetUp() override
    {
        DirectoryScannerTest::SetUp();
        writeFile(root.path(), "existing.jpg", "old");
        ASSERT_TRUE(QDir(root.path()).mkpath("album"));
        ASSERT_TRUE(scanner->setRoot(root.path()));
        scanner->setWatchEnabled(true);
        ASSERT_TRUE(scanner->isWatching());
    }
};

TEST_F(DirectoryWatchTest, WatchNeedsRoot)
{
    scanner->clearRoot();
    EXPECT_FALSE(scanner->isWatching());
    EXPECT_FALSE(scanner->watch());
}

/**
 * @test NewImageIsReported
 * @brief Adding an image queues FileAdded and signals eventsAvailable.
 */
TEST_F(DirectoryWatchTest, NewImageIsReported)
{
    int available = 0;
    QObject::connect(scanner.get(), &DirectoryScanner::eventsAvailable, [&available]() { available += 1; });
    const QString added = writeFile(root.path(), "new.jpg", "fresh");
    ASSERT_TRUE(waitForEvent(WatchEventType::FileAdded, added));
    EXPECT_GE(available, 1);
}

TEST_F(DirectoryWatchTest, ImageInSubfolderIsReported)
{
    const QString added = writeFile(root.path(), "album/inner.png", "fresh");
    ASSERT_TRUE(waitForEvent(WatchEventType::FileAdded, added));
}

TEST_F(DirectoryWatchTest, RemovedImageIsReported)
{
    const QString existing = root.filePath("existing.jpg");
    ASSERT_TRUE(QFile::remove(existing));
    ASSERT_TRUE(waitForEvent(WatchEventType::FileRemoved, existing));
}

TEST_F(DirectoryWatchTest, FolderChangesAreReported)
{
    const QString created = root.filePath("trip");
    ASSERT_TRUE(QDir(root.path()).mkdir("trip"));
    ASSERT_TRUE(waitForEvent(WatchEventType::DirectoryAdded, created));

    ASSERT_TRUE(QDir(root.filePath("album")).removeRecursively());
    ASSERT_TRUE(waitForEvent(WatchEventType::DirectoryRemoved, root.filePath("album")));
}

/**
 * @test HiddenFilesAreIgnored
 * @brief A dot-prefixed file never produces an event.
 */
TEST_F(DirectoryWatchTest, HiddenFilesAreIgnored)
{
    const QString hidden = writeFile(root.path(), ".partial.jpg", "x");
    const QString visible = writeFile(root.path(), "visible.jpg", "x");
    ASSERT_TRUE(waitForEvent(WatchEventType::FileAdded, visible));
    for (const WatchEvent &event : received) {
        EXPECT_NE(event.path, hidden);
    }
}

TEST_F(DirectoryWatchTest, UnwatchKeepsQueuedEvents)
{
    const QString added = writeFile(root.path(), "queued.jpg", "x");
    ASSERT_TRUE(TestUtils::waitFor([this]() { return !scanner->events().isEmpty(); }));
    scanner->unwatch();
    EXPECT_FALSE(scanner->isWatching());
    received += scanner->events().drain();
    EXPECT_TRUE(hasEvent(WatchEventType::FileAdded, added));
}
