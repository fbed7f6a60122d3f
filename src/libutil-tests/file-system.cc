#include <gtest/gtest.h>

#include "arbor/util/file-system.hh"

#include <cerrno>
#include <filesystem>

#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

namespace arbor {

/* ----------------------------------------------------------------------------
 * absPath
 * --------------------------------------------------------------------------*/

TEST(absPath, doesntChangeRoot)
{
    auto p = absPath("/");

    ASSERT_EQ(p, "/");
}

TEST(absPath, turnsEmptyPathIntoCWD)
{
    char cwd[PATH_MAX + 1];
    auto p = absPath("");

    ASSERT_EQ(p, getcwd((char *) &cwd, PATH_MAX));
}

TEST(absPath, usesOptionalBasePathWhenGiven)
{
    auto p = absPath("stages/org.osbuild.noop", "/usr/lib/arbor");

    ASSERT_EQ(p, "/usr/lib/arbor/stages/org.osbuild.noop");
}

TEST(absPath, isIdempotent)
{
    char _cwd[PATH_MAX + 1];
    char * cwd = getcwd((char *) &_cwd, PATH_MAX);
    auto p1 = absPath(cwd);
    auto p2 = absPath(p1);

    ASSERT_EQ(p1, p2);
}

/* ----------------------------------------------------------------------------
 * canonPath
 * --------------------------------------------------------------------------*/

TEST(canonPath, removesTrailingSlashes)
{
    ASSERT_EQ(canonPath("/this/is/a/path//"), "/this/is/a/path");
}

TEST(canonPath, removesDots)
{
    ASSERT_EQ(canonPath("/this/./is/a/path/./"), "/this/is/a/path");
}

TEST(canonPath, removesDots2)
{
    ASSERT_EQ(canonPath("/this/a/../is/a////path/foo/.."), "/this/is/a/path");
}

TEST(canonPath, requiresAbsolutePath)
{
    ASSERT_ANY_THROW(canonPath("."));
    ASSERT_ANY_THROW(canonPath(".."));
    ASSERT_ANY_THROW(canonPath("../"));
}

TEST(canonPath, dotDotCannotEscapeRoot)
{
    ASSERT_EQ(canonPath("/../../etc"), "/etc");
}

/* ----------------------------------------------------------------------------
 * dirOf / baseNameOf
 * --------------------------------------------------------------------------*/

TEST(dirOf, returnsEmptyStringForRoot)
{
    ASSERT_EQ(dirOf("/"), "/");
}

TEST(dirOf, returnsFirstPathComponent)
{
    ASSERT_EQ(dirOf("/dir/"), "/dir");
    ASSERT_EQ(dirOf("/dir"), "/");
    ASSERT_EQ(dirOf("/dir/.."), "/dir");
    ASSERT_EQ(dirOf("/dir/../"), "/dir/..");
}

TEST(dirOf, relative)
{
    ASSERT_EQ(dirOf("arbor.conf"), ".");
}

TEST(baseNameOf, emptyPath)
{
    ASSERT_EQ(baseNameOf(""), "");
}

TEST(baseNameOf, pathOnRoot)
{
    ASSERT_EQ(baseNameOf("/dir"), "dir");
}

TEST(baseNameOf, relativePath)
{
    ASSERT_EQ(baseNameOf("dir/foo"), "foo");
}

TEST(baseNameOf, pathWithTrailingSlashRoot)
{
    ASSERT_EQ(baseNameOf("/"), "");
}

TEST(baseNameOf, trailingSlash)
{
    ASSERT_EQ(baseNameOf("/dir/"), "dir");
}

/* ----------------------------------------------------------------------------
 * isInDir
 * --------------------------------------------------------------------------*/

TEST(isInDir, trivialCase)
{
    ASSERT_TRUE(isInDir("/foo/bar", "/foo"));
}

TEST(isInDir, notInDir)
{
    ASSERT_FALSE(isInDir("/zes/foo/bar", "/foo"));
}

TEST(isInDir, prefixIsNotEnough)
{
    ASSERT_FALSE(isInDir("/foobar", "/foo"));
}

TEST(isInDir, directoryIsNotInItself)
{
    ASSERT_FALSE(isInDir("/arbor", "/arbor"));
    ASSERT_TRUE(isInDir("/arbor", "/"));
    ASSERT_FALSE(isInDir("/", "/"));
}

/* ----------------------------------------------------------------------------
 * pathExists / readFile / writeFile
 * --------------------------------------------------------------------------*/

TEST(pathExists, rootExists)
{
    ASSERT_TRUE(pathExists("/"));
}

TEST(pathExists, bogusPathDoesNotExist)
{
    ASSERT_FALSE(pathExists("/schnitzel/darmstadt/pommes"));
}

TEST(readFile, roundTripsWrittenContent)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    writeFile(tmpDir + "/file", "line 1\nline 2\n", 0600);

    ASSERT_EQ(readFile(tmpDir + "/file"), "line 1\nline 2\n");
    ASSERT_EQ(lstat(tmpDir + "/file").st_mode & 0777, 0600u);
}

TEST(readFile, missingFileThrows)
{
    ASSERT_THROW(readFile("/schnitzel/darmstadt/pommes"), SysError);
}

/* ----------------------------------------------------------------------------
 * copyTree / renameFile / deletePath
 * --------------------------------------------------------------------------*/

TEST(copyTree, copiesFilesDirectoriesAndSymlinks)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    createDirs(tmpDir + "/from/etc/arbor");
    writeFile(tmpDir + "/from/etc/arbor/arbor.conf", "max-jobs = 2\n");
    writeFile(tmpDir + "/from/run.sh", "#!/bin/sh\n", 0755);
    createSymlink("etc/arbor/arbor.conf", tmpDir + "/from/link");

    copyTree(tmpDir + "/from", tmpDir + "/to");

    ASSERT_EQ(readFile(tmpDir + "/to/etc/arbor/arbor.conf"), "max-jobs = 2\n");
    ASSERT_EQ(lstat(tmpDir + "/to/run.sh").st_mode & 0777, 0755u);
    ASSERT_TRUE(S_ISLNK(lstat(tmpDir + "/to/link").st_mode));
    ASSERT_EQ(std::filesystem::read_symlink(tmpDir + "/to/link").string(), "etc/arbor/arbor.conf");

    /* The copy is independent of the original. */
    writeFile(tmpDir + "/to/etc/arbor/arbor.conf", "changed");
    ASSERT_EQ(readFile(tmpDir + "/from/etc/arbor/arbor.conf"), "max-jobs = 2\n");
}

TEST(renameFile, failsWithErrnoOfRename)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    createDirs(tmpDir + "/a");
    createDirs(tmpDir + "/b/sub");

    try {
        renameFile(tmpDir + "/a", tmpDir + "/b");
        FAIL() << "renaming onto a non-empty directory succeeded";
    } catch (SysError & e) {
        ASSERT_TRUE(e.errNo == ENOTEMPTY || e.errNo == EEXIST);
    }
}

TEST(deletePath, removesTreeAndToleratesMissing)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    createDirs(tmpDir + "/tree/a/b");
    writeFile(tmpDir + "/tree/a/b/c", "");
    chmod((tmpDir + "/tree/a").c_str(), 0500);

    deletePath(tmpDir + "/tree");

    ASSERT_FALSE(pathExists(tmpDir + "/tree"));
    ASSERT_NO_THROW(deletePath(tmpDir + "/tree"));
}

/* ----------------------------------------------------------------------------
 * AutoDelete
 * --------------------------------------------------------------------------*/

TEST(AutoDelete, deletesOnDestruction)
{
    Path dir;
    {
        AutoDelete del(createTempDir(), true);
        dir = del.path().string();
        writeFile(dir + "/file", "");
        ASSERT_TRUE(pathExists(dir));
    }
    ASSERT_FALSE(pathExists(dir));
}

TEST(AutoDelete, cancelKeepsPath)
{
    auto tmpDir = createTempDir();
    {
        AutoDelete del(tmpDir, true);
        del.cancel();
    }
    ASSERT_TRUE(pathExists(tmpDir));
    deletePath(tmpDir);
}

TEST(AutoDelete, moveTransfersOwnership)
{
    auto tmpDir = createTempDir();
    {
        AutoDelete inner(tmpDir, true);
        {
            AutoDelete outer(std::move(inner));
            ASSERT_EQ(outer.path().string(), tmpDir);
        }
        ASSERT_FALSE(pathExists(tmpDir));
    }
}

} // namespace arbor
