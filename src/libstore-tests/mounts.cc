#include <gtest/gtest.h>

#include "arbor/store/build/devices.hh"
#include "arbor/store/build/mounts.hh"

#include <sys/mount.h>

namespace arbor {

using nlohmann::json;

TEST(filesystemType, knownTypes)
{
    ASSERT_EQ(filesystemType("org.osbuild.ext4"), "ext4");
    ASSERT_EQ(filesystemType("org.osbuild.fat"), "vfat");
    ASSERT_EQ(filesystemType("org.osbuild.noop"), "");
}

TEST(filesystemType, unknownTypeIsRejected)
{
    ASSERT_THROW(filesystemType("org.osbuild.zfs"), SandboxError);
}

TEST(translateMountOptions, fixedOrder)
{
    auto options = json::parse(R"({"umask": "077", "readonly": true, "uid": 0, "norecovery": true})");

    ASSERT_EQ(translateMountOptions(options), (Strings{"ro", "norecovery", "uid=0", "umask=077"}));
}

TEST(translateMountOptions, falseFlagsAreOmitted)
{
    auto options = json::parse(R"({"readonly": false, "compress": "zstd:1"})");

    ASSERT_EQ(translateMountOptions(options), (Strings{"compress=zstd:1"}));
}

TEST(translateMountOptions, nullMeansNoOptions)
{
    ASSERT_TRUE(translateMountOptions(nullptr).empty());
    ASSERT_TRUE(translateMountOptions(json::object()).empty());
}

TEST(toMountFlags, readOnlyBecomesAFlag)
{
    auto res = toMountFlags({"ro", "uid=0", "umask=077"});

    ASSERT_EQ(res.flags, (unsigned long) MS_RDONLY);
    ASSERT_EQ(res.data, "uid=0,umask=077");
}

TEST(mountId, isDeterministic)
{
    auto a = mountId("org.osbuild.ext4", "dev1", "/", json::parse(R"({"a": 1, "b": 2})"));
    auto b = mountId("org.osbuild.ext4", "dev1", "/", json::parse(R"({"b": 2, "a": 1})"));

    ASSERT_EQ(a, b);
    ASSERT_EQ(a.size(), 64u);
}

TEST(mountId, dependsOnEveryField)
{
    auto options = json::object();
    auto base = mountId("org.osbuild.ext4", "dev1", "/", options);

    ASSERT_NE(base, mountId("org.osbuild.xfs", "dev1", "/", options));
    ASSERT_NE(base, mountId("org.osbuild.ext4", "dev2", "/", options));
    ASSERT_NE(base, mountId("org.osbuild.ext4", "dev1", "/boot", options));
    ASSERT_NE(base, mountId("org.osbuild.ext4", "dev1", "/", json{{"readonly", true}}));
}

TEST(deviceId, includesParent)
{
    auto options = json{{"filename", "disk.img"}};

    ASSERT_NE(
        deviceId("org.osbuild.loopback", std::nullopt, options),
        deviceId("org.osbuild.loopback", "parent", options));
}

/* ----------------------------------------------------------------------------
 * parseLoopOptions
 * --------------------------------------------------------------------------*/

TEST(parseLoopOptions, defaults)
{
    auto res = parseLoopOptions(json{{"filename", "disk.img"}}, "/run/tree");

    ASSERT_EQ(res.filename, "/run/tree/disk.img");
    ASSERT_EQ(res.start, 0u);
    ASSERT_EQ(res.size, 0u);
    ASSERT_EQ(res.sectorSize, 512u);
    ASSERT_FALSE(res.readOnly);
}

TEST(parseLoopOptions, allFields)
{
    auto res = parseLoopOptions(
        json::parse(R"({
            "filename": "images/disk.img",
            "start": 2048,
            "size": 4096,
            "sector-size": 4096,
            "lock": true,
            "partscan": true,
            "read-only": true
        })"),
        "/run/tree");

    ASSERT_EQ(res.filename, "/run/tree/images/disk.img");
    ASSERT_EQ(res.start, 2048u);
    ASSERT_EQ(res.size, 4096u);
    ASSERT_EQ(res.sectorSize, 4096u);
    ASSERT_TRUE(res.lock);
    ASSERT_TRUE(res.partscan);
    ASSERT_TRUE(res.readOnly);
}

TEST(parseLoopOptions, fileMustStayInTree)
{
    ASSERT_THROW(parseLoopOptions(json{{"filename", "../../etc/shadow"}}, "/run/tree"), SandboxError);
}

TEST(parseLoopOptions, sectorSizeMustBeAPowerOfTwo)
{
    ASSERT_THROW(parseLoopOptions(json{{"filename", "disk.img"}, {"sector-size", 1000u}}, "/run/tree"), SandboxError);
    ASSERT_THROW(parseLoopOptions(json{{"filename", "disk.img"}, {"sector-size", 256u}}, "/run/tree"), SandboxError);
}

TEST(parseLoopOptions, wrongTypesAreRejected)
{
    ASSERT_THROW(parseLoopOptions(json{{"filename", "disk.img"}, {"start", -1}}, "/run/tree"), Error);
    ASSERT_THROW(parseLoopOptions(json{{"filename", 7}}, "/run/tree"), Error);
}

} // namespace arbor
