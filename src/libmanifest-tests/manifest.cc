#include <gtest/gtest.h>

#include "arbor/manifest/manifest.hh"

namespace arbor {

static const std::string helloChecksum =
    "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

/* ----------------------------------------------------------------------------
 * Version 2
 * --------------------------------------------------------------------------*/

TEST(Manifest, parsesVersion2)
{
    auto manifest = Manifest::parse(R"({
        "version": "2",
        "pipelines": [
            {
                "name": "build",
                "runner": "org.osbuild.fedora38",
                "stages": [{"type": "org.osbuild.rpm", "options": {"gpgkeys": []}}]
            },
            {
                "name": "tree",
                "build": "name:build",
                "source-epoch": 1700000000,
                "stages": [
                    {
                        "type": "org.osbuild.copy",
                        "inputs": {
                            "root": {
                                "type": "org.osbuild.tree",
                                "origin": "org.osbuild.pipeline",
                                "references": ["name:build"]
                            },
                            "files": {
                                "type": "org.osbuild.files",
                                "origin": "org.osbuild.source",
                                "references": {
                                    "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824": {"mode": "0644"}
                                }
                            }
                        }
                    }
                ]
            }
        ],
        "sources": {
            "org.osbuild.curl": {
                "items": {
                    "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824": {
                        "url": ["https://mirror-1.example/hello", "https://mirror-2.example/hello"]
                    }
                }
            }
        }
    })");

    ASSERT_EQ(manifest.version, "2");
    ASSERT_EQ(manifest.pipelines.size(), 2u);

    auto & build = manifest.pipelines[0];
    ASSERT_EQ(build.name, "build");
    ASSERT_EQ(build.runner, "org.osbuild.fedora38");
    ASSERT_FALSE(build.build);
    ASSERT_EQ(build.stages.size(), 1u);
    ASSERT_EQ(build.stages[0].type, "org.osbuild.rpm");

    auto & tree = manifest.pipelines[1];
    ASSERT_EQ(tree.build, "build");
    ASSERT_EQ(tree.sourceEpoch, 1700000000u);
    ASSERT_EQ(tree.dependencies(), std::set<std::string>{"build"});

    auto & inputs = tree.stages[0].inputs;
    ASSERT_EQ(inputs.at("root").origin, StageInput::Origin::Pipeline);
    ASSERT_EQ(inputs.at("root").references.count("build"), 1u);
    ASSERT_EQ(inputs.at("files").origin, StageInput::Origin::Source);
    ASSERT_EQ(inputs.at("files").references.at(helloChecksum)["mode"], "0644");

    auto & source = manifest.sources.at(helloChecksum);
    ASSERT_EQ(source.type, "org.osbuild.curl");
    ASSERT_EQ(source.urls.size(), 2u);
    ASSERT_EQ(source.urls[0], "https://mirror-1.example/hello");
}

TEST(Manifest, curlItemForms)
{
    auto manifest = Manifest::parse(R"({
        "version": "2",
        "sources": {
            "org.osbuild.curl": {
                "items": {
                    "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824": "https://example.com/hello",
                    "sha256:486ea46224d1bb4fb680f34f7c9ad96a8f24ec88be73ea8e5a6c65260e9cb8a7": {"url": "https://example.com/world"}
                }
            },
            "org.osbuild.inline": {
                "items": {
                    "sha256:c3ab8ff13720e8ad9047dd39466b3c8974e592c2fa383d4a3960714caef0c4f2": {"encoding": "base64", "data": "Zm9vYmFy"}
                }
            }
        }
    })");

    ASSERT_EQ(manifest.sources.size(), 3u);
    ASSERT_EQ(manifest.sources.at(helloChecksum).urls, std::vector<std::string>{"https://example.com/hello"});

    auto & inlineItem =
        manifest.sources.at("sha256:c3ab8ff13720e8ad9047dd39466b3c8974e592c2fa383d4a3960714caef0c4f2");
    ASSERT_EQ(inlineItem.type, "org.osbuild.inline");
    ASSERT_EQ(inlineItem.encoding, "base64");
    ASSERT_EQ(inlineItem.data, "Zm9vYmFy");
}

TEST(Manifest, devicesAndMounts)
{
    auto manifest = Manifest::parse(R"({
        "version": "2",
        "pipelines": [{
            "name": "image",
            "stages": [{
                "type": "org.osbuild.copy",
                "devices": {
                    "root": {"type": "org.osbuild.loopback", "options": {"filename": "disk.img", "start": 2048}},
                    "boot": {"type": "org.osbuild.loopback", "parent": "root"}
                },
                "mounts": [
                    {"name": "root", "type": "org.osbuild.ext4", "source": "root", "target": "/"},
                    {"name": "efi", "type": "org.osbuild.fat", "source": "root", "target": "/boot/efi", "partition": 1}
                ]
            }]
        }]
    })");

    auto & stage = manifest.pipelines[0].stages[0];

    ASSERT_EQ(stage.devices.size(), 2u);
    ASSERT_EQ(stage.devices[0].name, "boot");
    ASSERT_EQ(stage.devices[0].parent, "root");
    ASSERT_EQ(stage.devices[1].options["start"], 2048);

    ASSERT_EQ(stage.mounts.size(), 2u);
    ASSERT_EQ(stage.mounts[0].name, "root");
    ASSERT_EQ(stage.mounts[1].partition, 1u);
}

TEST(Manifest, rejectsBrokenDocuments)
{
    /* Not JSON. */
    ASSERT_THROW(Manifest::parse("{"), ManifestError);

    /* Not an object. */
    ASSERT_THROW(Manifest::parse("[]"), ManifestError);

    ASSERT_THROW(Manifest::parse(R"({"version": "3"})"), ManifestError);
    ASSERT_THROW(Manifest::parse(R"({"version": 2})"), ManifestError);

    ASSERT_THROW(
        Manifest::parse(R"({"version": "2", "pipelines": [{"name": "tree"}, {"name": "tree"}]})"), ManifestError);

    ASSERT_THROW(Manifest::parse(R"({"version": "2", "pipelines": [{"stages": []}]})"), ManifestError);

    ASSERT_THROW(
        Manifest::parse(R"({"version": "2", "pipelines": [{"name": "tree", "stages": [{"type": ""}]}]})"),
        ManifestError);

    ASSERT_THROW(
        Manifest::parse(R"({"version": "2", "sources": {"org.osbuild.curl": {"items": {"md5:abc": "https://x"}}}})"),
        ManifestError);
}

TEST(Manifest, rejectsDanglingDeviceReferences)
{
    ASSERT_THROW(
        Manifest::parse(R"({
            "version": "2",
            "pipelines": [{"name": "image", "stages": [{
                "type": "org.osbuild.copy",
                "devices": {"boot": {"type": "org.osbuild.loopback", "parent": "root"}}
            }]}]
        })"),
        ManifestError);

    ASSERT_THROW(
        Manifest::parse(R"({
            "version": "2",
            "pipelines": [{"name": "image", "stages": [{
                "type": "org.osbuild.copy",
                "mounts": [{"name": "root", "type": "org.osbuild.ext4", "source": "disk", "target": "/"}]
            }]}]
        })"),
        ManifestError);
}

TEST(Manifest, errorsNameTheirLocation)
{
    try {
        Manifest::parse(R"({
            "version": "2",
            "pipelines": [{"name": "tree", "stages": [{"type": "org.osbuild.noop"}, {"options": {}}]}]
        })");
        FAIL() << "manifest should have been rejected";
    } catch (ManifestError & e) {
        auto msg = e.message();
        ASSERT_NE(msg.find("tree"), std::string::npos);
        ASSERT_NE(msg.find("stage"), std::string::npos);
    }
}

/* ----------------------------------------------------------------------------
 * Version 1
 * --------------------------------------------------------------------------*/

TEST(Manifest, convertsVersion1)
{
    auto manifest = Manifest::parse(R"({
        "pipeline": {
            "build": {
                "runner": "org.osbuild.fedora38",
                "pipeline": {
                    "stages": [{"name": "org.osbuild.rpm", "options": {"packages": ["dnf"]}}]
                }
            },
            "stages": [{"name": "org.osbuild.rpm"}, {"name": "org.osbuild.users"}],
            "assembler": {"name": "org.osbuild.qemu", "options": {"format": "qcow2"}}
        },
        "sources": {
            "org.osbuild.curl": {
                "urls": {
                    "sha256:2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824": "https://example.com/hello"
                }
            }
        }
    })");

    ASSERT_EQ(manifest.version, "1");
    ASSERT_EQ(manifest.pipelines.size(), 3u);

    ASSERT_EQ(manifest.pipelines[0].name, "build");
    ASSERT_EQ(manifest.pipelines[0].stages[0].options["packages"][0], "dnf");

    ASSERT_EQ(manifest.pipelines[1].name, "tree");
    ASSERT_EQ(manifest.pipelines[1].build, "build");
    ASSERT_EQ(manifest.pipelines[1].runner, "org.osbuild.fedora38");
    ASSERT_EQ(manifest.pipelines[1].stages.size(), 2u);

    auto & assembler = manifest.pipelines[2];
    ASSERT_EQ(assembler.name, "assembler");
    ASSERT_EQ(assembler.build, "build");
    ASSERT_EQ(assembler.stages[0].type, "org.osbuild.qemu");
    ASSERT_EQ(assembler.dependencies(), (std::set<std::string>{"build", "tree"}));

    ASSERT_EQ(manifest.sources.at(helloChecksum).urls, std::vector<std::string>{"https://example.com/hello"});
}

TEST(Manifest, version1WithoutBuildPipeline)
{
    auto manifest = Manifest::parse(R"({"pipeline": {"stages": [{"name": "org.osbuild.noop"}]}})");

    ASSERT_EQ(manifest.pipelines.size(), 1u);
    ASSERT_EQ(manifest.pipelines[0].name, "tree");
    ASSERT_FALSE(manifest.pipelines[0].build);
}

TEST(Manifest, emptyVersion1Document)
{
    auto manifest = Manifest::parse("{}");

    ASSERT_EQ(manifest.version, "1");
    ASSERT_TRUE(manifest.pipelines.empty());
}

} // namespace arbor
