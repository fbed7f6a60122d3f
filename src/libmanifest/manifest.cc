#include "arbor/manifest/manifest.hh"
#include "arbor/util/json-utils.hh"
#include "arbor/util/strings.hh"

#include <algorithm>

namespace arbor {

std::string_view printOrigin(StageInput::Origin origin)
{
    switch (origin) {
    case StageInput::Origin::Source:
        return "org.osbuild.source";
    case StageInput::Origin::Pipeline:
        return "org.osbuild.pipeline";
    }
    unreachable();
}

std::set<std::string> Pipeline::dependencies() const
{
    std::set<std::string> res;
    if (build)
        res.insert(*build);
    for (auto & stage : stages)
        for (auto & [_, input] : stage.inputs)
            if (input.origin == StageInput::Origin::Pipeline)
                for (auto & [ref, _] : input.references)
                    res.insert(ref);
    return res;
}

const Pipeline * Manifest::findPipeline(std::string_view name) const
{
    for (auto & p : pipelines)
        if (p.name == name)
            return &p;
    return nullptr;
}

/**
 * `name:foo` and `foo` both refer to pipeline `foo`.
 */
static std::string parsePipelineRef(std::string_view ref)
{
    if (hasPrefix(ref, "name:"))
        ref.remove_prefix(5);
    if (ref.empty())
        throw ManifestError("empty pipeline reference");
    return std::string(ref);
}

static std::string parseChecksum(std::string_view s)
{
    try {
        return Hash::parsePrefixed(s).to_string();
    } catch (BadHash & e) {
        throw ManifestError("invalid source checksum '%s': %s", s, e.message());
    }
}

static StageInput::Origin parseOrigin(std::string_view s)
{
    if (s == "org.osbuild.source" || s == "source")
        return StageInput::Origin::Source;
    if (s == "org.osbuild.pipeline" || s == "pipeline")
        return StageInput::Origin::Pipeline;
    throw ManifestError("unknown input origin '%s'", s);
}

static nlohmann::json referenceOptions(const nlohmann::json & value)
{
    if (value.is_null())
        return nlohmann::json::object();
    getObject(value);
    return value;
}

static StageInput parseInput(const nlohmann::json & json)
{
    auto & obj = getObject(json);

    StageInput input;
    input.type = getString(valueAt(obj, "type"));
    input.origin = parseOrigin(getString(valueAt(obj, "origin")));

    auto resolve = [&](const std::string & id) {
        return input.origin == StageInput::Origin::Pipeline ? parsePipelineRef(id) : parseChecksum(id);
    };

    if (auto * refs = optionalValueAt(obj, "references")) {
        if (refs->is_array()) {
            for (auto & ref : getArray(*refs))
                input.references.emplace(resolve(getString(ref)), nlohmann::json::object());
        } else {
            for (auto & [id, options] : getObject(*refs))
                input.references.emplace(resolve(id), referenceOptions(options));
        }
    }

    return input;
}

static Stage parseStageV2(const nlohmann::json & json)
{
    auto & obj = getObject(json);

    Stage stage;
    stage.type = getString(valueAt(obj, "type"));
    if (stage.type.empty())
        throw ManifestError("stage type is empty");

    if (auto * options = optionalValueAt(obj, "options"); options && !options->is_null()) {
        getObject(*options);
        stage.options = *options;
    }

    if (auto * inputs = optionalValueAt(obj, "inputs"))
        for (auto & [name, input] : getObject(*inputs)) {
            try {
                stage.inputs.emplace(name, parseInput(input));
            } catch (Error & e) {
                throw ManifestError("input '%s': %s", name, e.message());
            }
        }

    if (auto * devices = optionalValueAt(obj, "devices"))
        for (auto & [name, device] : getObject(*devices)) {
            auto & d = getObject(device);
            DeviceSpec spec{.name = name, .type = getString(valueAt(d, "type"))};
            if (auto * parent = optionalValueAt(d, "parent"); parent && !parent->is_null())
                spec.parent = getString(*parent);
            if (auto * options = optionalValueAt(d, "options"); options && !options->is_null()) {
                getObject(*options);
                spec.options = *options;
            }
            stage.devices.push_back(std::move(spec));
        }

    for (auto & device : stage.devices)
        if (device.parent) {
            if (*device.parent == device.name)
                throw ManifestError("device '%s' is its own parent", device.name);
            if (std::none_of(stage.devices.begin(), stage.devices.end(), [&](auto & d) {
                    return d.name == *device.parent;
                }))
                throw ManifestError("device '%s' has unknown parent '%s'", device.name, *device.parent);
        }

    if (auto * mounts = optionalValueAt(obj, "mounts")) {
        std::set<std::string> names;
        for (auto & mount : getArray(*mounts)) {
            auto & m = getObject(mount);
            MountSpec spec{
                .name = getString(valueAt(m, "name")),
                .type = getString(valueAt(m, "type")),
            };
            if (auto * source = optionalValueAt(m, "source"); source && !source->is_null())
                spec.source = getString(*source);
            if (auto * target = optionalValueAt(m, "target"); target && !target->is_null())
                spec.target = getString(*target);
            if (auto * partition = optionalValueAt(m, "partition"); partition && !partition->is_null())
                spec.partition = getUnsigned(*partition);
            if (auto * options = optionalValueAt(m, "options"); options && !options->is_null()) {
                getObject(*options);
                spec.options = *options;
            }

            if (!names.insert(spec.name).second)
                throw ManifestError("duplicate mount '%s'", spec.name);
            if (!spec.source.empty()
                && std::none_of(stage.devices.begin(), stage.devices.end(), [&](auto & d) {
                       return d.name == spec.source;
                   }))
                throw ManifestError("mount '%s' refers to unknown device '%s'", spec.name, spec.source);

            stage.mounts.push_back(std::move(spec));
        }
    }

    return stage;
}

static Pipeline parsePipelineV2(const nlohmann::json & json)
{
    auto & obj = getObject(json);

    Pipeline pipeline;
    if (auto * name = optionalValueAt(obj, "name"))
        pipeline.name = getString(*name);
    if (pipeline.name.empty())
        throw ManifestError("pipeline without a name");

    try {
        if (auto * build = optionalValueAt(obj, "build"); build && !build->is_null())
            pipeline.build = parsePipelineRef(getString(*build));
        if (auto * runner = optionalValueAt(obj, "runner"); runner && !runner->is_null())
            pipeline.runner = getString(*runner);
        if (auto * epoch = optionalValueAt(obj, "source-epoch"); epoch && !epoch->is_null())
            pipeline.sourceEpoch = getUnsigned(*epoch);

        if (auto * stages = optionalValueAt(obj, "stages")) {
            size_t n = 0;
            for (auto & stage : getArray(*stages)) {
                try {
                    pipeline.stages.push_back(parseStageV2(stage));
                } catch (Error & e) {
                    throw ManifestError("stage %d: %s", n, e.message());
                }
                n++;
            }
        }
    } catch (Error & e) {
        throw ManifestError("pipeline '%s': %s", pipeline.name, e.message());
    }

    return pipeline;
}

static std::vector<std::string> parseCurlUrls(const nlohmann::json & item)
{
    if (item.is_string())
        return {getString(item)};

    auto & url = valueAt(getObject(item), "url");
    if (url.is_string())
        return {getString(url)};

    std::vector<std::string> urls;
    for (auto & u : getArray(url))
        urls.push_back(getString(u));
    if (urls.empty())
        throw ManifestError("no URLs given");
    return urls;
}

static void parseSources(const nlohmann::json & json, bool v1, std::map<std::string, SourceItem> & sources)
{
    for (auto & [type, desc] : getObject(json)) {
        auto & obj = getObject(desc);

        auto * items = optionalValueAt(obj, v1 && type == "org.osbuild.curl" ? "urls" : "items");
        if (!items)
            continue;

        for (auto & [id, value] : getObject(*items)) {
            try {
                SourceItem item{.type = type, .checksum = Hash::parsePrefixed(id)};

                if (type == "org.osbuild.curl")
                    item.urls = parseCurlUrls(value);
                else if (type == "org.osbuild.inline") {
                    auto & o = getObject(value);
                    item.encoding = getString(valueAt(o, "encoding"));
                    item.data = getString(valueAt(o, "data"));
                }

                auto key = item.checksum.to_string();
                if (!sources.emplace(key, std::move(item)).second)
                    throw ManifestError("declared more than once");
            } catch (Error & e) {
                throw ManifestError("source '%s' of type '%s': %s", id, type, e.message());
            }
        }
    }
}

static Manifest parseV2(const nlohmann::json::object_t & obj)
{
    Manifest manifest{.version = "2"};

    if (auto * pipelines = optionalValueAt(obj, "pipelines"))
        for (auto & p : getArray(*pipelines)) {
            auto pipeline = parsePipelineV2(p);
            if (manifest.findPipeline(pipeline.name))
                throw ManifestError("duplicate pipeline name '%s'", pipeline.name);
            manifest.pipelines.push_back(std::move(pipeline));
        }

    if (auto * sources = optionalValueAt(obj, "sources"))
        parseSources(*sources, false, manifest.sources);

    return manifest;
}

static std::vector<Stage> parseStagesV1(const nlohmann::json::object_t & obj)
{
    std::vector<Stage> stages;
    if (auto * list = optionalValueAt(obj, "stages")) {
        size_t n = 0;
        for (auto & s : getArray(*list)) {
            try {
                auto & o = getObject(s);
                Stage stage{.type = getString(valueAt(o, "name"))};
                if (auto * options = optionalValueAt(o, "options"); options && !options->is_null()) {
                    getObject(*options);
                    stage.options = *options;
                }
                stages.push_back(std::move(stage));
            } catch (Error & e) {
                throw ManifestError("stage %d: %s", n, e.message());
            }
            n++;
        }
    }
    return stages;
}

/**
 * Convert a version 1 document. Nested build pipelines are flattened
 * into `build`, `build-1`, ... (innermost first), the main pipeline
 * becomes `tree` and its assembler `assembler`.
 */
static Manifest parseV1(const nlohmann::json::object_t & obj)
{
    Manifest manifest{.version = "1"};

    if (auto * top = optionalValueAt(obj, "pipeline")) {
        struct Level
        {
            const nlohmann::json::object_t * desc;
            std::optional<std::string> runner;
        };

        /* chain[0] is the main pipeline, chain.back() the innermost
           build pipeline. */
        std::vector<Level> chain{{&getObject(*top), std::nullopt}};
        while (true) {
            auto * build = optionalValueAt(*chain.back().desc, "build");
            if (!build || build->is_null())
                break;
            auto & b = getObject(*build);
            if (auto * runner = optionalValueAt(b, "runner"); runner && !runner->is_null())
                chain.back().runner = getString(*runner);
            chain.push_back({&getObject(valueAt(b, "pipeline")), std::nullopt});
        }

        auto nameOf = [&](size_t level) -> std::string {
            if (level == 0)
                return "tree";
            auto depth = chain.size() - 1 - level;
            return depth == 0 ? "build" : fmt("build-%d", depth);
        };

        for (size_t level = chain.size(); level-- > 0;) {
            Pipeline pipeline{.name = nameOf(level), .runner = chain[level].runner};
            if (level + 1 < chain.size())
                pipeline.build = nameOf(level + 1);
            try {
                pipeline.stages = parseStagesV1(*chain[level].desc);
            } catch (Error & e) {
                throw ManifestError("pipeline '%s': %s", pipeline.name, e.message());
            }
            manifest.pipelines.push_back(std::move(pipeline));
        }

        if (auto * assembler = optionalValueAt(*chain[0].desc, "assembler"); assembler && !assembler->is_null()) {
            auto & tree = manifest.pipelines.back();
            Pipeline pipeline{.name = "assembler", .build = tree.build, .runner = tree.runner};
            try {
                auto & a = getObject(*assembler);
                Stage stage{.type = getString(valueAt(a, "name"))};
                if (auto * options = optionalValueAt(a, "options"); options && !options->is_null()) {
                    getObject(*options);
                    stage.options = *options;
                }
                stage.inputs.emplace(
                    "tree",
                    StageInput{
                        .type = "org.osbuild.tree",
                        .origin = StageInput::Origin::Pipeline,
                        .references = {{"tree", nlohmann::json::object()}},
                    });
                pipeline.stages.push_back(std::move(stage));
            } catch (Error & e) {
                throw ManifestError("assembler: %s", e.message());
            }
            manifest.pipelines.push_back(std::move(pipeline));
        }
    }

    if (auto * sources = optionalValueAt(obj, "sources"))
        parseSources(*sources, true, manifest.sources);

    return manifest;
}

Manifest Manifest::fromJSON(const nlohmann::json & json)
{
    try {
        auto & obj = getObject(json);

        auto * version = optionalValueAt(obj, "version");
        if (!version)
            return parseV1(obj);

        if (!version->is_string() || getString(*version) != "2")
            throw ManifestError("unsupported manifest version %s", version->dump());

        return parseV2(obj);
    } catch (ManifestError &) {
        throw;
    } catch (Error & e) {
        throw ManifestError("invalid manifest: %s", e.message());
    }
}

Manifest Manifest::parse(std::string_view text)
{
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (nlohmann::json::parse_error & e) {
        throw ManifestError("manifest is not valid JSON: %s", e.what());
    }
    return fromJSON(json);
}

} // namespace arbor
