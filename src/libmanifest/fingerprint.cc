#include "arbor/manifest/fingerprint.hh"
#include "arbor/util/json-utils.hh"

namespace arbor {

Fingerprint Fingerprint::parse(std::string_view s)
{
    return Fingerprint{Hash::parseHex(s, HashAlgorithm::SHA256)};
}

Fingerprint computeFingerprint(const nlohmann::json & identity)
{
    return Fingerprint{hashString(HashAlgorithm::SHA256, canonicalJSON(identity))};
}

static nlohmann::json optionalFingerprint(const std::optional<Fingerprint> & fp)
{
    return fp ? nlohmann::json(fp->to_string()) : nlohmann::json();
}

template<typename T>
static nlohmann::json optionalJSON(const std::optional<T> & v)
{
    return v ? nlohmann::json(*v) : nlohmann::json();
}

static nlohmann::json devicesJSON(const Stage & stage)
{
    auto res = nlohmann::json::object();
    for (auto & d : stage.devices)
        res[d.name] = {{"type", d.type}, {"parent", optionalJSON(d.parent)}, {"options", d.options}};
    return res;
}

static nlohmann::json mountsJSON(const Stage & stage)
{
    auto res = nlohmann::json::array();
    for (auto & m : stage.mounts)
        res.push_back({
            {"name", m.name},
            {"type", m.type},
            {"source", m.source},
            {"target", m.target},
            {"partition", optionalJSON(m.partition)},
            {"options", m.options},
        });
    return res;
}

std::optional<size_t> ResolvedManifest::indexOf(std::string_view name) const
{
    for (size_t i = 0; i < manifest.pipelines.size(); ++i)
        if (manifest.pipelines[i].name == name)
            return i;
    return std::nullopt;
}

ResolvedManifest resolveManifest(Manifest manifest, const StageRegistry & registry)
{
    auto graph = PipelineGraph::build(manifest);

    auto n = manifest.pipelines.size();
    ResolvedManifest res{
        .manifest = std::move(manifest),
        .graph = std::move(graph),
        .stageFingerprints = std::vector<std::vector<Fingerprint>>(n),
        .pipelineFingerprints = std::vector<std::optional<Fingerprint>>(n),
        .descriptors = std::vector<std::vector<std::shared_ptr<const StageDescriptor>>>(n),
    };

    auto & pipelines = res.manifest.pipelines;

    auto fingerprintOf = [&](const std::string & name) {
        return res.pipelineFingerprints[*res.indexOf(name)];
    };

    for (auto p : res.graph.order) {
        auto & pipeline = pipelines[p];

        std::optional<Fingerprint> buildFp;
        if (pipeline.build)
            buildFp = fingerprintOf(*pipeline.build);

        auto base = buildFp;

        for (size_t k = 0; k < pipeline.stages.size(); ++k) {
            auto & stage = pipeline.stages[k];

            try {
                auto descriptor = registry.lookup(stage.type);
                descriptor->validateOptions(stage.options);
                res.descriptors[p].push_back(descriptor);

                auto inputs = nlohmann::json::object();
                for (auto & [name, input] : stage.inputs) {
                    auto refs = nlohmann::json::object();
                    for (auto & [id, options] : input.references) {
                        std::string resolved;
                        if (input.origin == StageInput::Origin::Pipeline) {
                            auto fp = fingerprintOf(id);
                            /* A pipeline without stages or build
                               pipeline has an empty tree. */
                            resolved = fp ? fp->to_string() : "empty";
                        } else {
                            if (!res.manifest.sources.count(id))
                                throw ManifestError("input '%s' refers to undeclared source '%s'", name, id);
                            resolved = id;
                        }
                        refs[resolved] = options;
                    }
                    inputs[name] = {
                        {"type", input.type},
                        {"origin", std::string(printOrigin(input.origin))},
                        {"references", std::move(refs)},
                    };
                }

                nlohmann::json identity{
                    {"type", stage.type},
                    {"options", stage.options},
                    {"base", optionalFingerprint(base)},
                    {"build", optionalFingerprint(buildFp)},
                    {"runner", optionalJSON(pipeline.runner)},
                    {"source-epoch", optionalJSON(pipeline.sourceEpoch)},
                    {"inputs", std::move(inputs)},
                    {"devices", devicesJSON(stage)},
                    {"mounts", mountsJSON(stage)},
                };

                auto fp = computeFingerprint(identity);
                res.stageFingerprints[p].push_back(fp);
                base = fp;
            } catch (ManifestError & e) {
                throw ManifestError("pipeline '%s', stage %d ('%s'): %s", pipeline.name, k, stage.type, e.message());
            }
        }

        res.pipelineFingerprints[p] = base;
    }

    return res;
}

static nlohmann::json sourcesJSON(const std::map<std::string, SourceItem> & sources)
{
    auto res = nlohmann::json::object();
    for (auto & [id, item] : sources) {
        nlohmann::json value = nlohmann::json::object();
        if (!item.urls.empty())
            value["url"] = item.urls.size() == 1 ? nlohmann::json(item.urls.front()) : nlohmann::json(item.urls);
        if (!item.encoding.empty()) {
            value["encoding"] = item.encoding;
            value["data"] = item.data;
        }
        res[item.type]["items"][id] = std::move(value);
    }
    return res;
}

nlohmann::json ResolvedManifest::inspect() const
{
    auto pipelinesJSON = nlohmann::json::array();

    for (size_t p = 0; p < manifest.pipelines.size(); ++p) {
        auto & pipeline = manifest.pipelines[p];

        auto stages = nlohmann::json::array();
        for (size_t k = 0; k < pipeline.stages.size(); ++k) {
            auto & stage = pipeline.stages[k];

            nlohmann::json s{
                {"type", stage.type},
                {"id", stageFingerprints[p][k].to_string()},
                {"options", stage.options},
            };

            if (!stage.inputs.empty()) {
                auto & inputs = s["inputs"] = nlohmann::json::object();
                for (auto & [name, input] : stage.inputs) {
                    auto refs = nlohmann::json::object();
                    for (auto & [id, options] : input.references)
                        refs[input.origin == StageInput::Origin::Pipeline ? "name:" + id : id] = options;
                    inputs[name] = {
                        {"type", input.type},
                        {"origin", std::string(printOrigin(input.origin))},
                        {"references", std::move(refs)},
                    };
                }
            }
            if (!stage.devices.empty())
                s["devices"] = devicesJSON(stage);
            if (!stage.mounts.empty())
                s["mounts"] = mountsJSON(stage);

            stages.push_back(std::move(s));
        }

        nlohmann::json json{{"name", pipeline.name}, {"stages", std::move(stages)}};
        if (pipeline.build)
            json["build"] = "name:" + *pipeline.build;
        if (pipeline.runner)
            json["runner"] = *pipeline.runner;
        if (pipeline.sourceEpoch)
            json["source-epoch"] = *pipeline.sourceEpoch;
        if (pipelineFingerprints[p])
            json["id"] = pipelineFingerprints[p]->to_string();

        pipelinesJSON.push_back(std::move(json));
    }

    return {
        {"version", "2"},
        {"pipelines", std::move(pipelinesJSON)},
        {"sources", sourcesJSON(manifest.sources)},
    };
}

} // namespace arbor
