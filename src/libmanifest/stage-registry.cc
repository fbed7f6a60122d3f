#include "arbor/manifest/stage-registry.hh"
#include "arbor/manifest/manifest.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/json-utils.hh"
#include "arbor/util/logging.hh"

#include <unistd.h>

namespace arbor {

namespace {

class ThrowingErrorHandler : public nlohmann::json_schema::basic_error_handler
{
    void error(const nlohmann::json::json_pointer & ptr, const nlohmann::json & instance, const std::string & message)
        override
    {
        std::string pos = ptr.to_string();
        if (pos == "")
            pos = "/";
        throw std::invalid_argument("at '" + pos + "', " + message);
    }
};

} // namespace

StageDescriptor::StageDescriptor(std::string type, Path program, const nlohmann::json & meta)
    : type(std::move(type))
    , program(std::move(program))
{
    if (meta.is_null())
        return;

    try {
        auto & obj = getObject(meta);
        if (auto * summary = optionalValueAt(obj, "summary"))
            this->summary = getString(*summary);
        if (auto * caps = optionalValueAt(obj, "capabilities"))
            capabilities = getStringSet(*caps);
        if (auto * s = optionalValueAt(obj, "schema"); s && !s->is_null())
            schema = *s;
    } catch (Error & e) {
        throw ManifestError("invalid descriptor of stage '%s': %s", this->type, e.message());
    }

    if (schema) {
        auto v = std::make_shared<nlohmann::json_schema::json_validator>(
            nullptr, nlohmann::json_schema::default_string_format_check);
        try {
            v->set_root_schema(*schema);
        } catch (std::exception & e) {
            throw ManifestError("invalid options schema of stage '%s': %s", this->type, e.what());
        }
        validator = std::move(v);
    }
}

void StageDescriptor::validateOptions(const nlohmann::json & options) const
{
    if (!validator)
        return;

    ThrowingErrorHandler handler;
    try {
        validator->validate(options, handler);
    } catch (std::invalid_argument & e) {
        throw ManifestError("options of stage '%s' are invalid: %s", type, e.what());
    }
}

FileStageRegistry::FileStageRegistry(const Path & libDir)
    : stagesDir(libDir + "/stages")
{
}

std::shared_ptr<const StageDescriptor> FileStageRegistry::lookup(const std::string & type) const
{
    {
        auto cache_(cache.lock());
        auto i = cache_->find(type);
        if (i != cache_->end())
            return i->second;
    }

    if (type.empty() || type.find('/') != std::string::npos || type[0] == '.')
        throw ManifestError("invalid stage type '%s'", type);

    auto program = stagesDir + "/" + type;
    if (access(program.c_str(), X_OK) != 0)
        throw ManifestError("unknown stage type '%s'", type);

    nlohmann::json meta;
    auto metaPath = program + ".meta.json";
    if (pathExists(metaPath)) {
        try {
            meta = nlohmann::json::parse(readFile(metaPath));
        } catch (nlohmann::json::parse_error & e) {
            throw ManifestError("descriptor '%s' is not valid JSON: %s", metaPath, e.what());
        }
    } else
        debug("stage '%s' has no descriptor", type);

    auto descriptor = std::make_shared<const StageDescriptor>(type, program, meta);

    auto cache_(cache.lock());
    return cache_->emplace(type, descriptor).first->second;
}

void MemoryStageRegistry::add(StageDescriptor descriptor)
{
    auto type = descriptor.type;
    stages.insert_or_assign(type, std::make_shared<const StageDescriptor>(std::move(descriptor)));
}

std::shared_ptr<const StageDescriptor> MemoryStageRegistry::lookup(const std::string & type) const
{
    auto i = stages.find(type);
    if (i == stages.end())
        throw ManifestError("unknown stage type '%s'", type);
    return i->second;
}

} // namespace arbor
