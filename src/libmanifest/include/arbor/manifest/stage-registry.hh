#pragma once
///@file

#include "arbor/util/sync.hh"
#include "arbor/util/types.hh"

#include <map>
#include <memory>
#include <optional>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

namespace arbor {

/**
 * What the core knows about a stage type: where its executable lives,
 * which capabilities it needs and how to check its options.
 */
class StageDescriptor
{
public:
    std::string type;

    /**
     * The stage executable on the host.
     */
    Path program;

    std::string summary;
    StringSet capabilities;
    std::optional<nlohmann::json> schema;

    /**
     * @param meta The stage's descriptor document (`summary`,
     * `capabilities`, `schema`), or null.
     */
    StageDescriptor(std::string type, Path program, const nlohmann::json & meta = nullptr);

    /**
     * Check `options` against the stage's schema, if it has one.
     *
     * @throws ManifestError
     */
    void validateOptions(const nlohmann::json & options) const;

private:
    std::shared_ptr<nlohmann::json_schema::json_validator> validator;
};

/**
 * Maps stage type identifiers to descriptors.
 */
class StageRegistry
{
public:
    virtual ~StageRegistry() {}

    /**
     * @throws ManifestError if `type` is not a known stage type.
     */
    virtual std::shared_ptr<const StageDescriptor> lookup(const std::string & type) const = 0;
};

/**
 * Stages installed as `<libdir>/stages/<type>`, with an optional
 * descriptor in `<libdir>/stages/<type>.meta.json`.
 */
class FileStageRegistry : public StageRegistry
{
    Path stagesDir;

    mutable Sync<std::map<std::string, std::shared_ptr<const StageDescriptor>>> cache;

public:
    explicit FileStageRegistry(const Path & libDir);

    std::shared_ptr<const StageDescriptor> lookup(const std::string & type) const override;
};

class MemoryStageRegistry : public StageRegistry
{
    std::map<std::string, std::shared_ptr<const StageDescriptor>> stages;

public:
    void add(StageDescriptor descriptor);

    std::shared_ptr<const StageDescriptor> lookup(const std::string & type) const override;
};

} // namespace arbor
