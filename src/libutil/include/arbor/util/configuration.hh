#pragma once
///@file

#include <map>
#include <set>
#include <type_traits>

#include <nlohmann/json_fwd.hpp>

#include "arbor/util/types.hh"
#include "arbor/util/error.hh"

namespace arbor {

class AbstractSetting;

/**
 * A set of named settings, filled from `arbor.conf`, `ARBOR_*`
 * environment variables and `--option`. Settings register themselves
 * on construction:
 *
 *   struct Settings : Config
 *   {
 *       Setting<unsigned int> maxJobs{this, 1, "max-jobs", "Stages to run in parallel.", {"j"}};
 *   };
 *
 * A list-valued setting `foo` can be extended with `extra-foo`.
 */
class Config
{
    struct Entry
    {
        AbstractSetting * setting;
        bool isAlias;
    };

    std::map<std::string, Entry> entries;

public:

    struct SettingInfo
    {
        std::string value;
        std::string description;
    };

    virtual ~Config() = default;

    void addSetting(AbstractSetting * setting);

    /**
     * Parse `value` into the setting called `name` and mark it
     * overridden.
     *
     * @return false if no such setting exists.
     * @throws UsageError if `value` does not parse.
     */
    bool set(const std::string & name, const std::string & value);

    /**
     * Apply `name = value` lines. `#` starts a comment, `include FILE`
     * and `!include FILE` (no error if missing) read another file
     * relative to `path`. Unknown names are warned about.
     */
    void applyConfig(const std::string & contents, const std::string & path = "<unknown>");

    /**
     * Apply each `<prefix><NAME>` environment variable to the setting
     * with NAME lowercased and `_` replaced by `-`, so that
     * `ARBOR_MAX_JOBS=4` sets `max-jobs`.
     */
    void applyEnvironment(std::string_view prefix);

    /**
     * Add every setting (but not its aliases) to `res`.
     */
    void getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly = false) const;

    void resetOverridden();

    /**
     * `{ name: { value, description, aliases } }` for every setting.
     */
    nlohmann::json toJSON() const;
};

class AbstractSetting
{
public:

    const std::string name;
    const std::string description;
    const StringSet aliases;

    /**
     * Set by Config::set(), i.e. the value no longer is the default.
     */
    bool overridden = false;

    virtual ~AbstractSetting() = default;

    /**
     * Parse `str` and replace the value, or with `append` add to it.
     */
    virtual void set(const std::string & str, bool append = false) = 0;

    virtual bool isAppendable() const = 0;

    virtual std::string to_string() const = 0;

protected:

    AbstractSetting(const std::string & name, const std::string & description, const StringSet & aliases)
        : name(name)
        , description(description)
        , aliases(aliases)
    {
    }
};

/**
 * A setting holding a `T`. Implemented for integers, `bool`,
 * `std::string`, `Strings` and `StringSet`; the last two are
 * whitespace-separated and appendable.
 */
template<typename T>
class BaseSetting : public AbstractSetting
{
protected:

    T value;

    virtual T parse(const std::string & str) const;

public:

    BaseSetting(const T & def, const std::string & name, const std::string & description, const StringSet & aliases = {})
        : AbstractSetting(name, description, aliases)
        , value(def)
    {
    }

    operator const T &() const
    {
        return value;
    }

    const T & get() const
    {
        return value;
    }

    template<typename U>
    bool operator==(const U & other) const
    {
        return value == other;
    }

    void operator=(const T & v)
    {
        value = v;
    }

    /**
     * Set from code, e.g. a dedicated command line flag.
     */
    void override(const T & v)
    {
        value = v;
        overridden = true;
    }

    void set(const std::string & str, bool append = false) override;

    bool isAppendable() const override
    {
        return std::is_same_v<T, Strings> || std::is_same_v<T, StringSet>;
    }

    std::string to_string() const override;
};

template<typename T>
class Setting : public BaseSetting<T>
{
public:

    Setting(
        Config * config,
        const T & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {})
        : BaseSetting<T>(def, name, description, aliases)
    {
        config->addSetting(this);
    }

    using BaseSetting<T>::operator=;
};

/**
 * An absolute, canonical path. Relative values are taken relative to
 * the current directory; empty values are rejected.
 */
class PathSetting : public BaseSetting<Path>
{
public:

    PathSetting(
        Config * config,
        const Path & def,
        const std::string & name,
        const std::string & description,
        const StringSet & aliases = {});

    Path parse(const std::string & str) const override;

    using BaseSetting<Path>::operator=;
};

} // namespace arbor
