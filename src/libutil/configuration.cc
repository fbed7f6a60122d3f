#include "arbor/util/configuration.hh"
#include "arbor/util/file-system.hh"
#include "arbor/util/logging.hh"
#include "arbor/util/strings.hh"

#include <algorithm>

#include <nlohmann/json.hpp>

extern char ** environ;

namespace arbor {

void Config::addSetting(AbstractSetting * setting)
{
    entries.emplace(setting->name, Entry{setting, false});
    for (auto & alias : setting->aliases)
        entries.emplace(alias, Entry{setting, true});
}

bool Config::set(const std::string & name, const std::string & value)
{
    auto i = entries.find(name);
    bool append = false;

    if (i == entries.end() && hasPrefix(name, "extra-")) {
        i = entries.find(name.substr(6));
        if (i != entries.end() && !i->second.setting->isAppendable())
            i = entries.end();
        append = true;
    }

    if (i == entries.end())
        return false;

    i->second.setting->set(value, append);
    i->second.setting->overridden = true;
    return true;
}

static UsageError syntaxError(const std::string & line, const std::string & path)
{
    return UsageError("syntax error in configuration line '%s' in '%s'", line, path);
}

void Config::applyConfig(const std::string & contents, const std::string & path)
{
    for (auto line : tokenizeString<Strings>(contents, "\n")) {
        line = line.substr(0, line.find('#'));

        auto words = tokenizeString<std::vector<std::string>>(line);
        if (words.empty())
            continue;

        if (words[0] == "include" || words[0] == "!include") {
            if (words.size() != 2)
                throw syntaxError(line, path);
            auto included = absPath(words[1], dirOf(path));
            if (pathExists(included))
                applyConfig(readFile(included), included);
            else if (words[0] == "include")
                throw Error("file '%s' included from '%s' not found", included, path);
            continue;
        }

        if (words.size() < 2 || words[1] != "=")
            throw syntaxError(line, path);

        auto value = concatStringsSep(" ", std::vector<std::string>(words.begin() + 2, words.end()));
        if (!set(words[0], value))
            warn("unknown setting '%s' in '%s'", words[0], path);
    }
}

void Config::applyEnvironment(std::string_view prefix)
{
    for (auto env = environ; env && *env; ++env) {
        std::string_view var(*env);
        auto eq = var.find('=');
        if (eq == var.npos || !hasPrefix(var.substr(0, eq), prefix))
            continue;

        auto name = toLower(std::string(var.substr(prefix.size(), eq - prefix.size())));
        std::replace(name.begin(), name.end(), '_', '-');

        if (!set(name, std::string(var.substr(eq + 1))))
            debug("environment variable '%s' does not name a setting", var.substr(0, eq));
    }
}

void Config::getSettings(std::map<std::string, SettingInfo> & res, bool overriddenOnly) const
{
    for (auto & [name, entry] : entries)
        if (!entry.isAlias && (entry.setting->overridden || !overriddenOnly))
            res.emplace(name, SettingInfo{entry.setting->to_string(), entry.setting->description});
}

void Config::resetOverridden()
{
    for (auto & [_, entry] : entries)
        entry.setting->overridden = false;
}

nlohmann::json Config::toJSON() const
{
    auto res = nlohmann::json::object();
    for (auto & [name, entry] : entries)
        if (!entry.isAlias)
            res[name] = {
                {"value", entry.setting->to_string()},
                {"description", entry.setting->description},
                {"aliases", entry.setting->aliases},
            };
    return res;
}

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral_v<T>);
    if (auto n = string2Int<T>(str))
        return *n;
    throw UsageError("setting '%s' has invalid value '%s'", name, str);
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral_v<T>);
    return std::to_string(value);
}

template<typename T>
void BaseSetting<T>::set(const std::string & str, bool append)
{
    auto parsed = parse(str);
    if constexpr (std::is_same_v<T, Strings>) {
        if (!append)
            value.clear();
        value.insert(value.end(), parsed.begin(), parsed.end());
    } else if constexpr (std::is_same_v<T, StringSet>) {
        if (!append)
            value.clear();
        value.insert(parsed.begin(), parsed.end());
    } else {
        if (append)
            throw UsageError("setting '%s' cannot be appended to", name);
        value = std::move(parsed);
    }
}

template<>
bool BaseSetting<bool>::parse(const std::string & str) const
{
    if (str == "true" || str == "yes" || str == "1")
        return true;
    if (str == "false" || str == "no" || str == "0")
        return false;
    throw UsageError("Boolean setting '%s' has invalid value '%s'", name, str);
}

template<>
std::string BaseSetting<bool>::to_string() const
{
    return value ? "true" : "false";
}

template<>
std::string BaseSetting<std::string>::parse(const std::string & str) const
{
    return str;
}

template<>
std::string BaseSetting<std::string>::to_string() const
{
    return value;
}

template<>
Strings BaseSetting<Strings>::parse(const std::string & str) const
{
    return tokenizeString<Strings>(str);
}

template<>
std::string BaseSetting<Strings>::to_string() const
{
    return concatStringsSep(" ", value);
}

template<>
StringSet BaseSetting<StringSet>::parse(const std::string & str) const
{
    return tokenizeString<StringSet>(str);
}

template<>
std::string BaseSetting<StringSet>::to_string() const
{
    return concatStringsSep(" ", value);
}

template class BaseSetting<unsigned int>;
template class BaseSetting<unsigned long>;
template class BaseSetting<bool>;
template class BaseSetting<std::string>;
template class BaseSetting<Strings>;
template class BaseSetting<StringSet>;

PathSetting::PathSetting(
    Config * config, const Path & def, const std::string & name, const std::string & description, const StringSet & aliases)
    : BaseSetting<Path>(def, name, description, aliases)
{
    config->addSetting(this);
}

Path PathSetting::parse(const std::string & str) const
{
    if (str.empty())
        throw UsageError("setting '%s' is a path and paths cannot be empty", name);
    return absPath(str);
}

} // namespace arbor
