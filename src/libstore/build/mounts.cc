#include "arbor/store/build/mounts.hh"
#include "arbor/util/hash.hh"
#include "arbor/util/json-utils.hh"
#include "arbor/util/strings.hh"

#include <sys/mount.h>

namespace arbor {

std::string filesystemType(std::string_view mountType)
{
    static const std::map<std::string_view, std::string> types = {
        {"org.osbuild.ext4", "ext4"},
        {"org.osbuild.xfs", "xfs"},
        {"org.osbuild.fat", "vfat"},
        {"org.osbuild.btrfs", "btrfs"},
        {"org.osbuild.noop", ""},
    };

    auto i = types.find(mountType);
    if (i == types.end())
        throw SandboxError("unsupported mount type '%s'", mountType);
    return i->second;
}

Strings translateMountOptions(const nlohmann::json & options)
{
    Strings res;

    if (options.is_null())
        return res;

    auto & obj = getObject(options);

    auto flag = [&](std::string_view name) {
        auto v = optionalValueAt(obj, name);
        return v && v->is_boolean() && v->get<bool>();
    };

    if (flag("readonly"))
        res.push_back("ro");
    if (flag("norecovery"))
        res.push_back("norecovery");

    for (auto name : {"uid", "gid", "umask", "shortname", "subvol", "compress"}) {
        auto v = optionalValueAt(obj, name);
        if (!v)
            continue;
        res.push_back(fmt("%s=%s", name, v->is_string() ? v->get<std::string>() : v->dump()));
    }

    return res;
}

MountFlags toMountFlags(const Strings & options)
{
    MountFlags res;
    Strings data;
    for (auto & opt : options) {
        if (opt == "ro")
            res.flags |= MS_RDONLY;
        else
            data.push_back(opt);
    }
    res.data = concatStringsSep(",", data);
    return res;
}

std::string deviceId(
    const std::string & type, const std::optional<std::string> & parentId, const nlohmann::json & options)
{
    HashSink sink(HashAlgorithm::SHA256);
    sink(nlohmann::json(type).dump());
    if (parentId)
        sink(nlohmann::json(*parentId).dump());
    sink(options.dump());
    return sink.finish().to_string(false);
}

std::string mountId(
    const std::string & type,
    const std::optional<std::string> & deviceId,
    const std::optional<std::string> & target,
    const nlohmann::json & options)
{
    /* nlohmann::json keeps object keys sorted, so dump() matches a
       sorted-keys serialization. */
    HashSink sink(HashAlgorithm::SHA256);
    sink(nlohmann::json(type).dump());
    if (deviceId)
        sink(nlohmann::json(*deviceId).dump());
    if (target)
        sink(nlohmann::json(*target).dump());
    sink(options.dump());
    return sink.finish().to_string(false);
}

} // namespace arbor
