#include "actiondag/common/artifact_key.hpp"

namespace actiondag
{

std::string artifact_key(ActionKind kind, const std::string& name, const std::string& version)
{
    return kind_key_name(kind) + "." + name + "." + version;
}

std::string artifact_metadata_filename(const std::string& key)
{
    return ".metadata." + key + ".json";
}

} // namespace actiondag
