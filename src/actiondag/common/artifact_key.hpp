/**
 * @file artifact_key.hpp
 * @brief Key format under which action artifacts are stored.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action_types.hpp"

namespace actiondag
{

/**
 * @brief Artifact key of one version of an action.
 * @return `<kind>.<name>.<version>`, e.g. `test.module-a-unit.v-1234512345`.
 */
std::string artifact_key(ActionKind kind, const std::string& name, const std::string& version);

/**
 * @brief File name of the metadata file listing the artifacts of a key.
 * @return `.metadata.<key>.json`
 */
std::string artifact_metadata_filename(const std::string& key);

} // namespace actiondag
