#include "actiondag/common/action_types.hpp"
#include "actiondag/common/engine_errors.hpp"

#include <algorithm>
#include <cctype>

namespace actiondag
{

namespace
{

struct KindNames
{
    ActionKind kind;
    std::string display;
    std::string key;
};

const std::vector<KindNames>& kind_names()
{
    static const std::vector<KindNames> names = {
        {ActionKind::Build, "Build", "build"},
        {ActionKind::Deploy, "Deploy", "deploy"},
        {ActionKind::Run, "Run", "run"},
        {ActionKind::Test, "Test", "test"},
    };
    return names;
}

} // namespace

const std::string& kind_display_name(ActionKind kind)
{
    return kind_names()[static_cast<size_t>(kind)].display;
}

const std::string& kind_key_name(ActionKind kind)
{
    return kind_names()[static_cast<size_t>(kind)].key;
}

std::optional<ActionKind> parse_action_kind(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kind_names())
    {
        if (entry.key == lowered)
        {
            return entry.kind;
        }
    }
    return std::nullopt;
}

std::string ActionKey::to_string() const
{
    return kind_key_name(kind) + "." + name;
}

std::ostream& operator<<(std::ostream& os, const ActionKey& key)
{
    return os << key.to_string();
}

ActionKey parse_action_reference(std::string_view reference)
{
    std::string ref(reference);
    size_t dot = reference.find('.');
    if (dot == std::string_view::npos)
    {
        throw InvalidActionReferenceError(ref, "expected <kind>.<name>");
    }

    auto kind = parse_action_kind(reference.substr(0, dot));
    if (!kind)
    {
        throw InvalidActionReferenceError(
            ref, "unknown action kind '" + std::string(reference.substr(0, dot)) + "'");
    }

    std::string name(reference.substr(dot + 1));
    if (name.empty())
    {
        throw InvalidActionReferenceError(ref, "action name is empty");
    }

    return ActionKey{*kind, std::move(name)};
}

} // namespace actiondag
