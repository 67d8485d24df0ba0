#include "core/account_target.hpp"
#include "core/pipeline_errors.hpp"
#include <algorithm>
#include <cctype>

std::string platformCode(Platform platform)
{
    switch (platform)
    {
    case Platform::Vk:
        return "vk";
    case Platform::Instagram:
        return "io";
    case Platform::YouTube:
        return "gg";
    case Platform::Pinterest:
        return "pi";
    }
    return "vk";
}

std::string platformDisplayName(Platform platform)
{
    switch (platform)
    {
    case Platform::Vk:
        return "VK";
    case Platform::Instagram:
        return "Instagram";
    case Platform::YouTube:
        return "YouTube";
    case Platform::Pinterest:
        return "Pinterest";
    }
    return "VK";
}

std::optional<Platform> platformFromCode(const std::string &code)
{
    if (code == "vk")
        return Platform::Vk;
    if (code == "io")
        return Platform::Instagram;
    if (code == "gg")
        return Platform::YouTube;
    if (code == "pi")
        return Platform::Pinterest;
    return std::nullopt;
}

std::string accountTypeName(AccountType type)
{
    switch (type)
    {
    case AccountType::User:
        return "user";
    case AccountType::Group:
        return "group";
    case AccountType::Page:
        return "page";
    }
    return "user";
}

std::optional<AccountType> accountTypeFromName(const std::string &name)
{
    if (name == "user")
        return AccountType::User;
    if (name == "group")
        return AccountType::Group;
    if (name == "page")
        return AccountType::Page;
    return std::nullopt;
}

AccountTarget AccountTarget::fromJson(const nlohmann::json &json)
{
    if (!json.is_object())
        throw ValidationError("account target must be an object, got " + json.dump());

    AccountTarget target;

    auto id = json.find("id");
    if (id == json.end() || id->is_null())
        throw ValidationError("account target is missing 'id': " + json.dump());
    if (id->is_string())
        target.account_id = id->get<std::string>();
    else if (id->is_number_integer())
        target.account_id = std::to_string(id->get<long long>());
    else
        throw ValidationError("account 'id' must be a string or integer: " + json.dump());

    if (target.account_id.empty() ||
        std::any_of(target.account_id.begin(), target.account_id.end(),
                    [](unsigned char c)
                    { return std::isspace(c) || c == ':' || c == '/' || c == '\\'; }))
    {
        throw ValidationError("invalid account id '" + target.account_id + "'");
    }

    auto social = json.find("social");
    if (social == json.end() || !social->is_string())
        throw ValidationError("account " + target.account_id + " is missing 'social'");
    auto platform = platformFromCode(social->get<std::string>());
    if (!platform)
        throw ValidationError("account " + target.account_id + " has unknown platform '" +
                              social->get<std::string>() + "' (expected vk, io, gg or pi)");
    target.platform = *platform;

    auto type = json.find("type");
    if (type == json.end() || !type->is_string())
        throw ValidationError("account " + target.account_id + " is missing 'type'");
    auto account_type = accountTypeFromName(type->get<std::string>());
    if (!account_type)
        throw ValidationError("account " + target.account_id + " has unknown type '" +
                              type->get<std::string>() + "' (expected user, group or page)");
    target.type = *account_type;

    auto name = json.find("name");
    if (name != json.end() && name->is_string())
        target.name = name->get<std::string>();

    return target;
}

nlohmann::json AccountTarget::toJson() const
{
    nlohmann::json json = {
        {"id", account_id},
        {"social", platformCode(platform)},
        {"type", accountTypeName(type)}};
    if (!name.empty())
        json["name"] = name;
    return json;
}
