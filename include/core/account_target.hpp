#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Social networks as the publishing provider names them
 */
enum class Platform
{
    Vk,        // "vk"
    Instagram, // "io"
    YouTube,   // "gg"
    Pinterest  // "pi"
};

enum class AccountType
{
    User,
    Group,
    Page
};

std::string platformCode(Platform platform);
std::string platformDisplayName(Platform platform);
std::optional<Platform> platformFromCode(const std::string &code);

std::string accountTypeName(AccountType type);
std::optional<AccountType> accountTypeFromName(const std::string &name);

/**
 * @brief One destination account, validated at batch entry
 */
struct AccountTarget
{
    std::string account_id;
    Platform platform = Platform::Vk;
    AccountType type = AccountType::User;
    std::string name;

    /**
     * @brief "<platform>:<account_id>"; unique per batch and used as the selector salt
     */
    std::string key() const { return platformCode(platform) + ":" + account_id; }

    /**
     * @brief Parse {"id", "social", "type", "name"?}
     * @throws ValidationError on missing fields or unknown platform/type
     */
    static AccountTarget fromJson(const nlohmann::json &json);

    nlohmann::json toJson() const;
};
