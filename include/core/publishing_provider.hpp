#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/account_target.hpp"
#include "core/media_types.hpp"

struct PublishRequest
{
    AccountTarget account;
    MediaHandle media;
    std::string caption;
    int64_t scheduled_at = 0; // unix seconds
};

enum class PublishStatus
{
    Ok,
    Transient,
    Rejected
};

struct PublishResponse
{
    PublishStatus status = PublishStatus::Rejected;
    std::string post_id;
    std::string message;
};

/**
 * @brief Schedules one post on a third-party publishing service
 *
 * Implementations report failures through PublishResponse and do not throw:
 * Transient for timeouts, connection errors, 5xx, 429 and 408; Rejected for
 * everything the provider refused.
 */
class PublishingProvider
{
public:
    virtual ~PublishingProvider() = default;

    virtual PublishResponse publish(const PublishRequest &request, std::chrono::seconds timeout) = 0;
};

class ProviderError : public std::runtime_error
{
public:
    explicit ProviderError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Read-only view of the accounts connected to the provider
 */
class AccountRegistry
{
public:
    virtual ~AccountRegistry() = default;

    /**
     * @throws ProviderError when the listing cannot be fetched
     */
    virtual std::vector<AccountTarget> listAccounts() = 0;

    static std::map<Platform, std::vector<AccountTarget>> groupByPlatform(const std::vector<AccountTarget> &accounts)
    {
        std::map<Platform, std::vector<AccountTarget>> grouped;
        for (const auto &account : accounts)
        {
            grouped[account.platform].push_back(account);
        }
        return grouped;
    }
};
