#pragma once

#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/pipeline_config.hpp"
#include "core/publishing_provider.hpp"

/**
 * @brief SmmBox REST client: postponed posts and connected groups
 *
 * Every call opens its own httplib::Client, so one instance can be shared by
 * all publish workers.
 */
class SmmBoxClient : public PublishingProvider, public AccountRegistry
{
public:
    SmmBoxClient(ProviderConfig config, int default_timeout_seconds);

    PublishResponse publish(const PublishRequest &request, std::chrono::seconds timeout) override;

    std::vector<AccountTarget> listAccounts() override;

    /**
     * @brief Body for POST v1/posts/postpone with a single post
     */
    static nlohmann::json buildPostPayload(const PublishRequest &request);

    /**
     * @brief Map an HTTP status and body onto Ok / Transient / Rejected
     */
    static PublishResponse interpretPublishResponse(int http_status, const std::string &body);

    /**
     * @brief Parse the v1/groups response, skipping entries on unknown platforms
     * @throws ProviderError when the body is not a successful listing
     */
    static std::vector<AccountTarget> parseGroups(const std::string &body);

    /**
     * @brief Split "https://host/api/" into {"https://host", "/api/"}
     */
    static std::pair<std::string, std::string> splitBaseUrl(const std::string &url);

    /**
     * @brief Strip whitespace and stray quotes copied from .env files
     */
    static std::string normalizeToken(const std::string &token);

    static bool isTransientStatus(int http_status);

private:
    static std::string errorMessageFrom(const nlohmann::json &body);

    ProviderConfig config_;
    std::string origin_;
    std::string base_path_;
    std::string token_;
    int default_timeout_seconds_;
};
