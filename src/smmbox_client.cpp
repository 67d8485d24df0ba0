#include "core/smmbox_client.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>

namespace
{
    std::string trimCaption(const std::string &caption)
    {
        auto begin = std::find_if_not(caption.begin(), caption.end(),
                                      [](unsigned char c)
                                      { return std::isspace(c); });
        auto end = std::find_if_not(caption.rbegin(), caption.rend(),
                                    [](unsigned char c)
                                    { return std::isspace(c); })
                       .base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    std::string bodyExcerpt(const std::string &body)
    {
        return body.size() > 200 ? body.substr(0, 200) + "..." : body;
    }

    // SmmBox is loose about the type of "success": true, 1 and "true" all occur
    bool successFlag(const nlohmann::json &body)
    {
        auto flag = body.find("success");
        if (flag == body.end())
            return false;
        switch (flag->type())
        {
        case nlohmann::json::value_t::boolean:
            return flag->get<bool>();
        case nlohmann::json::value_t::number_integer:
            return flag->get<long long>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return flag->get<unsigned long long>() != 0;
        case nlohmann::json::value_t::number_float:
            return flag->get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !flag->get_ref<const std::string &>().empty();
        case nlohmann::json::value_t::array:
        case nlohmann::json::value_t::object:
            return !flag->empty();
        default:
            return false;
        }
    }
}

SmmBoxClient::SmmBoxClient(ProviderConfig config, int default_timeout_seconds)
    : config_(std::move(config)), default_timeout_seconds_(default_timeout_seconds)
{
    auto parts = splitBaseUrl(config_.api_url);
    origin_ = parts.first;
    base_path_ = parts.second;
    token_ = normalizeToken(config_.api_token);
}

std::pair<std::string, std::string> SmmBoxClient::splitBaseUrl(const std::string &url)
{
    auto scheme_end = url.find("://");
    size_t host_start = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == std::string::npos)
        return {url, "/"};

    std::string path = url.substr(path_start);
    if (path.back() != '/')
        path += "/";
    return {url.substr(0, path_start), path};
}

std::string SmmBoxClient::normalizeToken(const std::string &token)
{
    std::string value = token;
    auto strip = [&value](const std::string &chars)
    {
        auto begin = value.find_first_not_of(chars);
        if (begin == std::string::npos)
        {
            value.clear();
            return;
        }
        value = value.substr(begin, value.find_last_not_of(chars) - begin + 1);
    };
    strip(" \t\r\n");
    strip("\"'");
    return value;
}

bool SmmBoxClient::isTransientStatus(int http_status)
{
    return http_status >= 500 || http_status == 429 || http_status == 408;
}

nlohmann::json SmmBoxClient::buildPostPayload(const PublishRequest &request)
{
    nlohmann::json attachments = nlohmann::json::array();
    std::string caption = trimCaption(request.caption);
    if (!caption.empty())
    {
        attachments.push_back({{"type", "text"}, {"text", caption}});
    }
    attachments.push_back({{"type", "video"}, {"url", request.media.url}});

    nlohmann::json post = {
        {"group", {{"id", request.account.account_id}, {"social", platformCode(request.account.platform)}, {"type", accountTypeName(request.account.type)}}},
        {"attachments", attachments},
        {"date", request.scheduled_at}};

    return nlohmann::json{{"posts", nlohmann::json::array({post})}};
}

std::string SmmBoxClient::errorMessageFrom(const nlohmann::json &body)
{
    auto error = body.find("error");
    if (error == body.end() || error->is_null())
        return "unknown provider error";
    if (error->is_object())
    {
        auto message = error->find("message");
        if (message != error->end() && message->is_string())
            return message->get<std::string>();
        return error->dump();
    }
    if (error->is_string())
        return error->get<std::string>();
    return error->dump();
}

PublishResponse SmmBoxClient::interpretPublishResponse(int http_status, const std::string &body)
{
    PublishResponse response;

    nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
    bool parsed = !json.is_discarded() && json.is_object();

    if (http_status < 200 || http_status >= 300)
    {
        std::string detail = parsed ? errorMessageFrom(json) : bodyExcerpt(body);
        response.status = isTransientStatus(http_status) ? PublishStatus::Transient : PublishStatus::Rejected;
        if (http_status == 401 || http_status == 403)
            response.message = "HTTP " + std::to_string(http_status) + " authentication failed: " + detail;
        else
            response.message = "HTTP " + std::to_string(http_status) + ": " + detail;
        return response;
    }

    if (!parsed)
    {
        // The post may exist already; resending could duplicate it
        response.status = PublishStatus::Rejected;
        response.message = "unparseable provider response: " + bodyExcerpt(body);
        return response;
    }

    // A 2xx may mean the post exists already, so nothing below may turn into a retry
    try
    {
        if (!successFlag(json))
        {
            response.status = PublishStatus::Rejected;
            response.message = errorMessageFrom(json);
            return response;
        }

        response.status = PublishStatus::Ok;
        response.message = "scheduled";
        auto payload = json.find("response");
        if (payload != json.end() && payload->is_object())
        {
            auto posts = payload->find("posts");
            if (posts != payload->end() && posts->is_array() && !posts->empty() && (*posts)[0].is_object())
            {
                auto id = (*posts)[0].find("id");
                if (id != (*posts)[0].end() && id->is_string())
                    response.post_id = id->get<std::string>();
                else if (id != (*posts)[0].end() && id->is_number_integer())
                    response.post_id = std::to_string(id->get<long long>());
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        response.status = PublishStatus::Rejected;
        response.post_id.clear();
        response.message = std::string("malformed provider response: ") + e.what();
    }
    return response;
}

PublishResponse SmmBoxClient::publish(const PublishRequest &request, std::chrono::seconds timeout)
{
    if (token_.empty())
    {
        return {PublishStatus::Rejected, "", "SmmBox API token is not configured"};
    }

    std::string body = buildPostPayload(request).dump();
    std::string path = base_path_ + "v1/posts/postpone";

    httplib::Client client(origin_);
    client.set_bearer_token_auth(token_);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    Logger::debug("POST " + origin_ + path + " for " + request.account.key());
    auto res = client.Post(path, body, "application/json");
    if (!res)
    {
        PublishResponse response;
        response.status = PublishStatus::Transient;
        response.message = "request to SmmBox failed: " + httplib::to_string(res.error());
        Logger::warn("Publish to " + request.account.key() + " failed: " + response.message);
        return response;
    }

    PublishResponse response = interpretPublishResponse(res->status, res->body);
    if (response.status == PublishStatus::Ok)
        Logger::info("Scheduled post for " + request.account.key() + " (post id " +
                     (response.post_id.empty() ? "unknown" : response.post_id) + ")");
    else
        Logger::warn("SmmBox refused post for " + request.account.key() + ": " + response.message);
    return response;
}

std::vector<AccountTarget> SmmBoxClient::parseGroups(const std::string &body)
{
    nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object())
        throw ProviderError("unparseable groups response: " + bodyExcerpt(body));
    if (!successFlag(json))
        throw ProviderError("failed to list groups: " + errorMessageFrom(json));

    auto groups = json.find("response");
    if (groups == json.end() || !groups->is_array())
        throw ProviderError("groups response has no 'response' array");

    std::vector<AccountTarget> accounts;
    for (const auto &group : *groups)
    {
        nlohmann::json normalized = group;
        if (normalized.contains("social") && normalized["social"].is_string())
        {
            std::string social = normalized["social"].get<std::string>();
            std::transform(social.begin(), social.end(), social.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            normalized["social"] = social;
        }
        try
        {
            accounts.push_back(AccountTarget::fromJson(normalized));
        }
        catch (const ValidationError &e)
        {
            Logger::warn(std::string("Skipping group: ") + e.what());
        }
        catch (const nlohmann::json::exception &e)
        {
            Logger::warn(std::string("Skipping malformed group: ") + e.what());
        }
    }
    return accounts;
}

std::vector<AccountTarget> SmmBoxClient::listAccounts()
{
    if (token_.empty())
        throw ProviderError("SmmBox API token is not configured (set SMMBOX_API_TOKEN)");

    httplib::Client client(origin_);
    client.set_bearer_token_auth(token_);
    client.set_connection_timeout(std::chrono::seconds(default_timeout_seconds_));
    client.set_read_timeout(std::chrono::seconds(default_timeout_seconds_));

    std::string path = base_path_ + "v1/groups";
    Logger::info("Requesting group list from " + origin_ + path);
    auto res = client.Get(path);
    if (!res)
        throw ProviderError("request to SmmBox failed: " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        throw ProviderError("HTTP " + std::to_string(res->status) + ": " + bodyExcerpt(res->body));

    auto accounts = parseGroups(res->body);
    Logger::info("Received " + std::to_string(accounts.size()) + " groups from SmmBox");
    return accounts;
}
