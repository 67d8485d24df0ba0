#include "core/media_storage.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/UUIDGenerator.h>
#include <system_error>

LocalDirectoryStorage::LocalDirectoryStorage(StorageConfig config) : config_(std::move(config))
{
}

std::string LocalDirectoryStorage::urlFor(const std::string &key) const
{
    if (config_.public_base_url.empty())
    {
        std::error_code ec;
        auto absolute = fs::absolute(fs::path(config_.root_dir) / key, ec);
        return "file://" + (ec ? (fs::path(config_.root_dir) / key).string() : absolute.string());
    }
    std::string base = config_.public_base_url;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base + "/" + key;
}

MediaHandle LocalDirectoryStorage::store(const std::string &local_path)
{
    if (!FileUtils::isNonEmptyFile(local_path))
        throw StorageError("cannot store missing or empty file " + local_path);
    if (!FileUtils::ensureDirectory(config_.root_dir))
        throw StorageError("storage directory unavailable: " + config_.root_dir);

    std::string extension = fs::path(local_path).extension().string();
    MediaHandle handle;
    handle.key = Poco::UUIDGenerator::defaultGenerator().createRandom().toString() + extension;

    std::error_code ec;
    fs::copy_file(local_path, fs::path(config_.root_dir) / handle.key, fs::copy_options::overwrite_existing, ec);
    if (ec)
        throw StorageError("failed to copy " + local_path + " into storage: " + ec.message());

    handle.url = urlFor(handle.key);
    Logger::debug("Stored " + local_path + " as " + handle.key + " (" + handle.url + ")");
    return handle;
}

std::string LocalDirectoryStorage::retrieve(const MediaHandle &handle)
{
    fs::path path = fs::path(config_.root_dir) / handle.key;
    if (handle.key.empty() || !FileUtils::isNonEmptyFile(path.string()))
        throw StorageError("unknown storage key: " + handle.key);
    return path.string();
}
