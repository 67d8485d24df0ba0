#pragma once

#include <stdexcept>
#include <string>
#include "core/media_types.hpp"
#include "core/pipeline_config.hpp"

class StorageError : public std::runtime_error
{
public:
    explicit StorageError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Where variants go so the publishing provider can fetch them
 */
class MediaStorage
{
public:
    virtual ~MediaStorage() = default;

    /**
     * @brief Persist a local file and return its public handle
     * @throws StorageError when the file cannot be stored
     */
    virtual MediaHandle store(const std::string &local_path) = 0;

    /**
     * @brief Local path of a stored object
     * @throws StorageError when the key is unknown
     */
    virtual std::string retrieve(const MediaHandle &handle) = 0;
};

/**
 * @brief MediaStorage on a directory served under a public base URL
 */
class LocalDirectoryStorage : public MediaStorage
{
public:
    explicit LocalDirectoryStorage(StorageConfig config);

    MediaHandle store(const std::string &local_path) override;
    std::string retrieve(const MediaHandle &handle) override;

    std::string urlFor(const std::string &key) const;

private:
    StorageConfig config_;
};
