#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief File and hashing helpers shared by the encoder, storage and pipeline
 */
class FileUtils
{
public:
    using Sha256Digest = std::array<uint8_t, 32>;

    /**
     * Computes SHA256 hash of a file
     * @param file_path Path to the file
     * @return SHA256 hash as hexadecimal string, empty if the file cannot be read
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * @brief SHA256 digest of an in-memory string
     */
    static Sha256Digest sha256(const std::string &data);

    static std::string toHex(const uint8_t *data, size_t size);

    /**
     * @brief Check the container extension against the accepted source formats
     * @param file_path Path to check (extension compared case-insensitively)
     * @return true for mp4, mov, avi and mkv
     */
    static bool hasSupportedVideoExtension(const std::string &file_path);

    static const std::vector<std::string> &supportedVideoExtensions();

    // Regular file that exists and is non-empty
    static bool isNonEmptyFile(const std::string &file_path);

    /**
     * @brief Create a directory (and parents) if needed
     * @return false when the path exists as something other than a directory or creation fails
     */
    static bool ensureDirectory(const std::string &dir_path);

    /**
     * @brief Remove a file, logging instead of throwing on failure
     * @return true if the file is gone afterwards
     */
    static bool removeFile(const std::string &file_path);
};
