#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 8192;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";
    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), bytes_read) != 1)
                return "";
        }
    }
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

FileUtils::Sha256Digest FileUtils::sha256(const std::string &data)
{
    Sha256Digest digest{};
    SHA256(reinterpret_cast<const unsigned char *>(data.data()), data.size(), digest.data());
    return digest;
}

std::string FileUtils::toHex(const uint8_t *data, size_t size)
{
    std::stringstream ss;
    for (size_t i = 0; i < size; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return ss.str();
}

const std::vector<std::string> &FileUtils::supportedVideoExtensions()
{
    static const std::vector<std::string> extensions = {".mp4", ".mov", ".avi", ".mkv"};
    return extensions;
}

bool FileUtils::hasSupportedVideoExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    const auto &supported = supportedVideoExtensions();
    return std::find(supported.begin(), supported.end(), ext) != supported.end();
}

bool FileUtils::isNonEmptyFile(const std::string &file_path)
{
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec) || ec)
        return false;
    auto size = fs::file_size(file_path, ec);
    return !ec && size > 0;
}

bool FileUtils::ensureDirectory(const std::string &dir_path)
{
    std::error_code ec;
    if (fs::exists(dir_path, ec))
        return fs::is_directory(dir_path, ec);
    fs::create_directories(dir_path, ec);
    if (ec)
    {
        Logger::error("Failed to create directory " + dir_path + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileUtils::removeFile(const std::string &file_path)
{
    std::error_code ec;
    fs::remove(file_path, ec);
    if (ec)
    {
        Logger::warn("Failed to remove " + file_path + ": " + ec.message());
        return false;
    }
    return true;
}
