#include "migration/transport/file_artifact_transport.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace {

struct DigestDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestDeleter>;

std::string toHex(const unsigned char* data, unsigned int length) {
    std::stringstream ss;
    for (unsigned int i = 0; i < length; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

bool finishDigest(EVP_MD_CTX* ctx, std::string& checksum) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        return false;
    }
    checksum = toHex(hash, hashLen);
    return true;
}

void reportError(std::string& error, const std::string& message) {
    error = message;
    Logger::error(message);
}

} // namespace

FileArtifactTransport::FileArtifactTransport(const std::string& stagingRoot, size_t chunkSize, bool verifyChecksums)
    : stagingRoot_(stagingRoot)
    , chunkSize_(chunkSize > 0 ? chunkSize : 64 * 1024)
    , verifyChecksums_(verifyChecksums) {
}

std::string FileArtifactTransport::stagingPath(const std::string& hostId, const std::string& relativePath) const {
    return (fs::path(stagingRoot_) / hostId / relativePath).string();
}

bool FileArtifactTransport::send(const Artifact& artifact, const std::string& targetHostId,
                                 Artifact& delivered, const ChunkCallback& onChunk, std::string& error) {
    const std::string sourcePath = stagingPath(artifact.hostId, artifact.path);
    const std::string targetPath = stagingPath(targetHostId, artifact.path);
    const std::string partPath = targetPath + ".part";

    std::ifstream input(sourcePath, std::ios::binary);
    if (!input.is_open()) {
        reportError(error, "Failed to open " + sourcePath);
        return false;
    }

    std::error_code ec;
    fs::create_directories(fs::path(targetPath).parent_path(), ec);
    if (ec) {
        reportError(error, "Failed to create staging directory for " + targetHostId + ": " + ec.message());
        return false;
    }

    std::ofstream output(partPath, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        reportError(error, "Failed to open " + partPath + " for writing");
        return false;
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        reportError(error, "Failed to initialize SHA-256 digest");
        return false;
    }

    std::vector<char> buffer(chunkSize_);
    uint64_t sent = 0;
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = input.gcount();
        if (count <= 0) {
            break;
        }
        output.write(buffer.data(), count);
        output.flush();
        if (!output) {
            reportError(error, "Write failed on " + partPath + " after " + std::to_string(sent) + " bytes");
            output.close();
            fs::remove(partPath, ec);
            return false;
        }
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(count)) != 1) {
            reportError(error, "Failed to update SHA-256 digest");
            output.close();
            fs::remove(partPath, ec);
            return false;
        }
        sent += static_cast<uint64_t>(count);
        if (onChunk) {
            onChunk(sent);
        }
    }

    if (input.bad()) {
        reportError(error, "Read failed on " + sourcePath + " after " + std::to_string(sent) + " bytes");
        output.close();
        fs::remove(partPath, ec);
        return false;
    }
    output.close();

    if (sent != artifact.sizeBytes) {
        reportError(error, "Size mismatch for " + artifact.path + ": expected " + std::to_string(artifact.sizeBytes) +
                     " bytes, sent " + std::to_string(sent));
        fs::remove(partPath, ec);
        return false;
    }

    std::string checksum;
    if (!finishDigest(ctx.get(), checksum)) {
        reportError(error, "Failed to finalize SHA-256 digest");
        fs::remove(partPath, ec);
        return false;
    }
    if (verifyChecksums_ && !artifact.checksum.empty() && artifact.checksum != checksum) {
        reportError(error, "Checksum mismatch for " + artifact.path + ": expected " + artifact.checksum + ", got " + checksum);
        fs::remove(partPath, ec);
        return false;
    }

    fs::rename(partPath, targetPath, ec);
    if (ec) {
        reportError(error, "Failed to rename " + partPath + ": " + ec.message());
        fs::remove(partPath, ec);
        return false;
    }

    delivered = artifact;
    delivered.hostId = targetHostId;
    delivered.checksum = checksum;
    Logger::debug("Delivered " + artifact.path + " to " + targetHostId + " (" + std::to_string(sent) + " bytes, sha256 " +
                  checksum + ")");
    return true;
}

bool FileArtifactTransport::remove(const std::string& hostId, const Artifact& artifact, std::string& error) {
    if (artifact.path.empty()) {
        return true;
    }
    const std::string targetPath = stagingPath(hostId, artifact.path);
    std::error_code ec;
    fs::remove(targetPath + ".part", ec);
    if (ec) {
        reportError(error, "Failed to remove " + targetPath + ".part: " + ec.message());
        return false;
    }
    fs::remove(targetPath, ec);
    if (ec) {
        reportError(error, "Failed to remove " + targetPath + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileArtifactTransport::calculateChecksum(const std::string& filePath, std::string& checksum, std::string& error) {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        error = "Failed to open " + filePath;
        return false;
    }

    DigestContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        error = "Failed to initialize SHA-256 digest";
        return false;
    }

    char buffer[4096];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0 &&
            EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            error = "Failed to update SHA-256 digest";
            return false;
        }
    }
    if (file.bad()) {
        error = "Read failed on " + filePath;
        return false;
    }

    if (!finishDigest(ctx.get(), checksum)) {
        error = "Failed to finalize SHA-256 digest";
        return false;
    }
    return true;
}
