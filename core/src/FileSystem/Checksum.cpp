// Checksum.cpp — Контрольные суммы через OpenSSL EVP

#include "twinpane/FileSystem/Checksum.h"
#include "twinpane/FileSystem/PathUtils.h"
#include "twinpane/Errors.h"
#include <openssl/evp.h>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace TwinPane {

namespace fs = std::filesystem;

static const EVP_MD* digestFor(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Md5:  return EVP_md5();
        case HashAlgorithm::Sha1: return EVP_sha1();
        case HashAlgorithm::Sha256:
        default:                  return EVP_sha256();
    }
}

std::string computeChecksum(std::istream& input, HashAlgorithm algorithm) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create digest context");
    }
    if (EVP_DigestInit_ex(ctx.get(), digestFor(algorithm), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize digest");
    }

    std::vector<char> buffer(CHECKSUM_BUFFER_SIZE);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(input.gcount())) != 1) {
            throw std::runtime_error("Failed to update digest");
        }
        if (input.eof()) break;
    }
    if (input.bad()) {
        throw std::runtime_error("Read error");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &length) != 1) {
        throw std::runtime_error("Failed to finalize digest");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string computeChecksum(const std::string& data, HashAlgorithm algorithm) {
    std::istringstream input(data);
    return computeChecksum(input, algorithm);
}

std::string computeFileChecksum(const std::string& path, HashAlgorithm algorithm) {
    const std::string context = "Failed to calculate checksum";
    fs::path p = utf8ToPath(path);

    std::error_code ec;
    auto status = fs::status(p, ec);
    if (ec) {
        throw makeFileError(context, ec);
    }
    if (fs::is_directory(status)) {
        throw makeFileError(context, std::make_error_code(std::errc::is_a_directory));
    }

    std::ifstream file(p, std::ios::binary);
    if (!file) {
        int err = errno != 0 ? errno : EIO;
        throw makeFileError(context, std::error_code(err, std::generic_category()));
    }

    try {
        return computeChecksum(file, algorithm);
    } catch (const std::runtime_error& e) {
        throw FileOperationError(ErrorCode::OperationFailed, context + ": " + e.what());
    }
}

} // namespace TwinPane
