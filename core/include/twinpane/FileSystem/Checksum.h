// Checksum.h — Контрольные суммы файлов (OpenSSL EVP)

#pragma once

#include "../export.h"
#include "../Types.h"
#include <istream>
#include <string>

namespace TwinPane {

constexpr size_t CHECKSUM_BUFFER_SIZE = 64 * 1024;

/// Хэш потока, lowercase hex
/// @throws std::runtime_error при ошибке чтения или OpenSSL
TP_API std::string computeChecksum(std::istream& input, HashAlgorithm algorithm);

/// Хэш строки в памяти
TP_API std::string computeChecksum(const std::string& data, HashAlgorithm algorithm);

/// Хэш файла
/// @throws FileOperationError("Failed to calculate checksum: <причина>")
TP_API std::string computeFileChecksum(const std::string& path, HashAlgorithm algorithm);

} // namespace TwinPane
