// FileSystemOperations.cpp — Поиск удалённой файловой системы по hostId

#include "twinpane/FileSystem/FileSystemOperations.h"
#include "twinpane/Errors.h"

namespace TwinPane {

std::shared_ptr<FileSystemOperations> requireRemote(
    const RemoteFileSystemProvider& provider, const std::string& hostId)
{
    std::shared_ptr<FileSystemOperations> remote = provider ? provider(hostId) : nullptr;
    if (!remote) {
        throw FileOperationError(ErrorCode::HostNotFound, "Remote host not found: " + hostId);
    }
    return remote;
}

} // namespace TwinPane
