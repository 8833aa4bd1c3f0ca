#pragma once

#include <chrono>
#include <cstddef>

namespace sftpgate::core {

namespace transfer {

constexpr std::size_t kCopyBufferSize = 32 * 1024; // 32 KB
constexpr int kDefaultSshPort = 22;
constexpr std::chrono::seconds kConnectTimeout{30};
constexpr unsigned int kRemoteFileMode = 0644;
constexpr unsigned int kRemoteDirectoryMode = 0755;

} // namespace transfer

} // namespace sftpgate::core
