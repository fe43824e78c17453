#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include "displaysnap/file_descriptor.hpp"

namespace displaysnap {

    // Exclusive advisory lock that serializes save and apply across processes. Released on destruction.
    class ActionLock {
      public:
        static std::expected<ActionLock, std::string> acquire(const std::filesystem::path& path);

        bool                                          held() const {
            return static_cast<bool>(fd_);
        }

      private:
        explicit ActionLock(FileDescriptor fd) : fd_(std::move(fd)) {}

        FileDescriptor fd_;
    };

} // namespace displaysnap
