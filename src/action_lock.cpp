#include "displaysnap/action_lock.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>

namespace displaysnap {

    std::expected<ActionLock, std::string> ActionLock::acquire(const std::filesystem::path& path) {
        std::error_code ec;
        if (const auto parent = path.parent_path(); !parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return std::unexpected("unable to create " + parent.string());
            }
        }

        FileDescriptor fd(::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600));
        if (!fd) {
            return std::unexpected("unable to open " + path.string() + ": " + std::strerror(errno));
        }
        while (::flock(fd.get(), LOCK_EX | LOCK_NB) < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EWOULDBLOCK) {
                return std::unexpected(std::string("another save or apply is in progress"));
            }
            return std::unexpected("unable to lock " + path.string() + ": " + std::strerror(errno));
        }
        return ActionLock(std::move(fd));
    }

} // namespace displaysnap
