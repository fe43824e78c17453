#include "displaysnap/hyprctl_socket.hpp"

#include "displaysnap/file_descriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace displaysnap {

    namespace {

        void send_all(int fd, std::string_view payload) {
            size_t sent = 0;
            while (sent < payload.size()) {
                const ssize_t result = ::send(fd, payload.data() + sent, payload.size() - sent, MSG_NOSIGNAL);
                if (result > 0) {
                    sent += static_cast<size_t>(result);
                    continue;
                }
                if (result < 0 && errno == EINTR) {
                    continue;
                }
                throw HyprctlError(std::string("hyprctl send failed: ") + std::strerror(errno));
            }
        }

        std::string read_all(int fd) {
            std::string            output;
            std::array<char, 8192> buffer{};
            while (true) {
                const ssize_t result = ::read(fd, buffer.data(), buffer.size());
                if (result > 0) {
                    output.append(buffer.data(), static_cast<size_t>(result));
                    continue;
                }
                if (result == 0) {
                    break;
                }
                if (errno == EINTR) {
                    continue;
                }
                throw HyprctlError(std::string("hyprctl read failed: ") + std::strerror(errno));
            }
            return output;
        }

    } // namespace

    std::string build_hyprctl_request(std::string_view call, std::string_view args, std::string_view format) {
        std::string request;
        if (!format.empty()) {
            request.append(format);
        }
        request.append("/");
        request.append(call);
        if (!args.empty()) {
            request.append(" ");
            request.append(args);
        }
        return request;
    }

    SocketHyprctlInvoker::SocketHyprctlInvoker(std::filesystem::path socket_path) : socket_path_(std::move(socket_path)) {}

    std::string SocketHyprctlInvoker::invoke(std::string_view call, std::string_view args, std::string_view format) {
        if (socket_path_.empty()) {
            throw HyprctlError("Hyprland socket unknown; is HYPRLAND_INSTANCE_SIGNATURE set?");
        }
        FileDescriptor fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
        if (!fd) {
            throw HyprctlError("unable to create hyprctl socket");
        }

        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        const auto path = socket_path_.string();
        if (path.size() >= sizeof(addr.sun_path)) {
            throw HyprctlError("hyprctl socket path too long");
        }
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            throw HyprctlError("unable to connect to " + path + ": " + std::strerror(errno));
        }

        send_all(fd.get(), build_hyprctl_request(call, args, format));
        return read_all(fd.get());
    }

} // namespace displaysnap
