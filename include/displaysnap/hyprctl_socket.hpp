#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "displaysnap/hyprctl.hpp"

namespace displaysnap {

    // Talks to the compositor over its request socket, one connection per request.
    class SocketHyprctlInvoker : public HyprctlInvoker {
      public:
        explicit SocketHyprctlInvoker(std::filesystem::path socket_path);

        std::string                  invoke(std::string_view call, std::string_view args, std::string_view format) override;

        const std::filesystem::path& socket_path() const {
            return socket_path_;
        }

      private:
        std::filesystem::path socket_path_;
    };

    std::string build_hyprctl_request(std::string_view call, std::string_view args, std::string_view format);

} // namespace displaysnap
