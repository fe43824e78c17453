#include <atomic>
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "displaysnap/file_descriptor.hpp"
#include "displaysnap/hyprctl_socket.hpp"

namespace {

    std::filesystem::path temp_socket_path() {
        static std::atomic<int> counter{0};
        const auto              suffix = std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1));
        return std::filesystem::temp_directory_path() / ("displaysnap-hyprctl-" + suffix + ".sock");
    }

    displaysnap::FileDescriptor listen_on(const std::filesystem::path& path) {
        displaysnap::FileDescriptor fd(::socket(AF_UNIX, SOCK_STREAM, 0));
        if (!fd) {
            return fd;
        }
        sockaddr_un addr{};
        addr.sun_family               = AF_UNIX;
        const std::string socket_path = path.string();
        std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);
        if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd.get(), 1) < 0) {
            return displaysnap::FileDescriptor();
        }
        return fd;
    }

    // Accepts one connection, records the request and answers with the given reply.
    void serve_once(int listener, std::string reply, std::string* request) {
        displaysnap::FileDescriptor client(::accept(listener, nullptr, nullptr));
        if (!client) {
            return;
        }
        char          buffer[256];
        const ssize_t received = ::recv(client.get(), buffer, sizeof(buffer), 0);
        if (received > 0) {
            request->assign(buffer, static_cast<size_t>(received));
        }
        ::send(client.get(), reply.data(), reply.size(), MSG_NOSIGNAL);
    }

} // namespace

TEST(HyprctlRequest, PrefixesFormatFlags) {
    EXPECT_EQ(displaysnap::build_hyprctl_request("monitors", "all", "j"), "j/monitors all");
    EXPECT_EQ(displaysnap::build_hyprctl_request("keyword", "monitor DP-1,disable", ""), "/keyword monitor DP-1,disable");
    EXPECT_EQ(displaysnap::build_hyprctl_request("version", "", "j"), "j/version");
}

TEST(SocketHyprctlInvoker, EmptyPathThrows) {
    displaysnap::SocketHyprctlInvoker invoker{std::filesystem::path()};

    EXPECT_THROW(invoker.invoke("monitors", "all", "j"), displaysnap::HyprctlError);
}

TEST(SocketHyprctlInvoker, MissingSocketThrows) {
    displaysnap::SocketHyprctlInvoker invoker(temp_socket_path());

    EXPECT_THROW(invoker.invoke("monitors", "all", "j"), displaysnap::HyprctlError);
}

TEST(SocketHyprctlInvoker, SendsRequestAndReadsReply) {
    const auto path     = temp_socket_path();
    auto       listener = listen_on(path);
    ASSERT_TRUE(listener);

    std::string request;
    std::thread server(serve_once, listener.get(), std::string("ok"), &request);

    displaysnap::SocketHyprctlInvoker invoker(path);
    const auto                        reply = invoker.invoke("keyword", "monitor DP-1,disable", "");
    server.join();

    EXPECT_EQ(reply, "ok");
    EXPECT_EQ(request, "/keyword monitor DP-1,disable");

    std::filesystem::remove(path);
}
