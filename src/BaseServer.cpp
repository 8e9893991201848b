#include <iostream>
#include <cerrno>
#include <arpa/inet.h>
#include <unistd.h>
#include <pthread.h>

#include "BaseServer.hpp"
#include "Logger.hpp"
#include "NetworkUtils.hpp"


BaseServer::BaseServer(int port, int idle_timeout_seconds)
    : socket_fd{-1}, server_port{port}, idle_timeout{idle_timeout_seconds} {}

BaseServer::~BaseServer() {
    if (socket_fd != -1) {
        closeListener();
        std::cout << "[BaseServer] Listener on port " << server_port << " closed.\n";
    }
}

// ====================================================================================================
// Listener Setup
// ====================================================================================================

std::string BaseServer::openListener() {
    socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        return "socket";
    }

    // Allow reuse of the address
    int opt = 1;
    if (setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return "setsockopt";
    }

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(server_port);

    if (bind(socket_fd, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) < 0) {
        return "bind to port " + std::to_string(server_port);
    }

    if (listen(socket_fd, SOMAXCONN) < 0) {
        return "listen on port " + std::to_string(server_port);
    }
    return "";
}

void BaseServer::closeListener() {
    if (socket_fd != -1) {
        close(socket_fd);
        socket_fd = -1;
    }
}

// ====================================================================================================
// Accept Loop
// ====================================================================================================

bool BaseServer::start() {
    std::string failed = openListener();
    if (!failed.empty()) {
        std::cerr << "[BaseServer] Error: Failed to " << failed
                  << " (" << NetworkUtils::getLastError() << ")\n";
        closeListener();
        return false;
    }

    Logger("server").logCustomMsg("Listening on port " + std::to_string(server_port));

    while (true) {
        int client_fd = acceptConnection();
        if (client_fd < 0) {
            continue;
        }

        if (idle_timeout > 0) {
            NetworkUtils::setSocketTimeout(client_fd, idle_timeout);
        }

        if (!spawnConnectionThread(client_fd)) {
            close(client_fd);
        }
    }

    return true;
}

int BaseServer::acceptConnection() {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    int client_fd = accept(socket_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
        // Interrupted or aborted handshakes are routine
        if (errno != EINTR && errno != ECONNABORTED) {
            std::cerr << "[BaseServer] Error: Failed to accept connection ("
                      << NetworkUtils::getLastError() << ")\n";
        }
        return -1;
    }
    return client_fd;
}

// ====================================================================================================
// Connection Threads
// ====================================================================================================

bool BaseServer::spawnConnectionThread(int client_fd) {
    auto* connection = new Connection{this, client_fd};

    pthread_t thread_id;
    int rc = pthread_create(&thread_id, nullptr, BaseServer::threadEntry, connection);
    if (rc != 0) {
        std::cerr << "[BaseServer] Error: Failed to create connection thread (" << rc << ")\n";
        delete connection;
        return false;
    }

    pthread_detach(thread_id);
    return true;
}

void* BaseServer::threadEntry(void* arg) {
    auto* connection = static_cast<Connection*>(arg);
    BaseServer* server = connection->server;
    int client_fd = connection->client_fd;
    delete connection;

    server->serveConnection(client_fd);
    return nullptr;
}

void BaseServer::serveConnection(int client_fd) {
    std::string peer = NetworkUtils::peerAddress(client_fd);
    Logger logger("server");

    logger.logConnectionOpened(peer);

    handleRequest(client_fd);
    close(client_fd);

    logger.logConnectionClosed(peer);
}
