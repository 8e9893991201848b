#ifndef BASE_SERVER_HPP
#define BASE_SERVER_HPP

#include <string>

/**
 * BaseServer - TCP accept loop with one detached thread per connection
 *
 * Subclasses implement handleRequest(); the socket is closed after it returns.
 * Each accepted socket gets a receive/send timeout so idle keep-alive
 * connections do not hold a thread forever.
 */
class BaseServer{
public:
    BaseServer(int port, int idle_timeout_seconds = 30);
    virtual ~BaseServer();

    /**
     * Bind, listen and serve until the process exits
     * @return false if the listening socket could not be set up
     */
    bool start();

    int acceptConnection();

    int getPort() const { return server_port; }

protected:
    int socket_fd;
    int server_port;
    int idle_timeout;

    virtual void handleRequest(int client_fd) = 0;

private:
    struct Connection {
        BaseServer* server;
        int client_fd;
    };

    /**
     * Create, bind and listen on socket_fd
     * @return Empty string on success, otherwise what failed
     */
    std::string openListener();

    void closeListener();

    bool spawnConnectionThread(int client_fd);

    static void* threadEntry(void* arg);
    void serveConnection(int client_fd);
};

#endif // BASE_SERVER_HPP
