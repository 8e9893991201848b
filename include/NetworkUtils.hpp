#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <sys/types.h>

/**
 * NetworkUtils - Socket helpers shared by the server components
 *
 * - Sending data with error checking
 * - Per-socket timeouts
 * - Peer address formatting
 *
 * This is a utility class with static methods only.
 */
class NetworkUtils {
public:
    /**
     * Send complete data to socket
     *
     * Handles partial sends automatically. SIGPIPE is suppressed; a closed
     * peer is reported as a failure.
     *
     * @param fd Socket file descriptor
     * @param data Data to send
     * @param length Length of data in bytes
     * @return true on success, false on failure
     */
    static bool sendData(int fd, const char* data, size_t length);

    /**
     * Send string data to socket
     *
     * @param fd Socket file descriptor
     * @param data String data to send
     * @return true on success, false on failure
     */
    static bool sendData(int fd, const std::string& data);

    /**
     * Set socket timeout
     *
     * Sets both send and receive timeouts.
     *
     * @param fd Socket file descriptor
     * @param seconds Timeout in seconds
     * @return true on success, false on failure
     */
    static bool setSocketTimeout(int fd, int seconds);

    /**
     * Format the remote address of a connected socket as "ip:port"
     *
     * @param fd Connected socket
     * @return Peer address, or "unknown" if it cannot be determined
     */
    static std::string peerAddress(int fd);

    /**
     * Get last socket error as string
     *
     * @return Human-readable error message
     */
    static std::string getLastError();

private:
    // Utility class - no instances allowed
    NetworkUtils() = delete;
    ~NetworkUtils() = delete;
    NetworkUtils(const NetworkUtils&) = delete;
    NetworkUtils& operator=(const NetworkUtils&) = delete;
};

#endif // NETWORK_UTILS_HPP
