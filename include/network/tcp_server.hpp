#ifndef GNTP_NETWORK_TCP_SERVER_HPP
#define GNTP_NETWORK_TCP_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "network/connection_manager.hpp"

namespace gntp {
namespace network {

// Accepts GNTP connections on its own io thread and hands them to the
// connection manager
class TCP_Server {
public:
  // Delete copy constructor and assignment operator
  TCP_Server(const TCP_Server&) = delete;
  TCP_Server& operator=(const TCP_Server&) = delete;


  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port; see get_port()
  TCP_Server(const uint16_t port, const std::string& address, ConnectionManager& connection_manager);
  ~TCP_Server();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting; live connections are left to the connection manager
  void shutdown();


  // ---- GETTERS ----
  // Bound port once listening, otherwise the configured one
  uint16_t get_port() const;
  bool is_running() const { return is_running_; }

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};
  std::atomic<uint16_t> bound_port_{0};

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // System components
  ConnectionManager& connection_manager_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
};

} // namespace network
} // namespace gntp

#endif // GNTP_NETWORK_TCP_SERVER_HPP
