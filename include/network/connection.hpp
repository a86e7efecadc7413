#ifndef GNTP_NETWORK_CONNECTION_HPP
#define GNTP_NETWORK_CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "protocol/protocol_engine.hpp"

namespace gntp {
namespace network {

/**
 * One accepted GNTP connection. A dedicated thread runs a single request
 * through the protocol engine over a socket iostream, then closes the socket.
 * The owner must keep the connection alive until join() returns.
 */
class Connection {
public:
  using ClosedCallback = std::function<void(std::uint64_t)>;

  // Delete copy operations to prevent socket duplication
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // A zero read_timeout disables the read deadline
  Connection(std::uint64_t id,
             boost::asio::ip::tcp::socket socket,
             protocol::ProtocolEngine& engine,
             std::chrono::seconds read_timeout);
  ~Connection();


  // ---- CONNECTION CONTROL ----
  // Starts the processing thread; on_closed runs on that thread when it ends
  bool start(ClosedCallback on_closed);
  // Shuts the socket down, which unblocks a pending read
  void close();
  // Waits for the processing thread to finish
  void join();


  // ---- GETTERS ----
  std::uint64_t get_id() const { return id_; }
  const std::string& get_remote_endpoint() const { return remote_endpoint_; }
  bool is_active() const { return active_; }

private:
  // ---- PARAMETERS ----
  const std::uint64_t id_;
  std::string remote_endpoint_;
  boost::asio::ip::tcp::iostream stream_;
  protocol::ProtocolEngine& engine_;
  const std::chrono::seconds read_timeout_;

  std::atomic<bool> active_{false};
  ClosedCallback on_closed_;
  std::unique_ptr<std::thread> processing_thread_;
  std::mutex join_mutex_;
  // Guards shutdown and close against the processing thread
  std::mutex socket_mutex_;


  // ---- PROCESSING ----
  void process();
  void shutdown_socket();
};

} // namespace network
} // namespace gntp

#endif // GNTP_NETWORK_CONNECTION_HPP
