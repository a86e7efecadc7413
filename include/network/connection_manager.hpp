#ifndef GNTP_NETWORK_CONNECTION_MANAGER_HPP
#define GNTP_NETWORK_CONNECTION_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <boost/asio.hpp>
#include "network/connection.hpp"
#include "protocol/protocol_engine.hpp"

namespace gntp {
namespace network {

// Owns every connection until its thread is joined. A connection moves itself
// from the live set to the finished list when its thread ends.
class ConnectionManager {
public:
  // Delete copy constructor and assignment operator
  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ConnectionManager(protocol::ProtocolEngine& engine,
                             std::chrono::seconds read_timeout = std::chrono::seconds(0));
  ~ConnectionManager();


  // ---- CONNECTION MANAGEMENT ----
  // Wraps an accepted socket and starts serving it. Returns the connection id,
  // or 0 when the manager is shut down or the connection fails to start.
  std::uint64_t create_connection(boost::asio::ip::tcp::socket socket);
  void remove_connection(std::uint64_t connection_id);
  bool has_connection(std::uint64_t connection_id) const;
  std::shared_ptr<Connection> get_connection(std::uint64_t connection_id) const;


  // ---- UTILITY METHODS ----
  std::size_t size() const;
  // Closes every live connection, waits up to grace for them to go idle, then
  // joins every connection thread. Returns only once no thread is running.
  void shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));
  // Blocks until no connection is live or timeout passes
  bool wait_idle(std::chrono::milliseconds timeout) const;

private:
  // ---- PARAMETERS ----
  protocol::ProtocolEngine& engine_;
  const std::chrono::seconds read_timeout_;

  std::atomic<std::uint64_t> next_id_{1};
  bool accepting_ = true;

  // Connections map and access mutex
  std::map<std::uint64_t, std::shared_ptr<Connection>> connections_;
  // Closed connections whose threads are not joined yet
  std::vector<std::shared_ptr<Connection>> finished_;
  mutable std::mutex mutex_;
  mutable std::condition_variable idle_;

  // Joins the threads of finished connections and releases them
  void reap_finished();
  void join_all();
};

} // namespace network
} // namespace gntp

#endif // GNTP_NETWORK_CONNECTION_MANAGER_HPP
