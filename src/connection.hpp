#pragma once
#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "log.hpp"

class Connection;

class ConnectionHandler {
public:
    virtual ~ConnectionHandler() = default;
    virtual void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& j) = 0;
    // Called once per connection, whatever closed it.
    virtual void on_closed(const std::shared_ptr<Connection>& conn, const std::error_code& ec) = 0;
};

// One TCP session carrying newline delimited JSON.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using WriteHandler = std::function<void(const std::error_code&)>;
    using ConnectHandler = std::function<void(const std::error_code&, std::shared_ptr<Connection>)>;

    // Accepted socket; call start() to begin reading.
    static std::shared_ptr<Connection> create(asio::ip::tcp::socket sock,
                                              ConnectionHandler* handler,
                                              std::shared_ptr<Logger> logger);

    // Connects, then hands over a started connection (or the error).
    static void connect_outgoing(asio::io_context& io,
                                 const std::string& host,
                                 unsigned short port,
                                 ConnectionHandler* handler,
                                 std::shared_ptr<Logger> logger,
                                 ConnectHandler on_connect);

    ~Connection();

    void start();
    void async_send_json(const nlohmann::json& j, WriteHandler on_written = nullptr);
    void close();
    // Drops the handler; no further callbacks are made.
    void detach() { handler_ = nullptr; }

    bool is_open() const { return !closed_; }
    std::size_t backlog() const { return backlog_; }
    std::string remote_address() const { return remote_address_; }

    std::string peer_id() const { return peer_id_; }
    void set_peer_id(const std::string& id) { peer_id_ = id; }

private:
    Connection(asio::ip::tcp::socket sock,
               ConnectionHandler* handler,
               std::shared_ptr<Logger> logger);
    void do_read();
    void handle_line(const std::string& line);
    void do_write();
    void close_with(const std::error_code& ec);

    struct PendingWrite {
        std::string data;
        WriteHandler on_written;
    };

    asio::ip::tcp::socket socket_;
    ConnectionHandler* handler_;
    std::shared_ptr<Logger> logger_;
    asio::streambuf read_buf_;
    std::deque<PendingWrite> write_queue_;
    std::size_t backlog_ = 0;
    std::string peer_id_;
    std::string remote_address_;
    bool writing_ = false;
    bool closed_ = false;
};
