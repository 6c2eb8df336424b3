#include "connection.hpp"

using json = nlohmann::json;

namespace {
// A resource chunk line is ~90KB; anything far beyond that is garbage.
constexpr std::size_t kMaxLineBytes = 1024 * 1024;
}

std::shared_ptr<Connection> Connection::create(asio::ip::tcp::socket sock,
                                               ConnectionHandler* handler,
                                               std::shared_ptr<Logger> logger)
{
    return std::shared_ptr<Connection>(new Connection(std::move(sock), handler, std::move(logger)));
}

Connection::Connection(asio::ip::tcp::socket sock,
                       ConnectionHandler* handler,
                       std::shared_ptr<Logger> logger)
: socket_(std::move(sock)),
  handler_(handler),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("connection")),
  read_buf_(kMaxLineBytes)
{
    std::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    if(!ec) remote_address_ = ep.address().to_string() + ":" + std::to_string(ep.port());
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    do_read();
}

void Connection::do_read(){
    if(closed_) return;
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(ec){
                if(ec != asio::error::operation_aborted){
                    logger_->debug("Connection {} read ended: {}", remote_address_, ec.message());
                }
                close_with(ec);
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty()){
                handle_line(line);
            }
            do_read();
        });
}

void Connection::handle_line(const std::string& line){
    auto j = json::parse(line, nullptr, false);
    if(j.is_discarded() || !j.is_object()){
        logger_->warn("Failed to parse JSON from {} ({} bytes)", remote_address_, line.size());
        return;
    }
    if(handler_) handler_->on_message(shared_from_this(), j);
}

void Connection::async_send_json(const json& j, WriteHandler on_written){
    if(closed_){
        if(on_written) on_written(asio::error::not_connected);
        return;
    }
    auto s = j.dump() + "\n";
    backlog_ += s.size();
    bool start_write = !writing_;
    write_queue_.push_back(PendingWrite{std::move(s), std::move(on_written)});
    if(start_write){
        do_write();
    }
}

void Connection::do_write(){
    if(write_queue_.empty() || closed_) return;
    writing_ = true;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front().data),
        [this, self](std::error_code ec, std::size_t){
            if(closed_) return;
            if(ec){
                logger_->debug("Connection {} write error: {}", remote_address_, ec.message());
                close_with(ec);
                return;
            }
            auto done = std::move(write_queue_.front());
            write_queue_.pop_front();
            backlog_ -= done.data.size();
            writing_ = false;
            if(!write_queue_.empty()){
                do_write();
            }
            if(done.on_written) done.on_written(ec);
        });
}

void Connection::close(){
    close_with(std::error_code());
}

void Connection::close_with(const std::error_code& ec){
    if(closed_) return;
    closed_ = true;
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    write_queue_.clear();
    backlog_ = 0;
    auto* handler = handler_;
    handler_ = nullptr;
    if(handler) handler->on_closed(shared_from_this(), ec);
}

void Connection::connect_outgoing(asio::io_context& io,
                                  const std::string& host,
                                  unsigned short port,
                                  ConnectionHandler* handler,
                                  std::shared_ptr<Logger> logger,
                                  ConnectHandler on_connect)
{
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io);
    resolver->async_resolve(host, std::to_string(port),
        [resolver, &io, handler, logger, host, port, on_connect](std::error_code ec,
                                                                asio::ip::tcp::resolver::results_type results){
            if(ec){
                logger->info("Resolve failed for {}:{}  {}", host, port, ec.message());
                on_connect(ec, nullptr);
                return;
            }
            auto sock = std::make_shared<asio::ip::tcp::socket>(io);
            asio::async_connect(*sock, results,
                [sock, handler, logger, on_connect](std::error_code ec, asio::ip::tcp::endpoint ep){
                    if(ec){
                        logger->info("Connect failed: {}", ec.message());
                        on_connect(ec, nullptr);
                        return;
                    }
                    logger->debug("Connected outgoing to {}:{}", ep.address().to_string(), ep.port());
                    auto conn = Connection::create(std::move(*sock), handler, logger);
                    conn->start();
                    on_connect(ec, conn);
                });
        });
}
