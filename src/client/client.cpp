#include "client.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace rgtp {

const char *to_string(ClientState s) {
  switch (s) {
  case ClientState::Init:
    return "init";
  case ClientState::Pulling:
    return "pulling";
  case ClientState::Complete:
    return "complete";
  case ClientState::TimedOut:
    return "timed out";
  case ClientState::Failed:
    return "failed";
  }
  return "unknown";
}

Client::Client(Context &ctx, Config cfg) : ctx_(ctx), cfg_(std::move(cfg)) {}

Client::Client(Context &ctx, Config cfg, TransportFactory factory)
    : ctx_(ctx), cfg_(std::move(cfg)), factory_(std::move(factory)) {}

Client::~Client() { close(); }

void Client::pull_to_file(const std::string &host, uint16_t port,
                          const std::string &path, std::error_code &ec) {
  std::vector<uint8_t> data = pull_data(host, port, ec);
  if (ec)
    return;
  std::error_code fec;
  write_file_atomic(path, data, fec);
  if (fec) {
    Logger::instance().log(LogLevel::ERROR, "write %s failed: %s",
                           path.c_str(), fec.message().c_str());
    ec = make_error_code(errc::pull_failure);
    set_state(ClientState::Failed);
    notify_error(ec, "write " + path + " failed");
    return;
  }
  Logger::instance().log(LogLevel::INFO, "wrote %s (%s)", path.c_str(),
                         format_size(data.size()).c_str());
}

std::vector<uint8_t> Client::pull_data(const std::string &host, uint16_t port,
                                       size_t capacity, std::error_code &ec) {
  PullState st;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    st = std::move(resume_);
    resume_.reset();
  }
  std::vector<uint8_t> data = pull(host, port, st, capacity, ec);
  std::lock_guard<std::mutex> lk(mtx_);
  resume_ = std::move(st);
  return data;
}

std::vector<uint8_t> Client::pull_data(const std::string &host, uint16_t port,
                                       std::error_code &ec) {
  return pull_data(host, port, std::numeric_limits<size_t>::max(), ec);
}

std::vector<uint8_t> Client::pull(const std::string &host, uint16_t port,
                                  PullState &resume, size_t capacity,
                                  std::error_code &ec) {
  if (closed_) {
    ec = make_error_code(errc::closed_resource);
    return {};
  }
  std::lock_guard<std::mutex> op(op_mtx_);
  if (closed_) {
    ec = make_error_code(errc::closed_resource);
    return {};
  }
  if (!ctx_.initialized()) {
    ec = make_error_code(errc::init_failure);
    return {};
  }

  std::unique_ptr<DatagramTransport> t;
  if (factory_) {
    t = factory_(ec);
  } else {
    t = ctx_.create_socket(ec);
    if (!ec)
      t->bind(cfg_.port, ec);
  }
  if (ec) {
    set_state(ClientState::Failed);
    notify_error(ec, "socket setup failed");
    return {};
  }
  Endpoint source = t->resolve(host, port, ec);
  if (ec) {
    set_state(ClientState::Failed);
    notify_error(ec, "cannot resolve " + host);
    return {};
  }

  std::unique_ptr<Puller> p(new Puller(*t, cfg_));
  p->set_progress([this](uint64_t done, uint64_t total) {
    std::lock_guard<std::recursive_mutex> lk(cb_mtx_);
    if (!closed_ && cfg_.on_progress)
      cfg_.on_progress(done, total);
  });
  Puller *puller = p.get();
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_) {
      ec = make_error_code(errc::closed_resource);
      return {};
    }
    puller_ = std::move(p);
    transport_ = std::move(t);
    state_ = ClientState::Pulling;
    pull_thread_ = std::this_thread::get_id();
  }

  std::vector<uint8_t> data = puller->pull(source, resume, capacity, ec);
  {
    std::lock_guard<std::mutex> lk(mtx_);
    pull_thread_ = std::thread::id();
    // closed from a callback on this thread
    if (closed_) {
      transport_->close();
      ec = make_error_code(errc::closed_resource);
    }
  }
  if (closed_) {
    set_state(ClientState::Failed);
    return {};
  }
  if (!ec) {
    set_state(ClientState::Complete);
    return data;
  }
  set_state(ec == errc::timeout ? ClientState::TimedOut : ClientState::Failed);
  notify_error(ec, "pull from " + source.to_string() + " failed");
  return {};
}

PullState Client::resume_state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return resume_;
}

Stats Client::get_stats(std::error_code &ec) const {
  if (closed_) {
    ec = make_error_code(errc::closed_resource);
    return Stats{};
  }
  std::lock_guard<std::mutex> lk(mtx_);
  ec.clear();
  return puller_ ? puller_->stats() : Stats{};
}

void Client::cancel() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (transport_ && state_ == ClientState::Pulling)
    transport_->cancel();
}

void Client::close() {
  if (closed_.exchange(true))
    return;
  {
    // an in-flight callback finishes before close returns
    std::lock_guard<std::recursive_mutex> lk(cb_mtx_);
  }
  cancel();
  {
    // the pulling thread holds op_mtx_; it releases the socket itself
    std::lock_guard<std::mutex> lk(mtx_);
    if (pull_thread_ == std::this_thread::get_id())
      return;
  }
  std::lock_guard<std::mutex> op(op_mtx_);
  std::lock_guard<std::mutex> lk(mtx_);
  if (transport_)
    transport_->close();
}

ClientState Client::state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_;
}

void Client::set_state(ClientState s) {
  std::lock_guard<std::mutex> lk(mtx_);
  state_ = s;
}

void Client::notify_error(const std::error_code &ec,
                          const std::string &message) {
  std::lock_guard<std::recursive_mutex> lk(cb_mtx_);
  if (!closed_ && cfg_.on_error)
    cfg_.on_error(ec, message);
}

void receive_file(Context &ctx, const std::string &host, uint16_t port,
                  const std::string &path, std::error_code &ec) {
  Client client(ctx, default_config());
  client.pull_to_file(host, port, path, ec);
}

} // namespace rgtp
