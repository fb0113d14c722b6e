#include "session.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace rgtp {

static constexpr auto kServeWait = std::chrono::milliseconds(100);

const char *to_string(SessionState s) {
  switch (s) {
  case SessionState::Init:
    return "init";
  case SessionState::Exposing:
    return "exposing";
  case SessionState::Complete:
    return "complete";
  case SessionState::Failed:
    return "failed";
  }
  return "unknown";
}

Session::Session(Context &ctx, Config cfg) : ctx_(ctx), cfg_(std::move(cfg)) {}

Session::Session(Context &ctx, Config cfg,
                 std::unique_ptr<DatagramTransport> transport)
    : ctx_(ctx), cfg_(std::move(cfg)), transport_(std::move(transport)) {}

Session::~Session() {
  close();
  // close() from a callback leaves the worker for its owner to reap
  if (worker_.joinable()) {
    if (worker_.get_id() == std::this_thread::get_id())
      worker_.detach();
    else
      worker_.join();
  }
}

void Session::expose_data(std::vector<uint8_t> data, std::error_code &ec) {
  if (closed_) {
    ec = make_error_code(errc::closed_resource);
    return;
  }
  if (state() != SessionState::Init) {
    ec = make_error_code(errc::invalid_argument);
    return;
  }
  if (!ctx_.initialized()) {
    ec = make_error_code(errc::init_failure);
    return;
  }
  if (!transport_) {
    auto t = ctx_.create_socket(ec);
    if (ec) {
      set_state(SessionState::Failed, ec);
      return;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    transport_ = std::move(t);
  }
  if (transport_->local_port() == 0) {
    transport_->bind(cfg_.port, ec);
    if (ec) {
      set_state(SessionState::Failed, ec);
      notify_error(ec, "bind failed");
      return;
    }
  }
  std::unique_ptr<Exposer> e(new Exposer(*transport_, cfg_));
  e->expose(std::move(data), ec);
  if (ec) {
    set_state(SessionState::Failed, ec);
    return;
  }
  {
    std::lock_guard<std::mutex> lk(mtx_);
    exposer_ = std::move(e);
  }
  set_state(SessionState::Exposing);
  Logger::instance().log(LogLevel::INFO, "session serving on port %u",
                         (unsigned)transport_->local_port());
  worker_ = std::thread(&Session::run, this);
}

void Session::expose_file(const std::string &path, std::error_code &ec) {
  if (closed_) {
    ec = make_error_code(errc::closed_resource);
    return;
  }
  std::error_code fec;
  auto data = read_file(path, fec);
  if (fec) {
    Logger::instance().log(LogLevel::ERROR, "read %s failed: %s", path.c_str(),
                           fec.message().c_str());
    ec = make_error_code(errc::expose_failure);
    return;
  }
  expose_data(std::move(data), ec);
}

void Session::wait_complete(std::chrono::milliseconds timeout,
                            std::error_code &ec) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (state_ == SessionState::Init) {
    ec = make_error_code(errc::expose_failure);
    return;
  }
  bool done = cv_.wait_for(lk, timeout, [this] {
    return closed_ || state_ == SessionState::Complete ||
           state_ == SessionState::Failed;
  });
  if (closed_)
    ec = make_error_code(errc::closed_resource);
  else if (state_ == SessionState::Failed)
    ec = failure_;
  else if (!done)
    ec = make_error_code(errc::timeout);
  else
    ec.clear();
}

void Session::wait_complete(std::error_code &ec) {
  std::unique_lock<std::mutex> lk(mtx_);
  if (state_ == SessionState::Init) {
    ec = make_error_code(errc::expose_failure);
    return;
  }
  cv_.wait(lk, [this] {
    return closed_ || state_ == SessionState::Complete ||
           state_ == SessionState::Failed;
  });
  if (closed_)
    ec = make_error_code(errc::closed_resource);
  else if (state_ == SessionState::Failed)
    ec = failure_;
  else
    ec.clear();
}

Stats Session::get_stats(std::error_code &ec) const {
  if (closed_) {
    ec = make_error_code(errc::closed_resource);
    return Stats{};
  }
  std::lock_guard<std::mutex> lk(mtx_);
  ec.clear();
  if (!exposer_ || !exposer_->surface())
    return Stats{};
  return exposer_->surface()->stats();
}

void Session::announce(const std::string &host, uint16_t port,
                       std::error_code &ec) {
  if (closed_) {
    ec = make_error_code(errc::closed_resource);
    return;
  }
  std::lock_guard<std::mutex> lk(mtx_);
  if (!transport_ || state_ == SessionState::Init ||
      state_ == SessionState::Failed) {
    ec = make_error_code(errc::expose_failure);
    return;
  }
  Endpoint dest = transport_->resolve(host, port, ec);
  if (ec)
    return;
  announce_q_.push_back(dest);
}

void Session::cancel() {
  stop_worker(true);
  std::lock_guard<std::mutex> lk(mtx_);
  if (state_ == SessionState::Exposing) {
    state_ = SessionState::Failed;
    failure_ = make_error_code(errc::cancelled);
    cv_.notify_all();
  }
}

void Session::close() {
  if (closed_.exchange(true))
    return;
  {
    // an in-flight callback finishes before close returns
    std::lock_guard<std::recursive_mutex> lk(cb_mtx_);
  }
  stop_worker(false);
  if (exposer_) {
    std::error_code ec;
    exposer_->finish(ec);
    if (ec)
      Logger::instance().log(LogLevel::DEBUG, "exposure end notice: %s",
                             error_string(ec).c_str());
    if (exposer_->surface())
      exposer_->surface()->close();
  }
  if (transport_)
    transport_->close();
  std::lock_guard<std::mutex> lk(mtx_);
  cv_.notify_all();
}

SessionState Session::state() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return state_;
}

uint16_t Session::local_port() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return transport_ ? transport_->local_port() : 0;
}

uint32_t Session::session_id() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return exposer_ && exposer_->surface() ? exposer_->surface()->session_id()
                                         : 0;
}

Manifest Session::manifest() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return exposer_ && exposer_->surface() ? exposer_->surface()->manifest()
                                         : Manifest{};
}

void Session::run() {
  std::error_code ec;
  while (!stop_) {
    std::vector<Endpoint> pending;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      pending.swap(announce_q_);
    }
    for (const auto &dest : pending) {
      exposer_->announce(dest, ec);
      if (ec)
        notify_error(ec, "announce to " + dest.to_string() + " failed");
    }

    exposer_->serve(kServeWait, ec);
    if (ec == errc::cancelled)
      break;
    if (ec) {
      Logger::instance().log(LogLevel::ERROR, "exposure failed: %s",
                             error_string(ec).c_str());
      set_state(SessionState::Failed, ec);
      notify_error(ec, "exposure failed");
      break;
    }
    notify_progress();
    if (exposer_->complete()) {
      std::lock_guard<std::mutex> lk(mtx_);
      if (state_ == SessionState::Exposing) {
        state_ = SessionState::Complete;
        cv_.notify_all();
      }
    }
  }
}

void Session::stop_worker(bool cancel_transport) {
  stop_ = true;
  if (cancel_transport && transport_)
    transport_->cancel();
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
    worker_.join();
}

void Session::set_state(SessionState s, std::error_code ec) {
  std::lock_guard<std::mutex> lk(mtx_);
  state_ = s;
  if (ec)
    failure_ = ec;
  cv_.notify_all();
}

void Session::notify_progress() {
  const Surface *s = exposer_->surface();
  uint64_t bytes = s->bytes_exposed();
  if (bytes == reported_bytes_)
    return;
  reported_bytes_ = bytes;
  std::lock_guard<std::recursive_mutex> lk(cb_mtx_);
  if (!closed_ && cfg_.on_progress)
    cfg_.on_progress(bytes, s->manifest().total_size);
}

void Session::notify_error(const std::error_code &ec,
                           const std::string &message) {
  std::lock_guard<std::recursive_mutex> lk(cb_mtx_);
  if (!closed_ && cfg_.on_error)
    cfg_.on_error(ec, message);
}

void send_file(Context &ctx, const std::string &path, uint16_t port,
               std::chrono::milliseconds timeout, std::error_code &ec) {
  Config cfg = default_config();
  cfg.port = port;
  Session session(ctx, cfg);
  session.expose_file(path, ec);
  if (ec)
    return;
  session.wait_complete(timeout, ec);
  session.close();
}

} // namespace rgtp
