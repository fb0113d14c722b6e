#include "exposer.hpp"
#include "compression.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <thread>

namespace rgtp {

static constexpr size_t kServeBatch = 64;
static constexpr auto kDrainWait = std::chrono::milliseconds(1);

Exposer::Exposer(DatagramTransport &transport, const Config &cfg)
    : transport_(transport), cfg_(cfg),
      rxbuf_(transport.max_datagram_size()) {}

void Exposer::expose(std::vector<uint8_t> payload, std::error_code &ec) {
  if (surface_) {
    ec = make_error_code(errc::invalid_argument);
    return;
  }
  ec = validate(cfg_);
  if (ec)
    return;
  if (cfg_.enable_encryption) {
    crypto_.reset(new SodiumAead());
    crypto_->set_key(cfg_.encryption_key);
  }
  uint32_t chunk_size = choose_chunk_size(cfg_, payload.size(),
                                          transport_.max_datagram_size());
  if (chunk_count_for(payload.size(), chunk_size) > UINT32_MAX) {
    Logger::instance().log(LogLevel::ERROR,
                           "payload of %llu bytes needs too many chunks",
                           (unsigned long long)payload.size());
    ec = make_error_code(errc::invalid_argument);
    return;
  }
  uint16_t mode = make_exposure_mode(
      cfg_.adaptive_mode ? RateMode::Adaptive : RateMode::Fixed,
      cfg_.hash_algorithm, cfg_.enable_encryption, cfg_.enable_compression);
  Manifest m = build_manifest(payload, chunk_size, mode, cfg_.priority);
  uint32_t sid = random_session_id();
  ChunkStore store(m, std::move(payload));
  surface_.reset(new Surface(Role::Exposer, sid, m, std::move(store),
                             ChunkBitmap(m.chunk_count), cfg_, transport_,
                             Endpoint{}));
  wire_.assign(m.chunk_count, WireChunk{});
  complete_ = false;
  Logger::instance().log(
      LogLevel::INFO, "EXPOSE sid=%08x size=%llu chunks=%u chunk_size=%u", sid,
      (unsigned long long)m.total_size, m.chunk_count, m.optimal_chunk_size);
  ec.clear();
}

void Exposer::announce(const Endpoint &dest, std::error_code &ec) {
  if (!surface_) {
    ec = make_error_code(errc::expose_failure);
    return;
  }
  Frame a;
  a.hdr.type = (uint8_t)PacketType::ExposeAnnounce;
  a.hdr.session_id = surface_->session_id();
  send_frame(a, dest, ec);
  if (ec)
    return;
  on_manifest_request(dest, ec);
}

size_t Exposer::serve(std::chrono::milliseconds timeout, std::error_code &ec) {
  if (!surface_) {
    ec = make_error_code(errc::expose_failure);
    return 0;
  }
  if (surface_->closed()) {
    ec = make_error_code(errc::closed_resource);
    return 0;
  }
  drop_idle_peers(clock::now());
  size_t handled = 0;
  auto wait = timeout;
  while (handled < kServeBatch) {
    Endpoint from;
    size_t n = transport_.receive_from(rxbuf_.data(), rxbuf_.size(), from,
                                       wait, ec);
    if (ec == errc::timeout) {
      ec.clear();
      return handled;
    }
    if (ec)
      return handled;
    wait = kDrainWait;
    handled++;

    std::error_code fec;
    Frame f = parse_frame(rxbuf_.data(), n, fec);
    if (fec) {
      Logger::instance().log(LogLevel::TRACE, "drop malformed datagram from %s",
                             from.to_string().c_str());
      continue;
    }
    if (!verify_checksum(f, cfg_.checksum)) {
      Logger::instance().log(LogLevel::TRACE, "drop bad checksum from %s",
                             from.to_string().c_str());
      continue;
    }
    handle(f, from, ec);
    // one unreachable peer does not end the exposure for the others
    if (ec == errc::transport_failure)
      ec.clear();
    if (ec)
      return handled;
  }
  ec.clear();
  return handled;
}

void Exposer::finish(std::error_code &ec) {
  ec.clear();
  if (!surface_)
    return;
  for (auto &kv : peers_) {
    if (kv.second.done)
      continue;
    Frame f;
    f.hdr.type = (uint8_t)PacketType::ExposureComplete;
    f.hdr.session_id = surface_->session_id();
    send_frame(f, kv.first, ec);
    if (ec)
      return;
  }
}

Exposer::Peer *Exposer::peer_for(const Endpoint &from) {
  auto now = clock::now();
  auto it = peers_.find(from);
  if (it == peers_.end()) {
    if (peers_.size() >= cfg_.max_peers)
      drop_idle_peers(now);
    if (peers_.size() >= cfg_.max_peers) {
      Logger::instance().log(LogLevel::DEBUG,
                             "PEER sid=%08x %s refused, %u live",
                             surface_->session_id(), from.to_string().c_str(),
                             (unsigned)peers_.size());
      return nullptr;
    }
    Logger::instance().log(LogLevel::INFO, "PEER sid=%08x %s",
                           surface_->session_id(), from.to_string().c_str());
    Peer p;
    p.sent = ChunkBitmap(surface_->manifest().chunk_count);
    it = peers_.emplace(from, std::move(p)).first;
  }
  it->second.last_seen = now;
  surface_->set_peer(from);
  return &it->second;
}

void Exposer::drop_idle_peers(clock::time_point now) {
  auto idle = std::chrono::milliseconds(cfg_.timeout_ms);
  for (auto it = peers_.begin(); it != peers_.end();) {
    if (now - it->second.last_seen >= idle) {
      Logger::instance().log(LogLevel::DEBUG, "PEER sid=%08x %s idle, dropped",
                             surface_->session_id(),
                             it->first.to_string().c_str());
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
}

void Exposer::handle(const Frame &f, const Endpoint &from,
                     std::error_code &ec) {
  ec.clear();
  auto type = (PacketType)f.hdr.type;
  // a manifest may be asked for before the session id is known
  if (type == PacketType::ManifestRequest) {
    if (f.hdr.session_id == 0 || f.hdr.session_id == surface_->session_id())
      on_manifest_request(from, ec);
    return;
  }
  if (f.hdr.session_id != surface_->session_id()) {
    Logger::instance().log(LogLevel::TRACE, "drop foreign sid=%08x from %s",
                           f.hdr.session_id, from.to_string().c_str());
    return;
  }
  switch (type) {
  case PacketType::PullRequest:
    on_pull_request(f, from, ec);
    break;
  case PacketType::PullComplete:
    on_pull_complete(from);
    break;
  default:
    Logger::instance().log(LogLevel::TRACE, "ignore type %u from %s",
                           (unsigned)f.hdr.type, from.to_string().c_str());
    break;
  }
}

void Exposer::on_manifest_request(const Endpoint &from, std::error_code &ec) {
  Peer *p = peer_for(from);
  if (!p)
    return;
  Frame f;
  f.hdr.type = (uint8_t)PacketType::Manifest;
  f.hdr.session_id = surface_->session_id();
  f.payload.resize(kManifestSize);
  encode_manifest(surface_->manifest(), f.payload.data());
  send_frame(f, from, ec);
  if (ec)
    return;
  check_complete(*p);
}

void Exposer::on_pull_request(const Frame &f, const Endpoint &from,
                              std::error_code &ec) {
  uint32_t index = f.hdr.sequence;
  if (index >= surface_->manifest().chunk_count) {
    Logger::instance().log(LogLevel::TRACE, "drop request for chunk %u of %u",
                           index, surface_->manifest().chunk_count);
    return;
  }
  std::error_code pec;
  uint32_t pressure = decode_pressure(f.payload, pec);
  if (pec) {
    Logger::instance().log(LogLevel::TRACE, "drop request without pressure");
    return;
  }

  Peer *p = peer_for(from);
  if (!p)
    return;

  CongestionController &cc = surface_->congestion();
  if (f.hdr.flags & HF_RETRANSMIT)
    cc.on_loss();
  else
    cc.on_delivery();
  cc.on_pull_pressure(pressure);

  const WireChunk *w = wire_chunk(index, ec);
  if (ec)
    return;

  bool resend = !p->sent.set(index);
  if (resend) {
    surface_->record_retransmission();
    Logger::instance().log(LogLevel::DEBUG, "RESEND sid=%08x chunk=%u to %s",
                           surface_->session_id(), index,
                           from.to_string().c_str());
  }

  Frame out;
  out.hdr.type = (uint8_t)PacketType::ChunkData;
  out.hdr.session_id = surface_->session_id();
  out.hdr.sequence = index;
  out.hdr.flags = w->flags;
  if (resend)
    out.hdr.flags |= HF_RETRANSMIT;
  out.payload = w->bytes;
  pace();
  send_frame(out, from, ec);
  if (ec)
    return;

  if (surface_->bitmap().set(index))
    surface_->record_chunk(surface_->store().chunk_length(index));
  check_complete(*p);
}

void Exposer::on_pull_complete(const Endpoint &from) {
  auto it = peers_.find(from);
  if (it == peers_.end() || it->second.done)
    return;
  it->second.done = true;
  Logger::instance().log(LogLevel::INFO, "PULL_COMPLETE sid=%08x %s",
                         surface_->session_id(), from.to_string().c_str());
  check_complete(it->second);
  peers_.erase(it);
}

void Exposer::send_frame(Frame &f, const Endpoint &to, std::error_code &ec) {
  auto buf = serialize_frame(f, cfg_.checksum);
  transport_.send_to(buf.data(), buf.size(), to, ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "send type %u to %s failed: %s",
                           (unsigned)f.hdr.type, to.to_string().c_str(),
                           error_string(ec).c_str());
}

const Exposer::WireChunk *Exposer::wire_chunk(uint32_t index,
                                              std::error_code &ec) {
  WireChunk &w = wire_[index];
  if (w.ready) {
    ec.clear();
    return &w;
  }
  const ChunkStore &store = surface_->store();
  const uint8_t *data = store.chunk_data(index);
  uint32_t len = store.chunk_length(index);
  w.flags = 0;
  if (cfg_.enable_compression && compress_chunk(data, len, w.bytes))
    w.flags |= HF_COMPRESSED;
  else
    w.bytes.assign(data, data + len);
  if (crypto_) {
    if (!crypto_->encrypt(surface_->session_id(), index, w.bytes)) {
      Logger::instance().log(LogLevel::ERROR, "seal chunk %u failed", index);
      w.bytes.clear();
      ec = make_error_code(errc::expose_failure);
      return nullptr;
    }
    w.flags |= HF_ENCRYPTED;
  }
  w.ready = true;
  ec.clear();
  return &w;
}

void Exposer::pace() {
  const CongestionController &cc = surface_->congestion();
  for (;;) {
    auto wait = pacer_.acquire(cc.exposure_rate(), cc.window(), clock::now());
    if (wait.count() == 0)
      return;
    std::this_thread::sleep_for(wait);
  }
}

void Exposer::check_complete(const Peer &p) {
  if (complete_)
    return;
  if (surface_->bytes_exposed() == surface_->manifest().total_size &&
      (p.sent.full() || p.done)) {
    complete_ = true;
    Logger::instance().log(LogLevel::INFO, "EXPOSURE_COMPLETE sid=%08x",
                           surface_->session_id());
  }
}

std::unique_ptr<Exposer> expose(DatagramTransport &transport,
                                std::vector<uint8_t> data, const Endpoint *dest,
                                const Config &cfg, std::error_code &ec) {
  std::unique_ptr<Exposer> e(new Exposer(transport, cfg));
  e->expose(std::move(data), ec);
  if (ec)
    return nullptr;
  if (dest) {
    e->announce(*dest, ec);
    if (ec)
      return nullptr;
  }
  return e;
}

} // namespace rgtp
