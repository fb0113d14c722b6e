#include "puller.hpp"
#include "compression.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>

namespace rgtp {

Puller::Puller(DatagramTransport &transport, const Config &cfg)
    : transport_(transport), cfg_(cfg),
      rxbuf_(transport.max_datagram_size()) {}

std::vector<uint8_t> Puller::pull(const Endpoint &source, PullState &state,
                                  size_t capacity, std::error_code &ec) {
  ec = validate(cfg_);
  if (ec)
    return {};
  if (cfg_.enable_encryption) {
    crypto_.reset(new SodiumAead());
    crypto_->set_key(cfg_.encryption_key);
  }
  pending_.clear();
  retry_.clear();
  inflight_.clear();
  attempts_.clear();
  last_cause_.clear();
  fatal_.clear();
  last_progress_ = clock::now();

  uint32_t sid = 0;
  Manifest m = fetch_manifest(source, sid, ec);
  if (ec)
    return {};
  uint64_t limit = std::min<uint64_t>(capacity, cfg_.max_pull_size);
  if (m.total_size > limit) {
    Logger::instance().log(LogLevel::ERROR,
                           "payload of %llu bytes exceeds limit of %llu",
                           (unsigned long long)m.total_size,
                           (unsigned long long)limit);
    ec = make_error_code(errc::buffer_too_small);
    return {};
  }
  if (m.encrypted() && !crypto_) {
    Logger::instance().log(LogLevel::ERROR,
                           "exposure sid=%08x is encrypted and no key is set",
                           sid);
    ec = make_error_code(errc::pull_failure);
    return {};
  }

  ChunkBitmap bitmap;
  std::vector<uint8_t> data;
  if (!state.empty()) {
    if (state.session_id == sid && state.manifest == m &&
        state.bitmap.size() == m.chunk_count &&
        state.data.size() == m.total_size) {
      bitmap = state.bitmap;
      data = std::move(state.data);
      Logger::instance().log(LogLevel::INFO, "RESUME sid=%08x have %u/%u",
                             sid, bitmap.count(), m.chunk_count);
    } else {
      Logger::instance().log(LogLevel::INFO,
                             "resume state is for sid=%08x, exposure is "
                             "sid=%08x; starting over",
                             state.session_id, sid);
    }
  }
  state.reset();
  try {
    bool fresh = data.empty();
    ChunkStore store = fresh ? ChunkStore(m) : ChunkStore(m, std::move(data));
    if (fresh)
      bitmap = ChunkBitmap(m.chunk_count);
    std::lock_guard<std::mutex> lk(surface_mtx_);
    surface_.reset(new Surface(Role::Puller, sid, m, std::move(store),
                               std::move(bitmap), cfg_, transport_, source));
  } catch (const std::bad_alloc &) {
    Logger::instance().log(LogLevel::ERROR,
                           "no memory for %llu byte payload of sid=%08x",
                           (unsigned long long)m.total_size, sid);
    ec = make_error_code(errc::pull_failure);
    return {};
  } catch (const std::length_error &) {
    Logger::instance().log(LogLevel::ERROR,
                           "%llu byte payload of sid=%08x is not addressable",
                           (unsigned long long)m.total_size, sid);
    ec = make_error_code(errc::pull_failure);
    return {};
  }

  std::vector<uint32_t> order = surface_->bitmap().missing();
  if (cfg_.order_requests)
    cfg_.order_requests(m, order);
  pending_.assign(order.begin(), order.end());
  Logger::instance().log(LogLevel::INFO, "PULL sid=%08x from %s chunks=%u",
                         sid, source.to_string().c_str(),
                         (unsigned)pending_.size());

  auto timeout = std::chrono::milliseconds(cfg_.timeout_ms);
  ChunkBitmap &have = surface_->bitmap();
  CongestionController &cc = surface_->congestion();
  while (!have.full()) {
    if (fatal_) {
      ec = fatal_;
      save(state);
      return {};
    }
    auto now = clock::now();
    if (now - last_progress_ >= timeout) {
      Logger::instance().log(LogLevel::WARN,
                             "PULL sid=%08x timed out with %u/%u chunks", sid,
                             have.count(), have.size());
      ec = make_error_code(errc::timeout);
      save(state);
      return {};
    }

    while (inflight_.size() < cc.window() &&
           (!retry_.empty() || !pending_.empty())) {
      bool rt = !retry_.empty();
      uint32_t index = rt ? retry_.front() : pending_.front();
      if (rt)
        retry_.pop_front();
      else
        pending_.pop_front();
      if (index >= have.size() || have.test(index) || inflight_.count(index))
        continue;
      if (attempts_[index] >= cfg_.max_attempts_per_chunk) {
        std::error_code cause = last_cause_[index];
        ec = (cause == errc::checksum_mismatch ||
              cause == errc::decrypt_failure)
                 ? make_error_code(errc::checksum_mismatch)
                 : make_error_code(errc::pull_failure);
        Logger::instance().log(LogLevel::ERROR,
                               "chunk %u failed after %u attempts: %s", index,
                               attempts_[index], error_string(cause).c_str());
        save(state);
        return {};
      }
      request(index, rt, ec);
      if (ec) {
        save(state);
        return {};
      }
    }

    now = clock::now();
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        timeout - (now - last_progress_));
    for (const auto &kv : inflight_) {
      auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
          kv.second.deadline - now);
      wait = std::min(wait, until);
    }
    wait = std::max(wait, std::chrono::milliseconds(1));

    Endpoint from;
    size_t n = transport_.receive_from(rxbuf_.data(), rxbuf_.size(), from, wait,
                                       ec);
    if (ec == errc::timeout) {
      ec.clear();
      expire(clock::now());
      continue;
    }
    if (ec) {
      save(state);
      return {};
    }
    on_datagram(rxbuf_.data(), n, from, ec);
    expire(clock::now());
  }

  std::vector<uint8_t> out = surface_->store().reassemble(have, ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN,
                           "PULL sid=%08x content hash mismatch, discarded",
                           sid);
    return {};
  }
  std::error_code cec;
  send_control(PacketType::PullComplete, sid, source, cec);
  if (cec)
    Logger::instance().log(LogLevel::WARN, "PULL_COMPLETE not sent: %s",
                           error_string(cec).c_str());
  Stats s = surface_->stats();
  Logger::instance().log(LogLevel::INFO,
                         "PULL_COMPLETE sid=%08x %u chunks, %u retransmitted",
                         sid, s.chunks_transferred, s.retransmissions);
  return out;
}

Stats Puller::stats() const {
  std::lock_guard<std::mutex> lk(surface_mtx_);
  return surface_ ? surface_->stats() : Stats{};
}

bool Puller::has_surface() const {
  std::lock_guard<std::mutex> lk(surface_mtx_);
  return surface_ != nullptr;
}

Manifest Puller::fetch_manifest(const Endpoint &source, uint32_t &sid_out,
                                std::error_code &ec) {
  auto timeout = std::chrono::milliseconds(cfg_.timeout_ms);
  auto retry = std::chrono::milliseconds(cfg_.congestion.initial_rto_ms);
  auto started = clock::now();
  auto next_send = started;
  for (;;) {
    auto now = clock::now();
    if (now - started >= timeout) {
      Logger::instance().log(LogLevel::WARN, "no manifest from %s",
                             source.to_string().c_str());
      ec = make_error_code(errc::timeout);
      return Manifest{};
    }
    if (now >= next_send) {
      send_control(PacketType::ManifestRequest, 0, source, ec);
      if (ec)
        return Manifest{};
      next_send = now + retry;
    }
    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::min(next_send - now, timeout - (now - started)));
    wait = std::max(wait, std::chrono::milliseconds(1));

    Endpoint from;
    size_t n = transport_.receive_from(rxbuf_.data(), rxbuf_.size(), from, wait,
                                       ec);
    if (ec == errc::timeout)
      continue;
    if (ec)
      return Manifest{};

    if (from != source) {
      Logger::instance().log(LogLevel::TRACE, "drop datagram from stranger %s",
                             from.to_string().c_str());
      continue;
    }
    std::error_code fec;
    Frame f = parse_frame(rxbuf_.data(), n, fec);
    if (fec || !verify_checksum(f, cfg_.checksum) ||
        f.hdr.type != (uint8_t)PacketType::Manifest)
      continue;
    Manifest m = decode_manifest(f.payload.data(), f.payload.size(), fec);
    if (fec) {
      Logger::instance().log(LogLevel::TRACE, "drop bad manifest from %s",
                             from.to_string().c_str());
      continue;
    }
    sid_out = f.hdr.session_id;
    ec.clear();
    return m;
  }
}

void Puller::request(uint32_t index, bool retransmit, std::error_code &ec) {
  Frame f;
  f.hdr.type = (uint8_t)PacketType::PullRequest;
  f.hdr.session_id = surface_->session_id();
  f.hdr.sequence = index;
  f.hdr.flags = retransmit ? HF_RETRANSMIT : 0;
  f.payload = encode_pressure(pressure());
  auto buf = serialize_frame(f, cfg_.checksum);
  transport_.send_to(buf.data(), buf.size(), surface_->peer(), ec);
  if (ec)
    return;
  uint32_t n = ++attempts_[index];
  if (retransmit) {
    surface_->record_retransmission();
    Logger::instance().log(LogLevel::DEBUG, "RETRY sid=%08x chunk=%u attempt=%u",
                           surface_->session_id(), index, n);
  }
  auto now = clock::now();
  InFlight fl;
  fl.sent = now;
  fl.deadline = now + surface_->congestion().retransmit_timeout();
  fl.retransmit = retransmit;
  inflight_[index] = fl;
}

void Puller::on_datagram(const uint8_t *data, size_t n, const Endpoint &from,
                         std::error_code &ec) {
  ec.clear();
  // chunks are only taken from the exposer the manifest came from
  if (from != surface_->peer()) {
    Logger::instance().log(LogLevel::TRACE, "drop datagram from stranger %s",
                           from.to_string().c_str());
    return;
  }
  std::error_code fec;
  Frame f = parse_frame(data, n, fec);
  if (fec) {
    Logger::instance().log(LogLevel::TRACE, "drop malformed datagram from %s",
                           from.to_string().c_str());
    return;
  }
  if (f.hdr.session_id != surface_->session_id())
    return;
  switch ((PacketType)f.hdr.type) {
  case PacketType::ChunkData:
    if (!verify_checksum(f, cfg_.checksum)) {
      Logger::instance().log(LogLevel::TRACE, "bad checksum on chunk %u",
                             f.hdr.sequence);
      lose(f.hdr.sequence, make_error_code(errc::checksum_mismatch));
      return;
    }
    on_chunk(f);
    break;
  case PacketType::ExposureComplete:
    if (!verify_checksum(f, cfg_.checksum))
      return;
    Logger::instance().log(LogLevel::WARN, "exposer %s ended sid=%08x",
                           from.to_string().c_str(), f.hdr.session_id);
    fatal_ = make_error_code(errc::pull_failure);
    break;
  default:
    break;
  }
}

void Puller::on_chunk(const Frame &f) {
  uint32_t index = f.hdr.sequence;
  ChunkBitmap &have = surface_->bitmap();
  if (index >= have.size() || have.test(index))
    return;

  ChunkStore &store = surface_->store();
  std::vector<uint8_t> payload = f.payload;
  if (f.hdr.flags & HF_ENCRYPTED) {
    if (!crypto_ ||
        !crypto_->decrypt(surface_->session_id(), index, payload)) {
      Logger::instance().log(LogLevel::DEBUG, "chunk %u failed to open", index);
      lose(index, make_error_code(errc::decrypt_failure));
      return;
    }
  }
  if (f.hdr.flags & HF_COMPRESSED) {
    std::vector<uint8_t> plain;
    if (!decompress_chunk(payload.data(), payload.size(),
                          store.chunk_length(index), plain)) {
      Logger::instance().log(LogLevel::DEBUG, "chunk %u failed to inflate",
                             index);
      lose(index, make_error_code(errc::checksum_mismatch));
      return;
    }
    payload.swap(plain);
  }
  std::error_code wec;
  store.write_chunk(index, payload.data(), payload.size(), wec);
  if (wec) {
    lose(index, wec);
    return;
  }

  auto now = clock::now();
  have.set(index);
  surface_->record_chunk(store.chunk_length(index));
  CongestionController &cc = surface_->congestion();
  auto it = inflight_.find(index);
  if (it != inflight_.end()) {
    if (!it->second.retransmit)
      cc.on_rtt_sample(std::chrono::duration_cast<std::chrono::microseconds>(
          now - it->second.sent));
    inflight_.erase(it);
  }
  cc.on_delivery();
  last_progress_ = now;
  if (progress_)
    progress_(surface_->bytes_pulled(), surface_->manifest().total_size);
}

void Puller::lose(uint32_t index, const std::error_code &cause) {
  auto it = inflight_.find(index);
  if (it == inflight_.end())
    return;
  inflight_.erase(it);
  last_cause_[index] = cause;
  surface_->congestion().on_loss();
  retry_.push_back(index);
  Logger::instance().log(LogLevel::DEBUG, "LOSS sid=%08x chunk=%u (%s)",
                         surface_->session_id(), index,
                         error_string(cause).c_str());
}

void Puller::expire(clock::time_point now) {
  std::vector<uint32_t> late;
  for (const auto &kv : inflight_)
    if (kv.second.deadline <= now)
      late.push_back(kv.first);
  for (uint32_t index : late)
    lose(index, make_error_code(errc::timeout));
}

uint32_t Puller::pressure() const {
  uint32_t window = std::max<uint32_t>(1, surface_->congestion().window());
  return (uint32_t)std::min<size_t>(100, retry_.size() * 100 / window);
}

void Puller::send_control(PacketType type, uint32_t session_id,
                          const Endpoint &to, std::error_code &ec) {
  Frame f;
  f.hdr.type = (uint8_t)type;
  f.hdr.session_id = session_id;
  auto buf = serialize_frame(f, cfg_.checksum);
  transport_.send_to(buf.data(), buf.size(), to, ec);
}

void Puller::save(PullState &state) {
  state.session_id = surface_->session_id();
  state.manifest = surface_->manifest();
  state.bitmap = surface_->bitmap();
  state.data = surface_->store().release();
}

size_t pull(DatagramTransport &transport, const Endpoint &source,
            uint8_t *buffer, size_t capacity, const Config &cfg,
            std::error_code &ec) {
  Puller p(transport, cfg);
  PullState state;
  std::vector<uint8_t> data = p.pull(source, state, capacity, ec);
  if (ec)
    return 0;
  if (!data.empty())
    std::memcpy(buffer, data.data(), data.size());
  return data.size();
}

} // namespace rgtp
