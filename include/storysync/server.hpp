#pragma once

#include "storysync/config.hpp"
#include "storysync/error.hpp"
#include "storysync/handler.hpp"
#include "storysync/http.hpp"
#include "storysync/log.hpp"
#include "storysync/pairing.hpp"
#include "storysync/preview.hpp"
#include "storysync/session.hpp"
#include "storysync/transport.hpp"

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace storysync {

/// One running server: a listener, its accept thread and one worker thread
/// per connection, all bound to a single session. cancel() is a hard stop:
/// in-flight connections are shut down without a response.
class serving_task {
public:
  serving_task(tcp_listener listener, std::shared_ptr<session> sess,
               server_options options)
      : listener_(std::move(listener)), session_(std::move(sess)),
        options_(std::move(options)) {
    accept_thread_ = std::thread([this]() { accept_loop(); });
  }

  ~serving_task() { cancel(); }

  serving_task(const serving_task &) = delete;
  serving_task &operator=(const serving_task &) = delete;

  /// Stop accepting, abort every open connection and join all threads.
  void cancel() {
    cancelled_.store(true);
    if (accept_thread_.joinable())
      accept_thread_.join();
    close_listener(listener_);

    std::lock_guard<std::mutex> lock(workers_mu_);
    for (auto &w : workers_) {
      if (w->socket.valid())
        ::shutdown(w->socket.get(), SHUT_RDWR);
    }
    for (auto &w : workers_) {
      if (w->thread.joinable())
        w->thread.join();
    }
    workers_.clear();
  }

  const std::shared_ptr<session> &live_session() const { return session_; }

  /// True once the accept loop has died; no new connection is served.
  bool failed() const { return failed_.load(); }
  uint16_t port() const { return listener_.port; }

private:
  struct worker {
    socket_handle socket;
    std::thread thread;
    std::atomic<bool> done{false};
  };

  void accept_loop() {
    while (!cancelled_.load()) {
      socket_handle conn;
      try {
        conn = accept_for(listener_, options_.poll_interval);
      } catch (const std::exception &e) {
        logger()->error("sync listener failed: {}", e.what());
        failed_.store(true);
        return;
      }

      std::lock_guard<std::mutex> lock(workers_mu_);
      reap_finished();
      if (!conn.valid())
        continue;

      auto w = std::make_unique<worker>();
      w->socket = std::move(conn);
      worker *raw = w.get();
      raw->thread = std::thread([this, raw]() { serve_connection(*raw); });
      workers_.push_back(std::move(w));
    }
  }

  // Caller holds workers_mu_.
  void reap_finished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
      if ((*it)->done.load()) {
        if ((*it)->thread.joinable())
          (*it)->thread.join();
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }

  void serve_connection(worker &w) {
    io_deadline deadline{steady_clock::now() + options_.io_timeout,
                         &cancelled_, options_.poll_interval};
    int fd = w.socket.get();
    try {
      http_response resp;
      try {
        auto req = read_http_request(fd, options_.max_body_bytes, deadline);
        resp = handle_http(*session_, req);
      } catch (const http_status_error &e) {
        logger()->warn("bad sync request: {}", e.what());
        resp = plain_text(e.status(), e.what());
      }
      auto text = format_response(resp);
      send_all(fd, text.data(), text.size(), deadline);
      ::shutdown(fd, SHUT_WR);
    } catch (const sync_error &e) {
      logger()->debug("sync connection dropped ({}): {}", to_string(e.kind()),
                      e.what());
    } catch (const std::exception &e) {
      logger()->error("sync connection failed: {}", e.what());
    }
    w.done.store(true);
  }

  tcp_listener listener_;
  std::shared_ptr<session> session_;
  server_options options_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> failed_{false};

  std::mutex workers_mu_;
  std::list<std::unique_ptr<worker>> workers_;

  std::thread accept_thread_;
};

/// Owns at most one live sync session. start() replaces whatever is
/// running; stop() is idempotent.
class sync_server {
public:
  explicit sync_server(server_options options = {},
                       address_resolver resolver = local_ip,
                       pairing_renderer renderer = nullptr,
                       preview_extractor extractor = extract_preview)
      : options_(std::move(options)), resolver_(std::move(resolver)),
        renderer_(std::move(renderer)), extractor_(std::move(extractor)) {}

  ~sync_server() { stop(); }

  sync_server(const sync_server &) = delete;
  sync_server &operator=(const sync_server &) = delete;

  /// Start serving `story_inputs` under a fresh token. On failure nothing
  /// stays running and sync_error is thrown. The resolver and renderer run
  /// without the server lock held, so they may query this server.
  server_info start(const std::vector<std::string> &story_inputs) {
    stop();

    auto token = generate_token();
    auto sess = session::create(token, story_inputs, extractor_);
    auto listener = listen_tcp(options_.bind_host, options_.bind_port);

    std::string ip;
    try {
      ip = resolver_();
    } catch (const sync_error &e) {
      throw sync_error(error_kind::bind_failure, e.what());
    } catch (const std::exception &e) {
      throw sync_error(error_kind::bind_failure,
                       std::string("Failed to get local IP: ") + e.what());
    }

    pairing_payload payload{ip, listener.port, token};
    server_info info{ip, listener.port, token, ""};
    if (renderer_) {
      try {
        info.qr_code_base64 = renderer_(serialize_pairing(payload));
      } catch (const std::exception &e) {
        throw sync_error(error_kind::render_failure,
                         std::string("Failed to render pairing code: ") +
                             e.what());
      }
    }

    auto offered = sess->offered_count();
    std::lock_guard<std::mutex> lock(mu_);
    stop_locked();
    task_ = std::make_unique<serving_task>(std::move(listener), std::move(sess),
                                           options_);
    pairing_ = payload;
    logger()->info("sync server listening on {}:{} ({} stories offered)", ip,
                   info.port, offered);
    return info;
  }

  void stop() {
    std::lock_guard<std::mutex> lock(mu_);
    stop_locked();
  }

  /// False when stopped, and also when the listener failed after start.
  bool running() const {
    std::lock_guard<std::mutex> lock(mu_);
    return task_ != nullptr && !task_->failed();
  }

  std::shared_ptr<session> current_session() const {
    std::lock_guard<std::mutex> lock(mu_);
    return task_ ? task_->live_session() : nullptr;
  }

  std::optional<pairing_payload> pairing() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pairing_;
  }

  /// Stories pushed to the live session; empty when stopped.
  std::vector<std::string> received_stories() const {
    auto sess = current_session();
    return sess ? sess->peek_received() : std::vector<std::string>{};
  }

  /// Take the stories pushed to the live session, leaving it empty.
  std::vector<std::string> clear_received_stories() {
    auto sess = current_session();
    return sess ? sess->drain_received() : std::vector<std::string>{};
  }

private:
  void stop_locked() {
    if (!task_)
      return;
    task_->cancel();
    task_.reset();
    pairing_.reset();
    logger()->info("sync server stopped");
  }

  server_options options_;
  address_resolver resolver_;
  pairing_renderer renderer_;
  preview_extractor extractor_;

  mutable std::mutex mu_;
  std::unique_ptr<serving_task> task_;
  std::optional<pairing_payload> pairing_;
};

} // namespace storysync
