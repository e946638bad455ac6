#include <zk/watcher.hpp>
#include <zk/parser.hpp>
#include <zk/util/debouncer.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace zk {

namespace {

// Longest poll() wait, so stop() is noticed promptly
constexpr int MAX_POLL_MS = 100;

constexpr uint32_t WATCH_MASK =
    IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO;

}  // namespace

NoteWatcher::NoteWatcher(Config config,
                         std::shared_ptr<NoteIndex> index,
                         std::shared_ptr<LinkRegistry> registry,
                         std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , index_(std::move(index))
    , registry_(std::move(registry))
    , logger_(or_null_logger(std::move(logger)))
{}

NoteWatcher::~NoteWatcher() {
    stop();
}

Result<void> NoteWatcher::start() {
    if (running_.load()) {
        return Ok();
    }

    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        return Error(ErrorCode::WATCH_ERROR,
                     std::string("inotify_init1 failed: ") + std::strerror(errno));
    }

    watch_fd_ = inotify_add_watch(inotify_fd_, config_.note_dir.c_str(), WATCH_MASK);
    if (watch_fd_ < 0) {
        int err = errno;
        close_inotify();
        return Error(ErrorCode::WATCH_ERROR,
                     "Cannot watch " + config_.note_dir.string() + ": " + std::strerror(err));
    }

    queue_ = std::make_unique<BoundedQueue<Batch>>(config_.channel_capacity);
    running_ = true;
    consumer_ = std::thread([this] { consume_loop(); });
    observer_ = std::thread([this] { observe_loop(); });

    logger_->info("watching " + config_.note_dir.string());
    return Ok();
}

void NoteWatcher::stop() {
    running_ = false;
    if (observer_.joinable()) {
        observer_.join();
    }
    if (queue_) {
        queue_->close();
    }
    if (consumer_.joinable()) {
        consumer_.join();
    }
    close_inotify();
}

void NoteWatcher::close_inotify() {
    if (inotify_fd_ >= 0) {
        if (watch_fd_ >= 0) {
            inotify_rm_watch(inotify_fd_, watch_fd_);
        }
        close(inotify_fd_);
    }
    inotify_fd_ = -1;
    watch_fd_ = -1;
}

void NoteWatcher::observe_loop() {
    Debouncer debouncer(config_.debounce);
    std::set<fs::path> pending;
    alignas(inotify_event) char buffer[16384];

    while (running_.load()) {
        int timeout = MAX_POLL_MS;
        if (debouncer.is_pending()) {
            timeout = std::clamp(debouncer.remaining_ms(), 1, MAX_POLL_MS);
        }

        pollfd pfd{};
        pfd.fd = inotify_fd_;
        pfd.events = POLLIN;
        int rc = poll(&pfd, 1, timeout);
        if (rc < 0) {
            if (errno == EINTR) continue;
            logger_->error(std::string("watcher poll failed: ") + std::strerror(errno));
            break;
        }

        if (rc > 0 && (pfd.revents & POLLIN)) {
            ssize_t len = read(inotify_fd_, buffer, sizeof(buffer));
            for (ssize_t i = 0; i < len;) {
                auto* event = reinterpret_cast<inotify_event*>(&buffer[i]);
                if (event->mask & IN_Q_OVERFLOW) {
                    logger_->warning("inotify queue overflow; some changes were lost");
                }
                if (event->mask & IN_IGNORED) {
                    logger_->warning("watch on " + config_.note_dir.string() + " was removed");
                }
                if (event->len > 0) {
                    pending.insert(config_.note_dir / event->name);
                    debouncer.trigger();
                }
                i += static_cast<ssize_t>(sizeof(inotify_event) + event->len);
            }
        }

        if (debouncer.ready() && !pending.empty()) {
            Batch batch(pending.begin(), pending.end());
            pending.clear();
            logger_->debug("watcher batch of " + std::to_string(batch.size()) + " path(s)");
            if (!queue_->push(std::move(batch))) {
                break;
            }
        }
    }
}

void NoteWatcher::consume_loop() {
    while (auto batch = queue_->pop()) {
        process_batch(*batch);
        ++batches_processed_;
    }
}

void NoteWatcher::process_batch(const Batch& batch) {
    for (const auto& path : batch) {
        if (!parser::is_note_filename(path)) {
            continue;
        }
        NoteId id = path.stem().string();

        std::error_code ec;
        if (fs::exists(path, ec)) {
            logger_->info("note changed/created: " + path.string());
            auto updated = index_->update_file(path);
            if (!updated.ok()) {
                logger_->debug("re-index skipped: " + updated.error().to_string());
            }
            if (registry_) {
                auto added = registry_->add_entry(id);
                if (!added.ok()) {
                    logger_->error("link registry: " + added.error().to_string());
                }
            }
        } else {
            logger_->info("note removed: " + path.string());
            index_->remove_by_path(path);
            if (registry_) {
                auto removed = registry_->remove_entry(id);
                if (!removed.ok()) {
                    logger_->error("link registry: " + removed.error().to_string());
                }
            }
        }
    }
}

}  // namespace zk
