#pragma once

#include <zk/config.hpp>
#include <zk/link_registry.hpp>
#include <zk/note_index.hpp>
#include <zk/result.hpp>
#include <zk/util/bounded_queue.hpp>
#include <zk/util/logger.hpp>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace zk {

/**
 * NoteWatcher - Keeps the index and link registry in sync with the note
 * directory.
 *
 * An observation thread blocks on inotify and collects changed paths
 * until the directory has been quiet for the debounce window, then hands
 * the batch to a consumer thread over a bounded queue. The consumer does
 * not trust event kinds: a path that still exists is re-indexed and
 * registered, a path that is gone is removed and deregistered.
 */
class NoteWatcher {
public:
    using Batch = std::vector<fs::path>;

    NoteWatcher(Config config,
                std::shared_ptr<NoteIndex> index,
                std::shared_ptr<LinkRegistry> registry,
                std::shared_ptr<Logger> logger = nullptr);

    ~NoteWatcher();

    NoteWatcher(const NoteWatcher&) = delete;
    NoteWatcher& operator=(const NoteWatcher&) = delete;

    /**
     * Start watching the note directory (non-recursive).
     * @return WATCH_ERROR if inotify cannot be set up
     */
    Result<void> start();

    /**
     * Stop both threads. Batches already queued are processed first.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    /**
     * Reconcile one batch of changed paths against the filesystem.
     * Paths that are not `<ID>.typ` files are ignored.
     */
    void process_batch(const Batch& batch);

    /**
     * Number of batches the consumer has processed.
     */
    size_t batches_processed() const { return batches_processed_.load(); }

private:
    void observe_loop();
    void consume_loop();
    void close_inotify();

    Config config_;
    std::shared_ptr<NoteIndex> index_;
    std::shared_ptr<LinkRegistry> registry_;
    std::shared_ptr<Logger> logger_;

    int inotify_fd_ = -1;
    int watch_fd_ = -1;
    std::atomic<bool> running_{false};
    std::atomic<size_t> batches_processed_{0};
    std::unique_ptr<BoundedQueue<Batch>> queue_;
    std::thread observer_;
    std::thread consumer_;
};

}  // namespace zk
