#include "./pipe.hpp"

#include "./error.hpp"
#include "./log.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <utility>

using namespace tpipe;

/**
 * @brief The buffer and bookkeeping shared by every endpoint of a pipe.
 *
 * `bytes`, `drained` and `corrupted` are guarded by `mutex`. The endpoint counters are atomics so
 * that they can be observed without the lock. Every change to any of them is followed by a
 * notification on `cv`.
 *
 * Nothing is logged while `mutex` is held, so log handlers are free to use the pipe.
 */
struct tpipe::detail::pipe_state {
    explicit pipe_state(pipe_options opts) noexcept
        : max_buffered(opts.max_buffered) {}

    std::mutex              mutex;
    std::condition_variable cv;
    std::deque<std::byte>   bytes;
    /// Total number of bytes ever removed from the front of `bytes`
    std::size_t drained = 0;
    /// Set if an exception interrupted a modification of `bytes`
    bool              corrupted = false;
    const std::size_t max_buffered;

    std::atomic<std::size_t> readers{0};
    std::atomic<std::size_t> writers{0};

    bool has_readers() const noexcept { return readers.load(std::memory_order_acquire) != 0; }
    bool has_writers() const noexcept { return writers.load(std::memory_order_acquire) != 0; }

    /// The number of bytes that can be appended before hitting the ceiling
    std::size_t space() const noexcept { return max_buffered - bytes.size(); }

    /// Throw if the buffer is corrupted. `lk` is released first.
    void throw_if_corrupted(std::unique_lock<std::mutex>& lk) const {
        if (corrupted) {
            lk.unlock();
            log_error("Access to pipe {} after its buffer was corrupted",
                      static_cast<const void*>(this));
            throw_for_pipe_errc(pipe_errc::corrupted,
                                "The pipe buffer was left inconsistent by an earlier failure");
        }
    }

    /// Acquire the buffer lock
    [[nodiscard]] std::unique_lock<std::mutex> lock() {
        std::unique_lock lk{mutex};
        throw_if_corrupted(lk);
        return lk;
    }

    /**
     * @brief Block until `pred()` holds.
     *
     * `pred` is re-evaluated after every wake-up, whatever its cause. `lk` must hold `mutex`.
     */
    template <typename Pred>
    void wait(std::unique_lock<std::mutex>& lk, Pred&& pred) {
        while (!pred()) {
            cv.wait(lk);
            throw_if_corrupted(lk);
        }
    }

    /// Wake the waiters so they re-check their conditions
    void notify() noexcept { cv.notify_all(); }
};

namespace {

using detail::pipe_state;
using counter_ptr = std::atomic<std::size_t> pipe_state::*;

/**
 * @brief Marks the pipe as corrupted if an exception leaves the scope.
 *
 * Wrap every modification of the buffer that is not known to be exception-free.
 */
class mutation_scope {
    pipe_state& _st;
    int         _n_uncaught = std::uncaught_exceptions();

public:
    explicit mutation_scope(pipe_state& st) noexcept
        : _st(st) {}

    ~mutation_scope() {
        if (std::uncaught_exceptions() > _n_uncaught) {
            _st.corrupted = true;
            _st.notify();
        }
    }

    mutation_scope(mutation_scope&&) = delete;
    mutation_scope& operator=(mutation_scope&&) = delete;
};

void append(pipe_state& st, const_buffer buf) {
    mutation_scope scope{st};
    st.bytes.insert(st.bytes.end(), buf.data(), buf.data() + buf.size());
}

/// Move the first `n` buffered bytes into raw memory
void drain_into(pipe_state& st, std::byte* out, std::size_t n) {
    mutation_scope scope{st};
    auto           first = st.bytes.begin();
    auto           last  = first + static_cast<std::ptrdiff_t>(n);
    std::copy(first, last, out);
    st.bytes.erase(first, last);
    st.drained += n;
}

/// Remove the first `n` buffered bytes
void discard(pipe_state& st, std::size_t n) noexcept {
    auto first = st.bytes.begin();
    st.bytes.erase(first, first + static_cast<std::ptrdiff_t>(n));
    st.drained += n;
}

/// Move the first `n` buffered bytes to the end of `out`
void drain_append(pipe_state& st, std::string& out, std::size_t n) {
    const auto old_size = out.size();
    // If this throws, neither the pipe nor `out` have been modified
    out.resize(old_size + n);
    mutation_scope scope{st};
    auto           first = st.bytes.begin();
    auto           last  = first + static_cast<std::ptrdiff_t>(n);
    std::transform(first, last, out.begin() + static_cast<std::ptrdiff_t>(old_size), [](auto b) {
        return static_cast<char>(b);
    });
    st.bytes.erase(first, last);
    st.drained += n;
}

void attach(pipe_state& st, counter_ptr counter) noexcept {
    (st.*counter).fetch_add(1, std::memory_order_acq_rel);
}

void detach(pipe_state& st, counter_ptr counter) noexcept {
    if ((st.*counter).fetch_sub(1, std::memory_order_acq_rel) == 1) {
        // Waiters check the counter while holding the lock. Taking it here ensures that nobody is
        // between such a check and cv.wait() when the notification is sent.
        std::lock_guard lk{st.mutex};
        st.notify();
    }
}

/**
 * @brief Wait until a writer may append, or throw if no reader remains.
 *
 * @param need_space If true, also wait until the buffer is below its ceiling
 */
void wait_writable(pipe_state& st, std::unique_lock<std::mutex>& lk, bool need_space) {
    st.wait(lk, [&] { return !st.has_readers() || !need_space || st.space() != 0; });
    if (!st.has_readers()) {
        lk.unlock();
        log_debug("Write to pipe {} with no open readers", static_cast<const void*>(&st));
        throw_for_pipe_errc(pipe_errc::broken_pipe, "Write to a pipe with no open readers");
    }
}

}  // namespace

pipe_pair tpipe::create_pipe(pipe_options opts) {
    neo_assert(expects,
               opts.max_buffered != 0,
               "A pipe must be able to buffer at least one byte",
               opts.max_buffered);
    auto st = std::make_shared<pipe_state>(opts);
    log_trace("Created pipe {} [max_buffered={}]",
              static_cast<const void*>(st.get()),
              opts.max_buffered);
    return pipe_pair{pipe_reader(st), pipe_writer(std::move(st))};
}

pipe_reader::pipe_reader(std::shared_ptr<pipe_state> st) noexcept
    : _state(std::move(st)) {
    attach(*_state, &pipe_state::readers);
}

pipe_reader pipe_reader::duplicate() const {
    auto& st = _checked_state();
    log_trace("Duplicated a reader of pipe {}", static_cast<const void*>(&st));
    return pipe_reader(_state);
}

void pipe_reader::close() noexcept {
    if (auto st = std::move(_state)) {
        detach(*st, &pipe_state::readers);
    }
}

bool pipe_reader::has_writers() const noexcept { return _state && _state->has_writers(); }

pipe_state& pipe_reader::_checked_state() const {
    neo_assert(expects, _state != nullptr, "Attempted to read data from a closed pipe_reader");
    return *_state;
}

std::size_t pipe_reader::do_read_some(mutable_buffer buf) {
    auto& st = _checked_state();
    if (buf.size() == 0) {
        return 0;
    }
    auto lk = st.lock();
    // An empty buffer is not the end of the stream while a writer may still add to it
    st.wait(lk, [&] { return !st.bytes.empty() || !st.has_writers(); });
    const auto n = std::min(buf.size(), st.bytes.size());
    if (n == 0) {
        return 0;
    }
    drain_into(st, buf.data(), n);
    st.notify();
    return n;
}

void pipe_reader::do_read_exact(mutable_buffer buf) {
    auto& st = _checked_state();
    auto  lk = st.lock();
    while (buf.size() != 0) {
        // A request larger than the ceiling could never be buffered all at once, so it is taken
        // in ceiling-sized pieces
        const auto want = std::min(buf.size(), st.max_buffered);
        st.wait(lk, [&] { return st.bytes.size() >= want || !st.has_writers(); });
        if (st.bytes.size() < want) {
            const auto have = st.bytes.size();
            lk.unlock();
            log_debug("Exact read of {} bytes from pipe {} failed: {} buffered and no open writers",
                      want,
                      static_cast<const void*>(&st),
                      have);
            throw_for_pipe_errc(pipe_errc::unexpected_eof,
                                neo::ufmt("Exact read of {} bytes from a pipe with no open writers "
                                          "and only {} bytes remaining",
                                          want,
                                          have));
        }
        drain_into(st, buf.data(), want);
        buf += want;
        st.notify();
    }
}

std::size_t pipe_reader::do_read_until(char delim, std::string& out) {
    auto&      st         = _checked_state();
    auto       lk         = st.lock();
    const auto delim_byte = static_cast<std::byte>(delim);

    // Stream offset up to which the buffer is known to hold no delimiter. Only the bytes after it
    // are searched on each wake-up. Other readers may drain from the front in the meantime.
    std::size_t                clean_until = st.drained;
    std::optional<std::size_t> line_len;
    st.wait(lk, [&] {
        const auto skip = clean_until > st.drained ? clean_until - st.drained : 0;
        const auto it   = std::find(st.bytes.begin() + static_cast<std::ptrdiff_t>(skip),
                                  st.bytes.end(),
                                  delim_byte);
        if (it != st.bytes.end()) {
            line_len = static_cast<std::size_t>(it - st.bytes.begin()) + 1;
            return true;
        }
        clean_until = st.drained + st.bytes.size();
        // A full buffer without a delimiter is handed over as-is, so writers can continue
        return !st.has_writers() || st.bytes.size() >= st.max_buffered;
    });

    const auto n = line_len.value_or(st.bytes.size());
    if (n == 0) {
        return 0;
    }
    drain_append(st, out, n);
    st.notify();
    return n;
}

std::size_t pipe_reader::do_read_to_end(std::string& out) {
    auto&       st    = _checked_state();
    auto        lk    = st.lock();
    std::size_t total = 0;
    while (true) {
        st.wait(lk, [&] { return !st.has_writers() || st.bytes.size() >= st.max_buffered; });
        // Check before draining: writers cannot append while we hold the lock, so if none remain
        // now, what we take is the last of the data.
        const bool finished = !st.has_writers();
        const auto n        = st.bytes.size();
        if (n != 0) {
            drain_append(st, out, n);
            total += n;
            st.notify();
        }
        if (finished) {
            return total;
        }
    }
}

std::size_t pipe_reader::do_read_to_string(std::string& out) {
    auto&       st = _checked_state();
    auto        lk = st.lock();
    std::string text;
    while (true) {
        st.wait(lk, [&] { return !st.has_writers() || st.bytes.size() >= st.max_buffered; });
        if (!st.has_writers()) {
            break;
        }
        // Writers cannot finish until a full buffer is emptied, so this part is taken before the
        // text as a whole can be checked
        drain_append(st, text, st.bytes.size());
        st.notify();
    }
    const auto taken = text.size();
    const auto n     = st.bytes.size();
    text.resize(taken + n);
    std::transform(st.bytes.begin(),
                   st.bytes.end(),
                   text.begin() + static_cast<std::ptrdiff_t>(taken),
                   [](auto b) { return static_cast<char>(b); });
    // Throws with the buffered bytes still in place
    check_text(text, "Pipe content is not valid UTF-8");
    out.reserve(out.size() + text.size());
    discard(st, n);
    st.notify();
    out.append(text);
    return text.size();
}

pipe_writer::pipe_writer(std::shared_ptr<pipe_state> st) noexcept
    : _state(std::move(st)) {
    attach(*_state, &pipe_state::writers);
}

pipe_writer pipe_writer::duplicate() const {
    auto& st = _checked_state();
    log_trace("Duplicated a writer of pipe {}", static_cast<const void*>(&st));
    return pipe_writer(_state);
}

void pipe_writer::close() noexcept {
    if (auto st = std::move(_state)) {
        detach(*st, &pipe_state::writers);
    }
}

bool pipe_writer::has_readers() const noexcept { return _state && _state->has_readers(); }

pipe_state& pipe_writer::_checked_state() const {
    neo_assert(expects, _state != nullptr, "Attempted to write data to a closed pipe_writer");
    return *_state;
}

std::size_t pipe_writer::do_write(const_buffer buf) {
    auto& st = _checked_state();
    auto  lk = st.lock();
    wait_writable(st, lk, buf.size() != 0);
    const auto n = std::min(buf.size(), st.space());
    if (n == 0) {
        return 0;
    }
    append(st, buf.first(n));
    st.notify();
    return n;
}

void pipe_writer::do_write_all(const_buffer buf) {
    auto& st = _checked_state();
    auto  lk = st.lock();
    wait_writable(st, lk, buf.size() != 0);
    while (buf.size() != 0) {
        const auto n = std::min(buf.size(), st.space());
        append(st, buf.first(n));
        buf += n;
        st.notify();
        if (buf.size() != 0) {
            wait_writable(st, lk, true);
        }
    }
}

void tpipe::detail::run_buffer_mutation(const pipe_writer& w, const std::function<void()>& fn) {
    auto&          st = w._checked_state();
    auto           lk = st.lock();
    mutation_scope scope{st};
    fn();
}
