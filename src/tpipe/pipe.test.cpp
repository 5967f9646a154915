#include "./pipe.hpp"

#include "./error.hpp"
#include "./log.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

using namespace std::literals;

namespace {

/// Long enough that a thread which should be blocked would have finished by now otherwise
constexpr auto settle_time = 50ms;

/// Route log messages to a handler for the duration of a test
struct scoped_log_handler {
    tpipe::log_level prev_level = tpipe::get_log_level();

    scoped_log_handler(tpipe::log_level lvl, tpipe::log_handler h) {
        tpipe::set_log_handler(std::move(h));
        tpipe::set_log_level(lvl);
    }

    ~scoped_log_handler() {
        tpipe::set_log_handler({});
        tpipe::set_log_level(prev_level);
    }
};

}  // namespace

TEST_CASE("Create a pipe") {
    auto p = tpipe::create_pipe();
    p.writer.write("I am a string"sv);
    auto b = p.reader.read(388);
    CHECK(b == "I am a string");

    p.writer.write("foobar"sv);
    b = p.reader.read(3);
    CHECK(b == "foo");
    b = p.reader.read(3);
    CHECK(b == "bar");
}

TEST_CASE("Exact read of data that is already buffered") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;
    writer.write_all("Hello"sv);
    CHECK(reader.read_exact(5) == "Hello");
}

TEST_CASE("Two threads talk over a pair of pipes") {
    auto a_to_b = tpipe::create_pipe();
    auto b_to_a = tpipe::create_pipe();

    std::string a_got;
    std::string b_got;
    std::thread thread_a{[&] {
        a_to_b.writer.write_all("Hello"sv);
        a_got = b_to_a.reader.read_exact(5);
    }};
    std::thread thread_b{[&] {
        b_got = a_to_b.reader.read_exact(5);
        b_to_a.writer.write_all("World"sv);
    }};
    thread_a.join();
    thread_b.join();
    CHECK(a_got == "World");
    CHECK(b_got == "Hello");
}

TEST_CASE("Writing with no readers is a broken pipe") {
    auto writer = std::move(tpipe::create_pipe().writer);
    CHECK_FALSE(writer.has_readers());
    CHECK_THROWS_AS(writer.write("x"sv), tpipe::broken_pipe_error);
    CHECK_THROWS_AS(writer.write_all("Hello"sv), tpipe::broken_pipe_error);
    // Even an empty write is diagnosed
    CHECK_THROWS_AS(writer.write(""sv), tpipe::broken_pipe_error);

    try {
        writer.write("x"sv);
        FAIL("Write to pipe with no readers succeeded");
    } catch (const tpipe::pipe_error& e) {
        CHECK(e.code() == tpipe::pipe_errc::broken_pipe);
        CHECK(e.code() == std::errc::broken_pipe);
    }
}

TEST_CASE("Exact read with too little data and no writers") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;
    writer.write_all("Hi"sv);
    writer.close();
    CHECK_FALSE(reader.has_writers());
    CHECK_THROWS_AS(reader.read_exact(5), tpipe::unexpected_eof_error);
    // Nothing was consumed by the failed read
    CHECK(reader.read_exact(2) == "Hi");
    CHECK_THROWS_AS(reader.read_exact(1), tpipe::unexpected_eof_error);
    // A zero-length exact read always succeeds
    CHECK(reader.read_exact(0) == "");
}

TEST_CASE("Read lines until the writer goes away") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;
    writer.write_all("line1\nline2"sv);
    writer.close();
    CHECK(reader.read_line() == "line1\n");
    CHECK(reader.read_line() == "line2");
    CHECK(reader.read_line() == "");
}

TEST_CASE("Read blocks until data arrives") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::atomic<bool> done{false};
    std::string       got;
    std::thread       t{[&] {
        got = reader.read(64);
        done.store(true);
    }};
    std::this_thread::sleep_for(settle_time);
    CHECK_FALSE(done.load());
    writer.write_all("abc"sv);
    t.join();
    CHECK(got == "abc");
}

TEST_CASE("Read returns nothing once all writers are gone") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;
    writer.write_all("tail"sv);

    std::string got;
    std::thread t{[&] {
        got = reader.read(2);
        got += reader.read(64);
        // Blocks until the writer is closed, then reports end-of-stream
        got += std::to_string(reader.read(64).size());
    }};
    std::this_thread::sleep_for(settle_time);
    writer.close();
    t.join();
    CHECK(got == "tail0");

    std::string empty;
    CHECK(reader.read_into(empty) == 0);
}

TEST_CASE("Exact read waits for enough data") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::atomic<bool> done{false};
    std::string       got;
    std::thread       t{[&] {
        got = reader.read_exact(6);
        done.store(true);
    }};
    writer.write_all("abc"sv);
    std::this_thread::sleep_for(settle_time);
    CHECK_FALSE(done.load());
    writer.write_all("defg"sv);
    t.join();
    CHECK(got == "abcdef");
    CHECK(reader.read(10) == "g");
}

TEST_CASE("Closing the writer wakes a blocked exact read") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;
    writer.write_all("abc"sv);

    std::atomic<bool> got_eof{false};
    std::thread       t{[&] {
        try {
            (void)reader.read_exact(6);
        } catch (const tpipe::unexpected_eof_error&) {
            got_eof.store(true);
        }
    }};
    std::this_thread::sleep_for(settle_time);
    writer.close();
    t.join();
    CHECK(got_eof.load());
    CHECK(reader.read() == "abc");
}

TEST_CASE("Read until a delimiter") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;
    writer.write_all("key=value;rest"sv);

    std::string out = "prefix:";
    CHECK(reader.read_until('=', out) == 4);
    CHECK(out == "prefix:key=");
    CHECK(reader.read_until(';') == "value;");

    SECTION("The delimiter arrives later") {
        std::string got;
        std::thread t{[&] { got = reader.read_until(';'); }};
        std::this_thread::sleep_for(settle_time);
        writer.write_all("-more"sv);
        std::this_thread::sleep_for(settle_time);
        writer.write_all("-end;after"sv);
        t.join();
        CHECK(got == "rest-more-end;");
        CHECK(reader.read(100) == "after");
    }

    SECTION("The stream ends without a delimiter") {
        std::string got;
        std::thread t{[&] { got = reader.read_until(';'); }};
        std::this_thread::sleep_for(settle_time);
        writer.close();
        t.join();
        CHECK(got == "rest");
        std::string tail;
        CHECK(reader.read_until(';', tail) == 0);
        CHECK(tail.empty());
    }
}

TEST_CASE("Text reads reject invalid UTF-8") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;

    SECTION("read_line") {
        writer.write_all("ok\n\xff\xfe bad\nafter\n"sv);
        CHECK(reader.read_line() == "ok\n");
        std::string out = "unchanged";
        try {
            reader.read_line(out);
            FAIL("Invalid UTF-8 was accepted");
        } catch (const tpipe::invalid_data_error& e) {
            CHECK(e.code() == tpipe::pipe_errc::invalid_data);
            CHECK(e.code() == std::errc::illegal_byte_sequence);
        }
        CHECK(out == "unchanged");
        // The bad line was consumed
        CHECK(reader.read_line() == "after\n");
    }

    SECTION("read_to_string") {
        writer.write_all("caf\xc3"sv);
        writer.close();
        std::string out;
        CHECK_THROWS_AS(reader.read_to_string(out), tpipe::invalid_data_error);
        CHECK(out.empty());
        // The rejected bytes are still in the pipe
        CHECK(reader.read() == "caf\xc3"sv);
    }

    SECTION("Valid multi-byte text") {
        writer.write_all("€42\n"sv);
        writer.close();
        std::string out;
        CHECK(reader.read_to_string(out) == 6);
        CHECK(out == "€42\n");
    }
}

TEST_CASE("Read to the end of the stream") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::atomic<bool> done{false};
    std::string       got;
    std::thread       t{[&] {
        got = reader.read();
        done.store(true);
    }};
    writer.write_all("one "sv);
    writer.write_all("two "sv);
    std::this_thread::sleep_for(settle_time);
    CHECK_FALSE(done.load());
    writer.write_all("three"sv);
    writer.close();
    t.join();
    CHECK(got == "one two three");

    // Once drained, every later call finds nothing
    std::string out;
    CHECK(reader.read_to_end(out) == 0);
    CHECK(reader.read_to_end(out) == 0);
    CHECK(out.empty());
}

TEST_CASE("Bytes arrive in the order they were written") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::string expect;
    for (int i = 0; i < 500; ++i) {
        expect += std::to_string(i);
        expect.append(static_cast<std::size_t>(i % 13), static_cast<char>('a' + i % 26));
    }

    std::thread t{[&, w = std::move(writer)]() mutable {
        std::size_t pos = 0;
        for (int i = 0; pos < expect.size(); ++i) {
            auto n = std::min(static_cast<std::size_t>(1 + i % 17), expect.size() - pos);
            w.write_all(std::string_view(expect).substr(pos, n));
            pos += n;
        }
    }};

    std::string got;
    while (true) {
        auto chunk = reader.read(7);
        if (chunk.empty()) {
            break;
        }
        got += chunk;
    }
    t.join();
    CHECK(got == expect);
}

TEST_CASE("Several writers feed one reader") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::vector<std::thread> threads;
    for (char c : "abcd"sv) {
        threads.emplace_back([c, w = writer.duplicate()]() mutable {
            for (int i = 0; i < 100; ++i) {
                w.write_all(std::string(3, c));
            }
        });
    }
    // Only the duplicates keep the pipe open
    writer.close();
    CHECK(reader.has_writers());

    auto all = reader.read();
    for (auto& t : threads) {
        t.join();
    }
    CHECK_FALSE(reader.has_writers());
    REQUIRE(all.size() == 1200);
    for (char c : "abcd"sv) {
        CHECK(std::count(all.begin(), all.end(), c) == 300);
    }
}

TEST_CASE("Several readers share one writer") {
    auto  p       = tpipe::create_pipe();
    auto& reader  = p.reader;
    auto& writer  = p.writer;
    auto  reader2 = reader.duplicate();

    std::atomic<std::size_t> total{0};
    auto                     drain = [&](tpipe::pipe_reader& r) {
        while (true) {
            auto chunk = r.read(1);
            if (chunk.empty()) {
                return;
            }
            total += chunk.size();
        }
    };
    std::thread t1{[&] { drain(reader); }};
    std::thread t2{[&] { drain(reader2); }};
    for (int i = 0; i < 1000; ++i) {
        writer.write_all("x"sv);
    }
    writer.close();
    t1.join();
    t2.join();
    CHECK(total.load() == 1000);

    // The writer only sees a broken pipe once every reader is closed
    auto q = tpipe::create_pipe();
    auto r = q.reader.duplicate();
    q.reader.close();
    CHECK(q.writer.has_readers());
    CHECK(q.writer.write("ok"sv) == 2);
    r.close();
    CHECK_THROWS_AS(q.writer.write("no"sv), tpipe::broken_pipe_error);
}

TEST_CASE("Writes are truncated at the buffer ceiling") {
    auto  p      = tpipe::create_pipe({.max_buffered = 4});
    auto& reader = p.reader;
    auto& writer = p.writer;
    CHECK(writer.write("abcdefgh"sv) == 4);
    CHECK(reader.read(2) == "ab");
    CHECK(writer.write("xyz"sv) == 2);
    CHECK(reader.read(100) == "cdxy");
}

TEST_CASE("A write to a full buffer waits for space") {
    auto  p      = tpipe::create_pipe({.max_buffered = 4});
    auto& reader = p.reader;
    auto& writer = p.writer;
    CHECK(writer.write("abcd"sv) == 4);

    std::atomic<bool> done{false};
    std::size_t       n = 0;
    std::thread       t{[&] {
        n = writer.write("efgh"sv);
        done.store(true);
    }};
    std::this_thread::sleep_for(settle_time);
    CHECK_FALSE(done.load());
    CHECK(reader.read(1) == "a");
    t.join();
    CHECK(n == 1);
    CHECK(reader.read(100) == "bcde");
}

TEST_CASE("A full write is delivered through a small buffer") {
    auto  p      = tpipe::create_pipe({.max_buffered = 4});
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::string msg;
    for (int i = 0; i < 64; ++i) {
        msg += static_cast<char>('A' + i % 26);
    }
    std::thread t{[&, w = std::move(writer)]() mutable { w.write_all(msg); }};
    auto        got = reader.read();
    t.join();
    CHECK(got == msg);
}

TEST_CASE("A write blocked on a full buffer fails when the readers go away") {
    auto  p      = tpipe::create_pipe({.max_buffered = 2});
    auto& reader = p.reader;
    auto& writer = p.writer;
    writer.write_all("ab"sv);

    std::atomic<bool> got_broken_pipe{false};
    std::thread       t{[&] {
        try {
            writer.write_all("cd"sv);
        } catch (const tpipe::broken_pipe_error&) {
            got_broken_pipe.store(true);
        }
    }};
    std::this_thread::sleep_for(settle_time);
    CHECK_FALSE(got_broken_pipe.load());
    reader.close();
    t.join();
    CHECK(got_broken_pipe.load());
}

TEST_CASE("Reads larger than the buffer ceiling") {
    auto  p      = tpipe::create_pipe({.max_buffered = 3});
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::thread t{[&, w = std::move(writer)]() mutable {
        w.write_all("0123456789;"sv);
        w.write_all("abcdefgh"sv);
    }};
    CHECK(reader.read_exact(5) == "01234");
    // A full buffer with no delimiter is handed over as it is
    std::string part;
    while (part.empty() || part.back() != ';') {
        reader.read_until(';', part);
    }
    CHECK(part == "56789;");
    CHECK(reader.read() == "abcdefgh");
    t.join();
}

TEST_CASE("Moving and closing endpoints") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;
    CHECK(reader.is_open());
    CHECK(writer.is_open());

    tpipe::pipe_writer other = std::move(writer);
    CHECK_FALSE(writer.is_open());
    CHECK(other.is_open());
    CHECK(reader.has_writers());

    // Assigning over an open writer closes it
    other = tpipe::pipe_writer();
    CHECK_FALSE(other.is_open());
    CHECK_FALSE(reader.has_writers());
    CHECK(reader.read() == "");

    // Closing twice is harmless
    reader.close();
    reader.close();
    CHECK_FALSE(reader.is_open());
    CHECK_FALSE(reader.has_writers());
}

TEST_CASE("Flushing a writer does nothing") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;
    writer.write_all("data"sv);
    writer.flush();
    CHECK(reader.read(4) == "data");
}

TEST_CASE("Text read through a buffer smaller than the text") {
    auto  p      = tpipe::create_pipe({.max_buffered = 4});
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::thread feed{[&] {
        writer.write_all("Grüße aus Köln"sv);
        writer.close();
    }};
    std::string out;
    CHECK(reader.read_to_string(out) == 17);
    feed.join();
    CHECK(out == "Grüße aus Köln");
}

TEST_CASE("A failure while changing the buffer corrupts the pipe") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;

    std::mutex               log_mutex;
    std::vector<std::string> errors;
    scoped_log_handler       logs{tpipe::log_level::error,
                            [&](tpipe::log_level, std::string_view msg) {
                                std::lock_guard lk{log_mutex};
                                errors.emplace_back(msg);
                            }};

    writer.write_all("abc"sv);
    std::atomic<bool> woken_by_corruption = false;
    std::thread       blocked{[&] {
        try {
            (void)reader.duplicate().read_exact(10);
        } catch (const tpipe::pipe_corrupted_error&) {
            woken_by_corruption = true;
        }
    }};
    std::this_thread::sleep_for(settle_time);

    CHECK_THROWS_AS(tpipe::detail::run_buffer_mutation(
                        writer, [] { throw std::runtime_error("Interrupted mid-change"); }),
                    std::runtime_error);
    blocked.join();
    CHECK(woken_by_corruption.load());

    CHECK_THROWS_AS(reader.read(1), tpipe::pipe_corrupted_error);
    CHECK_THROWS_AS(reader.read_exact(1), tpipe::pipe_corrupted_error);
    CHECK_THROWS_AS(reader.read_line(), tpipe::pipe_corrupted_error);
    CHECK_THROWS_AS(reader.read(), tpipe::pipe_corrupted_error);
    CHECK_THROWS_AS(writer.write("x"sv), tpipe::pipe_corrupted_error);
    CHECK_THROWS_AS(writer.write_all("x"sv), tpipe::pipe_corrupted_error);
    auto other_writer = writer.duplicate();
    CHECK_THROWS_AS(other_writer.write_all("x"sv), tpipe::pipe_corrupted_error);

    try {
        (void)reader.read(1);
        FAIL("Read from a corrupted pipe succeeded");
    } catch (const tpipe::pipe_error& e) {
        CHECK(e.code() == tpipe::pipe_errc::corrupted);
        CHECK(e.code() == std::errc::state_not_recoverable);
    }

    std::lock_guard lk{log_mutex};
    CHECK_FALSE(errors.empty());
}

TEST_CASE("A log handler may use the pipe that is logging") {
    auto  p      = tpipe::create_pipe();
    auto& reader = p.reader;
    auto& writer = p.writer;

    SECTION("Failed exact read") {
        writer.write_all("ab"sv);
        writer.close();
        std::string        drained;
        scoped_log_handler logs{tpipe::log_level::debug, [&](tpipe::log_level, std::string_view) {
                                    drained += reader.read();
                                }};
        CHECK_THROWS_AS(reader.read_exact(4), tpipe::unexpected_eof_error);
        CHECK(drained == "ab");
    }

    SECTION("Broken pipe") {
        reader.close();
        int                n_messages = 0;
        scoped_log_handler logs{tpipe::log_level::debug, [&](tpipe::log_level, std::string_view) {
                                    if (++n_messages == 1) {
                                        // Logs again from inside the handler
                                        CHECK_THROWS_AS(writer.write("y"sv),
                                                        tpipe::broken_pipe_error);
                                    }
                                }};
        CHECK_THROWS_AS(writer.write("x"sv), tpipe::broken_pipe_error);
        CHECK(n_messages == 2);
    }
}

