/**
 * @file stream_parser.h
 * @brief Incremental decoding of |id|payload chunk streams
 *
 * Text arrives through write() in arbitrary pieces. A chunk is complete once
 * the delimiter of the next chunk (an unquoted '|') has arrived, or when the
 * stream ends, so the emitted chunks depend only on the concatenated input
 * and never on where it was split.
 *
 * Usage:
 *   soon::StreamParser stream;
 *   stream.on_chunk([](const soon::Chunk& c) { ... });
 *   stream.on_error([](const soon::DecodeError& e) { ... });
 *   stream.write("|c1|\nname John");
 *   stream.write("|c2|\nage 30");
 *   stream.end();
 */

#pragma once

#include "soon/errors.h"
#include "soon/parser.h"
#include "soon/value.h"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace soon {

struct StreamOptions {
    ParserOptions parser;    // applied to every chunk payload
    bool verbose = false;    // log chunk activity to std::cerr
};

struct Chunk {
    std::string id;
    Value value;
};

enum class StreamState {
    Idle,        // buffer empty
    Buffering,   // holding an incomplete chunk
    Emitting,    // inside a callback
    Ended
};

const char* stream_state_name(StreamState state);

class StreamParser {
public:
    using ChunkCallback = std::function<void(const Chunk&)>;
    using ErrorCallback = std::function<void(const DecodeError&)>;
    using EndCallback = std::function<void()>;

    explicit StreamParser(const StreamOptions& options = StreamOptions{});

    void on_chunk(ChunkCallback callback) { chunk_callback_ = std::move(callback); }
    void on_error(ErrorCallback callback) { error_callback_ = std::move(callback); }
    void on_end(EndCallback callback) { end_callback_ = std::move(callback); }

    /**
     * @brief Append text and emit every chunk it completes
     * @throws StreamError after end() or when called from a callback
     */
    void write(const std::string& data);

    /**
     * @brief Flush the trailing chunk and finish the stream
     *
     * Undelimited leftover text gets one best-effort decode; a failure there
     * is dropped. Calling end() twice has no further effect.
     */
    void end();

    StreamState state() const { return state_; }
    bool is_ended() const { return state_ == StreamState::Ended; }
    size_t buffered_size() const { return buffer_.size(); }
    uint64_t chunks_emitted() const { return chunks_emitted_; }
    uint64_t errors_emitted() const { return errors_emitted_; }

private:
    void process_buffer(bool final_pass);
    size_t find_payload_end(size_t begin) const;
    void emit(const std::string& id, const std::string& payload);
    Value decode_payload(const std::string& payload) const;
    std::string next_id(const std::string& explicit_id);
    void settle_state();

    StreamOptions options_;
    ChunkCallback chunk_callback_;
    ErrorCallback error_callback_;
    EndCallback end_callback_;

    std::string buffer_;
    uint64_t next_chunk_id_ = 0;
    uint64_t chunks_emitted_ = 0;
    uint64_t errors_emitted_ = 0;
    StreamState state_ = StreamState::Idle;
};

/**
 * @brief Feed @p pieces through a StreamParser and collect the chunks
 * @throws LexError, ParseError or EvalError: the first chunk error, rethrown once the stream has ended
 */
std::vector<Chunk> parse_stream(const std::vector<std::string>& pieces,
                                const StreamOptions& options = StreamOptions{});

} // namespace soon
