/**
 * @file stream_parser.cpp
 * @brief Chunked stream decoding
 */

#include "soon/stream_parser.h"
#include "soon/evaluator.h"
#include "soon/lexer.h"

#include <exception>
#include <iostream>
#include <utility>

namespace soon {

namespace {

// Marks the parser as Emitting while user callbacks run
class EmittingScope {
public:
    explicit EmittingScope(StreamState& state) : state_(state), previous_(state) {
        state_ = StreamState::Emitting;
    }
    ~EmittingScope() { state_ = previous_; }

    EmittingScope(const EmittingScope&) = delete;
    EmittingScope& operator=(const EmittingScope&) = delete;

private:
    StreamState& state_;
    StreamState previous_;
};

bool is_blank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

const char* stream_state_name(StreamState state) {
    switch (state) {
        case StreamState::Idle:      return "idle";
        case StreamState::Buffering: return "buffering";
        case StreamState::Emitting:  return "emitting";
        case StreamState::Ended:     return "ended";
    }
    return "unknown";
}

StreamParser::StreamParser(const StreamOptions& options) : options_(options) {
    options_.parser.streaming = true;
}

void StreamParser::write(const std::string& data) {
    if (state_ == StreamState::Ended) {
        throw StreamError(ErrorCode::StreamClosed, "Cannot write to an ended stream");
    }
    if (state_ == StreamState::Emitting) {
        throw StreamError(ErrorCode::StreamClosed, "Cannot write to a stream from its own callback");
    }

    buffer_ += data;
    process_buffer(false);
    settle_state();
}

void StreamParser::end() {
    if (state_ == StreamState::Ended) {
        return;
    }
    if (state_ == StreamState::Emitting) {
        throw StreamError(ErrorCode::StreamClosed, "Cannot end a stream from its own callback");
    }

    process_buffer(true);

    std::string leftover;
    leftover.swap(buffer_);
    if (!is_blank(leftover)) {
        std::optional<Value> value;
        try {
            value = decode_payload(leftover);
        } catch (const DecodeError& e) {
            if (options_.verbose) {
                std::cerr << "[StreamParser] Dropped " << leftover.size()
                          << " bytes of trailing data: " << e.what() << std::endl;
            }
        }
        if (value) {
            Chunk chunk{next_id(""), std::move(*value)};
            ++chunks_emitted_;
            if (chunk_callback_) {
                EmittingScope scope(state_);
                chunk_callback_(chunk);
            }
        }
    }

    state_ = StreamState::Ended;
    if (options_.verbose) {
        std::cerr << "[StreamParser] Stream ended: " << chunks_emitted_ << " chunks, "
                  << errors_emitted_ << " errors" << std::endl;
    }
    if (end_callback_) {
        end_callback_();
    }
}

void StreamParser::process_buffer(bool final_pass) {
    std::vector<std::pair<std::string, std::string>> ready;  // (id, payload)
    size_t consumed = 0;
    size_t search = 0;

    while (true) {
        size_t open = buffer_.find('|', search);
        if (open == std::string::npos) break;
        size_t close = buffer_.find('|', open + 1);
        if (close == std::string::npos) break;

        size_t begin = close + 1;
        size_t stop = find_payload_end(begin);
        bool terminated = stop != std::string::npos;
        if (!terminated) {
            stop = buffer_.size();
        }

        // "||" or a delimiter with nothing after it yet: retry from the next pipe
        if (stop == begin) {
            search = open + 1;
            continue;
        }
        if (!terminated && !final_pass) {
            break;
        }

        ready.emplace_back(buffer_.substr(open + 1, close - open - 1),
                           buffer_.substr(begin, stop - begin));
        consumed = stop;
        search = stop;
    }

    if (consumed > 0) {
        buffer_.erase(0, consumed);
    }
    for (const auto& span : ready) {
        emit(span.first, span.second);
    }
}

size_t StreamParser::find_payload_end(size_t begin) const {
    bool in_string = false;
    for (size_t i = begin; i < buffer_.size(); ++i) {
        char c = buffer_[i];
        if (in_string) {
            if (c == '\\') {
                ++i;
            } else if (c == '"' || c == '\n') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '#') {
            size_t nl = buffer_.find('\n', i);
            if (nl == std::string::npos) break;
            i = nl;
        } else if (c == '|') {
            return i;
        }
    }
    return std::string::npos;
}

void StreamParser::emit(const std::string& id, const std::string& payload) {
    Value value;
    try {
        value = decode_payload(payload);
    } catch (const DecodeError& e) {
        ++errors_emitted_;
        if (options_.verbose) {
            std::cerr << "[StreamParser] Chunk '" << id << "' failed: " << e.what() << std::endl;
        }
        if (error_callback_) {
            EmittingScope scope(state_);
            error_callback_(e);
        }
        return;
    }

    Chunk chunk{next_id(id), std::move(value)};
    ++chunks_emitted_;
    if (options_.verbose) {
        std::cerr << "[StreamParser] Chunk '" << chunk.id << "' decoded ("
                  << payload.size() << " bytes)" << std::endl;
    }
    if (chunk_callback_) {
        EmittingScope scope(state_);
        chunk_callback_(chunk);
    }
}

Value StreamParser::decode_payload(const std::string& payload) const {
    try {
        Lexer lexer(payload);
        Parser parser(lexer.tokenize(), options_.parser);
        auto root = parser.parse();
        Evaluator evaluator;
        return evaluator.evaluate(*root);
    } catch (DecodeError& e) {
        e.attach_source(payload);
        throw;
    }
}

std::string StreamParser::next_id(const std::string& explicit_id) {
    if (!explicit_id.empty()) {
        return explicit_id;
    }
    return std::to_string(next_chunk_id_++);
}

void StreamParser::settle_state() {
    state_ = buffer_.empty() ? StreamState::Idle : StreamState::Buffering;
}

std::vector<Chunk> parse_stream(const std::vector<std::string>& pieces, const StreamOptions& options) {
    std::vector<Chunk> chunks;
    std::exception_ptr first_error;

    StreamParser stream(options);
    stream.on_chunk([&chunks](const Chunk& chunk) { chunks.push_back(chunk); });
    // Error callbacks run inside emit's handler, so the active exception keeps its real type
    stream.on_error([&first_error](const DecodeError&) {
        if (!first_error) {
            first_error = std::current_exception();
        }
    });

    for (const auto& piece : pieces) {
        stream.write(piece);
    }
    stream.end();

    if (first_error) {
        std::rethrow_exception(first_error);
    }
    return chunks;
}

} // namespace soon
