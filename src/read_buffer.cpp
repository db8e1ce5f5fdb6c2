// read_buffer.cpp - implementation of read_buffer_t

#include "serde/read_buffer.hpp"
#include "serde/error.hpp"

namespace serde {

read_buffer_t::read_buffer_t(std::string_view text)
    : data_(text)
    , exhausted_(true) {}

read_buffer_t::read_buffer_t(std::istream& stream, std::size_t chunk_size)
    : source_([&stream](char* data, std::size_t capacity) -> std::size_t {
          stream.read(data, static_cast<std::streamsize>(capacity));
          return static_cast<std::size_t>(stream.gcount());
      })
    , chunk_size_(chunk_size) {}

read_buffer_t::read_buffer_t(source_fn source, std::size_t chunk_size)
    : source_(std::move(source))
    , chunk_size_(chunk_size) {}

auto read_buffer_t::fill(std::size_t needed) -> bool {
    while (data_.size() - front_ < needed) {
        if (exhausted_) {
            return false;
        }
        if (front_ > 0 && front_ >= data_.size() / 2) {
            data_.erase(0, front_);
            front_ = 0;
        }
        auto size = data_.size();
        data_.resize(size + chunk_size_);
        auto count = source_(data_.data() + size, chunk_size_);
        data_.resize(size + count);
        if (count == 0) {
            exhausted_ = true;
        }
    }
    return true;
}

auto read_buffer_t::at_end() -> bool {
    return !fill(1);
}

auto read_buffer_t::peek(std::size_t offset) -> int {
    if (!fill(offset + 1)) {
        return eof;
    }
    return static_cast<unsigned char>(data_[front_ + offset]);
}

auto read_buffer_t::get() -> char {
    if (!fill(1)) {
        fail_end();
    }
    auto c = data_[front_++];
    if (c == '\n') {
        ++line_;
        column_ = 0;
    } else {
        ++column_;
    }
    return c;
}

void read_buffer_t::skip(std::size_t n) {
    for (std::size_t i = 0; i < n && fill(1); ++i) {
        get();
    }
}

auto read_buffer_t::starts_with(std::string_view prefix) -> bool {
    if (!fill(prefix.size())) {
        return false;
    }
    return std::string_view(data_).substr(front_, prefix.size()) == prefix;
}

void read_buffer_t::expect(char c) {
    if (at_end()) {
        fail_end();
    }
    if (peek() != static_cast<unsigned char>(c)) {
        fail(std::string("expected '") + c + "'");
    }
    get();
}

void read_buffer_t::expect(std::string_view prefix) {
    if (!starts_with(prefix)) {
        if (at_end()) {
            fail_end();
        }
        fail("expected '" + std::string(prefix) + "'");
    }
    skip(prefix.size());
}

void read_buffer_t::skip_whitespace() {
    while (true) {
        auto c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            get();
        } else {
            return;
        }
    }
}

void read_buffer_t::skip_blanks() {
    while (peek() == ' ' || peek() == '\t') {
        get();
    }
}

auto read_buffer_t::position() const -> std::string {
    return "line " + std::to_string(line_) + ", column " + std::to_string(column_);
}

void read_buffer_t::fail(const std::string& message) const {
    throw syntax_error_t(message, line_, column_);
}

void read_buffer_t::fail_end() const {
    throw unexpected_end_t(line_, column_);
}

} // namespace serde
