#pragma once
// Copyright (c) 2024-2026 The ELMS Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace core {

// ---------------------------------------------------------------------------
// DataStream -- append-only serialization buffer
// ---------------------------------------------------------------------------
// Default sink for the ser_write_* helpers. Covenant witness items and
// sighash preimage fields are assembled through it.
// ---------------------------------------------------------------------------
class DataStream {
public:
    DataStream() = default;

    explicit DataStream(std::vector<uint8_t> data)
        : buf_(std::move(data)) {}

    void write(std::span<const uint8_t> data) {
        buf_.insert(buf_.end(), data.begin(), data.end());
    }

    [[nodiscard]] size_t size() const noexcept { return buf_.size(); }
    [[nodiscard]] bool empty() const noexcept { return buf_.empty(); }

    [[nodiscard]] std::span<const uint8_t> view() const noexcept {
        return std::span<const uint8_t>(buf_);
    }

    /// Move the internal buffer out.  Resets the stream to empty state.
    [[nodiscard]] std::vector<uint8_t> release() {
        std::vector<uint8_t> out = std::move(buf_);
        buf_.clear();
        return out;
    }

    void clear() { buf_.clear(); }

private:
    std::vector<uint8_t> buf_;
};

// ---------------------------------------------------------------------------
// VectorWriter -- write-only stream that appends to an external vector
// ---------------------------------------------------------------------------
// Does not own the vector; the caller must ensure the referenced vector
// outlives the writer.
// ---------------------------------------------------------------------------
class VectorWriter {
public:
    explicit VectorWriter(std::vector<uint8_t>& vec) : vec_(vec) {}

    void write(std::span<const uint8_t> data) {
        vec_.insert(vec_.end(), data.begin(), data.end());
    }

private:
    std::vector<uint8_t>& vec_;
};

}  // namespace core
