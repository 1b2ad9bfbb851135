#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sharemesh::protocol {

// Big-endian field writer shared by the frame and manifest codecs.
class ByteWriter {
public:
    explicit ByteWriter(std::vector<std::uint8_t>& out) : out_(out) {}

    void u8(std::uint8_t value) { out_.push_back(value); }

    void u16(std::uint16_t value) {
        out_.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
        out_.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    }

    void u32(std::uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
        }
    }

    void u64(std::uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            out_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
        }
    }

    template <std::size_t N>
    void fixed(const std::array<std::uint8_t, N>& bytes) {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void blob(std::span<const std::uint8_t> bytes) {
        u32(static_cast<std::uint32_t>(bytes.size()));
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void text(std::string_view value) {
        u32(static_cast<std::uint32_t>(value.size()));
        out_.insert(out_.end(), value.begin(), value.end());
    }

private:
    std::vector<std::uint8_t>& out_;
};

// Throws std::invalid_argument on truncated input.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    std::uint8_t u8() {
        require(1);
        return data_[cursor_++];
    }

    std::uint16_t u16() {
        require(2);
        const auto value = static_cast<std::uint16_t>((data_[cursor_] << 8) | data_[cursor_ + 1]);
        cursor_ += 2;
        return value;
    }

    std::uint32_t u32() {
        require(4);
        std::uint32_t value = 0;
        for (int index = 0; index < 4; ++index) {
            value = (value << 8) | data_[cursor_++];
        }
        return value;
    }

    std::uint64_t u64() {
        require(8);
        std::uint64_t value = 0;
        for (int index = 0; index < 8; ++index) {
            value = (value << 8) | data_[cursor_++];
        }
        return value;
    }

    template <std::size_t N>
    std::array<std::uint8_t, N> fixed() {
        require(N);
        std::array<std::uint8_t, N> bytes{};
        for (std::size_t index = 0; index < N; ++index) {
            bytes[index] = data_[cursor_++];
        }
        return bytes;
    }

    std::vector<std::uint8_t> blob(std::size_t limit) {
        const auto length = u32();
        if (length > limit) {
            throw std::invalid_argument("field exceeds limit");
        }
        require(length);
        std::vector<std::uint8_t> bytes(data_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                                        data_.begin() + static_cast<std::ptrdiff_t>(cursor_ + length));
        cursor_ += length;
        return bytes;
    }

    std::string text(std::size_t limit) {
        const auto length = u32();
        if (length > limit) {
            throw std::invalid_argument("text field exceeds limit");
        }
        require(length);
        std::string value(reinterpret_cast<const char*>(data_.data() + cursor_), length);
        cursor_ += length;
        return value;
    }

    std::size_t remaining() const noexcept { return data_.size() - cursor_; }
    bool exhausted() const noexcept { return cursor_ == data_.size(); }

private:
    void require(std::size_t count) const {
        if (data_.size() - cursor_ < count) {
            throw std::invalid_argument("message truncated");
        }
    }

    std::span<const std::uint8_t> data_;
    std::size_t cursor_{0};
};

}  // namespace sharemesh::protocol
