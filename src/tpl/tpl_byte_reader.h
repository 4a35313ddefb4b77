/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "tpl_error.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

namespace ps::tpl {
// Big-endian cursor over an immutable buffer. Every read past the end throws
// DecodeError(UnexpectedEndOfBuffer) and leaves the position untouched.
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data, std::size_t pos = 0) : _data(data), _pos(0) {
        seek(pos);
    }

    std::size_t position() const { return _pos; }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool can_read(std::size_t count) const { return count <= remaining(); }

    std::uint8_t read_u8() {
        require(1, "u8");
        return _data[_pos++];
    }

    std::uint32_t read_u32_be() {
        require(4, "u32");
        std::uint32_t v = 0;
        for (int i = 0; i < 4; i++) {
            v = (v << 8) | static_cast<std::uint32_t>(_data[_pos++]);
        }
        return v;
    }

    std::uint64_t read_u64_be() {
        require(8, "u64");
        std::uint64_t v = 0;
        for (int i = 0; i < 8; i++) {
            v = (v << 8) | static_cast<std::uint64_t>(_data[_pos++]);
        }
        return v;
    }

    double read_f64_be() {
        const std::uint64_t bits = read_u64_be();
        double v = 0.0;
        static_assert(sizeof(v) == sizeof(bits));
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    std::span<const std::uint8_t> read_bytes(std::size_t count) {
        require(count, "byte span");
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

    std::span<const std::uint8_t> peek_bytes(std::size_t count) const {
        require(count, "byte span");
        return _data.subspan(_pos, count);
    }

    void skip(std::size_t count) {
        require(count, "skip");
        _pos += count;
    }

    void seek(std::size_t pos) {
        if (pos > _data.size()) {
            throw DecodeError(
                DecodeErrorKind::UnexpectedEndOfBuffer, pos,
                "seek beyond buffer of " + std::to_string(_data.size()) + " bytes"
            );
        }
        _pos = pos;
    }

   private:
    void require(std::size_t count, const char* what) const {
        if (!can_read(count)) {
            throw DecodeError(
                DecodeErrorKind::UnexpectedEndOfBuffer, _pos,
                std::string("need ") + std::to_string(count) + " bytes for " + what + ", "
                    + std::to_string(remaining()) + " remain"
            );
        }
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace ps::tpl
