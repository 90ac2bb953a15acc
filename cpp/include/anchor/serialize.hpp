#pragma once

#include "types.hpp"
#include <cstddef>
#include <string_view>

namespace anchor
{

    /**
     * Append-only byte sink for the proof wire format.
     * Integers are written as little-endian base-128 varuints.
     */
    class ByteWriter
    {
    public:
        void write_byte(uint8_t b) { out_.push_back(b); }

        void write_bytes(const Bytes &data);

        void write_varuint(uint64_t value);

        /** Length-prefixed byte string */
        void write_varbytes(const Bytes &data);

        const Bytes &bytes() const { return out_; }
        Bytes take() { return std::move(out_); }

    private:
        Bytes out_;
    };

    /**
     * Bounds-checked reader over a byte buffer. Every read reports truncation
     * as MalformedProof instead of throwing.
     */
    class ByteReader
    {
    public:
        explicit ByteReader(const Bytes &data) : data_(data) {}

        Result<uint8_t> read_byte();

        Result<Bytes> read_bytes(std::size_t n);

        Result<uint64_t> read_varuint();

        /** Length-prefixed byte string with length in [min_len, max_len] */
        Result<Bytes> read_varbytes(std::size_t max_len, std::size_t min_len = 0);

        /** Consume `expected` or fail */
        Result<void> expect_bytes(const Bytes &expected, std::string_view what);

        /** Fail if any input remains */
        Result<void> assert_eof() const;

        std::size_t remaining() const { return data_.size() - pos_; }

    private:
        const Bytes &data_;
        std::size_t pos_{0};
    };

} // namespace anchor
