#include "anchor/serialize.hpp"
#include <format>

namespace anchor
{

    void ByteWriter::write_bytes(const Bytes &data)
    {
        out_.insert(out_.end(), data.begin(), data.end());
    }

    void ByteWriter::write_varuint(uint64_t value)
    {
        do
        {
            uint8_t b = value & 0x7f;
            value >>= 7;
            if (value != 0)
                b |= 0x80;
            out_.push_back(b);
        } while (value != 0);
    }

    void ByteWriter::write_varbytes(const Bytes &data)
    {
        write_varuint(data.size());
        write_bytes(data);
    }

    Result<uint8_t> ByteReader::read_byte()
    {
        if (pos_ >= data_.size())
        {
            return std::unexpected(AnchorError::malformed("Unexpected end of data"));
        }
        return data_[pos_++];
    }

    Result<Bytes> ByteReader::read_bytes(std::size_t n)
    {
        if (n > remaining())
        {
            return std::unexpected(AnchorError::malformed(
                std::format("Unexpected end of data: wanted {} bytes, {} left", n, remaining())));
        }
        Bytes out(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
        pos_ += n;
        return out;
    }

    Result<uint64_t> ByteReader::read_varuint()
    {
        uint64_t value = 0;
        unsigned shift = 0;
        while (true)
        {
            auto b = read_byte();
            if (!b)
                return std::unexpected(b.error());
            if (shift > 63)
            {
                return std::unexpected(AnchorError::malformed("varuint overflow"));
            }
            value |= static_cast<uint64_t>(*b & 0x7f) << shift;
            if (!(*b & 0x80))
                break;
            shift += 7;
        }
        return value;
    }

    Result<Bytes> ByteReader::read_varbytes(std::size_t max_len, std::size_t min_len)
    {
        auto len = read_varuint();
        if (!len)
            return std::unexpected(len.error());
        if (*len > max_len)
        {
            return std::unexpected(AnchorError::malformed(
                std::format("varbytes max length exceeded; {} > {}", *len, max_len)));
        }
        if (*len < min_len)
        {
            return std::unexpected(AnchorError::malformed(
                std::format("varbytes min length not met; {} < {}", *len, min_len)));
        }
        return read_bytes(static_cast<std::size_t>(*len));
    }

    Result<void> ByteReader::expect_bytes(const Bytes &expected, std::string_view what)
    {
        auto got = read_bytes(expected.size());
        if (!got)
            return std::unexpected(got.error());
        if (*got != expected)
        {
            return std::unexpected(AnchorError::malformed(std::format("Bad {}", what)));
        }
        return {};
    }

    Result<void> ByteReader::assert_eof() const
    {
        if (remaining() != 0)
        {
            return std::unexpected(AnchorError::malformed(
                std::format("Trailing garbage: {} unexpected bytes", remaining())));
        }
        return {};
    }

} // namespace anchor
