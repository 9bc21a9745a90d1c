#include <NGIN/Metadata/BlobReader.hpp>

#include <bit>
#include <cstring>
#include <type_traits>

namespace NGIN::Metadata
{
  namespace
  {
    constexpr std::string_view kEndOfBlob = "read past end of blob";
  }

  Expected<void> BlobReader::SetPosition(NGIN::UInt64 position) noexcept
  {
    if (position > m_data.size())
      return std::unexpected(Fault("position out of range"));
    m_position = position;
    return {};
  }

  Expected<void> BlobReader::Rewind(NGIN::UInt64 count) noexcept
  {
    if (count > m_position)
      return std::unexpected(Fault("rewind before start of blob"));
    m_position -= count;
    return {};
  }

  template <class T>
  Expected<T> BlobReader::ReadLittleEndian() noexcept
  {
    using U = std::make_unsigned_t<T>;
    if (Remaining() < sizeof(T))
      return std::unexpected(Fault(kEndOfBlob));
    U raw = 0;
    for (NGIN::UIntSize i = 0; i < sizeof(T); ++i)
      raw |= static_cast<U>(static_cast<U>(m_data[m_position + i]) << (8 * i));
    m_position += sizeof(T);
    return static_cast<T>(raw);
  }

  Expected<NGIN::UInt8> BlobReader::ReadByte() noexcept
  {
    if (AtEnd())
      return std::unexpected(Fault(kEndOfBlob));
    return m_data[m_position++];
  }

  Expected<std::int8_t> BlobReader::ReadSByte() noexcept
  {
    auto b = ReadByte();
    if (!b.has_value())
      return std::unexpected(b.error());
    return static_cast<std::int8_t>(*b);
  }

  Expected<std::uint16_t> BlobReader::ReadUInt16() noexcept { return ReadLittleEndian<std::uint16_t>(); }
  Expected<std::int16_t> BlobReader::ReadInt16() noexcept { return ReadLittleEndian<std::int16_t>(); }
  Expected<std::uint32_t> BlobReader::ReadUInt32() noexcept { return ReadLittleEndian<std::uint32_t>(); }
  Expected<std::int32_t> BlobReader::ReadInt32() noexcept { return ReadLittleEndian<std::int32_t>(); }
  Expected<std::uint64_t> BlobReader::ReadUInt64() noexcept { return ReadLittleEndian<std::uint64_t>(); }
  Expected<std::int64_t> BlobReader::ReadInt64() noexcept { return ReadLittleEndian<std::int64_t>(); }

  Expected<float> BlobReader::ReadSingle() noexcept
  {
    auto bits = ReadLittleEndian<std::uint32_t>();
    if (!bits.has_value())
      return std::unexpected(bits.error());
    return std::bit_cast<float>(*bits);
  }

  Expected<double> BlobReader::ReadDouble() noexcept
  {
    auto bits = ReadLittleEndian<std::uint64_t>();
    if (!bits.has_value())
      return std::unexpected(bits.error());
    return std::bit_cast<double>(*bits);
  }

  Expected<std::uint32_t> BlobReader::ReadCompressedUInt32() noexcept
  {
    if (AtEnd())
      return std::unexpected(Fault(kEndOfBlob));
    const auto b0 = m_data[m_position];
    if ((b0 & 0x80u) == 0)
    {
      ++m_position;
      return static_cast<std::uint32_t>(b0);
    }
    if ((b0 & 0xC0u) == 0x80u)
    {
      if (Remaining() < 2)
        return std::unexpected(Fault("truncated compressed integer"));
      const auto v = (static_cast<std::uint32_t>(b0 & 0x3Fu) << 8) | m_data[m_position + 1];
      m_position += 2;
      return v;
    }
    if ((b0 & 0xE0u) == 0xC0u)
    {
      if (Remaining() < 4)
        return std::unexpected(Fault("truncated compressed integer"));
      const auto v = (static_cast<std::uint32_t>(b0 & 0x1Fu) << 24) |
                     (static_cast<std::uint32_t>(m_data[m_position + 1]) << 16) |
                     (static_cast<std::uint32_t>(m_data[m_position + 2]) << 8) |
                     static_cast<std::uint32_t>(m_data[m_position + 3]);
      m_position += 4;
      return v;
    }
    return std::unexpected(Fault("invalid compressed integer"));
  }

  Expected<ByteBuffer> BlobReader::ReadBytes(NGIN::UIntSize count)
  {
    if (Remaining() < count)
      return std::unexpected(Fault(kEndOfBlob));
    ByteBuffer out;
    out.Reserve(count);
    for (NGIN::UIntSize i = 0; i < count; ++i)
      out.PushBack(m_data[m_position + i]);
    m_position += count;
    return out;
  }

  ByteBuffer BlobReader::ReadAllBytes() const
  {
    ByteBuffer out;
    out.Reserve(m_data.size());
    for (NGIN::UIntSize i = 0; i < m_data.size(); ++i)
      out.PushBack(m_data[i]);
    return out;
  }

} // namespace NGIN::Metadata
