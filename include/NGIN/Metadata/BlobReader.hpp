// BlobReader.hpp
// Positioned little-endian cursor over a single #Blob entry
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Types.hpp>

#include <cstdint>
#include <span>

namespace NGIN::Metadata
{
  using ByteBuffer = NGIN::Containers::Vector<NGIN::UInt8>;

  /**
   * Non-owning cursor over a byte span. Every read either succeeds and advances the
   * position, or fails with ErrorCode::IoFault and leaves the position unchanged.
   * Cursors are cheap values: hand each decode its own instance.
   */
  class NGIN_METADATA_API BlobReader
  {
  public:
    constexpr BlobReader() = default;
    explicit constexpr BlobReader(std::span<const NGIN::UInt8> bytes) noexcept : m_data(bytes) {}

    [[nodiscard]] constexpr NGIN::UInt64 Position() const noexcept { return m_position; }
    [[nodiscard]] constexpr NGIN::UInt64 Length() const noexcept { return m_data.size(); }
    [[nodiscard]] constexpr NGIN::UInt64 Remaining() const noexcept { return m_data.size() - m_position; }
    [[nodiscard]] constexpr bool AtEnd() const noexcept { return m_position == m_data.size(); }

    Expected<void> SetPosition(NGIN::UInt64 position) noexcept;
    // Step back over bytes that were already read.
    Expected<void> Rewind(NGIN::UInt64 count = 1) noexcept;

    Expected<NGIN::UInt8> ReadByte() noexcept;
    Expected<std::int8_t> ReadSByte() noexcept;
    Expected<std::uint16_t> ReadUInt16() noexcept;
    Expected<std::int16_t> ReadInt16() noexcept;
    Expected<std::uint32_t> ReadUInt32() noexcept;
    Expected<std::int32_t> ReadInt32() noexcept;
    Expected<std::uint64_t> ReadUInt64() noexcept;
    Expected<std::int64_t> ReadInt64() noexcept;
    Expected<float> ReadSingle() noexcept;
    Expected<double> ReadDouble() noexcept;

    // ECMA-335 II.23.2 compressed unsigned integer (1, 2 or 4 bytes).
    Expected<std::uint32_t> ReadCompressedUInt32() noexcept;

    Expected<ByteBuffer> ReadBytes(NGIN::UIntSize count);

    // Copy of the whole span, independent of the current position.
    [[nodiscard]] ByteBuffer ReadAllBytes() const;

  private:
    [[nodiscard]] Error Fault(std::string_view message) const noexcept
    {
      return Error{ErrorCode::IoFault, message, m_position};
    }

    template <class T>
    Expected<T> ReadLittleEndian() noexcept;

    std::span<const NGIN::UInt8> m_data{};
    NGIN::UInt64 m_position{0};
  };

} // namespace NGIN::Metadata
