#include <NGIN/Metadata/BlobHeap.hpp>

namespace NGIN::Metadata
{

  NGIN::UInt32 BlobHeap::Append(std::span<const NGIN::UInt8> payload)
  {
    const auto offset = static_cast<NGIN::UInt32>(m_bytes.size());
    const auto len = static_cast<std::uint32_t>(payload.size());
    if (len <= 0x7Fu)
    {
      m_bytes.push_back(static_cast<NGIN::UInt8>(len));
    }
    else if (len <= 0x3FFFu)
    {
      m_bytes.push_back(static_cast<NGIN::UInt8>(0x80u | (len >> 8)));
      m_bytes.push_back(static_cast<NGIN::UInt8>(len & 0xFFu));
    }
    else
    {
      m_bytes.push_back(static_cast<NGIN::UInt8>(0xC0u | ((len >> 24) & 0x1Fu)));
      m_bytes.push_back(static_cast<NGIN::UInt8>((len >> 16) & 0xFFu));
      m_bytes.push_back(static_cast<NGIN::UInt8>((len >> 8) & 0xFFu));
      m_bytes.push_back(static_cast<NGIN::UInt8>(len & 0xFFu));
    }
    m_bytes.insert(m_bytes.end(), payload.begin(), payload.end());
    return offset;
  }

  Expected<BlobReader> BlobHeap::CreateReader(NGIN::UInt32 offset) const noexcept
  {
    if (offset >= m_bytes.size())
      return std::unexpected(Error{ErrorCode::IoFault, "blob offset out of range", offset});

    std::span<const NGIN::UInt8> heap{m_bytes};
    BlobReader prefix{heap.subspan(offset)};
    auto len = prefix.ReadCompressedUInt32();
    if (!len.has_value())
      return std::unexpected(Error{len.error().code, len.error().message, offset});
    if (*len > prefix.Remaining())
      return std::unexpected(Error{ErrorCode::IoFault, "blob length exceeds heap", offset});

    return BlobReader{heap.subspan(offset + prefix.Position(), *len)};
  }

} // namespace NGIN::Metadata
