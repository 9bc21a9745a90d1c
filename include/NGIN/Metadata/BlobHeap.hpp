// BlobHeap.hpp
// Owner of a module's #Blob stream; hands out independent per-blob cursors
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/BlobReader.hpp>

#include <span>
#include <vector>

namespace NGIN::Metadata
{

  class NGIN_METADATA_API BlobHeap
  {
  public:
    BlobHeap() = default;
    explicit BlobHeap(std::vector<NGIN::UInt8> bytes) : m_bytes(std::move(bytes)) {}
    explicit BlobHeap(std::span<const NGIN::UInt8> bytes) : m_bytes(bytes.begin(), bytes.end()) {}

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_bytes.size(); }

    // Append a blob (compressed length prefix + payload) and return its offset.
    NGIN::UInt32 Append(std::span<const NGIN::UInt8> payload);

    // Reader covering exactly the blob stored at `offset` (length prefix excluded).
    [[nodiscard]] Expected<BlobReader> CreateReader(NGIN::UInt32 offset) const noexcept;

  private:
    std::vector<NGIN::UInt8> m_bytes;
  };

} // namespace NGIN::Metadata
