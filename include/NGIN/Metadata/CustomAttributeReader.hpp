// CustomAttributeReader.hpp
// Decoder for ECMA-335 custom attribute blobs (II.23.3)
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/BlobReader.hpp>
#include <NGIN/Metadata/CustomAttribute.hpp>

namespace NGIN::Metadata
{
  class Module;

  /**
   * Decode the blob at `blobOffset` in the module's #Blob heap.
   *
   * Never fails: a malformed blob yields a CustomAttribute whose IsRawBlob() is true and
   * whose rawData holds the undecoded blob. The fault that caused the fallback is stored
   * in `*error` when `error` is not null. `stats`, when given, counts one decoded or one
   * raw attribute per call.
   */
  NGIN_METADATA_API CustomAttribute ReadCustomAttribute(const Module &module, const CustomAttributeCtor &ctor,
                                                        NGIN::UInt32 blobOffset, const ReadOptions &options = {},
                                                        Error *error = nullptr, DecodeStats *stats = nullptr);

  /**
   * Decode from a cursor owned by the caller, starting at its current position.
   *
   * On success the cursor is left after the last byte consumed. On failure it is left
   * where the fault was detected; no raw fallback is produced.
   */
  NGIN_METADATA_API Expected<CustomAttribute> ReadCustomAttribute(const Module &module, BlobReader &reader,
                                                                  const CustomAttributeCtor &ctor,
                                                                  const ReadOptions &options = {},
                                                                  DecodeStats *stats = nullptr);

} // namespace NGIN::Metadata
