// Types.hpp
// Public-facing error codes, decode options and statistics
#pragma once

#include <NGIN/Primitives.hpp>
#include <string_view>
#include <cstdint>
#include <expected>

namespace NGIN::Metadata
{

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    ParseFault = 3,
    IoFault = 4,
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    // Cursor offset (relative to the blob start) at which the fault was detected.
    NGIN::UInt64 position{0};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    constexpr Error(ErrorCode c, std::string_view m, NGIN::UInt64 pos) : code(c), message(m), position(pos) {}
  };

  template <class T>
  using Expected = std::expected<T, Error>;

  struct ReadOptions
  {
    // Upper bound for nested decode steps (arrays, boxed values, type descriptors).
    // A fixed argument and its value cost one unit each; an object[] level costs three.
    NGIN::UInt32 maxRecursionDepth{100};
  };

  struct DecodeStats
  {
    std::uint64_t attributesDecoded{0};
    std::uint64_t attributesRaw{0};
    std::uint64_t enumTypesGuessed{0};
  };

} // namespace NGIN::Metadata
