// CustomAttribute.hpp
// Constructor references and the decoded custom attribute value tree
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Metadata/BlobReader.hpp>
#include <NGIN/Metadata/TypeSig.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace NGIN::Metadata
{

  struct MethodSig
  {
    std::vector<TypeSigPtr> params{};
    bool hasThis{true};
  };

  struct CustomAttributeCtor
  {
    std::string name{".ctor"};
    // Absent when the constructor reference has no usable signature.
    std::optional<MethodSig> signature{};
    // Owner type; a GenericInst when the constructor belongs to a generic instantiation.
    TypeSigPtr declaringType{};
  };

  struct CAArgument;
  using CAArgumentList = std::vector<CAArgument>;

  // std::monostate is the null array marker; a null string is an empty optional.
  using CAValue = std::variant<std::monostate, bool, char16_t, std::int8_t, std::uint8_t, std::int16_t, std::uint16_t,
                               std::int32_t, std::uint32_t, std::int64_t, std::uint64_t, float, double,
                               std::optional<std::string>, TypeSigPtr, CAArgumentList>;

  struct CAArgument
  {
    TypeSigPtr type{};
    CAValue value{};

    [[nodiscard]] bool IsNullArray() const noexcept { return std::holds_alternative<std::monostate>(value); }
  };

  struct CANamedArgument
  {
    bool isField{false};
    TypeSigPtr type{};
    std::optional<std::string> name{};
    CAArgument argument{};

    [[nodiscard]] bool IsProperty() const noexcept { return !isField; }
  };

  struct CustomAttribute
  {
    CustomAttributeCtor ctor{};
    std::vector<CAArgument> ctorArguments{};
    std::vector<CANamedArgument> namedArguments{};
    // Undecoded blob, set only when decoding fell back to raw bytes.
    ByteBuffer rawData{};
    bool raw{false};

    [[nodiscard]] bool IsRawBlob() const noexcept { return raw; }
  };

} // namespace NGIN::Metadata
