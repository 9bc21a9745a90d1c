// ElementType.hpp
// ECMA-335 signature element types, custom attribute wire tags and the value decoder's tag set
#pragma once

#include <NGIN/Primitives.hpp>
#include <optional>

namespace NGIN::Metadata
{

  // Signature element types (ECMA-335 II.23.1.16)
  enum class ElementType : NGIN::UInt8
  {
    End = 0x00,
    Void = 0x01,
    Boolean = 0x02,
    Char = 0x03,
    I1 = 0x04,
    U1 = 0x05,
    I2 = 0x06,
    U2 = 0x07,
    I4 = 0x08,
    U4 = 0x09,
    I8 = 0x0A,
    U8 = 0x0B,
    R4 = 0x0C,
    R8 = 0x0D,
    String = 0x0E,
    Ptr = 0x0F,
    ByRef = 0x10,
    ValueType = 0x11,
    Class = 0x12,
    Var = 0x13,
    Array = 0x14,
    GenericInst = 0x15,
    TypedByRef = 0x16,
    I = 0x18,
    U = 0x19,
    FnPtr = 0x1B,
    Object = 0x1C,
    SZArray = 0x1D,
    MVar = 0x1E,
    CModReqd = 0x1F,
    CModOpt = 0x20,
    Internal = 0x21,
    Sentinel = 0x41,
    Pinned = 0x45,
  };

  // Tags that appear on the wire inside a custom attribute blob (ECMA-335 II.23.3)
  enum class SerializationType : NGIN::UInt8
  {
    Boolean = 0x02,
    Char = 0x03,
    I1 = 0x04,
    U1 = 0x05,
    I2 = 0x06,
    U2 = 0x07,
    I4 = 0x08,
    U4 = 0x09,
    I8 = 0x0A,
    U8 = 0x0B,
    R4 = 0x0C,
    R8 = 0x0D,
    String = 0x0E,
    SZArray = 0x1D,
    Type = 0x50,
    TaggedObject = 0x51,
    Field = 0x53,
    Property = 0x54,
    Enum = 0x55,
  };

  /**
   * Decode paths of the value decoder.
   *
   * The primitive tags plus Type/TaggedObject/Enum exist on the wire. DeclaredEnum and
   * DeclaredClass never appear on the wire: they are implied by a declared parameter type
   * (a value type, which must be an enum, or a class such as System.Type).
   */
  enum class ValueTag : NGIN::UInt8
  {
    Boolean,
    Char,
    I1,
    U1,
    I2,
    U2,
    I4,
    U4,
    I8,
    U8,
    R4,
    R8,
    String,
    Type,
    TaggedObject,
    Enum,
    DeclaredEnum,
    DeclaredClass,
  };

  [[nodiscard]] constexpr bool IsPrimitive(ValueTag tag) noexcept
  {
    return tag <= ValueTag::String;
  }

  // Primitive element types share their numeric code with the wire tag.
  [[nodiscard]] constexpr std::optional<ValueTag> PrimitiveValueTag(NGIN::UInt8 code) noexcept
  {
    if (code < static_cast<NGIN::UInt8>(ElementType::Boolean) || code > static_cast<NGIN::UInt8>(ElementType::String))
      return std::nullopt;
    return static_cast<ValueTag>(code - static_cast<NGIN::UInt8>(ElementType::Boolean));
  }

  // Inverse of PrimitiveValueTag. Only meaningful when IsPrimitive(tag).
  [[nodiscard]] constexpr ElementType PrimitiveElementType(ValueTag tag) noexcept
  {
    return static_cast<ElementType>(static_cast<NGIN::UInt8>(tag) + static_cast<NGIN::UInt8>(ElementType::Boolean));
  }

  // Tag implied by a declared (signature) type.
  [[nodiscard]] constexpr std::optional<ValueTag> ValueTagFromDeclaredType(ElementType et) noexcept
  {
    switch (et)
    {
      case ElementType::ValueType: return ValueTag::DeclaredEnum;
      case ElementType::Class: return ValueTag::DeclaredClass;
      case ElementType::Object: return ValueTag::TaggedObject;
      default: return PrimitiveValueTag(static_cast<NGIN::UInt8>(et));
    }
  }

  // Tag read from the stream. Array, field and property markers are not values and have no tag.
  [[nodiscard]] constexpr std::optional<ValueTag> ValueTagFromWire(SerializationType st) noexcept
  {
    switch (st)
    {
      case SerializationType::Type: return ValueTag::Type;
      case SerializationType::TaggedObject: return ValueTag::TaggedObject;
      case SerializationType::Enum: return ValueTag::Enum;
      default: return PrimitiveValueTag(static_cast<NGIN::UInt8>(st));
    }
  }

  // Valid enum underlying types are Boolean..U8.
  [[nodiscard]] constexpr bool IsEnumUnderlyingElementType(ElementType et) noexcept
  {
    return et >= ElementType::Boolean && et <= ElementType::U8;
  }

} // namespace NGIN::Metadata
