// TestUniverse.hpp - in-memory core library + user assembly shared by the metadata tests
#pragma once

#include <NGIN/Metadata/Metadata.hpp>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string_view>
#include <vector>

namespace MetadataTest
{
  using namespace NGIN::Metadata;

  inline AssemblyRefPtr MsCorLibRef()
  {
    static const AssemblyRefPtr ref = std::make_shared<const AssemblyRef>(
        AssemblyRef{"mscorlib", "4.0.0.0", "neutral", "b77a5c561934e089"});
    return ref;
  }

  // mscorlib (System.*) plus "UserLib" with:
  //   UserNs.Color : byte enum, UserNs.Point struct, UserNs.Widget class,
  //   UserNs.Outer class with nested enum Inner : short.
  struct TestUniverse
  {
    AssemblyResolver resolver;
    Assembly corLibAssembly{AssemblyRef{"mscorlib", "4.0.0.0", "neutral", "b77a5c561934e089"}};
    Module corLibModule{"mscorlib.dll", MsCorLibRef(), &resolver};
    Assembly userAssembly{AssemblyRef{"UserLib", "1.0.0.0"}};
    Module module{"UserLib.dll", MsCorLibRef(), &resolver};

    TypeDef color{};
    TypeDef point{};
    TypeDef widget{};
    TypeDef outer{};
    TypeDef inner{};

    TestUniverse()
    {
      corLibAssembly.AddModule(corLibModule);
      for (auto name : {"Object", "String", "Type", "Enum", "ValueType"})
        corLibModule.AddType(TypeDefDesc{.ns = "System", .name = name});
      for (auto name : {"Boolean", "Char", "SByte", "Byte", "Int16", "UInt16", "Int32", "UInt32", "Int64", "UInt64",
                        "Single", "Double"})
        corLibModule.AddType(TypeDefDesc{.ns = "System", .name = name, .isValueType = true});
      corLibModule.AddType(TypeDefDesc{.ns = "System",
                                       .name = "DayOfWeek",
                                       .isValueType = true,
                                       .isEnum = true,
                                       .enumUnderlyingType = corLibModule.GetCorLibTypes().Int32()});
      resolver.AddAssembly(corLibAssembly);

      userAssembly.AddModule(module);
      resolver.AddAssembly(userAssembly);
      const auto &cor = module.GetCorLibTypes();
      color = module.AddType(TypeDefDesc{.ns = "UserNs",
                                         .name = "Color",
                                         .isValueType = true,
                                         .isEnum = true,
                                         .enumUnderlyingType = cor.Byte()});
      point = module.AddType(TypeDefDesc{.ns = "UserNs", .name = "Point", .isValueType = true});
      widget = module.AddType(TypeDefDesc{.ns = "UserNs", .name = "Widget"});
      outer = module.AddType(TypeDefDesc{.ns = "UserNs", .name = "Outer"});
      inner = module.AddType(TypeDefDesc{.name = "Inner",
                                         .declaringType = outer,
                                         .isValueType = true,
                                         .isEnum = true,
                                         .enumUnderlyingType = cor.Int16()});
    }

    [[nodiscard]] const CorLibTypes &Cor() const noexcept { return module.GetCorLibTypes(); }

    [[nodiscard]] TypeSigPtr SystemType() const
    {
      return TypeSig::Class(TypeDefOrRef{Cor().GetTypeRef("System", "Type")});
    }

    [[nodiscard]] TypeSigPtr UserValueType(const char *ns, const char *name) const
    {
      return TypeSig::ValueType(TypeDefOrRef{module.CreateTypeRef(ns, name)});
    }

    // Reference into an assembly nobody can load.
    [[nodiscard]] TypeSigPtr MissingValueType() const
    {
      auto scope = std::make_shared<const AssemblyRef>(AssemblyRef{"Missing"});
      return TypeSig::ValueType(TypeDefOrRef{module.CreateTypeRef("Missing", "Flags", scope)});
    }

    [[nodiscard]] static CustomAttributeCtor Ctor(std::vector<TypeSigPtr> params, TypeSigPtr owner = nullptr)
    {
      CustomAttributeCtor ctor;
      ctor.signature = MethodSig{std::move(params), true};
      ctor.declaringType = std::move(owner);
      return ctor;
    }

    NGIN::UInt32 AddBlob(std::initializer_list<NGIN::UInt8> bytes)
    {
      const std::vector<NGIN::UInt8> payload{bytes};
      return module.Blobs().Append(payload);
    }

    NGIN::UInt32 AddBlob(const std::vector<NGIN::UInt8> &bytes)
    {
      return module.Blobs().Append(bytes);
    }
  };

  // Little-endian blob assembly helper for longer test inputs.
  struct BlobBuilder
  {
    std::vector<NGIN::UInt8> bytes;

    BlobBuilder &U8(NGIN::UInt8 v)
    {
      bytes.push_back(v);
      return *this;
    }
    BlobBuilder &U16(std::uint16_t v)
    {
      U8(static_cast<NGIN::UInt8>(v & 0xFF));
      return U8(static_cast<NGIN::UInt8>(v >> 8));
    }
    BlobBuilder &I32(std::int32_t v)
    {
      const auto u = static_cast<std::uint32_t>(v);
      for (int i = 0; i < 4; ++i)
        U8(static_cast<NGIN::UInt8>((u >> (8 * i)) & 0xFF));
      return *this;
    }
    BlobBuilder &Str(std::string_view s)
    {
      const auto n = static_cast<NGIN::UInt32>(s.size());
      if (n < 0x80)
        U8(static_cast<NGIN::UInt8>(n));
      else if (n < 0x4000)
        U8(static_cast<NGIN::UInt8>(0x80 | (n >> 8))).U8(static_cast<NGIN::UInt8>(n));
      else
        U8(static_cast<NGIN::UInt8>(0xC0 | (n >> 24)))
            .U8(static_cast<NGIN::UInt8>(n >> 16))
            .U8(static_cast<NGIN::UInt8>(n >> 8))
            .U8(static_cast<NGIN::UInt8>(n));
      for (char c : s)
        U8(static_cast<NGIN::UInt8>(c));
      return *this;
    }
    BlobBuilder &Prolog() { return U16(1); }
  };

} // namespace MetadataTest
