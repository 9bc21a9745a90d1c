#include <NGIN/Metadata/CustomAttributeReader.hpp>
#include <NGIN/Metadata/AssemblySearch.hpp>
#include <NGIN/Metadata/GenericArguments.hpp>
#include <NGIN/Metadata/Module.hpp>
#include <NGIN/Metadata/RecursionCounter.hpp>
#include <NGIN/Metadata/TypeNameParser.hpp>

#include <algorithm>
#include <utility>

namespace NGIN::Metadata
{
  namespace
  {
    constexpr std::string_view kTooDeep = "too much recursion";
    constexpr std::string_view kInvalidElementType = "invalid element type";
    constexpr std::string_view kBadTypeName = "could not parse type";

    template <class T>
    CAValue MakeValue(T v)
    {
      return CAValue{std::in_place_type<T>, std::move(v)};
    }

    class CustomAttributeDecoder
    {
    public:
      CustomAttributeDecoder(const Module &module, BlobReader &reader, const ReadOptions &options, DecodeStats *stats)
          : m_module(module), m_corLib(module.GetCorLibTypes()), m_reader(reader),
            m_recursion(options.maxRecursionDepth), m_finder(module), m_stats(stats)
      {
      }

      Expected<CustomAttribute> Read(const CustomAttributeCtor &ctor)
      {
        if (!ctor.signature.has_value())
          return std::unexpected(Fault("custom attribute ctor has no method signature"));

        m_genericArgs = GenericArguments::FromOwner(ctor.declaringType);
        const auto &params = ctor.signature->params;

        // Tools sometimes drop the prolog of an attribute without arguments.
        if (!(params.empty() && m_reader.AtEnd()))
        {
          auto prolog = m_reader.ReadUInt16();
          if (!prolog)
            return std::unexpected(prolog.error());
          if (*prolog != 1)
            return std::unexpected(Fault("invalid custom attribute prolog"));
        }

        CustomAttribute ca;
        ca.ctor = ctor;
        ca.ctorArguments.reserve(params.size());
        for (const auto &param : params)
        {
          auto arg = ReadFixedArg(FixTypeSig(param));
          if (!arg)
            return std::unexpected(arg.error());
          ca.ctorArguments.push_back(std::move(*arg));
        }

        // ... and the named argument count when there are none.
        if (!m_reader.AtEnd())
        {
          auto count = m_reader.ReadUInt16();
          if (!count)
            return std::unexpected(count.error());
          ca.namedArguments.reserve(std::min<NGIN::UInt64>(*count, m_reader.Remaining()));
          for (std::uint16_t i = 0; i < *count; ++i)
          {
            auto named = ReadNamedArgument();
            if (!named)
              return std::unexpected(named.error());
            ca.namedArguments.push_back(std::move(*named));
          }
        }

        // A guessed enum width is only verifiable once the whole blob is decoded.
        if (m_verifyReadAllBytes && !m_reader.AtEnd())
          return std::unexpected(Fault("not all bytes were read"));

        return ca;
      }

    private:
      [[nodiscard]] Error Fault(std::string_view message) const noexcept
      {
        return Error{ErrorCode::ParseFault, message, m_reader.Position()};
      }

      [[nodiscard]] TypeSigPtr FixTypeSig(const TypeSigPtr &type) const
      {
        return RemoveModifiers(m_genericArgs.Resolve(RemoveModifiers(type)));
      }

      Expected<CAArgument> ReadFixedArg(const TypeSigPtr &argType)
      {
        RecursionScope scope{m_recursion};
        if (!scope)
          return std::unexpected(Fault(kTooDeep));
        if (!argType)
          return std::unexpected(Fault("missing argument type"));

        if (argType->IsSZArray())
          return ReadArrayArgument(argType);
        return ReadElem(argType);
      }

      Expected<CAArgument> ReadElem(const TypeSigPtr &argType)
      {
        const auto tag = ValueTagFromDeclaredType(argType->GetElementType());
        if (!tag.has_value())
          return std::unexpected(Fault(kInvalidElementType));
        return ReadValue(*tag, argType);
      }

      Expected<CAArgument> ReadValue(ValueTag tag, const TypeSigPtr &argType)
      {
        RecursionScope scope{m_recursion};
        if (!scope)
          return std::unexpected(Fault(kTooDeep));

        if (IsPrimitive(tag))
        {
          auto value = ReadPrimitive(tag);
          if (!value)
            return std::unexpected(value.error());
          return CAArgument{m_corLib.FromElementType(PrimitiveElementType(tag)), std::move(*value)};
        }

        switch (tag)
        {
          case ValueTag::DeclaredEnum:
          {
            auto underlying = GetEnumUnderlyingType(argType);
            if (!underlying)
              return std::unexpected(underlying.error());
            auto value = ReadEnumValue(*underlying);
            if (!value)
              return std::unexpected(value.error());
            return CAArgument{argType, std::move(*value)};
          }

          case ValueTag::DeclaredClass:
          {
            const auto &type = argType->Type();
            if (type.DefinitionAssemblyIsCorLib() && type.Namespace() == "System")
            {
              if (type.Name() == "Type")
                return ReadValue(ValueTag::Type, argType);
              if (type.Name() == "String")
                return ReadValue(ValueTag::String, argType);
              if (type.Name() == "Object")
                return ReadValue(ValueTag::TaggedObject, argType);
            }
            // Any other class is an enum we could not resolve.
            auto value = ReadEnumValue(nullptr);
            if (!value)
              return std::unexpected(value.error());
            return CAArgument{argType, std::move(*value)};
          }

          case ValueTag::Type:
          {
            auto type = ReadType(true);
            if (!type)
              return std::unexpected(type.error());
            return CAArgument{argType, MakeValue<TypeSigPtr>(std::move(*type))};
          }

          // Wire enums are currently resolved by ReadFieldOrPropType before dispatch.
          case ValueTag::Enum:
          {
            auto enumType = ReadType(false);
            if (!enumType)
              return std::unexpected(enumType.error());
            auto underlying = GetEnumUnderlyingType(*enumType);
            if (!underlying)
              return std::unexpected(underlying.error());
            auto value = ReadEnumValue(*underlying);
            if (!value)
              return std::unexpected(value.error());
            return CAArgument{std::move(*enumType), std::move(*value)};
          }

          case ValueTag::TaggedObject:
          {
            auto runtimeType = ReadFieldOrPropType();
            if (!runtimeType)
              return std::unexpected(runtimeType.error());
            if ((*runtimeType)->IsSZArray())
              return ReadArrayArgument(*runtimeType);
            const auto inner = ValueTagFromDeclaredType((*runtimeType)->GetElementType());
            if (!inner.has_value())
              return std::unexpected(Fault(kInvalidElementType));
            return ReadValue(*inner, *runtimeType);
          }

          default:
            return std::unexpected(Fault(kInvalidElementType));
        }
      }

      Expected<CAValue> ReadPrimitive(ValueTag tag)
      {
        switch (tag)
        {
          case ValueTag::Boolean:
          {
            auto v = m_reader.ReadByte();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<bool>(*v != 0);
          }
          case ValueTag::Char:
          {
            auto v = m_reader.ReadUInt16();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<char16_t>(static_cast<char16_t>(*v));
          }
          case ValueTag::I1:
          {
            auto v = m_reader.ReadSByte();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::int8_t>(*v);
          }
          case ValueTag::U1:
          {
            auto v = m_reader.ReadByte();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::uint8_t>(*v);
          }
          case ValueTag::I2:
          {
            auto v = m_reader.ReadInt16();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::int16_t>(*v);
          }
          case ValueTag::U2:
          {
            auto v = m_reader.ReadUInt16();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::uint16_t>(*v);
          }
          case ValueTag::I4:
          {
            auto v = m_reader.ReadInt32();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::int32_t>(*v);
          }
          case ValueTag::U4:
          {
            auto v = m_reader.ReadUInt32();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::uint32_t>(*v);
          }
          case ValueTag::I8:
          {
            auto v = m_reader.ReadInt64();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::int64_t>(*v);
          }
          case ValueTag::U8:
          {
            auto v = m_reader.ReadUInt64();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::uint64_t>(*v);
          }
          case ValueTag::R4:
          {
            auto v = m_reader.ReadSingle();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<float>(*v);
          }
          case ValueTag::R8:
          {
            auto v = m_reader.ReadDouble();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<double>(*v);
          }
          case ValueTag::String:
          {
            auto v = ReadUTF8String();
            if (!v)
              return std::unexpected(v.error());
            return MakeValue<std::optional<std::string>>(std::move(*v));
          }
          default:
            return std::unexpected(Fault(kInvalidElementType));
        }
      }

      // Null `underlying` means the enum could not be resolved: assume Int32 and verify later.
      Expected<CAValue> ReadEnumValue(const TypeSigPtr &underlying)
      {
        if (underlying)
        {
          const auto et = underlying->GetElementType();
          if (!IsEnumUnderlyingElementType(et))
            return std::unexpected(Fault("invalid enum underlying type"));
          const auto tag = PrimitiveValueTag(static_cast<NGIN::UInt8>(et));
          return ReadPrimitive(*tag);
        }

        m_verifyReadAllBytes = true;
        if (m_stats)
          ++m_stats->enumTypesGuessed;
        return ReadPrimitive(ValueTag::I4);
      }

      // Null result: the type could not be resolved (or has no usable underlying type).
      Expected<TypeSigPtr> GetEnumUnderlyingType(const TypeSigPtr &type) const
      {
        const auto sig = RemoveModifiers(type);
        if (!sig)
          return TypeSigPtr{};
        const auto def = sig->Type().ResolveTypeDef();
        if (!def.has_value())
          return TypeSigPtr{};
        if (!def->IsEnum())
          return std::unexpected(Fault("type is not an enum"));
        return RemoveModifiers(def->EnumUnderlyingType());
      }

      Expected<TypeSigPtr> ReadType(bool canReturnNull)
      {
        auto name = ReadUTF8String();
        if (!name)
          return std::unexpected(name.error());
        if (!name->has_value())
        {
          if (canReturnNull)
            return TypeSigPtr{};
          return std::unexpected(Fault(kBadTypeName));
        }
        auto type = ParseTypeName(m_module, **name, &m_finder);
        if (!type)
          return std::unexpected(Fault(kBadTypeName));
        return type;
      }

      Expected<TypeSigPtr> ReadFieldOrPropType()
      {
        RecursionScope scope{m_recursion};
        if (!scope)
          return std::unexpected(Fault(kTooDeep));

        auto code = m_reader.ReadByte();
        if (!code)
          return std::unexpected(code.error());
        const auto wire = static_cast<SerializationType>(*code);
        if (wire == SerializationType::SZArray)
        {
          auto element = ReadFieldOrPropType();
          if (!element)
            return element;
          return TypeSig::SZArray(std::move(*element));
        }

        const auto tag = ValueTagFromWire(wire);
        if (!tag.has_value())
          return std::unexpected(Fault(kInvalidElementType));
        if (IsPrimitive(*tag))
          return m_corLib.FromElementType(PrimitiveElementType(*tag));
        switch (*tag)
        {
          case ValueTag::Type: return TypeSig::Class(TypeDefOrRef{m_corLib.GetTypeRef("System", "Type")});
          case ValueTag::TaggedObject: return m_corLib.Object();
          case ValueTag::Enum: return ReadType(false);
          default: return std::unexpected(Fault(kInvalidElementType));
        }
      }

      Expected<CAArgument> ReadArrayArgument(const TypeSigPtr &arrayType)
      {
        RecursionScope scope{m_recursion};
        if (!scope)
          return std::unexpected(Fault(kTooDeep));

        auto count = m_reader.ReadInt32();
        if (!count)
          return std::unexpected(count.error());
        if (*count == -1)
          return CAArgument{arrayType, CAValue{std::monostate{}}};
        if (*count < 0)
          return std::unexpected(Fault("array is too big"));

        CAArgumentList elements;
        elements.reserve(std::min<NGIN::UInt64>(static_cast<NGIN::UInt64>(*count), m_reader.Remaining()));
        const auto elementType = FixTypeSig(arrayType->Next());
        for (std::int32_t i = 0; i < *count; ++i)
        {
          auto element = ReadFixedArg(elementType);
          if (!element)
            return std::unexpected(element.error());
          elements.push_back(std::move(*element));
        }
        return CAArgument{arrayType, MakeValue<CAArgumentList>(std::move(elements))};
      }

      Expected<CANamedArgument> ReadNamedArgument()
      {
        auto kind = m_reader.ReadByte();
        if (!kind)
          return std::unexpected(kind.error());

        CANamedArgument named;
        if (*kind == static_cast<NGIN::UInt8>(SerializationType::Field))
          named.isField = true;
        else if (*kind == static_cast<NGIN::UInt8>(SerializationType::Property))
          named.isField = false;
        else
          return std::unexpected(Fault("named argument is neither a field nor a property"));

        auto type = ReadFieldOrPropType();
        if (!type)
          return std::unexpected(type.error());
        auto name = ReadUTF8String();
        if (!name)
          return std::unexpected(name.error());
        auto argument = ReadFixedArg(*type);
        if (!argument)
          return std::unexpected(argument.error());

        named.type = std::move(*type);
        named.name = std::move(*name);
        named.argument = std::move(*argument);
        return named;
      }

      Expected<std::optional<std::string>> ReadUTF8String()
      {
        auto marker = m_reader.ReadByte();
        if (!marker)
          return std::unexpected(marker.error());
        if (*marker == 0xFF)
          return std::optional<std::string>{};
        if (auto r = m_reader.Rewind(1); !r)
          return std::unexpected(r.error());

        auto length = m_reader.ReadCompressedUInt32();
        if (!length)
          return std::unexpected(length.error());
        if (*length == 0)
          return std::optional<std::string>{std::string{}};
        auto bytes = m_reader.ReadBytes(*length);
        if (!bytes)
          return std::unexpected(bytes.error());

        std::string text;
        text.reserve(bytes->Size());
        for (NGIN::UIntSize i = 0; i < bytes->Size(); ++i)
          text.push_back(static_cast<char>((*bytes)[i]));
        return std::optional<std::string>{std::move(text)};
      }

      const Module &m_module;
      const CorLibTypes &m_corLib;
      BlobReader &m_reader;
      RecursionCounter m_recursion;
      GenericArguments m_genericArgs;
      CustomAttributeAssemblyRefFinder m_finder;
      DecodeStats *m_stats{nullptr};
      bool m_verifyReadAllBytes{false};
    };

    CustomAttribute MakeRawAttribute(const CustomAttributeCtor &ctor, ByteBuffer bytes)
    {
      CustomAttribute ca;
      ca.ctor = ctor;
      ca.rawData = std::move(bytes);
      ca.raw = true;
      return ca;
    }
  } // namespace

  CustomAttribute ReadCustomAttribute(const Module &module, const CustomAttributeCtor &ctor, NGIN::UInt32 blobOffset,
                                      const ReadOptions &options, Error *error, DecodeStats *stats)
  {
    auto reader = module.Blobs().CreateReader(blobOffset);
    if (!reader)
    {
      if (error)
        *error = reader.error();
      if (stats)
        ++stats->attributesRaw;
      return MakeRawAttribute(ctor, ByteBuffer{});
    }

    CustomAttributeDecoder decoder{module, *reader, options, stats};
    auto result = decoder.Read(ctor);
    if (!result)
    {
      if (error)
        *error = result.error();
      if (stats)
        ++stats->attributesRaw;
      return MakeRawAttribute(ctor, reader->ReadAllBytes());
    }
    if (stats)
      ++stats->attributesDecoded;
    return std::move(*result);
  }

  Expected<CustomAttribute> ReadCustomAttribute(const Module &module, BlobReader &reader,
                                                const CustomAttributeCtor &ctor, const ReadOptions &options,
                                                DecodeStats *stats)
  {
    CustomAttributeDecoder decoder{module, reader, options, stats};
    auto result = decoder.Read(ctor);
    if (result && stats)
      ++stats->attributesDecoded;
    return result;
  }

} // namespace NGIN::Metadata
