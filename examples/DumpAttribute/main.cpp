#include <NGIN/Metadata/Metadata.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

using namespace NGIN::Metadata;

namespace
{
  void PrintArgument(const CAArgument &arg, int indent);

  void PrintValue(const CAValue &value, int indent)
  {
    std::visit(
        [indent](const auto &v)
        {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::monostate>)
            std::cout << "null[]";
          else if constexpr (std::is_same_v<T, std::optional<std::string>>)
            std::cout << (v ? "\"" + *v + "\"" : std::string{"null"});
          else if constexpr (std::is_same_v<T, TypeSigPtr>)
            std::cout << "typeof(" << (v ? v->FullName() : std::string{"null"}) << ")";
          else if constexpr (std::is_same_v<T, CAArgumentList>)
          {
            std::cout << "{\n";
            for (const auto &item : v)
              PrintArgument(item, indent + 2);
            std::cout << std::string(indent, ' ') << "}";
          }
          else if constexpr (std::is_same_v<T, char16_t>)
            std::cout << "'\\u" << static_cast<unsigned>(v) << "'";
          else if constexpr (std::is_same_v<T, std::int8_t> || std::is_same_v<T, std::uint8_t>)
            std::cout << static_cast<int>(v);
          else
            std::cout << v;
        },
        value);
  }

  void PrintArgument(const CAArgument &arg, int indent)
  {
    std::cout << std::string(indent, ' ') << (arg.type ? arg.type->FullName() : std::string{"?"}) << " = ";
    PrintValue(arg.value, indent);
    std::cout << "\n";
  }
} // namespace

int main()
{
  std::cout << "Library: " << LibraryName() << "\n";

  auto corLibRef = std::make_shared<const AssemblyRef>(AssemblyRef{"mscorlib", "4.0.0.0"});
  AssemblyResolver resolver;
  Assembly demo{AssemblyRef{"Demo"}};
  Module module{"Demo.dll", corLibRef, &resolver};
  demo.AddModule(module);
  resolver.AddAssembly(demo);
  module.AddType(TypeDefDesc{.ns = "Demo",
                             .name = "Level",
                             .isValueType = true,
                             .isEnum = true,
                             .enumUnderlyingType = module.GetCorLibTypes().Int32()});

  // [Demo(typeof(int), new object[] { "x", Level.High }, Name = "n")]
  const std::vector<NGIN::UInt8> blob{
      0x01, 0x00,                                                             // prolog
      0x0C, 'S', 'y', 's', 't', 'e', 'm', '.', 'I', 'n', 't', '3', '2',       // typeof(int)
      0x02, 0x00, 0x00, 0x00,                                                 // object[2]
      0x0E, 0x01, 'x',                                                        // "x"
      0x55, 0x0A, 'D', 'e', 'm', 'o', '.', 'L', 'e', 'v', 'e', 'l', 0x02, 0x00, 0x00, 0x00, // Level 2
      0x01, 0x00,                                                             // one named argument
      0x54, 0x0E, 0x04, 'N', 'a', 'm', 'e', 0x01, 'n',                        // Name = "n"
  };
  const auto offset = module.Blobs().Append(blob);

  const auto &cor = module.GetCorLibTypes();
  CustomAttributeCtor ctor;
  ctor.signature = MethodSig{{TypeSig::Class(TypeDefOrRef{cor.GetTypeRef("System", "Type")}), TypeSig::SZArray(cor.Object())}};

  Error error{};
  DecodeStats stats{};
  const auto ca = ReadCustomAttribute(module, ctor, offset, {}, &error, &stats);
  if (ca.IsRawBlob())
  {
    std::cout << "decode failed at " << error.position << ": " << error.message << " (" << ca.rawData.Size()
              << " raw bytes)\n";
    return 1;
  }

  for (const auto &arg : ca.ctorArguments)
    PrintArgument(arg, 0);
  for (const auto &named : ca.namedArguments)
  {
    std::cout << (named.isField ? "field " : "property ") << named.name.value_or("<null>") << ": ";
    PrintArgument(named.argument, 0);
  }
  std::cout << "decoded=" << stats.attributesDecoded << " raw=" << stats.attributesRaw << "\n";
  return 0;
}
