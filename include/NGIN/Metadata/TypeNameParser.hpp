// TypeNameParser.hpp
// Reflection-style type names ("NS.Outer+Inner`1[[System.Int32, mscorlib]][], Asm") to signatures
#pragma once

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/Types.hpp>
#include <NGIN/Metadata/TypeSig.hpp>

#include <string_view>

namespace NGIN::Metadata
{
  class Module;

  // Picks the scope of a parsed name that carries no assembly qualification.
  class NGIN_METADATA_API IAssemblyRefFinder
  {
  public:
    virtual ~IAssemblyRefFinder() = default;
    // Return null to scope the reference to the referencing module.
    [[nodiscard]] virtual AssemblyRefPtr FindAssemblyRef(const TypeRef &nonNestedTypeRef) const = 0;
  };

  /**
   * Parse a reflection-style type name into a signature owned by `module`.
   *
   * Supported: namespaces, `+` nested types, `\` escapes, generic arguments in both
   * `[[Name, Asm]]` and `[Name]` form, `[]`, `[,]` and `[*]` arrays, `*` pointers, `&`
   * by-refs, and a trailing assembly qualification. Core-library primitives map to the
   * module's CorLibTypes; resolved value types become ValueType sigs and everything else,
   * unresolved references included, becomes a Class sig.
   *
   * Fails with ErrorCode::ParseFault only on syntax errors. `position` is the character
   * offset into `name`.
   */
  NGIN_METADATA_API Expected<TypeSigPtr> ParseTypeName(const Module &module, std::string_view name,
                                                       const IAssemblyRefFinder *finder = nullptr);

} // namespace NGIN::Metadata
