// TypeSig.hpp
// Type references, definition handles and immutable signature trees
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/ElementType.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace NGIN::Metadata
{
  class Module;
  class TypeSig;
  class TypeRef;

  using TypeSigPtr = std::shared_ptr<const TypeSig>;
  using TypeRefPtr = std::shared_ptr<const TypeRef>;

  struct NGIN_METADATA_API AssemblyRef
  {
    std::string name;
    std::string version{};
    std::string culture{};
    std::string publicKeyToken{};

    // mscorlib, System.Runtime, netstandard and System.Private.CoreLib
    [[nodiscard]] bool IsCorLib() const noexcept;
    [[nodiscard]] std::string FullName() const;
  };

  using AssemblyRefPtr = std::shared_ptr<const AssemblyRef>;

  // Small handle to a type definition row owned by a Module. Intentionally trivial.
  class NGIN_METADATA_API TypeDef
  {
  public:
    constexpr TypeDef() = default;
    constexpr TypeDef(const Module *module, NGIN::UInt32 index) : m_module(module), m_index(index) {}

    [[nodiscard]] bool IsValid() const noexcept;
    [[nodiscard]] const Module *GetModule() const noexcept { return m_module; }
    [[nodiscard]] NGIN::UInt32 Index() const noexcept { return m_index; }

    [[nodiscard]] std::string_view Namespace() const;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] std::string FullName() const;
    [[nodiscard]] TypeDef DeclaringType() const;
    [[nodiscard]] bool IsNested() const;
    [[nodiscard]] bool IsValueType() const;
    [[nodiscard]] bool IsEnum() const;
    // Underlying type of an enum; null for non-enums or malformed enums.
    [[nodiscard]] TypeSigPtr EnumUnderlyingType() const;
    [[nodiscard]] bool DefinitionAssemblyIsCorLib() const;

    friend constexpr bool operator==(const TypeDef &a, const TypeDef &b) noexcept
    {
      return a.m_module == b.m_module && a.m_index == b.m_index;
    }

  private:
    const Module *m_module{nullptr};
    NGIN::UInt32 m_index{static_cast<NGIN::UInt32>(-1)};
  };

  /**
   * Immutable reference to a type by name. The resolution scope is an assembly reference,
   * an enclosing type reference (nested types) or, when both are null, the referencing module.
   */
  class NGIN_METADATA_API TypeRef
  {
  public:
    TypeRef(const Module *module, std::string ns, std::string name, AssemblyRefPtr scope = nullptr)
        : m_module(module), m_namespace(std::move(ns)), m_name(std::move(name)), m_scope(std::move(scope))
    {
    }
    TypeRef(const Module *module, std::string name, TypeRefPtr declaringType)
        : m_module(module), m_name(std::move(name)), m_declaringType(std::move(declaringType))
    {
    }

    [[nodiscard]] const Module *GetModule() const noexcept { return m_module; }
    [[nodiscard]] std::string_view Namespace() const noexcept { return m_namespace; }
    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    [[nodiscard]] const AssemblyRefPtr &Scope() const noexcept { return m_scope; }
    [[nodiscard]] const TypeRefPtr &DeclaringType() const noexcept { return m_declaringType; }
    [[nodiscard]] bool IsNested() const noexcept { return m_declaringType != nullptr; }

    [[nodiscard]] const TypeRef &NonNestedTypeRef() const noexcept;
    [[nodiscard]] std::string FullName() const;
    [[nodiscard]] bool DefinitionAssemblyIsCorLib() const;

    // Find the definition through the owning module's assembly resolver.
    [[nodiscard]] std::optional<TypeDef> Resolve() const;

  private:
    const Module *m_module{nullptr};
    std::string m_namespace;
    std::string m_name;
    AssemblyRefPtr m_scope;
    TypeRefPtr m_declaringType;
  };

  class NGIN_METADATA_API TypeDefOrRef
  {
  public:
    TypeDefOrRef() = default;
    TypeDefOrRef(TypeDef def) : m_def(def) {}
    TypeDefOrRef(TypeRefPtr ref) : m_ref(std::move(ref)) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_def.IsValid() || m_ref != nullptr; }
    [[nodiscard]] bool IsTypeDef() const noexcept { return m_def.IsValid(); }
    [[nodiscard]] bool IsTypeRef() const noexcept { return m_ref != nullptr; }
    [[nodiscard]] TypeDef GetTypeDef() const noexcept { return m_def; }
    [[nodiscard]] const TypeRefPtr &GetTypeRef() const noexcept { return m_ref; }

    [[nodiscard]] std::string_view Namespace() const;
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] std::string FullName() const;
    [[nodiscard]] bool DefinitionAssemblyIsCorLib() const;
    // The definition itself, or the resolved reference. Empty when the reference cannot be resolved.
    [[nodiscard]] std::optional<TypeDef> ResolveTypeDef() const;

  private:
    TypeDef m_def{};
    TypeRefPtr m_ref;
  };

  /**
   * Node of an immutable signature tree. Leaf nodes (core-library primitives, value types,
   * classes) carry a TypeDefOrRef; wrapper nodes (arrays, pointers, modifiers) carry Next().
   * Nodes are shared freely between trees.
   */
  class NGIN_METADATA_API TypeSig
  {
  public:
    [[nodiscard]] ElementType GetElementType() const noexcept { return m_elementType; }
    [[nodiscard]] const TypeDefOrRef &Type() const noexcept { return m_type; }
    [[nodiscard]] const TypeSigPtr &Next() const noexcept { return m_next; }
    // Generic parameter index (Var/MVar) or array rank (Array).
    [[nodiscard]] NGIN::UInt32 Number() const noexcept { return m_number; }
    [[nodiscard]] const NGIN::Containers::Vector<TypeSigPtr> &GenericArguments() const noexcept { return m_genericArgs; }

    [[nodiscard]] bool IsTypeDefOrRef() const noexcept { return m_type.IsValid() && !IsModifier(); }
    [[nodiscard]] bool IsModifier() const noexcept
    {
      return m_elementType == ElementType::CModReqd || m_elementType == ElementType::CModOpt;
    }
    [[nodiscard]] bool IsSZArray() const noexcept { return m_elementType == ElementType::SZArray; }

    // Reflection-style display name, e.g. "System.Int32[]" or "NS.Outer+Inner".
    [[nodiscard]] std::string FullName() const;

    static TypeSigPtr CorLib(ElementType elementType, TypeDefOrRef type);
    static TypeSigPtr ValueType(TypeDefOrRef type);
    static TypeSigPtr Class(TypeDefOrRef type);
    static TypeSigPtr SZArray(TypeSigPtr next);
    static TypeSigPtr Array(TypeSigPtr next, NGIN::UInt32 rank);
    static TypeSigPtr Ptr(TypeSigPtr next);
    static TypeSigPtr ByRef(TypeSigPtr next);
    static TypeSigPtr Pinned(TypeSigPtr next);
    static TypeSigPtr Var(NGIN::UInt32 number);
    static TypeSigPtr MVar(NGIN::UInt32 number);
    static TypeSigPtr GenericInst(TypeSigPtr genericType, NGIN::Containers::Vector<TypeSigPtr> args);
    static TypeSigPtr Modifier(bool required, TypeDefOrRef modifier, TypeSigPtr next);

  private:
    TypeSig(ElementType et, TypeDefOrRef type, TypeSigPtr next, NGIN::UInt32 number)
        : m_elementType(et), m_type(std::move(type)), m_next(std::move(next)), m_number(number)
    {
    }

    ElementType m_elementType{ElementType::End};
    TypeDefOrRef m_type{};
    TypeSigPtr m_next;
    NGIN::UInt32 m_number{0};
    NGIN::Containers::Vector<TypeSigPtr> m_genericArgs;
  };

  // Strip leading CModReqd/CModOpt wrappers.
  NGIN_METADATA_API TypeSigPtr RemoveModifiers(TypeSigPtr sig);

} // namespace NGIN::Metadata
