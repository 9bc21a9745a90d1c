// Module.hpp
// Modules, assemblies, core-library types and assembly resolution
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/BlobHeap.hpp>
#include <NGIN/Metadata/TypeSig.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace NGIN::Metadata
{
  class Assembly;

  class NGIN_METADATA_API IAssemblyResolver
  {
  public:
    virtual ~IAssemblyResolver() = default;
    // Null when the assembly is not available.
    [[nodiscard]] virtual const Assembly *Resolve(const AssemblyRef &assembly, const Module &source) const = 0;
  };

  // Name-indexed table of loaded assemblies. Assembly names compare case-insensitively.
  class NGIN_METADATA_API AssemblyResolver final : public IAssemblyResolver
  {
  public:
    void AddAssembly(const Assembly &assembly);
    [[nodiscard]] const Assembly *Resolve(const AssemblyRef &assembly, const Module &source) const override;

  private:
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::Containers::Vector<const Assembly *>> m_byName;
  };

  /**
   * Core-library signatures as seen from one module. All of them are references into the
   * module's core library, so they stay valid when that assembly is not loaded.
   */
  class NGIN_METADATA_API CorLibTypes
  {
  public:
    CorLibTypes(const Module &module, AssemblyRefPtr corLib);

    [[nodiscard]] const AssemblyRefPtr &CorLibAssemblyRef() const noexcept { return m_corLib; }

    [[nodiscard]] const TypeSigPtr &Void() const noexcept { return m_void; }
    [[nodiscard]] const TypeSigPtr &Boolean() const noexcept { return m_boolean; }
    [[nodiscard]] const TypeSigPtr &Char() const noexcept { return m_char; }
    [[nodiscard]] const TypeSigPtr &SByte() const noexcept { return m_sbyte; }
    [[nodiscard]] const TypeSigPtr &Byte() const noexcept { return m_byte; }
    [[nodiscard]] const TypeSigPtr &Int16() const noexcept { return m_int16; }
    [[nodiscard]] const TypeSigPtr &UInt16() const noexcept { return m_uint16; }
    [[nodiscard]] const TypeSigPtr &Int32() const noexcept { return m_int32; }
    [[nodiscard]] const TypeSigPtr &UInt32() const noexcept { return m_uint32; }
    [[nodiscard]] const TypeSigPtr &Int64() const noexcept { return m_int64; }
    [[nodiscard]] const TypeSigPtr &UInt64() const noexcept { return m_uint64; }
    [[nodiscard]] const TypeSigPtr &Single() const noexcept { return m_single; }
    [[nodiscard]] const TypeSigPtr &Double() const noexcept { return m_double; }
    [[nodiscard]] const TypeSigPtr &String() const noexcept { return m_string; }
    [[nodiscard]] const TypeSigPtr &Object() const noexcept { return m_object; }

    // Primitive signature for a core-library type name, or null.
    [[nodiscard]] TypeSigPtr GetCorLibTypeSig(std::string_view ns, std::string_view name) const;
    // Signature for a primitive element type (Boolean..String, Object), or null.
    [[nodiscard]] TypeSigPtr FromElementType(ElementType et) const;
    [[nodiscard]] TypeRefPtr GetTypeRef(std::string_view ns, std::string_view name) const;

  private:
    TypeSigPtr Make(ElementType et, std::string_view name) const;

    const Module *m_module;
    AssemblyRefPtr m_corLib;
    TypeSigPtr m_void, m_boolean, m_char, m_sbyte, m_byte, m_int16, m_uint16, m_int32, m_uint32, m_int64, m_uint64,
        m_single, m_double, m_string, m_object;
  };

  struct TypeDefDesc
  {
    std::string ns{};
    std::string name{};
    TypeDef declaringType{};
    bool isValueType{false};
    bool isEnum{false};
    TypeSigPtr enumUnderlyingType{};
  };

  class NGIN_METADATA_API Module
  {
  public:
    Module(std::string name, AssemblyRefPtr corLib, const IAssemblyResolver *resolver = nullptr);
    Module(const Module &) = delete;
    Module &operator=(const Module &) = delete;

    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    [[nodiscard]] const Assembly *GetAssembly() const noexcept { return m_assembly; }
    [[nodiscard]] const CorLibTypes &GetCorLibTypes() const noexcept { return m_corLibTypes; }
    [[nodiscard]] const IAssemblyResolver *Resolver() const noexcept { return m_resolver; }
    void SetResolver(const IAssemblyResolver *resolver) noexcept { m_resolver = resolver; }

    [[nodiscard]] BlobHeap &Blobs() noexcept { return m_blobs; }
    [[nodiscard]] const BlobHeap &Blobs() const noexcept { return m_blobs; }

    TypeDef AddType(TypeDefDesc desc);
    [[nodiscard]] NGIN::UIntSize TypeCount() const noexcept { return m_types.Size(); }
    [[nodiscard]] TypeDef TypeAt(NGIN::UIntSize i) const noexcept { return TypeDef{this, static_cast<NGIN::UInt32>(i)}; }

    // Non-nested type lookup.
    [[nodiscard]] std::optional<TypeDef> Find(std::string_view ns, std::string_view name) const;
    [[nodiscard]] std::optional<TypeDef> FindNested(TypeDef declaringType, std::string_view name) const;

    // Reference from this module; a null scope means "this module".
    [[nodiscard]] TypeRefPtr CreateTypeRef(std::string ns, std::string name, AssemblyRefPtr scope = nullptr) const;

  private:
    friend class TypeDef;
    friend class Assembly;

    struct TypeDefRecord
    {
      std::string ns;
      std::string name;
      NGIN::UInt32 declaringIndex{static_cast<NGIN::UInt32>(-1)};
      bool isValueType{false};
      bool isEnum{false};
      TypeSigPtr enumUnderlyingType;
    };

    std::string m_name;
    const Assembly *m_assembly{nullptr};
    const IAssemblyResolver *m_resolver{nullptr};
    CorLibTypes m_corLibTypes;
    BlobHeap m_blobs;
    NGIN::Containers::Vector<TypeDefRecord> m_types;
    // FNV-1a of "namespace.name" -> non-nested type indices
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::Containers::Vector<NGIN::UInt32>> m_byName;
  };

  class NGIN_METADATA_API Assembly
  {
  public:
    explicit Assembly(AssemblyRef identity);
    Assembly(const Assembly &) = delete;
    Assembly &operator=(const Assembly &) = delete;

    [[nodiscard]] const AssemblyRefPtr &Identity() const noexcept { return m_identity; }
    [[nodiscard]] bool IsCorLib() const noexcept { return m_identity->IsCorLib(); }

    // The first module added becomes the manifest module.
    void AddModule(Module &module);
    [[nodiscard]] NGIN::UIntSize ModuleCount() const noexcept { return m_modules.Size(); }
    [[nodiscard]] const Module *ModuleAt(NGIN::UIntSize i) const noexcept { return m_modules[i]; }

    [[nodiscard]] std::optional<TypeDef> Find(std::string_view ns, std::string_view name) const;

  private:
    AssemblyRefPtr m_identity;
    NGIN::Containers::Vector<const Module *> m_modules;
  };

} // namespace NGIN::Metadata
