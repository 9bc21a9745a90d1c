#include <NGIN/Metadata/Module.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <array>
#include <memory>

namespace NGIN::Metadata
{
  namespace
  {
    constexpr std::array<std::string_view, 4> kCorLibNames{
        "mscorlib",
        "System.Runtime",
        "netstandard",
        "System.Private.CoreLib",
    };

    char ToLowerAscii(char c) noexcept
    {
      return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept
    {
      if (a.size() != b.size())
        return false;
      for (NGIN::UIntSize i = 0; i < a.size(); ++i)
      {
        if (ToLowerAscii(a[i]) != ToLowerAscii(b[i]))
          return false;
      }
      return true;
    }

    NGIN::UInt64 HashAssemblyName(std::string_view name)
    {
      std::string lowered(name);
      for (auto &c : lowered)
        c = ToLowerAscii(c);
      return NGIN::Hashing::FNV1a64(lowered.data(), lowered.size());
    }

    NGIN::UInt64 HashTypeName(std::string_view ns, std::string_view name)
    {
      std::string full;
      full.reserve(ns.size() + name.size() + 1);
      full.append(ns);
      full.push_back('.');
      full.append(name);
      return NGIN::Hashing::FNV1a64(full.data(), full.size());
    }

    std::string JoinTypeName(std::string_view ns, std::string_view name)
    {
      if (ns.empty())
        return std::string{name};
      std::string out{ns};
      out.push_back('.');
      out.append(name);
      return out;
    }
  } // namespace

  // AssemblyRef
  bool AssemblyRef::IsCorLib() const noexcept
  {
    for (auto corLib : kCorLibNames)
    {
      if (EqualsIgnoreCase(name, corLib))
        return true;
    }
    return false;
  }

  std::string AssemblyRef::FullName() const
  {
    std::string out = name;
    if (!version.empty())
      out += ", Version=" + version;
    if (!culture.empty())
      out += ", Culture=" + culture;
    if (!publicKeyToken.empty())
      out += ", PublicKeyToken=" + publicKeyToken;
    return out;
  }

  // TypeDef
  bool TypeDef::IsValid() const noexcept
  {
    return m_module != nullptr && m_index < m_module->m_types.Size();
  }

  std::string_view TypeDef::Namespace() const
  {
    if (!IsValid())
      return {};
    return m_module->m_types[m_index].ns;
  }

  std::string_view TypeDef::Name() const
  {
    if (!IsValid())
      return {};
    return m_module->m_types[m_index].name;
  }

  std::string TypeDef::FullName() const
  {
    if (!IsValid())
      return {};
    if (IsNested())
      return DeclaringType().FullName() + "+" + std::string{Name()};
    return JoinTypeName(Namespace(), Name());
  }

  TypeDef TypeDef::DeclaringType() const
  {
    if (!IsValid())
      return TypeDef{};
    const auto declaring = m_module->m_types[m_index].declaringIndex;
    if (declaring == static_cast<NGIN::UInt32>(-1))
      return TypeDef{};
    return TypeDef{m_module, declaring};
  }

  bool TypeDef::IsNested() const
  {
    return DeclaringType().IsValid();
  }

  bool TypeDef::IsValueType() const
  {
    if (!IsValid())
      return false;
    return m_module->m_types[m_index].isValueType;
  }

  bool TypeDef::IsEnum() const
  {
    if (!IsValid())
      return false;
    return m_module->m_types[m_index].isEnum;
  }

  TypeSigPtr TypeDef::EnumUnderlyingType() const
  {
    if (!IsEnum())
      return nullptr;
    return m_module->m_types[m_index].enumUnderlyingType;
  }

  bool TypeDef::DefinitionAssemblyIsCorLib() const
  {
    if (!IsValid())
      return false;
    const auto *assembly = m_module->GetAssembly();
    return assembly && assembly->IsCorLib();
  }

  // TypeRef
  const TypeRef &TypeRef::NonNestedTypeRef() const noexcept
  {
    const TypeRef *cur = this;
    while (cur->m_declaringType)
      cur = cur->m_declaringType.get();
    return *cur;
  }

  std::string TypeRef::FullName() const
  {
    if (m_declaringType)
      return m_declaringType->FullName() + "+" + m_name;
    return JoinTypeName(m_namespace, m_name);
  }

  bool TypeRef::DefinitionAssemblyIsCorLib() const
  {
    const auto &outer = NonNestedTypeRef();
    if (outer.m_scope)
      return outer.m_scope->IsCorLib();
    if (!outer.m_module)
      return false;
    const auto *assembly = outer.m_module->GetAssembly();
    return assembly && assembly->IsCorLib();
  }

  std::optional<TypeDef> TypeRef::Resolve() const
  {
    if (m_declaringType)
    {
      auto outer = m_declaringType->Resolve();
      if (!outer.has_value())
        return std::nullopt;
      return outer->GetModule()->FindNested(*outer, m_name);
    }
    if (!m_module)
      return std::nullopt;

    const auto *own = m_module->GetAssembly();
    if (!m_scope)
    {
      if (own)
        return own->Find(m_namespace, m_name);
      return m_module->Find(m_namespace, m_name);
    }
    if (own && EqualsIgnoreCase(own->Identity()->name, m_scope->name))
      return own->Find(m_namespace, m_name);

    const auto *resolver = m_module->Resolver();
    if (!resolver)
      return std::nullopt;
    const auto *target = resolver->Resolve(*m_scope, *m_module);
    if (!target)
      return std::nullopt;
    return target->Find(m_namespace, m_name);
  }

  // TypeDefOrRef
  std::string_view TypeDefOrRef::Namespace() const
  {
    if (m_def.IsValid())
      return m_def.Namespace();
    if (m_ref)
      return m_ref->Namespace();
    return {};
  }

  std::string_view TypeDefOrRef::Name() const
  {
    if (m_def.IsValid())
      return m_def.Name();
    if (m_ref)
      return m_ref->Name();
    return {};
  }

  std::string TypeDefOrRef::FullName() const
  {
    if (m_def.IsValid())
      return m_def.FullName();
    if (m_ref)
      return m_ref->FullName();
    return {};
  }

  bool TypeDefOrRef::DefinitionAssemblyIsCorLib() const
  {
    if (m_def.IsValid())
      return m_def.DefinitionAssemblyIsCorLib();
    if (m_ref)
      return m_ref->DefinitionAssemblyIsCorLib();
    return false;
  }

  std::optional<TypeDef> TypeDefOrRef::ResolveTypeDef() const
  {
    if (m_def.IsValid())
      return m_def;
    if (m_ref)
      return m_ref->Resolve();
    return std::nullopt;
  }

  // CorLibTypes
  CorLibTypes::CorLibTypes(const Module &module, AssemblyRefPtr corLib)
      : m_module(&module), m_corLib(std::move(corLib))
  {
    m_void = Make(ElementType::Void, "Void");
    m_boolean = Make(ElementType::Boolean, "Boolean");
    m_char = Make(ElementType::Char, "Char");
    m_sbyte = Make(ElementType::I1, "SByte");
    m_byte = Make(ElementType::U1, "Byte");
    m_int16 = Make(ElementType::I2, "Int16");
    m_uint16 = Make(ElementType::U2, "UInt16");
    m_int32 = Make(ElementType::I4, "Int32");
    m_uint32 = Make(ElementType::U4, "UInt32");
    m_int64 = Make(ElementType::I8, "Int64");
    m_uint64 = Make(ElementType::U8, "UInt64");
    m_single = Make(ElementType::R4, "Single");
    m_double = Make(ElementType::R8, "Double");
    m_string = Make(ElementType::String, "String");
    m_object = Make(ElementType::Object, "Object");
  }

  TypeSigPtr CorLibTypes::Make(ElementType et, std::string_view name) const
  {
    return TypeSig::CorLib(et, TypeDefOrRef{GetTypeRef("System", name)});
  }

  TypeRefPtr CorLibTypes::GetTypeRef(std::string_view ns, std::string_view name) const
  {
    return std::make_shared<const TypeRef>(m_module, std::string{ns}, std::string{name}, m_corLib);
  }

  TypeSigPtr CorLibTypes::GetCorLibTypeSig(std::string_view ns, std::string_view name) const
  {
    if (ns != "System")
      return nullptr;
    const TypeSigPtr *all[] = {&m_void, &m_boolean, &m_char, &m_sbyte, &m_byte, &m_int16, &m_uint16, &m_int32,
                               &m_uint32, &m_int64, &m_uint64, &m_single, &m_double, &m_string, &m_object};
    for (const auto *sig : all)
    {
      if ((*sig)->Type().Name() == name)
        return *sig;
    }
    return nullptr;
  }

  TypeSigPtr CorLibTypes::FromElementType(ElementType et) const
  {
    switch (et)
    {
      case ElementType::Void: return m_void;
      case ElementType::Boolean: return m_boolean;
      case ElementType::Char: return m_char;
      case ElementType::I1: return m_sbyte;
      case ElementType::U1: return m_byte;
      case ElementType::I2: return m_int16;
      case ElementType::U2: return m_uint16;
      case ElementType::I4: return m_int32;
      case ElementType::U4: return m_uint32;
      case ElementType::I8: return m_int64;
      case ElementType::U8: return m_uint64;
      case ElementType::R4: return m_single;
      case ElementType::R8: return m_double;
      case ElementType::String: return m_string;
      case ElementType::Object: return m_object;
      default: return nullptr;
    }
  }

  // Module
  Module::Module(std::string name, AssemblyRefPtr corLib, const IAssemblyResolver *resolver)
      : m_name(std::move(name)), m_resolver(resolver), m_corLibTypes(*this, std::move(corLib))
  {
  }

  TypeDef Module::AddType(TypeDefDesc desc)
  {
    const auto idx = static_cast<NGIN::UInt32>(m_types.Size());
    TypeDefRecord rec{};
    rec.ns = std::move(desc.ns);
    rec.name = std::move(desc.name);
    rec.isValueType = desc.isValueType || desc.isEnum;
    rec.isEnum = desc.isEnum;
    rec.enumUnderlyingType = std::move(desc.enumUnderlyingType);
    if (desc.declaringType.IsValid() && desc.declaringType.GetModule() == this)
      rec.declaringIndex = desc.declaringType.Index();

    if (rec.declaringIndex == static_cast<NGIN::UInt32>(-1))
    {
      const auto key = HashTypeName(rec.ns, rec.name);
      if (auto *vec = m_byName.GetPtr(key))
        vec->PushBack(idx);
      else
      {
        NGIN::Containers::Vector<NGIN::UInt32> v;
        v.PushBack(idx);
        m_byName.Insert(key, std::move(v));
      }
    }
    m_types.PushBack(std::move(rec));
    return TypeDef{this, idx};
  }

  std::optional<TypeDef> Module::Find(std::string_view ns, std::string_view name) const
  {
    const auto *vec = m_byName.GetPtr(HashTypeName(ns, name));
    if (!vec)
      return std::nullopt;
    for (NGIN::UIntSize i = 0; i < vec->Size(); ++i)
    {
      const auto idx = (*vec)[i];
      const auto &rec = m_types[idx];
      if (rec.ns == ns && rec.name == name)
        return TypeDef{this, idx};
    }
    return std::nullopt;
  }

  std::optional<TypeDef> Module::FindNested(TypeDef declaringType, std::string_view name) const
  {
    if (!declaringType.IsValid() || declaringType.GetModule() != this)
      return std::nullopt;
    for (NGIN::UIntSize i = 0; i < m_types.Size(); ++i)
    {
      const auto &rec = m_types[i];
      if (rec.declaringIndex == declaringType.Index() && rec.name == name)
        return TypeDef{this, static_cast<NGIN::UInt32>(i)};
    }
    return std::nullopt;
  }

  TypeRefPtr Module::CreateTypeRef(std::string ns, std::string name, AssemblyRefPtr scope) const
  {
    return std::make_shared<const TypeRef>(this, std::move(ns), std::move(name), std::move(scope));
  }

  // Assembly
  Assembly::Assembly(AssemblyRef identity)
      : m_identity(std::make_shared<const AssemblyRef>(std::move(identity)))
  {
  }

  void Assembly::AddModule(Module &module)
  {
    module.m_assembly = this;
    m_modules.PushBack(&module);
  }

  std::optional<TypeDef> Assembly::Find(std::string_view ns, std::string_view name) const
  {
    for (NGIN::UIntSize i = 0; i < m_modules.Size(); ++i)
    {
      if (auto def = m_modules[i]->Find(ns, name))
        return def;
    }
    return std::nullopt;
  }

  // AssemblyResolver
  void AssemblyResolver::AddAssembly(const Assembly &assembly)
  {
    const auto key = HashAssemblyName(assembly.Identity()->name);
    if (auto *vec = m_byName.GetPtr(key))
      vec->PushBack(&assembly);
    else
    {
      NGIN::Containers::Vector<const Assembly *> v;
      v.PushBack(&assembly);
      m_byName.Insert(key, std::move(v));
    }
  }

  const Assembly *AssemblyResolver::Resolve(const AssemblyRef &assembly, const Module &) const
  {
    const auto *vec = m_byName.GetPtr(HashAssemblyName(assembly.name));
    if (!vec)
      return nullptr;
    for (NGIN::UIntSize i = 0; i < vec->Size(); ++i)
    {
      if (EqualsIgnoreCase((*vec)[i]->Identity()->name, assembly.name))
        return (*vec)[i];
    }
    return nullptr;
  }

} // namespace NGIN::Metadata
