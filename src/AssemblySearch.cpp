#include <NGIN/Metadata/AssemblySearch.hpp>
#include <NGIN/Metadata/Module.hpp>

namespace NGIN::Metadata
{

  AssemblyRefPtr CustomAttributeAssemblyRefFinder::FindAssemblyRef(const TypeRef &nonNestedTypeRef) const
  {
    const auto ns = nonNestedTypeRef.Namespace();
    const auto name = nonNestedTypeRef.Name();
    const auto *assembly = m_module.GetAssembly();

    if (assembly)
    {
      if (assembly->Find(ns, name).has_value())
        return assembly->Identity();
    }
    else if (m_module.Find(ns, name).has_value())
      return nullptr;

    const auto &corLibRef = m_module.GetCorLibTypes().CorLibAssemblyRef();
    if (corLibRef && m_module.Resolver())
    {
      const auto *corLib = m_module.Resolver()->Resolve(*corLibRef, m_module);
      if (corLib && corLib->Find(ns, name).has_value())
        return corLibRef;
    }

    if (assembly)
      return assembly->Identity();
    return nullptr;
  }

} // namespace NGIN::Metadata
