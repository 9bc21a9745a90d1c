// AssemblySearch.hpp
// Scope selection for System.Type names read from custom attribute blobs
#pragma once

#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/TypeNameParser.hpp>

namespace NGIN::Metadata
{
  class Module;

  /**
   * Search order for unqualified names:
   *  1. the current assembly (or the module itself when it has no assembly),
   *  2. the core library, resolved through the module's assembly resolver,
   *  3. the current assembly again, or the referencing module when there is none.
   */
  class NGIN_METADATA_API CustomAttributeAssemblyRefFinder final : public IAssemblyRefFinder
  {
  public:
    explicit CustomAttributeAssemblyRefFinder(const Module &module) noexcept : m_module(module) {}

    [[nodiscard]] AssemblyRefPtr FindAssemblyRef(const TypeRef &nonNestedTypeRef) const override;

  private:
    const Module &m_module;
  };

} // namespace NGIN::Metadata
