// GenericArguments.hpp
// Substitution of generic type parameters (!n) by the owning instantiation's arguments
#pragma once

#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Metadata/Export.hpp>
#include <NGIN/Metadata/TypeSig.hpp>

#include <vector>

namespace NGIN::Metadata
{

  class NGIN_METADATA_API GenericArguments
  {
  public:
    GenericArguments() = default;

    // Captures the arguments of a GenericInst owner. Other owners give an empty context.
    static GenericArguments FromOwner(const TypeSigPtr &owner);

    void PushTypeArgs(NGIN::Containers::Vector<TypeSigPtr> args);
    void PopTypeArgs();
    [[nodiscard]] bool Empty() const noexcept { return m_typeArgs.empty(); }

    /// Rewrite every Var(n) in `sig` with the n-th argument of the innermost list.
    /// Placeholders without a matching argument are kept. The input tree is never modified.
    [[nodiscard]] TypeSigPtr Resolve(const TypeSigPtr &sig) const;

  private:
    [[nodiscard]] TypeSigPtr ResolveImpl(const TypeSigPtr &sig, NGIN::UInt32 depth) const;

    std::vector<NGIN::Containers::Vector<TypeSigPtr>> m_typeArgs;
  };

} // namespace NGIN::Metadata
