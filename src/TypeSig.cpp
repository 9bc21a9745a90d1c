#include <NGIN/Metadata/TypeSig.hpp>

#include <utility>

namespace NGIN::Metadata
{
  namespace
  {
    std::string NameOrNull(const TypeSigPtr &sig)
    {
      return sig ? sig->FullName() : std::string{"<null>"};
    }
  } // namespace

  TypeSigPtr TypeSig::CorLib(ElementType elementType, TypeDefOrRef type)
  {
    return TypeSigPtr(new TypeSig(elementType, std::move(type), nullptr, 0));
  }

  TypeSigPtr TypeSig::ValueType(TypeDefOrRef type)
  {
    return TypeSigPtr(new TypeSig(ElementType::ValueType, std::move(type), nullptr, 0));
  }

  TypeSigPtr TypeSig::Class(TypeDefOrRef type)
  {
    return TypeSigPtr(new TypeSig(ElementType::Class, std::move(type), nullptr, 0));
  }

  TypeSigPtr TypeSig::SZArray(TypeSigPtr next)
  {
    return TypeSigPtr(new TypeSig(ElementType::SZArray, {}, std::move(next), 1));
  }

  TypeSigPtr TypeSig::Array(TypeSigPtr next, NGIN::UInt32 rank)
  {
    return TypeSigPtr(new TypeSig(ElementType::Array, {}, std::move(next), rank));
  }

  TypeSigPtr TypeSig::Ptr(TypeSigPtr next)
  {
    return TypeSigPtr(new TypeSig(ElementType::Ptr, {}, std::move(next), 0));
  }

  TypeSigPtr TypeSig::ByRef(TypeSigPtr next)
  {
    return TypeSigPtr(new TypeSig(ElementType::ByRef, {}, std::move(next), 0));
  }

  TypeSigPtr TypeSig::Pinned(TypeSigPtr next)
  {
    return TypeSigPtr(new TypeSig(ElementType::Pinned, {}, std::move(next), 0));
  }

  TypeSigPtr TypeSig::Var(NGIN::UInt32 number)
  {
    return TypeSigPtr(new TypeSig(ElementType::Var, {}, nullptr, number));
  }

  TypeSigPtr TypeSig::MVar(NGIN::UInt32 number)
  {
    return TypeSigPtr(new TypeSig(ElementType::MVar, {}, nullptr, number));
  }

  TypeSigPtr TypeSig::GenericInst(TypeSigPtr genericType, NGIN::Containers::Vector<TypeSigPtr> args)
  {
    auto *sig = new TypeSig(ElementType::GenericInst, {}, std::move(genericType), 0);
    sig->m_genericArgs = std::move(args);
    return TypeSigPtr(sig);
  }

  TypeSigPtr TypeSig::Modifier(bool required, TypeDefOrRef modifier, TypeSigPtr next)
  {
    const auto et = required ? ElementType::CModReqd : ElementType::CModOpt;
    return TypeSigPtr(new TypeSig(et, std::move(modifier), std::move(next), 0));
  }

  std::string TypeSig::FullName() const
  {
    switch (m_elementType)
    {
      case ElementType::SZArray:
        return NameOrNull(m_next) + "[]";
      case ElementType::Array:
      {
        if (m_number <= 1)
          return NameOrNull(m_next) + "[*]";
        return NameOrNull(m_next) + "[" + std::string(m_number - 1, ',') + "]";
      }
      case ElementType::Ptr:
        return NameOrNull(m_next) + "*";
      case ElementType::ByRef:
        return NameOrNull(m_next) + "&";
      case ElementType::Pinned:
        return NameOrNull(m_next) + " pinned";
      case ElementType::Var:
        return "!" + std::to_string(m_number);
      case ElementType::MVar:
        return "!!" + std::to_string(m_number);
      case ElementType::GenericInst:
      {
        std::string out = NameOrNull(m_next);
        out.push_back('[');
        for (NGIN::UIntSize i = 0; i < m_genericArgs.Size(); ++i)
        {
          if (i)
            out.push_back(',');
          out += NameOrNull(m_genericArgs[i]);
        }
        out.push_back(']');
        return out;
      }
      case ElementType::CModReqd:
        return NameOrNull(m_next) + " modreq(" + m_type.FullName() + ")";
      case ElementType::CModOpt:
        return NameOrNull(m_next) + " modopt(" + m_type.FullName() + ")";
      default:
        return m_type.FullName();
    }
  }

  TypeSigPtr RemoveModifiers(TypeSigPtr sig)
  {
    while (sig && sig->IsModifier())
      sig = sig->Next();
    return sig;
  }

} // namespace NGIN::Metadata
