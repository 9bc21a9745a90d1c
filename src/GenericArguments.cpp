#include <NGIN/Metadata/GenericArguments.hpp>

namespace NGIN::Metadata
{
  namespace
  {
    constexpr NGIN::UInt32 kMaxResolveDepth = 100;

    NGIN::Containers::Vector<TypeSigPtr> CopyArgs(const NGIN::Containers::Vector<TypeSigPtr> &src)
    {
      NGIN::Containers::Vector<TypeSigPtr> out;
      out.Reserve(src.Size());
      for (NGIN::UIntSize i = 0; i < src.Size(); ++i)
        out.PushBack(src[i]);
      return out;
    }
  } // namespace

  GenericArguments GenericArguments::FromOwner(const TypeSigPtr &owner)
  {
    GenericArguments ctx;
    const auto sig = RemoveModifiers(owner);
    if (sig && sig->GetElementType() == ElementType::GenericInst)
      ctx.PushTypeArgs(CopyArgs(sig->GenericArguments()));
    return ctx;
  }

  void GenericArguments::PushTypeArgs(NGIN::Containers::Vector<TypeSigPtr> args)
  {
    m_typeArgs.push_back(std::move(args));
  }

  void GenericArguments::PopTypeArgs()
  {
    if (!m_typeArgs.empty())
      m_typeArgs.pop_back();
  }

  TypeSigPtr GenericArguments::Resolve(const TypeSigPtr &sig) const
  {
    if (m_typeArgs.empty())
      return sig;
    return ResolveImpl(sig, 0);
  }

  TypeSigPtr GenericArguments::ResolveImpl(const TypeSigPtr &sig, NGIN::UInt32 depth) const
  {
    if (!sig || depth > kMaxResolveDepth)
      return sig;

    switch (sig->GetElementType())
    {
      case ElementType::Var:
      {
        const auto &args = m_typeArgs.back();
        if (sig->Number() < args.Size() && args[sig->Number()])
          return args[sig->Number()];
        return sig;
      }
      case ElementType::SZArray:
      case ElementType::Array:
      case ElementType::Ptr:
      case ElementType::ByRef:
      case ElementType::Pinned:
      case ElementType::CModReqd:
      case ElementType::CModOpt:
      {
        auto next = ResolveImpl(sig->Next(), depth + 1);
        if (next == sig->Next())
          return sig;
        switch (sig->GetElementType())
        {
          case ElementType::SZArray: return TypeSig::SZArray(std::move(next));
          case ElementType::Array: return TypeSig::Array(std::move(next), sig->Number());
          case ElementType::Ptr: return TypeSig::Ptr(std::move(next));
          case ElementType::ByRef: return TypeSig::ByRef(std::move(next));
          case ElementType::Pinned: return TypeSig::Pinned(std::move(next));
          default:
            return TypeSig::Modifier(sig->GetElementType() == ElementType::CModReqd, sig->Type(), std::move(next));
        }
      }
      case ElementType::GenericInst:
      {
        bool changed = false;
        auto genericType = ResolveImpl(sig->Next(), depth + 1);
        changed |= genericType != sig->Next();
        NGIN::Containers::Vector<TypeSigPtr> args;
        args.Reserve(sig->GenericArguments().Size());
        for (NGIN::UIntSize i = 0; i < sig->GenericArguments().Size(); ++i)
        {
          auto arg = ResolveImpl(sig->GenericArguments()[i], depth + 1);
          changed |= arg != sig->GenericArguments()[i];
          args.PushBack(std::move(arg));
        }
        if (!changed)
          return sig;
        return TypeSig::GenericInst(std::move(genericType), std::move(args));
      }
      default:
        return sig;
    }
  }

} // namespace NGIN::Metadata
