#include <NGIN/Metadata/TypeNameParser.hpp>
#include <NGIN/Metadata/Module.hpp>

#include <memory>
#include <string>
#include <vector>

namespace NGIN::Metadata
{
  namespace
  {
    constexpr NGIN::UInt32 kMaxNesting = 64;

    enum class SuffixKind : NGIN::UInt8
    {
      SZArray,
      Array,
      Ptr,
      ByRef,
    };

    struct Suffix
    {
      SuffixKind kind;
      NGIN::UInt32 rank{0};
    };

    struct Identifier
    {
      std::string text;
      std::string::size_type lastDot{std::string::npos};
    };

    bool IsSpace(char c) noexcept
    {
      return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    bool IsNameTerminator(char c) noexcept
    {
      return c == '+' || c == ',' || c == '[' || c == ']' || c == '*' || c == '&';
    }

    std::string_view Trim(std::string_view s) noexcept
    {
      while (!s.empty() && IsSpace(s.front()))
        s.remove_prefix(1);
      while (!s.empty() && IsSpace(s.back()))
        s.remove_suffix(1);
      return s;
    }

    class TypeNameParser
    {
    public:
      TypeNameParser(const Module &module, std::string_view text, const IAssemblyRefFinder *finder)
          : m_module(module), m_text(text), m_finder(finder)
      {
      }

      Expected<TypeSigPtr> Parse()
      {
        auto sig = ParseSpec(true, '\0', 0);
        if (!sig)
          return sig;
        SkipSpaces();
        if (!AtEnd())
          return std::unexpected(Fault());
        return sig;
      }

    private:
      [[nodiscard]] bool AtEnd() const noexcept { return m_pos >= m_text.size(); }
      [[nodiscard]] char Peek() const noexcept { return AtEnd() ? '\0' : m_text[m_pos]; }

      void SkipSpaces() noexcept
      {
        while (!AtEnd() && IsSpace(m_text[m_pos]))
          ++m_pos;
      }

      [[nodiscard]] Error Fault() const noexcept
      {
        return Error{ErrorCode::ParseFault, "could not parse type", m_pos};
      }

      Expected<Identifier> ReadIdentifier()
      {
        SkipSpaces();
        Identifier id;
        std::string::size_type lastKept = 0;
        while (!AtEnd() && !IsNameTerminator(m_text[m_pos]))
        {
          char c = m_text[m_pos++];
          if (c == '\\')
          {
            if (AtEnd())
              return std::unexpected(Fault());
            id.text.push_back(m_text[m_pos++]);
            lastKept = id.text.size();
            continue;
          }
          if (c == '.')
            id.lastDot = id.text.size();
          id.text.push_back(c);
          if (!IsSpace(c))
            lastKept = id.text.size();
        }
        id.text.resize(lastKept);
        if (id.lastDot != std::string::npos && id.lastDot >= id.text.size())
          id.lastDot = std::string::npos;
        if (id.text.empty())
          return std::unexpected(Fault());
        return id;
      }

      // '[' was just seen: a generic argument list starts unless the bracket opens an array suffix.
      [[nodiscard]] bool BracketOpensGenericArgs() const noexcept
      {
        auto p = m_pos + 1;
        while (p < m_text.size() && IsSpace(m_text[p]))
          ++p;
        if (p >= m_text.size())
          return false;
        const char c = m_text[p];
        return c != ']' && c != ',' && c != '*';
      }

      Expected<AssemblyRefPtr> ReadAssemblyName(char terminator)
      {
        const auto begin = m_pos;
        while (!AtEnd() && m_text[m_pos] != terminator)
          ++m_pos;
        std::string_view full = m_text.substr(begin, m_pos - begin);

        AssemblyRef ref;
        bool first = true;
        while (true)
        {
          const auto comma = full.find(',');
          const auto part = Trim(full.substr(0, comma));
          if (first)
          {
            if (part.empty())
              return std::unexpected(Error{ErrorCode::ParseFault, "could not parse type", begin});
            ref.name = std::string{part};
            first = false;
          }
          else
          {
            const auto eq = part.find('=');
            if (eq != std::string_view::npos)
            {
              const auto key = Trim(part.substr(0, eq));
              const auto value = std::string{Trim(part.substr(eq + 1))};
              if (key == "Version")
                ref.version = value;
              else if (key == "Culture")
                ref.culture = value;
              else if (key == "PublicKeyToken")
                ref.publicKeyToken = value;
            }
          }
          if (comma == std::string_view::npos)
            break;
          full.remove_prefix(comma + 1);
        }
        return std::make_shared<const AssemblyRef>(std::move(ref));
      }

      Expected<Suffix> ReadArraySuffix()
      {
        ++m_pos; // '['
        SkipSpaces();
        if (Peek() == ']')
        {
          ++m_pos;
          return Suffix{SuffixKind::SZArray, 1};
        }
        if (Peek() == '*')
        {
          ++m_pos;
          SkipSpaces();
          if (Peek() != ']')
            return std::unexpected(Fault());
          ++m_pos;
          return Suffix{SuffixKind::Array, 1};
        }
        NGIN::UInt32 rank = 1;
        while (Peek() == ',')
        {
          ++rank;
          ++m_pos;
          SkipSpaces();
        }
        if (Peek() != ']')
          return std::unexpected(Fault());
        ++m_pos;
        return Suffix{SuffixKind::Array, rank};
      }

      TypeSigPtr ToSig(const TypeRefPtr &ref) const
      {
        if (!ref->IsNested() && ref->DefinitionAssemblyIsCorLib())
        {
          if (auto sig = m_module.GetCorLibTypes().GetCorLibTypeSig(ref->Namespace(), ref->Name()))
            return sig;
        }
        const auto def = ref->Resolve();
        if (def.has_value() && def->IsValueType())
          return TypeSig::ValueType(TypeDefOrRef{ref});
        return TypeSig::Class(TypeDefOrRef{ref});
      }

      TypeRefPtr BuildTypeRef(const std::vector<Identifier> &names, const AssemblyRefPtr &assembly) const
      {
        const auto &outer = names.front();
        std::string ns;
        std::string name = outer.text;
        if (outer.lastDot != std::string::npos)
        {
          ns = outer.text.substr(0, outer.lastDot);
          name = outer.text.substr(outer.lastDot + 1);
        }

        AssemblyRefPtr scope = assembly;
        if (!scope && m_finder)
        {
          const TypeRef probe{&m_module, ns, name};
          scope = m_finder->FindAssemblyRef(probe);
        }

        auto ref = std::make_shared<const TypeRef>(&m_module, std::move(ns), std::move(name), std::move(scope));
        for (std::size_t i = 1; i < names.size(); ++i)
          ref = std::make_shared<const TypeRef>(&m_module, names[i].text, ref);
        return ref;
      }

      Expected<TypeSigPtr> ParseSpec(bool allowAssembly, char terminator, NGIN::UInt32 nesting)
      {
        // Nested names, generic arguments and suffixes all share one depth budget.
        if (nesting > kMaxNesting)
          return std::unexpected(Fault());

        std::vector<Identifier> names;
        while (true)
        {
          auto id = ReadIdentifier();
          if (!id)
            return std::unexpected(id.error());
          names.push_back(std::move(*id));
          SkipSpaces();
          if (Peek() != '+')
            break;
          if (++nesting > kMaxNesting)
            return std::unexpected(Fault());
          ++m_pos;
        }

        NGIN::Containers::Vector<TypeSigPtr> genericArgs;
        bool isGeneric = false;
        if (Peek() == '[' && BracketOpensGenericArgs())
        {
          isGeneric = true;
          ++m_pos;
          while (true)
          {
            SkipSpaces();
            Expected<TypeSigPtr> arg;
            if (Peek() == '[')
            {
              ++m_pos;
              arg = ParseSpec(true, ']', nesting + 1);
              if (!arg)
                return arg;
              SkipSpaces();
              if (Peek() != ']')
                return std::unexpected(Fault());
              ++m_pos;
            }
            else
            {
              arg = ParseSpec(false, ']', nesting + 1);
              if (!arg)
                return arg;
            }
            genericArgs.PushBack(std::move(*arg));
            SkipSpaces();
            if (Peek() == ',')
            {
              ++m_pos;
              continue;
            }
            if (Peek() == ']')
            {
              ++m_pos;
              break;
            }
            return std::unexpected(Fault());
          }
        }

        std::vector<Suffix> suffixes;
        while (true)
        {
          SkipSpaces();
          const char c = Peek();
          if ((c == '*' || c == '&' || c == '[') && ++nesting > kMaxNesting)
            return std::unexpected(Fault());
          if (c == '*')
          {
            ++m_pos;
            suffixes.push_back({SuffixKind::Ptr});
          }
          else if (c == '&')
          {
            ++m_pos;
            suffixes.push_back({SuffixKind::ByRef});
          }
          else if (c == '[')
          {
            auto s = ReadArraySuffix();
            if (!s)
              return std::unexpected(s.error());
            suffixes.push_back(*s);
          }
          else
            break;
        }

        AssemblyRefPtr assembly;
        SkipSpaces();
        if (allowAssembly && Peek() == ',')
        {
          ++m_pos;
          auto asmRef = ReadAssemblyName(terminator);
          if (!asmRef)
            return std::unexpected(asmRef.error());
          assembly = std::move(*asmRef);
        }

        auto ref = BuildTypeRef(names, assembly);
        TypeSigPtr sig = isGeneric ? TypeSig::GenericInst(ToSig(ref), std::move(genericArgs)) : ToSig(ref);
        for (const auto &s : suffixes)
        {
          switch (s.kind)
          {
            case SuffixKind::SZArray: sig = TypeSig::SZArray(std::move(sig)); break;
            case SuffixKind::Array: sig = TypeSig::Array(std::move(sig), s.rank); break;
            case SuffixKind::Ptr: sig = TypeSig::Ptr(std::move(sig)); break;
            case SuffixKind::ByRef: sig = TypeSig::ByRef(std::move(sig)); break;
          }
        }
        return sig;
      }

      const Module &m_module;
      std::string_view m_text;
      const IAssemblyRefFinder *m_finder;
      std::size_t m_pos{0};
    };
  } // namespace

  Expected<TypeSigPtr> ParseTypeName(const Module &module, std::string_view name, const IAssemblyRefFinder *finder)
  {
    TypeNameParser parser{module, name, finder};
    return parser.Parse();
  }

} // namespace NGIN::Metadata
