// GenericArgumentsTests.cpp - generic parameter substitution and recursion guard

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Metadata/GenericArguments.hpp>
#include <NGIN/Metadata/RecursionCounter.hpp>

#include "TestUniverse.hpp"

using namespace MetadataTest;

namespace
{
  TypeSigPtr MakeOwner(const TestUniverse &u, std::initializer_list<TypeSigPtr> args)
  {
    NGIN::Containers::Vector<TypeSigPtr> list;
    for (const auto &a : args)
      list.PushBack(a);
    auto generic = TypeSig::Class(TypeDefOrRef{u.module.CreateTypeRef("UserNs", "Holder`2")});
    return TypeSig::GenericInst(generic, std::move(list));
  }
} // namespace

TEST_CASE("VarIsReplacedByOwnerArgument", "[metadata][Generics]")
{
  TestUniverse u;
  const auto ctx = GenericArguments::FromOwner(MakeOwner(u, {u.Cor().Int32(), u.Cor().String()}));
  REQUIRE_FALSE(ctx.Empty());

  CHECK(ctx.Resolve(TypeSig::Var(0)) == u.Cor().Int32());
  CHECK(ctx.Resolve(TypeSig::Var(1)) == u.Cor().String());

  auto arr = ctx.Resolve(TypeSig::SZArray(TypeSig::Var(1)));
  REQUIRE(arr->IsSZArray());
  CHECK(arr->Next() == u.Cor().String());
}

TEST_CASE("SubstitutionIsPure", "[metadata][Generics]")
{
  TestUniverse u;
  const auto ctx = GenericArguments::FromOwner(MakeOwner(u, {u.Cor().Int32(), u.Cor().String()}));

  const auto original = TypeSig::SZArray(TypeSig::Var(0));
  const auto resolved = ctx.Resolve(original);
  CHECK(resolved != original);
  CHECK(original->Next()->GetElementType() == ElementType::Var);
  CHECK(resolved->Next() == u.Cor().Int32());

  // Nothing to substitute: same node comes back.
  const auto plain = TypeSig::SZArray(u.Cor().Double());
  CHECK(ctx.Resolve(plain) == plain);
}

TEST_CASE("UnmatchedPlaceholdersAreKept", "[metadata][Generics]")
{
  TestUniverse u;
  const auto ctx = GenericArguments::FromOwner(MakeOwner(u, {u.Cor().Int32()}));

  const auto var5 = TypeSig::Var(5);
  CHECK(ctx.Resolve(var5) == var5);
  const auto mvar = TypeSig::MVar(0);
  CHECK(ctx.Resolve(mvar) == mvar);

  const GenericArguments none = GenericArguments::FromOwner(u.Cor().Int32());
  CHECK(none.Empty());
  const auto var0 = TypeSig::Var(0);
  CHECK(none.Resolve(var0) == var0);
}

TEST_CASE("ModifiersAndNestedInstantiations", "[metadata][Generics]")
{
  TestUniverse u;
  const auto ctx = GenericArguments::FromOwner(MakeOwner(u, {u.Cor().Int64(), u.Cor().Boolean()}));

  const auto modifier = TypeDefOrRef{u.Cor().GetTypeRef("System.Runtime.CompilerServices", "IsVolatile")};
  auto modded = ctx.Resolve(TypeSig::Modifier(true, modifier, TypeSig::Var(1)));
  REQUIRE(modded->IsModifier());
  CHECK(RemoveModifiers(modded) == u.Cor().Boolean());

  auto nested = ctx.Resolve(MakeOwner(u, {TypeSig::Var(1), TypeSig::Var(0)}));
  REQUIRE(nested->GetElementType() == ElementType::GenericInst);
  CHECK(nested->GenericArguments()[0] == u.Cor().Boolean());
  CHECK(nested->GenericArguments()[1] == u.Cor().Int64());
}

TEST_CASE("PushAndPopTypeArgs", "[metadata][Generics]")
{
  TestUniverse u;
  GenericArguments ctx;
  NGIN::Containers::Vector<TypeSigPtr> outer;
  outer.PushBack(u.Cor().Int32());
  NGIN::Containers::Vector<TypeSigPtr> inner;
  inner.PushBack(u.Cor().String());

  ctx.PushTypeArgs(std::move(outer));
  ctx.PushTypeArgs(std::move(inner));
  CHECK(ctx.Resolve(TypeSig::Var(0)) == u.Cor().String());
  ctx.PopTypeArgs();
  CHECK(ctx.Resolve(TypeSig::Var(0)) == u.Cor().Int32());
  ctx.PopTypeArgs();
  CHECK(ctx.Empty());
  ctx.PopTypeArgs();
  CHECK(ctx.Empty());
}

TEST_CASE("RecursionScopeReleasesOnExit", "[metadata][Recursion]")
{
  RecursionCounter counter{2};
  {
    RecursionScope a{counter};
    CHECK(static_cast<bool>(a));
    {
      RecursionScope b{counter};
      CHECK(static_cast<bool>(b));
      RecursionScope c{counter};
      CHECK_FALSE(static_cast<bool>(c));
      CHECK(counter.Depth() == 2);
    }
    CHECK(counter.Depth() == 1);
  }
  CHECK(counter.Depth() == 0);
}
