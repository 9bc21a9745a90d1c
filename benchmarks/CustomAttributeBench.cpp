#include <iostream>
#include <memory>
#include <vector>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Metadata/Metadata.hpp>

using namespace NGIN;

int main()
{
  using namespace NGIN::Metadata;

  auto corLibRef = std::make_shared<const AssemblyRef>(AssemblyRef{"mscorlib"});
  AssemblyResolver resolver;
  Assembly assembly{AssemblyRef{"Bench"}};
  Module module{"Bench.dll", corLibRef, &resolver};
  assembly.AddModule(module);
  resolver.AddAssembly(assembly);
  const auto &cor = module.GetCorLibTypes();

  // Attr(int, string) { Flag = true }
  const std::vector<NGIN::UInt8> small{0x01, 0x00, 0x2A, 0x00, 0x00, 0x00, 0x03, 'a', 'b', 'c', 0x01, 0x00,
                                       0x54, 0x02, 0x04, 'F', 'l', 'a', 'g', 0x01};
  const auto smallOffset = module.Blobs().Append(small);
  CustomAttributeCtor smallCtor;
  smallCtor.signature = MethodSig{{cor.Int32(), cor.String()}};

  // Attr(object) holding object[256] of boxed ints
  std::vector<NGIN::UInt8> large{0x01, 0x00, 0x1D, 0x51, 0x00, 0x01, 0x00, 0x00};
  for (int i = 0; i < 256; ++i)
  {
    large.push_back(0x08);
    for (int b = 0; b < 4; ++b)
      large.push_back(static_cast<NGIN::UInt8>((i >> (8 * b)) & 0xFF));
  }
  large.push_back(0x00);
  large.push_back(0x00);
  const auto largeOffset = module.Blobs().Append(large);
  CustomAttributeCtor objectCtor;
  objectCtor.signature = MethodSig{{cor.Object()}};

  constexpr int N = 10000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        std::size_t args = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto ca = ReadCustomAttribute(module, smallCtor, smallOffset);
                          args += ca.ctorArguments.size() + ca.namedArguments.size();
                        }
                        ctx.doNotOptimize(args);
                        ctx.stop(); }, "ReadCustomAttribute small 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        std::size_t args = 0;
                        for (int i = 0; i < N / 10; ++i)
                        {
                          auto ca = ReadCustomAttribute(module, objectCtor, largeOffset);
                          args += ca.ctorArguments.size();
                        }
                        ctx.doNotOptimize(args);
                        ctx.stop(); }, "ReadCustomAttribute object[256] 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int ok = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto sig = ParseTypeName(module, "System.Collections.Generic.Dictionary`2[[System.String, mscorlib],[System.Int32, mscorlib]][]");
                          ok += sig.has_value() ? 1 : 0;
                        }
                        ctx.doNotOptimize(ok);
                        ctx.stop(); }, "ParseTypeName generic 10k");

  auto results = NGIN::Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
